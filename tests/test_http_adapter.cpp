//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_http_adapter.cpp
// Purpose: GoogleTests for the HTTP transport adapter (status codes, headers, payload limits)
//==========================================================================================================

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "stridemcp/HttpTransportAdapter.h"
#include "stridemcp/tools/StrideTools.h"

using namespace stridemcp;
using stridemcp::errors::ErrorKind;

namespace {

JSONValue parse(const std::string& text) {
    auto r = validation::ValidatePayload(text, validation::ValidationLimits{});
    EXPECT_TRUE(r.ok()) << text;
    return r.ok() ? r.document.value() : JSONValue{};
}

const JSONValue& member(const JSONValue& v, const std::string& key) {
    static const JSONValue kNull{nullptr};
    const JSONValue* m = FindMember(v, key);
    return m ? *m : kNull;
}

http::request<http::string_body> makeRequest(http::verb verb, const std::string& target, std::string body = {}) {
    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, "localhost");
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = std::move(body);
        req.prepare_payload();
    }
    return req;
}

void expectSecurityHeaders(const http::response<http::string_body>& res) {
    EXPECT_EQ(std::string(res[http::field::access_control_allow_origin]), "*");
    EXPECT_EQ(std::string(res["X-Content-Type-Options"]), "nosniff");
    EXPECT_EQ(std::string(res["X-Frame-Options"]), "DENY");
    EXPECT_EQ(std::string(res["X-XSS-Protection"]), "1; mode=block");
}

int64_t errorCodeOf(const JSONValue& body) {
    return std::get<int64_t>(member(member(body, "error"), "code").value);
}

class ThrowingRouter : public IJsonRpcRouter {
public:
    RouteOutcome route(const JSONValue&) const override {
        throw std::runtime_error("router exploded reading /var/lib/secret");
    }
};

class HttpAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry = std::make_shared<ToolRegistry>();
        tools::RegisterStrideTools(*registry);
        auto sanitizer = std::make_shared<const errors::ErrorSanitizer>();
        auto router = std::shared_ptr<const IJsonRpcRouter>(MakeJsonRpcRouter(ServerInfo{}, registry, sanitizer));
        adapter = std::make_unique<HttpTransportAdapter>(HttpTransportAdapter::Options{}, ServerInfo{},
                                                         registry, router, sanitizer);
    }

    std::shared_ptr<ToolRegistry> registry;
    std::unique_ptr<HttpTransportAdapter> adapter;
};

} // namespace

TEST_F(HttpAdapterTest, PostInitializeReturnsOk) {
    auto res = adapter->Handle(makeRequest(http::verb::post, "/mcp",
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})"));
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(std::string(res[http::field::content_type]), "application/json");
    expectSecurityHeaders(res);
    auto body = parse(res.body());
    EXPECT_EQ(member(member(body, "result"), "protocolVersion"), JSONValue{"2025-03-26"});
}

TEST_F(HttpAdapterTest, UnknownToolIsHttpOkWithJsonRpcError) {
    auto res = adapter->Handle(makeRequest(http::verb::post, "/mcp",
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"nonexistent_tool","arguments":{}}})"));
    EXPECT_EQ(res.result(), http::status::ok);
    auto body = parse(res.body());
    EXPECT_EQ(errorCodeOf(body), -32003);
    EXPECT_EQ(std::get<int64_t>(member(body, "id").value), 1);
}

TEST_F(HttpAdapterTest, OversizedBodyIs413WithNullId) {
    std::string body = R"({"jsonrpc":"2.0","id":99,"method":"tools/call","params":{"name":"x","arguments":{"blob":")";
    body.append(6u * 1024u * 1024u, 'A');
    body += "\"}}}";
    auto res = adapter->Handle(makeRequest(http::verb::post, "/mcp", body));
    EXPECT_EQ(res.result(), http::status::payload_too_large);
    expectSecurityHeaders(res);
    auto parsed = parse(res.body());
    EXPECT_TRUE(member(parsed, "id").isNull());
    EXPECT_EQ(errorCodeOf(parsed), -32010);
    EXPECT_EQ(member(member(parsed, "error"), "message"), JSONValue{"Payload too large"});
}

TEST_F(HttpAdapterTest, MalformedBodyIs400ParseError) {
    auto res = adapter->Handle(makeRequest(http::verb::post, "/mcp", "{not json"));
    EXPECT_EQ(res.result(), http::status::bad_request);
    auto body = parse(res.body());
    EXPECT_EQ(errorCodeOf(body), -32700);
    EXPECT_TRUE(member(body, "id").isNull());
}

TEST_F(HttpAdapterTest, TooDeepBodyIs400WithoutStructuralDetail) {
    std::string deep = R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":)";
    deep += std::string(40, '[') + std::string(40, ']') + "}";
    auto res = adapter->Handle(makeRequest(http::verb::post, "/mcp", deep));
    EXPECT_EQ(res.result(), http::status::bad_request);
    auto body = parse(res.body());
    EXPECT_EQ(errorCodeOf(body), -32011);
    EXPECT_EQ(member(member(body, "error"), "message"), JSONValue{"Payload too complex"});
    EXPECT_EQ(res.body().find("maxJsonDepth"), std::string::npos);
    EXPECT_EQ(res.body().find("$.params"), std::string::npos);
}

TEST_F(HttpAdapterTest, InvalidEnvelopeIs400) {
    auto res = adapter->Handle(makeRequest(http::verb::post, "/mcp", R"({"jsonrpc":"1.0","id":3,"method":"initialize"})"));
    EXPECT_EQ(res.result(), http::status::bad_request);
    auto body = parse(res.body());
    EXPECT_EQ(errorCodeOf(body), -32600);
    EXPECT_EQ(std::get<int64_t>(member(body, "id").value), 3);
}

TEST_F(HttpAdapterTest, EmptyPostBodyIsParseError) {
    auto res = adapter->Handle(makeRequest(http::verb::post, "/mcp"));
    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(errorCodeOf(parse(res.body())), -32700);
}

TEST_F(HttpAdapterTest, GetServesMetadata) {
    auto res = adapter->Handle(makeRequest(http::verb::get, "/mcp"));
    EXPECT_EQ(res.result(), http::status::ok);
    expectSecurityHeaders(res);
    auto body = parse(res.body());
    EXPECT_EQ(member(body, "name"), JSONValue{"STRIDE GPT MCP Server"});
    EXPECT_EQ(member(body, "protocolVersion"), JSONValue{"2025-03-26"});
    const auto& listed = std::get<JSONValue::Array>(member(body, "tools").value);
    ASSERT_EQ(listed.size(), tools::StrideToolNames().size());
    for (size_t i = 0; i < listed.size(); ++i) {
        EXPECT_EQ(*listed[i], JSONValue{tools::StrideToolNames()[i]});
    }
    EXPECT_TRUE(member(member(body, "endpoints"), "POST /mcp").isString());
}

TEST_F(HttpAdapterTest, OptionsPreflight) {
    auto res = adapter->Handle(makeRequest(http::verb::options, "/mcp"));
    EXPECT_EQ(res.result(), http::status::no_content);
    expectSecurityHeaders(res);
    EXPECT_EQ(std::string(res[http::field::access_control_allow_methods]), "GET, POST, OPTIONS");
    EXPECT_NE(std::string(res[http::field::access_control_allow_headers]).find("Content-Type"), std::string::npos);
    EXPECT_TRUE(res.body().empty());
}

TEST_F(HttpAdapterTest, OtherPathIs404) {
    auto res = adapter->Handle(makeRequest(http::verb::post, "/other", R"({"jsonrpc":"2.0","id":1,"method":"initialize"})"));
    EXPECT_EQ(res.result(), http::status::not_found);
    expectSecurityHeaders(res);
    EXPECT_EQ(errorCodeOf(parse(res.body())), -32600);
}

TEST_F(HttpAdapterTest, OtherMethodIs405WithAllow) {
    auto res = adapter->Handle(makeRequest(http::verb::put, "/mcp", "{}"));
    EXPECT_EQ(res.result(), http::status::method_not_allowed);
    EXPECT_EQ(std::string(res[http::field::allow]), "GET, POST, OPTIONS");
    expectSecurityHeaders(res);
}

TEST_F(HttpAdapterTest, QueryStringIgnoredForRouting) {
    auto res = adapter->Handle(makeRequest(http::verb::get, "/mcp?check=1"));
    EXPECT_EQ(res.result(), http::status::ok);
}

TEST_F(HttpAdapterTest, StrideToolCallOverHttp) {
    auto res = adapter->Handle(makeRequest(http::verb::post, "/mcp",
        R"({"jsonrpc":"2.0","id":"t1","method":"tools/call","params":{"name":"get_stride_threat_framework","arguments":{"app_description":"Online store"}}})"));
    EXPECT_EQ(res.result(), http::status::ok);
    auto body = parse(res.body());
    EXPECT_EQ(member(body, "id"), JSONValue{"t1"});
    const auto& content = std::get<JSONValue::Array>(member(member(body, "result"), "content").value);
    ASSERT_EQ(content.size(), 1u);
    auto framework = parse(std::get<std::string>(member(*content[0], "text").value));
    EXPECT_TRUE(member(framework, "stride_framework").isObject());
}

TEST(HttpAdapter, CustomLimitsApply) {
    auto registry = std::make_shared<ToolRegistry>();
    auto router = std::shared_ptr<const IJsonRpcRouter>(MakeJsonRpcRouter(ServerInfo{}, registry, nullptr));
    HttpTransportAdapter::Options opts;
    opts.endpointPath = "rpc";
    opts.limits.maxArrayLength = 2;
    HttpTransportAdapter adapter(opts, ServerInfo{}, registry, router, nullptr);
    EXPECT_EQ(adapter.GetOptions().endpointPath, "/rpc");

    auto req = makeRequest(http::verb::post, "/rpc", R"({"jsonrpc":"2.0","id":1,"method":"tools/list","params":[1,2,3]})");
    auto res = adapter.Handle(req);
    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(errorCodeOf(parse(res.body())), -32011);
}

TEST(HttpAdapter, RouterFailureIs500AndSanitized) {
    auto registry = std::make_shared<ToolRegistry>();
    HttpTransportAdapter adapter(HttpTransportAdapter::Options{}, ServerInfo{}, registry,
                                 std::make_shared<const ThrowingRouter>(), nullptr);
    auto res = adapter.Handle(makeRequest(http::verb::post, "/mcp", R"({"jsonrpc":"2.0","id":1,"method":"initialize"})"));
    EXPECT_EQ(res.result(), http::status::internal_server_error);
    expectSecurityHeaders(res);
    EXPECT_EQ(res.body().find("exploded"), std::string::npos);
    EXPECT_EQ(res.body().find("/var/lib"), std::string::npos);
    auto body = parse(res.body());
    EXPECT_EQ(errorCodeOf(body), -32603);
    EXPECT_TRUE(member(member(member(body, "error"), "data"), "errorId").isString());
}

TEST(HttpAdapter, MakePayloadTooLargeResponse) {
    auto registry = std::make_shared<ToolRegistry>();
    auto router = std::shared_ptr<const IJsonRpcRouter>(MakeJsonRpcRouter(ServerInfo{}, registry, nullptr));
    HttpTransportAdapter adapter(HttpTransportAdapter::Options{}, ServerInfo{}, registry, router, nullptr);
    auto res = adapter.MakePayloadTooLargeResponse(11);
    EXPECT_EQ(res.result(), http::status::payload_too_large);
    EXPECT_FALSE(res.keep_alive());
    auto body = parse(res.body());
    EXPECT_EQ(member(body, "jsonrpc"), JSONValue{"2.0"});
    EXPECT_TRUE(member(body, "id").isNull());
    EXPECT_EQ(errorCodeOf(body), -32010);
    EXPECT_EQ(member(member(body, "error"), "message"), JSONValue{"Payload too large"});
}

TEST(HttpAdapter, RequiresRegistryAndRouter) {
    auto registry = std::make_shared<ToolRegistry>();
    EXPECT_THROW({ HttpTransportAdapter adapter(HttpTransportAdapter::Options{}, ServerInfo{}, registry, nullptr, nullptr); },
                 std::invalid_argument);
}
