//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_http_server.cpp
// Purpose: GoogleTests for HTTPServer over real sockets (binding, request handling, oversized bodies)
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "stridemcp/HTTPServer.hpp"
#include "stridemcp/tools/StrideTools.h"

using namespace stridemcp;

namespace {

//==========================================================================================================
// httpRequest
// Purpose: Send a single HTTP request to 127.0.0.1 and capture the response (synchronously).
//==========================================================================================================
http::response<http::string_body> httpRequest(http::verb verb,
                                              unsigned short port,
                                              const std::string& target,
                                              const std::string& body = std::string()) {
    using boost::asio::ip::tcp;
    boost::asio::io_context ioc;
    tcp::resolver resolver{ioc};
    auto r = resolver.resolve("127.0.0.1", std::to_string(port));
    tcp::socket socket{ioc};
    boost::asio::connect(socket, r);

    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, "127.0.0.1");
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = body;
    }
    req.prepare_payload();
    http::write(socket, req);

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(socket, buffer, res);

    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);
    return res;
}

std::shared_ptr<const HttpTransportAdapter> makeAdapter() {
    auto registry = std::make_shared<ToolRegistry>();
    tools::RegisterStrideTools(*registry);
    auto sanitizer = std::make_shared<const errors::ErrorSanitizer>();
    std::shared_ptr<const IJsonRpcRouter> router = MakeJsonRpcRouter(ServerInfo{}, registry, sanitizer);
    return std::make_shared<const HttpTransportAdapter>(HttpTransportAdapter::Options{}, ServerInfo{},
                                                        registry, router, sanitizer);
}

HTTPServer::Options loopbackOptions(std::size_t threads = 1) {
    HTTPServer::Options opts;
    opts.address = "127.0.0.1";
    opts.port = "0";
    opts.threads = threads;
    return opts;
}

} // namespace

TEST(HTTPServer, ServesPostGetAndOptions) {
    HTTPServer server(loopbackOptions(), makeAdapter());
    ASSERT_NO_THROW(server.Start().get());
    const unsigned short port = server.BoundPort();
    ASSERT_NE(port, 0);

    auto post = httpRequest(http::verb::post, port, "/mcp",
                            R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})");
    EXPECT_EQ(post.result(), http::status::ok);
    EXPECT_NE(post.body().find("\"protocolVersion\":\"2025-03-26\""), std::string::npos);

    auto get = httpRequest(http::verb::get, port, "/mcp");
    EXPECT_EQ(get.result(), http::status::ok);
    EXPECT_NE(get.body().find("get_repository_analysis_guide"), std::string::npos);

    auto options = httpRequest(http::verb::options, port, "/mcp");
    EXPECT_EQ(options.result(), http::status::no_content);
    EXPECT_EQ(std::string(options[http::field::access_control_allow_origin]), "*");

    auto missing = httpRequest(http::verb::get, port, "/elsewhere");
    EXPECT_EQ(missing.result(), http::status::not_found);

    server.Stop().get();
}

TEST(HTTPServer, OversizedBodyReceives413) {
    HTTPServer server(loopbackOptions(), makeAdapter());
    ASSERT_NO_THROW(server.Start().get());

    std::string body = R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"x","arguments":{"blob":")";
    body.append(6u * 1024u * 1024u, 'A');
    body += "\"}}}";
    auto res = httpRequest(http::verb::post, server.BoundPort(), "/mcp", body);
    EXPECT_EQ(res.result(), http::status::payload_too_large);
    EXPECT_NE(res.body().find("-32010"), std::string::npos);
    EXPECT_NE(res.body().find("\"id\":null"), std::string::npos);

    // The server keeps accepting after refusing a body
    auto after = httpRequest(http::verb::post, server.BoundPort(), "/mcp",
                             R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
    EXPECT_EQ(after.result(), http::status::ok);

    server.Stop().get();
}

TEST(HTTPServer, ConcurrentRequestsOnSeveralThreads) {
    HTTPServer server(loopbackOptions(4), makeAdapter());
    ASSERT_NO_THROW(server.Start().get());
    const unsigned short port = server.BoundPort();

    std::atomic<int> ok{0};
    std::vector<std::thread> clients;
    for (int c = 0; c < 4; ++c) {
        clients.emplace_back([&ok, port, c]() {
            for (int i = 0; i < 5; ++i) {
                const std::string body = R"({"jsonrpc":"2.0","id":)" + std::to_string(c * 100 + i) +
                    R"(,"method":"tools/call","params":{"name":"get_stride_threat_framework","arguments":{"app_description":"Online store"}}})";
                auto res = httpRequest(http::verb::post, port, "/mcp", body);
                if (res.result() == http::status::ok &&
                    res.body().find("\"id\":" + std::to_string(c * 100 + i) + ",") != std::string::npos) {
                    ++ok;
                }
            }
        });
    }
    for (auto& t : clients) {
        t.join();
    }
    EXPECT_EQ(ok.load(), 20);
    server.Stop().get();
}

TEST(HTTPServer, InvalidPortFailsStart) {
    HTTPServer::Options opts = loopbackOptions();
    opts.port = "99999";
    HTTPServer server(opts, makeAdapter());
    auto fut = server.Start();
    EXPECT_THROW(fut.get(), std::invalid_argument);
    EXPECT_EQ(server.BoundPort(), 0);
}

TEST(HTTPServer, ConstructorRejectsBadConfiguration) {
    HTTPServer::Options opts = loopbackOptions();
    opts.scheme = "ftp";
    EXPECT_THROW({ HTTPServer server(opts, makeAdapter()); }, std::invalid_argument);

    opts.scheme = "http";
    EXPECT_THROW({ HTTPServer server(opts, nullptr); }, std::invalid_argument);

    opts.scheme = "https";
    opts.certFile = "/nonexistent/cert.pem";
    opts.keyFile = "/nonexistent/key.pem";
    EXPECT_ANY_THROW({ HTTPServer server(opts, makeAdapter()); });
}
