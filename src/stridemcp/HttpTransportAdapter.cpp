//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpTransportAdapter.cpp
// Purpose: HTTP policy layer between Boost.Beast messages and the JSON-RPC router
//==========================================================================================================

#include "stridemcp/HttpTransportAdapter.h"

#include <exception>
#include <stdexcept>
#include <utility>

#include "logging/Logger.h"

namespace stridemcp {

using errors::ErrorKind;

namespace {

constexpr const char* kAllowedMethods = "GET, POST, OPTIONS";
constexpr const char* kAllowedHeaders = "Content-Type, Authorization, Mcp-Session-Id";

void applyStandardHeaders(http::response<http::string_body>& res) {
    res.set(http::field::access_control_allow_origin, "*");
    res.set("X-Content-Type-Options", "nosniff");
    res.set("X-Frame-Options", "DENY");
    res.set("X-XSS-Protection", "1; mode=block");
    res.keep_alive(false);
}

http::response<http::string_body> jsonResponse(http::status status, unsigned version, std::string body) {
    http::response<http::string_body> res{status, version};
    applyStandardHeaders(res);
    res.set(http::field::content_type, "application/json");
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

std::string errorBody(ErrorKind kind, const std::string& message, const std::optional<JSONValue>& data = std::nullopt) {
    return errors::makeErrorResponse(nullptr, errors::makeError(kind, message, data))->Serialize();
}

http::status statusForValidationFailure(ErrorKind kind) {
    return kind == ErrorKind::PayloadTooLarge ? http::status::payload_too_large : http::status::bad_request;
}

std::string pathOf(boost::beast::string_view target) {
    std::string path(target.data(), target.size());
    auto q = path.find('?');
    if (q != std::string::npos) {
        path.erase(q);
    }
    return path;
}

} // namespace

HttpTransportAdapter::HttpTransportAdapter(Options o,
                                           ServerInfo info,
                                           std::shared_ptr<const ToolRegistry> reg,
                                           std::shared_ptr<const IJsonRpcRouter> rtr,
                                           std::shared_ptr<const errors::ErrorSanitizer> san)
    : opts(std::move(o)), serverInfo(std::move(info)), registry(std::move(reg)),
      router(std::move(rtr)), sanitizer(std::move(san)) {
    if (!registry || !router) {
        throw std::invalid_argument("HttpTransportAdapter requires a tool registry and a router");
    }
    if (!sanitizer) {
        sanitizer = std::make_shared<const errors::ErrorSanitizer>();
    }
    if (opts.endpointPath.empty() || opts.endpointPath.front() != '/') {
        opts.endpointPath = "/" + opts.endpointPath;
    }
}

JSONValue HttpTransportAdapter::Metadata() const {
    JSONValue::Array toolNames;
    for (const auto& descriptor : registry->ListAll()) {
        toolNames.push_back(std::make_shared<JSONValue>(descriptor.tool.name));
    }
    JSONValue::Object endpoints;
    endpoints["POST " + opts.endpointPath] = std::make_shared<JSONValue>("MCP JSON-RPC endpoint");
    endpoints["GET " + opts.endpointPath] = std::make_shared<JSONValue>("Server metadata");
    endpoints["OPTIONS " + opts.endpointPath] = std::make_shared<JSONValue>("CORS preflight");

    JSONValue::Object doc;
    doc["name"] = std::make_shared<JSONValue>(serverInfo.implementation.name);
    doc["version"] = std::make_shared<JSONValue>(serverInfo.implementation.version);
    doc["protocolVersion"] = std::make_shared<JSONValue>(PROTOCOL_VERSION);
    doc["description"] = std::make_shared<JSONValue>(serverInfo.description);
    doc["tools"] = std::make_shared<JSONValue>(std::move(toolNames));
    doc["endpoints"] = std::make_shared<JSONValue>(std::move(endpoints));
    return JSONValue{std::move(doc)};
}

http::response<http::string_body> HttpTransportAdapter::MakePayloadTooLargeResponse(unsigned version) const {
    return jsonResponse(http::status::payload_too_large, version,
                        errorBody(ErrorKind::PayloadTooLarge, validation::PublicMessage(ErrorKind::PayloadTooLarge)));
}

http::response<http::string_body> HttpTransportAdapter::Handle(const http::request<http::string_body>& req) const {
    FUNC_SCOPE();
    try {
        const std::string path = pathOf(req.target());
        if (path != opts.endpointPath) {
            LOG_DEBUG("HTTP {} {} -> 404", std::string(req.method_string()), path);
            return jsonResponse(http::status::not_found, req.version(),
                                errorBody(ErrorKind::InvalidRequestEnvelope, "Not found"));
        }

        switch (req.method()) {
            case http::verb::options: {
                http::response<http::string_body> res{http::status::no_content, req.version()};
                applyStandardHeaders(res);
                res.set(http::field::access_control_allow_methods, kAllowedMethods);
                res.set(http::field::access_control_allow_headers, kAllowedHeaders);
                res.prepare_payload();
                return res;
            }
            case http::verb::get:
                return jsonResponse(http::status::ok, req.version(), SerializeJSON(Metadata()));
            case http::verb::post:
                return handlePost(req);
            default: {
                LOG_DEBUG("HTTP {} {} -> 405", std::string(req.method_string()), path);
                auto res = jsonResponse(http::status::method_not_allowed, req.version(),
                                        errorBody(ErrorKind::InvalidRequestEnvelope, "Method not allowed"));
                res.set(http::field::allow, kAllowedMethods);
                return res;
            }
        }
    } catch (...) {
        const auto sanitized = sanitizer->Sanitize(std::current_exception(), ErrorKind::Internal, "HTTP request handling");
        JSONValue::Object data;
        data["errorId"] = std::make_shared<JSONValue>(sanitized.errorId);
        return jsonResponse(http::status::internal_server_error, req.version(),
                            errorBody(ErrorKind::Internal, sanitized.publicMessage, JSONValue{std::move(data)}));
    }
}

http::response<http::string_body> HttpTransportAdapter::handlePost(const http::request<http::string_body>& req) const {
    const validation::ValidationResult validated = validation::ValidatePayload(req.body(), opts.limits);
    if (!validated.ok()) {
        const validation::ValidationFailure& failure = validated.failure.value();
        LOG_WARN("Rejected request body: {}", validation::DescribeFailure(failure));
        return jsonResponse(statusForValidationFailure(failure.kind), req.version(),
                            errorBody(failure.kind, validation::PublicMessage(failure.kind)));
    }

    const RouteOutcome outcome = router->route(validated.document.value());
    const http::status status =
        (outcome.errorKind == ErrorKind::InvalidRequestEnvelope) ? http::status::bad_request : http::status::ok;
    return jsonResponse(status, req.version(), outcome.response.Serialize());
}

} // namespace stridemcp
