//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcRouter.cpp
// Purpose: Default implementation for JSON-RPC request routing
//========================================================================================================

#include <exception>
#include <string>
#include <utility>

#include "logging/Logger.h"
#include "stridemcp/JsonRpcRouter.h"
#include "stridemcp/validation/SchemaValidator.h"

namespace stridemcp {

using errors::ErrorKind;

namespace {

// Outcome of reading the request envelope: either a request or the reason it is invalid.
struct EnvelopeReadResult {
    std::optional<JSONRPCRequest> request;
    JSONRPCId recoveredId{nullptr};
    std::string reason;
};

std::optional<JSONRPCId> idFromValue(const JSONValue& v) {
    if (std::holds_alternative<std::string>(v.value)) return JSONRPCId{std::get<std::string>(v.value)};
    if (std::holds_alternative<int64_t>(v.value)) return JSONRPCId{std::get<int64_t>(v.value)};
    if (std::holds_alternative<double>(v.value)) return JSONRPCId{std::get<double>(v.value)};
    if (v.isNull()) return JSONRPCId{nullptr};
    return std::nullopt;
}

EnvelopeReadResult readEnvelope(const JSONValue& envelope) {
    EnvelopeReadResult out;
    if (!envelope.isObject()) {
        out.reason = "request must be a JSON object";
        return out;
    }

    std::optional<JSONRPCId> id;
    if (const JSONValue* idVal = FindMember(envelope, "id")) {
        id = idFromValue(*idVal);
        if (!id.has_value()) {
            out.reason = "id must be a string, a number or null";
            return out;
        }
        out.recoveredId = id.value();
    }

    const JSONValue* version = FindMember(envelope, "jsonrpc");
    if (version == nullptr || !version->isString() || std::get<std::string>(version->value) != "2.0") {
        out.reason = "jsonrpc must be \"2.0\"";
        return out;
    }

    const JSONValue* method = FindMember(envelope, "method");
    if (method == nullptr || !method->isString() || std::get<std::string>(method->value).empty()) {
        out.reason = "method must be a non-empty string";
        return out;
    }

    std::optional<JSONValue> params;
    if (const JSONValue* p = FindMember(envelope, "params")) {
        if (!p->isObject() && !p->isArray()) {
            out.reason = "params must be an object or an array";
            return out;
        }
        params = *p;
    }

    JSONRPCRequest request;
    request.id = std::move(id);
    request.method = std::get<std::string>(method->value);
    request.params = std::move(params);
    out.request = std::move(request);
    return out;
}

JSONValue toolToJSON(const Tool& tool) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(tool.name);
    obj["description"] = std::make_shared<JSONValue>(tool.description);
    obj["inputSchema"] = std::make_shared<JSONValue>(tool.inputSchema);
    return JSONValue{std::move(obj)};
}

JSONValue callToolResultToJSON(const CallToolResult& r) {
    JSONValue::Array content;
    for (const auto& item : r.content) {
        content.push_back(std::make_shared<JSONValue>(item));
    }
    JSONValue::Object obj;
    obj["content"] = std::make_shared<JSONValue>(std::move(content));
    obj["isError"] = std::make_shared<JSONValue>(r.isError);
    return JSONValue{std::move(obj)};
}

JSONValue textContent(std::string text) {
    JSONValue::Object item;
    item["type"] = std::make_shared<JSONValue>("text");
    item["text"] = std::make_shared<JSONValue>(std::move(text));
    return JSONValue{std::move(item)};
}

class JsonRpcRouter : public IJsonRpcRouter {
public:
    JsonRpcRouter(ServerInfo info,
                  std::shared_ptr<const ToolRegistry> registry,
                  std::shared_ptr<const errors::ErrorSanitizer> sanitizer)
        : serverInfo(std::move(info)), registry(std::move(registry)), sanitizer(std::move(sanitizer)) {
        if (!this->registry) {
            throw std::invalid_argument("JsonRpcRouter requires a tool registry");
        }
        if (!this->sanitizer) {
            this->sanitizer = std::make_shared<const errors::ErrorSanitizer>();
        }
    }

    RouteOutcome route(const JSONValue& envelope) const override {
        FUNC_SCOPE();
        JSONRPCId id{nullptr};
        std::string method;
        try {
            EnvelopeReadResult read = readEnvelope(envelope);
            id = read.recoveredId;
            if (!read.request.has_value()) {
                LOG_WARN("Router: invalid request envelope: {}", read.reason);
                JSONValue::Object data;
                data["reason"] = std::make_shared<JSONValue>(read.reason);
                return error(id, ErrorKind::InvalidRequestEnvelope, "Invalid Request", JSONValue{std::move(data)});
            }
            const JSONRPCRequest& request = read.request.value();
            method = request.method;
            if (request.IsNotification()) {
                LOG_DEBUG("Router: notification for {} will be answered with id null", method);
            }

            if (method == Methods::Initialize) {
                return success(id, handleInitialize());
            }
            if (method == Methods::ListTools) {
                return success(id, handleToolsList());
            }
            if (method == Methods::CallTool) {
                return handleToolsCall(id, request.params);
            }
            LOG_DEBUG("Router: method not found: {}", method);
            return error(id, ErrorKind::MethodNotFound, "Method not found");
        } catch (...) {
            const auto sanitized = sanitizer->Sanitize(std::current_exception(), ErrorKind::Internal,
                                                      method.empty() ? std::string("router") : "router: " + method);
            return sanitizedError(id, sanitized);
        }
    }

private:
    ServerInfo serverInfo;
    std::shared_ptr<const ToolRegistry> registry;
    std::shared_ptr<const errors::ErrorSanitizer> sanitizer;

    static RouteOutcome success(const JSONRPCId& id, JSONValue result) {
        RouteOutcome out;
        out.response.id = id;
        out.response.result = std::move(result);
        return out;
    }

    static RouteOutcome error(const JSONRPCId& id, ErrorKind kind, std::string message,
                              std::optional<JSONValue> data = std::nullopt) {
        RouteOutcome out;
        out.response.id = id;
        out.response.error = errors::makeErrorValue(errors::makeError(kind, std::move(message), std::move(data)));
        out.errorKind = kind;
        return out;
    }

    static RouteOutcome sanitizedError(const JSONRPCId& id, const errors::SanitizedError& sanitized) {
        JSONValue::Object data;
        data["errorId"] = std::make_shared<JSONValue>(sanitized.errorId);
        return error(id, sanitized.kind, sanitized.publicMessage, JSONValue{std::move(data)});
    }

    JSONValue handleInitialize() const {
        JSONValue::Object toolsCap;
        toolsCap["listChanged"] = std::make_shared<JSONValue>(ServerCapabilities{}.tools.listChanged);
        JSONValue::Object capabilities;
        capabilities["tools"] = std::make_shared<JSONValue>(std::move(toolsCap));

        JSONValue::Object info;
        info["name"] = std::make_shared<JSONValue>(serverInfo.implementation.name);
        info["version"] = std::make_shared<JSONValue>(serverInfo.implementation.version);

        JSONValue::Object result;
        result["protocolVersion"] = std::make_shared<JSONValue>(PROTOCOL_VERSION);
        result["capabilities"] = std::make_shared<JSONValue>(std::move(capabilities));
        result["serverInfo"] = std::make_shared<JSONValue>(std::move(info));
        result["instructions"] = std::make_shared<JSONValue>(serverInfo.instructions);
        return JSONValue{std::move(result)};
    }

    JSONValue handleToolsList() const {
        JSONValue::Array tools;
        for (const auto& descriptor : registry->ListAll()) {
            tools.push_back(std::make_shared<JSONValue>(toolToJSON(descriptor.tool)));
        }
        JSONValue::Object result;
        result["tools"] = std::make_shared<JSONValue>(std::move(tools));
        return JSONValue{std::move(result)};
    }

    RouteOutcome handleToolsCall(const JSONRPCId& id, const std::optional<JSONValue>& params) const {
        if (!params.has_value() || !params->isObject()) {
            return error(id, ErrorKind::InvalidToolArguments, "tools/call requires a params object");
        }
        const JSONValue* nameVal = FindMember(params.value(), "name");
        if (nameVal == nullptr || !nameVal->isString() || std::get<std::string>(nameVal->value).empty()) {
            return error(id, ErrorKind::InvalidToolArguments, "tools/call requires a tool name");
        }
        const std::string& name = std::get<std::string>(nameVal->value);

        const ToolDescriptor* descriptor = registry->Lookup(name);
        if (descriptor == nullptr) {
            LOG_INFO("Router: tools/call for unknown tool '{}'", name);
            return error(id, ErrorKind::ToolNotFound, "Tool not found");
        }

        JSONValue arguments{JSONValue::Object{}};
        if (const JSONValue* argVal = FindMember(params.value(), "arguments")) {
            if (!argVal->isNull()) {
                if (!argVal->isObject()) {
                    return error(id, ErrorKind::InvalidToolArguments, "arguments must be an object");
                }
                arguments = *argVal;
            }
        }

        if (auto violation = validation::ValidateArguments(arguments, descriptor->tool.inputSchema)) {
            LOG_DEBUG("Router: arguments for '{}' rejected: {}", name, violation.value());
            return error(id, ErrorKind::InvalidToolArguments, "Invalid arguments: " + violation.value());
        }

        JSONValue handlerResult;
        try {
            handlerResult = descriptor->handler(arguments);
        } catch (const errors::ToolArgumentError& e) {
            LOG_DEBUG("Router: tool '{}' rejected its arguments: {}", name, e.what());
            return error(id, ErrorKind::InvalidToolArguments, e.what());
        } catch (...) {
            const auto sanitized = sanitizer->Sanitize(std::current_exception(), ErrorKind::ToolExecutionFailed,
                                                      "tools/call: " + name);
            return sanitizedError(id, sanitized);
        }

        CallToolResult callResult;
        if (handlerResult.isString()) {
            callResult.content.push_back(textContent(std::get<std::string>(handlerResult.value)));
        } else {
            callResult.content.push_back(textContent(SerializeJSON(handlerResult)));
        }
        callResult.isError = false;
        return success(id, callToolResultToJSON(callResult));
    }
};

} // namespace

std::unique_ptr<IJsonRpcRouter> MakeJsonRpcRouter(ServerInfo serverInfo,
                                                  std::shared_ptr<const ToolRegistry> registry,
                                                  std::shared_ptr<const errors::ErrorSanitizer> sanitizer) {
    return std::make_unique<JsonRpcRouter>(std::move(serverInfo), std::move(registry), std::move(sanitizer));
}

} // namespace stridemcp
