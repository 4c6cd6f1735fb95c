//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Error taxonomy, typed errors and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "stridemcp/JSONRPCTypes.h"

namespace stridemcp {
namespace errors {

//==========================================================================================================
// ErrorKind
// Purpose: Every failure the request pipeline can report. Validation kinds never reach the router;
//          router kinds carry no sensitive detail; ToolExecutionFailed and Internal are sanitized.
//==========================================================================================================
enum class ErrorKind {
    PayloadTooLarge,
    MalformedJSON,
    PayloadTooComplex,
    InvalidRequestEnvelope,
    MethodNotFound,
    ToolNotFound,
    InvalidToolArguments,
    ToolExecutionFailed,
    Internal
};

inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PayloadTooLarge: return "PayloadTooLarge";
        case ErrorKind::MalformedJSON: return "MalformedJSON";
        case ErrorKind::PayloadTooComplex: return "PayloadTooComplex";
        case ErrorKind::InvalidRequestEnvelope: return "InvalidRequestEnvelope";
        case ErrorKind::MethodNotFound: return "MethodNotFound";
        case ErrorKind::ToolNotFound: return "ToolNotFound";
        case ErrorKind::InvalidToolArguments: return "InvalidToolArguments";
        case ErrorKind::ToolExecutionFailed: return "ToolExecutionFailed";
        case ErrorKind::Internal:
        default: return "Internal";
    }
}

// JSON-RPC error code reported for each kind.
inline int errorCodeFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PayloadTooLarge: return JSONRPCErrorCodes::PayloadTooLarge;
        case ErrorKind::MalformedJSON: return JSONRPCErrorCodes::ParseError;
        case ErrorKind::PayloadTooComplex: return JSONRPCErrorCodes::PayloadTooComplex;
        case ErrorKind::InvalidRequestEnvelope: return JSONRPCErrorCodes::InvalidRequest;
        case ErrorKind::MethodNotFound: return JSONRPCErrorCodes::MethodNotFound;
        case ErrorKind::ToolNotFound: return JSONRPCErrorCodes::ToolNotFound;
        case ErrorKind::InvalidToolArguments: return JSONRPCErrorCodes::InvalidParams;
        case ErrorKind::ToolExecutionFailed:
        case ErrorKind::Internal:
        default: return JSONRPCErrorCodes::InternalError;
    }
}

// Typed error representation used when building error envelopes.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
};

inline McpError makeError(ErrorKind kind, std::string message, std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.code = errorCodeFor(kind);
    e.message = std::move(message);
    e.data = std::move(data);
    return e;
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

//==========================================================================================================
// ToolArgumentError
// Purpose: Thrown by tool handlers for arguments that pass the schema but are still unusable.
//          The router reports it as InvalidParams with what() as the message, so the text must be
//          written for the caller.
//==========================================================================================================
class ToolArgumentError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace errors
} // namespace stridemcp
