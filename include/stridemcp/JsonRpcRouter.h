//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcRouter.h
// Purpose: Interface for JSON-RPC request routing (envelope checks and method dispatch)
//========================================================================================================

#pragma once

#include <memory>
#include <optional>

#include "stridemcp/JSONRPCTypes.h"
#include "stridemcp/Protocol.h"
#include "stridemcp/ToolRegistry.h"
#include "stridemcp/errors/ErrorSanitizer.h"
#include "stridemcp/errors/Errors.h"

namespace stridemcp {

//========================================================================================================
// RouteOutcome
// Purpose: The response envelope for one request, plus the error kind when the envelope is an error.
//          errorKind lets the transport choose a status code without re-reading the error object.
//========================================================================================================
struct RouteOutcome {
    JSONRPCResponse response;
    std::optional<errors::ErrorKind> errorKind;
};

class IJsonRpcRouter {
public:
    virtual ~IJsonRpcRouter() = default;

    // Routes one decoded request envelope and always produces a response envelope, including for
    // notifications (answered with id null). Never throws: failures inside routing are sanitized.
    virtual RouteOutcome route(const JSONValue& envelope) const = 0;
};

//========================================================================================================
// MakeJsonRpcRouter
// Purpose: Factory for the default router over a finished tool registry.
// Args:
//   serverInfo: Identity reported by initialize.
//   registry: Read-only tool registry shared with other components.
//   sanitizer: Converts handler and internal failures into public messages.
// Returns:
//   Router instance; stateless per request and safe to share across I/O threads.
//========================================================================================================
std::unique_ptr<IJsonRpcRouter> MakeJsonRpcRouter(ServerInfo serverInfo,
                                                  std::shared_ptr<const ToolRegistry> registry,
                                                  std::shared_ptr<const errors::ErrorSanitizer> sanitizer);

} // namespace stridemcp
