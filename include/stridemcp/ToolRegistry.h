//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Closed mapping from tool name to descriptor (metadata + handler)
//==========================================================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "stridemcp/Protocol.h"

namespace stridemcp {

//==========================================================================================================
// ToolHandler
// Purpose: Synchronous, side-effect free tool body. Receives the (schema-checked) arguments object.
//          A string result is sent verbatim as text; any other result is serialized to JSON text.
//          Throw errors::ToolArgumentError for caller mistakes the schema cannot express; any
//          other exception is treated as an execution failure and sanitized.
//==========================================================================================================
using ToolHandler = std::function<JSONValue(const JSONValue& arguments)>;

struct ToolDescriptor {
    Tool tool;
    ToolHandler handler;
};

//==========================================================================================================
// ToolRegistry
// Purpose: Built once at startup, then shared read-only (std::shared_ptr<const ToolRegistry>).
//          Lookups are safe from any number of threads once registration is finished.
//==========================================================================================================
class ToolRegistry {
public:
    ToolRegistry() = default;

    //==========================================================================================================
    // Register
    // Purpose: Add a tool.
    // Args:
    //   descriptor: Tool metadata and handler.
    // Throws:
    //   std::invalid_argument on an empty name, a duplicate name or a missing handler.
    //==========================================================================================================
    void Register(ToolDescriptor descriptor);

    // Convenience overload.
    void Register(const std::string& name, const std::string& description, JSONValue inputSchema, ToolHandler handler);

    // Returns the descriptor for name, or nullptr when no such tool is registered.
    const ToolDescriptor* Lookup(const std::string& name) const;

    // Every registered tool, in registration order.
    const std::vector<ToolDescriptor>& ListAll() const { return descriptors; }

    std::size_t Size() const { return descriptors.size(); }

private:
    std::vector<ToolDescriptor> descriptors;
    std::unordered_map<std::string, std::size_t> indexByName;
};

} // namespace stridemcp
