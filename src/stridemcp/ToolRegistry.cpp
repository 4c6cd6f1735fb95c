//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: Closed mapping from tool name to descriptor (metadata + handler)
//==========================================================================================================

#include "stridemcp/ToolRegistry.h"

#include <stdexcept>

#include "logging/Logger.h"

namespace stridemcp {

void ToolRegistry::Register(ToolDescriptor descriptor) {
    FUNC_SCOPE();
    if (descriptor.tool.name.empty()) {
        throw std::invalid_argument("Tool name must not be empty");
    }
    if (!descriptor.handler) {
        throw std::invalid_argument("Tool '" + descriptor.tool.name + "' has no handler");
    }
    if (indexByName.count(descriptor.tool.name) != 0) {
        throw std::invalid_argument("Tool '" + descriptor.tool.name + "' is already registered");
    }
    if (!descriptor.tool.inputSchema.isObject()) {
        // Tools without a declared schema accept any arguments object
        JSONValue::Object schema;
        schema["type"] = std::make_shared<JSONValue>("object");
        descriptor.tool.inputSchema = JSONValue{std::move(schema)};
    }
    LOG_DEBUG("Registering tool: {}", descriptor.tool.name);
    indexByName.emplace(descriptor.tool.name, descriptors.size());
    descriptors.push_back(std::move(descriptor));
}

void ToolRegistry::Register(const std::string& name, const std::string& description, JSONValue inputSchema, ToolHandler handler) {
    Register(ToolDescriptor{Tool(name, description, std::move(inputSchema)), std::move(handler)});
}

const ToolDescriptor* ToolRegistry::Lookup(const std::string& name) const {
    auto it = indexByName.find(name);
    if (it == indexByName.end()) {
        return nullptr;
    }
    return &descriptors[it->second];
}

} // namespace stridemcp
