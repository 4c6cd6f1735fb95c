//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP tool-subset data structures and constants
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include "version.h"
#include <string>
#include <vector>

namespace stridemcp {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// MCP Protocol version reported by initialize
constexpr const char* PROTOCOL_VERSION = "2025-03-26";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

//==========================================================================================================
// ServerInfo
// Purpose: Static identity reported by initialize and by the GET metadata document.
//==========================================================================================================
struct ServerInfo {
    Implementation implementation{"STRIDE GPT MCP Server", getVersionString()};
    std::string description{"Professional threat modeling server using the STRIDE methodology"};
    std::string instructions{"Professional threat modeling server using the STRIDE methodology."};
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
struct ToolsCapability {
    bool listChanged = false;
};

struct ServerCapabilities {
    ToolsCapability tools;
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Tool structures
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}
};

struct CallToolResult {
    std::vector<JSONValue> content;  // Array of content items
    bool isError = false;
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
}

} // namespace stridemcp
