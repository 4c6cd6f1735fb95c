//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaValidator.h
// Purpose: Structural validation of tool arguments against a declared input schema
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "stridemcp/JSONRPCTypes.h"

namespace stridemcp {
namespace validation {

//==========================================================================================================
// ValidateArguments
// Purpose: Check tool arguments against the subset of JSON Schema used by tool descriptors:
//          "type" (string, integer, number, boolean, array, object, null), "required", "enum",
//          "items", nested "properties" and "additionalProperties": false. Other keywords
//          ("description", "default", ...) are ignored.
// Args:
//   args: The tools/call arguments value.
//   schema: The tool's inputSchema.
// Returns:
//   std::nullopt when args conform; otherwise a description of the first violation, naming the
//   offending path (e.g. "arguments.threats[2]: expected object").
//==========================================================================================================
std::optional<std::string> ValidateArguments(const JSONValue& args, const JSONValue& schema);

} // namespace validation
} // namespace stridemcp
