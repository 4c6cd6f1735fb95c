//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PayloadValidator.h
// Purpose: Bounded decoding of untrusted JSON request bodies
//==========================================================================================================

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "stridemcp/JSONRPCTypes.h"
#include "stridemcp/errors/Errors.h"

namespace stridemcp {
namespace validation {

// Deepest nesting the recursive decoder will follow; larger maxJsonDepth values are enforced as this.
constexpr std::size_t kMaxSupportedJsonDepth = 512u;

//==========================================================================================================
// ValidationLimits
// Purpose: Process-wide structural limits for inbound payloads.
// Fields:
//   maxPayloadBytes: Raw body size limit, checked before decoding.
//   maxJsonDepth: Maximum number of nested containers (the root object counts as 1), at most
//                 kMaxSupportedJsonDepth.
//   maxObjectKeys: Maximum members per object.
//   maxArrayLength: Maximum elements per array.
//   maxStringLength: Maximum code points per string, object keys included.
//==========================================================================================================
struct ValidationLimits {
    std::size_t maxPayloadBytes{5u * 1024u * 1024u};
    std::size_t maxJsonDepth{32u};
    std::size_t maxObjectKeys{1000u};
    std::size_t maxArrayLength{10000u};
    std::size_t maxStringLength{1000000u};
};

//==========================================================================================================
// ValidationFailure
// Purpose: Why a payload was rejected. constraint, path and detail are for server logs only;
//          clients see PublicMessage(kind).
//==========================================================================================================
struct ValidationFailure {
    errors::ErrorKind kind{errors::ErrorKind::MalformedJSON};
    std::string constraint;  // e.g. "maxArrayLength"; empty for syntax failures
    std::string path;        // JSON path of the offending node, e.g. "$.params.arguments[3]"; keys escaped, cut at 64 bytes
    std::size_t depth{0};    // container depth at the point of failure
    std::size_t offset{0};   // byte offset into the payload
    std::string detail;
};

//==========================================================================================================
// ValidationResult
// Purpose: Either a decoded document or a failure; exactly one is set.
//==========================================================================================================
struct ValidationResult {
    std::optional<JSONValue> document;
    std::optional<ValidationFailure> failure;

    bool ok() const { return document.has_value(); }
};

//==========================================================================================================
// ValidatePayload
// Purpose: Decode raw bytes into a JSONValue while enforcing every limit in a single pass. Decoding
//          stops at the first violation, so the work done for a hostile payload is bounded by the
//          limits rather than by the payload.
// Args:
//   raw: Request body bytes.
//   limits: Structural limits to enforce.
// Returns:
//   ValidationResult with either the document or the first failure.
//==========================================================================================================
ValidationResult ValidatePayload(std::string_view raw, const ValidationLimits& limits);

// Generic client-facing message for a validation failure kind.
const char* PublicMessage(errors::ErrorKind kind);

// One-line description of a failure for the server log (includes the path).
std::string DescribeFailure(const ValidationFailure& failure);

} // namespace validation
} // namespace stridemcp
