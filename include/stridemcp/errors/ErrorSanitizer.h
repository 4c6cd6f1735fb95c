//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ErrorSanitizer.h
// Purpose: Converts internal exceptions into correlation-labelled public error messages
//==========================================================================================================

#pragma once

#include <exception>
#include <functional>
#include <string>
#include <string_view>

#include "stridemcp/errors/Errors.h"

namespace stridemcp {
namespace errors {

//==========================================================================================================
// ErrorRecord
// Purpose: Everything known about one sanitized failure. internalDetail stays inside the process
//          (server log and observers); only errorId and publicMessage are sent to clients.
//==========================================================================================================
struct ErrorRecord {
    std::string errorId;
    ErrorKind kind{ErrorKind::Internal};
    std::string context;
    std::string publicMessage;
    std::string internalDetail;   // demangled type name, message and stack trace
};

// Client-safe part of an ErrorRecord.
struct SanitizedError {
    std::string errorId;
    std::string publicMessage;
    ErrorKind kind{ErrorKind::Internal};
};

//==========================================================================================================
// ErrorSanitizer
// Purpose: Logs full exception detail at ERROR level under a fresh UUID and returns a fixed public
//          message that references the UUID. The public message never contains anything taken from
//          the exception.
//==========================================================================================================
class ErrorSanitizer {
public:
    using RecordObserver = std::function<void(const ErrorRecord&)>;

    ErrorSanitizer() = default;
    explicit ErrorSanitizer(RecordObserver observer);

    //==========================================================================================================
    // Sanitize
    // Purpose: Record an exception and produce its client-safe representation.
    // Args:
    //   error: The captured exception (std::current_exception() in a catch block). May be null.
    //   kind: ToolExecutionFailed for handler failures, Internal for everything else.
    //   context: Short label of where the failure happened, e.g. "tools/call: generate_threat_report".
    // Returns:
    //   SanitizedError with the correlation token and the public message.
    //==========================================================================================================
    SanitizedError Sanitize(std::exception_ptr error, ErrorKind kind, std::string_view context) const noexcept;

    // Fixed public message for a kind, with the correlation token appended.
    static std::string PublicMessageFor(ErrorKind kind, const std::string& errorId);

private:
    RecordObserver observer;
};

} // namespace errors
} // namespace stridemcp
