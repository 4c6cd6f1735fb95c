//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ErrorSanitizer.cpp
// Purpose: Converts internal exceptions into correlation-labelled public error messages
//==========================================================================================================

#include "stridemcp/errors/ErrorSanitizer.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <new>
#include <sstream>
#include <typeinfo>

#include <boost/core/demangle.hpp>
#include <boost/stacktrace.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "logging/Logger.h"

namespace stridemcp {
namespace errors {

namespace {

std::string newErrorId() {
    try {
        thread_local boost::uuids::random_generator gen;
        return boost::uuids::to_string(gen());
    } catch (const std::exception& e) {
        // Entropy source unavailable; fall back to a process-unique token
        static std::atomic<std::uint64_t> counter{0};
        const auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
        std::ostringstream oss;
        oss << "err-" << std::hex << ticks << "-" << counter.fetch_add(1);
        LOG_WARN("UUID generation failed ({}); using fallback token {}", e.what(), oss.str());
        return oss.str();
    }
}

struct ExceptionInfo {
    std::string typeName;
    std::string message;
};

ExceptionInfo describe(std::exception_ptr error) {
    ExceptionInfo info{"<none>", ""};
    if (!error) {
        return info;
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        info.typeName = boost::core::demangle(typeid(e).name());
        info.message = e.what();
    } catch (...) {
        // Non-std exceptions carry no type information we can report
        info.typeName = "<non-standard exception>";
    }
    return info;
}

void completeFallback(SanitizedError& out) noexcept {
    try {
        if (out.errorId.empty()) {
            out.errorId = "unavailable";
        }
        if (out.publicMessage.empty()) {
            out.publicMessage = ErrorSanitizer::PublicMessageFor(out.kind, out.errorId);
        }
    } catch (const std::bad_alloc&) {
        out.publicMessage.clear();
    }
}

} // namespace

ErrorSanitizer::ErrorSanitizer(RecordObserver observer) : observer(std::move(observer)) {}

std::string ErrorSanitizer::PublicMessageFor(ErrorKind kind, const std::string& errorId) {
    switch (kind) {
        case ErrorKind::ToolExecutionFailed:
            return "The tool failed to complete the request. Reference: " + errorId;
        case ErrorKind::Internal:
        default:
            return "An internal error occurred while processing your request. Reference: " + errorId;
    }
}

SanitizedError ErrorSanitizer::Sanitize(std::exception_ptr error, ErrorKind kind, std::string_view context) const noexcept {
    FUNC_SCOPE();
    if (kind != ErrorKind::ToolExecutionFailed) {
        kind = ErrorKind::Internal;
    }
    SanitizedError out;
    out.kind = kind;
    try {
        ErrorRecord record;
        record.errorId = newErrorId();
        record.kind = kind;
        record.context = std::string(context);
        record.publicMessage = PublicMessageFor(kind, record.errorId);

        const ExceptionInfo info = describe(error);
        std::ostringstream detail;
        detail << "type=" << info.typeName << " message=" << info.message << "\n"
               << boost::stacktrace::stacktrace();
        record.internalDetail = detail.str();

        LOG_ERROR("[{}] {} failure in {}: {}: {}", record.errorId, toString(kind), record.context,
                  info.typeName, info.message);
        LOG_ERROR("[{}] stack trace:\n{}", record.errorId, record.internalDetail);

        out.errorId = record.errorId;
        out.publicMessage = record.publicMessage;

        if (observer) {
            observer(record);
        }
    } catch (const std::exception& e) {
        // Allocation, logging or the observer failed; still hand back a usable public message
        completeFallback(out);
        std::cerr << "[ERROR] ErrorSanitizer: failed to record error " << out.errorId << ": " << e.what() << std::endl;
    } catch (...) {
        completeFallback(out);
        std::cerr << "[ERROR] ErrorSanitizer: failed to record error " << out.errorId
                  << ": non-standard exception" << std::endl;
    }
    return out;
}

} // namespace errors
} // namespace stridemcp
