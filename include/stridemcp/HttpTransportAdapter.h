//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpTransportAdapter.h
// Purpose: HTTP policy layer between Boost.Beast messages and the JSON-RPC router
//==========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <boost/beast/http.hpp>

#include "stridemcp/JsonRpcRouter.h"
#include "stridemcp/Protocol.h"
#include "stridemcp/ToolRegistry.h"
#include "stridemcp/errors/ErrorSanitizer.h"
#include "stridemcp/validation/PayloadValidator.h"

namespace stridemcp {

namespace http = boost::beast::http;

//==========================================================================================================
// HttpTransportAdapter
// Purpose: Applies transport policy to one HTTP exchange: endpoint and method routing, CORS and
//          security headers, bounded payload decoding, router invocation and status mapping.
//          Holds only read-only state, so one instance serves every I/O thread.
//==========================================================================================================
class HttpTransportAdapter {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   endpointPath: Path serving GET (metadata), POST (JSON-RPC) and OPTIONS (preflight).
    //   limits: Payload limits applied to POST bodies.
    //==========================================================================================================
    struct Options {
        std::string endpointPath{"/mcp"};
        validation::ValidationLimits limits;
    };

    HttpTransportAdapter(Options opts,
                         ServerInfo serverInfo,
                         std::shared_ptr<const ToolRegistry> registry,
                         std::shared_ptr<const IJsonRpcRouter> router,
                         std::shared_ptr<const errors::ErrorSanitizer> sanitizer);

    //==========================================================================================================
    // Handle
    // Purpose: Produce the complete response for a request. Never throws; adapter failures become a
    //          500 response with a sanitized JSON-RPC error body.
    //==========================================================================================================
    http::response<http::string_body> Handle(const http::request<http::string_body>& req) const;

    //==========================================================================================================
    // MakePayloadTooLargeResponse
    // Purpose: 413 response used when the HTTP layer refuses a body before it is read in full.
    // Args:
    //   version: HTTP version of the request (11 for HTTP/1.1).
    //==========================================================================================================
    http::response<http::string_body> MakePayloadTooLargeResponse(unsigned version) const;

    const Options& GetOptions() const { return opts; }

    // Static metadata document served on GET.
    JSONValue Metadata() const;

private:
    Options opts;
    ServerInfo serverInfo;
    std::shared_ptr<const ToolRegistry> registry;
    std::shared_ptr<const IJsonRpcRouter> router;
    std::shared_ptr<const errors::ErrorSanitizer> sanitizer;

    http::response<http::string_body> handlePost(const http::request<http::string_body>& req) const;
};

} // namespace stridemcp
