//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Immutable server configuration and its environment loader
//==========================================================================================================

#pragma once

#include <string>

#include "stridemcp/HTTPServer.hpp"
#include "stridemcp/Protocol.h"
#include "stridemcp/validation/PayloadValidator.h"

namespace stridemcp {

//==========================================================================================================
// ListenConfig
// Purpose: Result of parsing a listen URI: socket options plus the endpoint path.
//==========================================================================================================
struct ListenConfig {
    HTTPServer::Options server;
    std::string endpointPath{"/mcp"};
};

//==========================================================================================================
// ServerConfig
// Purpose: Everything the server needs, built once at startup and passed explicitly to the router,
//          the transport adapter and the HTTP server.
//==========================================================================================================
struct ServerConfig {
    ServerInfo serverInfo;
    validation::ValidationLimits limits;
    ListenConfig listen;
};

//==========================================================================================================
// ParseListenUri
// Purpose: Parse a listen URI. Accepted forms:
//            - "http://<address>:<port>/<path>" (e.g., http://127.0.0.1:0/mcp)
//            - "https://<address>:<port>/<path>?cert=<pem>&key=<pem>"
//            - "[addr]:port" for IPv6 literals
//          A missing scheme means http, a missing port means 8787 and a missing path means /mcp.
//          Unknown query parameters are ignored.
// Throws:
//   std::invalid_argument on an unknown scheme, a malformed port, or https without cert and key.
//==========================================================================================================
ListenConfig ParseListenUri(const std::string& uri);

//==========================================================================================================
// LoadServerConfigFromEnv
// Purpose: Build a ServerConfig from STRIDEMCP_* environment variables:
//            STRIDEMCP_LISTEN, STRIDEMCP_IO_THREADS, STRIDEMCP_MAX_PAYLOAD_BYTES,
//            STRIDEMCP_MAX_JSON_DEPTH, STRIDEMCP_MAX_OBJECT_KEYS, STRIDEMCP_MAX_ARRAY_LENGTH,
//            STRIDEMCP_MAX_STRING_LENGTH.
//          Unset variables keep their defaults; invalid values are logged at WARN and replaced by
//          the default.
//==========================================================================================================
ServerConfig LoadServerConfigFromEnv();

} // namespace stridemcp
