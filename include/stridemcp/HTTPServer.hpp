//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS server using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <string>

#include "stridemcp/HttpTransportAdapter.h"

namespace stridemcp {

  class HTTPServer {
  public:
    //==========================================================================================================
    // Options
    // Purpose: Configuration for bind address/port, I/O threads and TLS files.
    // Fields:
    //   address: Bind address (default: 0.0.0.0)
    //   port: Listen port (default: 8787; "0" picks an ephemeral port, see BoundPort())
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //   threads: Number of threads running the I/O context
    //==========================================================================================================
    struct Options {
        std::string address{"0.0.0.0"};
        std::string port{"8787"};
        std::string scheme{"http"}; // "http" or "https"
        std::string certFile; // PEM (required for https)
        std::string keyFile;  // PEM (required for https)
        std::size_t threads{1};
    };

    HTTPServer(const Options& opts, std::shared_ptr<const HttpTransportAdapter> adapter);
    ~HTTPServer();

    HTTPServer(const HTTPServer&) = delete;
    HTTPServer& operator=(const HTTPServer&) = delete;

    //==========================================================================================================
    // Binds the listening socket and starts the accept loop on the I/O threads.
    // Returns:
    //   Future that becomes ready once the server is accepting; it carries the exception when the
    //   port is invalid or the address cannot be bound.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stops the server: closes acceptor, stops I/O context, and joins the I/O threads.
    // Returns:
    //   Future that completes when shutdown has finished.
    //==========================================================================================================
    std::future<void> Stop();

    // Port actually bound after a successful Start(); 0 before that.
    std::uint16_t BoundPort() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
  };

} // namespace stridemcp
