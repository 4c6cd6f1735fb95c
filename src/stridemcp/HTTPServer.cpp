//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/stridemcp/HTTPServer.cpp
// Purpose: HTTP/HTTPS server using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "stridemcp/HTTPServer.hpp"

#include <openssl/ssl.h>

namespace stridemcp {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {
// Upper bound on request bytes read and discarded after refusing an oversized body
constexpr std::uint64_t kMaxDrainBytes = 64ull * 1024ull * 1024ull;
constexpr std::size_t kDrainChunk = 64u * 1024u;
} // namespace

class HTTPServer::Impl {
public:
    HTTPServer::Options opts;
    std::shared_ptr<const HttpTransportAdapter> adapter;
    std::atomic<bool> running{false};
    std::atomic<std::uint16_t> boundPort{0};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::vector<std::thread> ioThreads;

    Impl(const HTTPServer::Options& o, std::shared_ptr<const HttpTransportAdapter> a)
        : opts(o), adapter(std::move(a)) {
        if (!adapter) {
            throw std::invalid_argument("HTTPServer requires a transport adapter");
        }
        if (opts.scheme != "http" && opts.scheme != "https") {
            throw std::invalid_argument("HTTPServer unsupported scheme: " + opts.scheme);
        }
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("HTTPServer: failed to load certificate/key: {}", e.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        }
    }

    ~Impl() {
        ioc.stop();
        joinThreads();
    }

    void joinThreads() {
        for (auto& t : ioThreads) {
            if (t.joinable()) {
                t.join();
            }
        }
        ioThreads.clear();
    }

    void bind() {
        // Validate port strictly: numeric and within [0, 65535]
        if (opts.port.empty()) {
            throw std::invalid_argument("HTTPServer invalid port: empty");
        }
        bool allDigits = std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; });
        if (!allDigits || opts.port.size() > 5u || std::stoul(opts.port) > 65535ul) {
            throw std::invalid_argument("HTTPServer invalid port: " + opts.port);
        }
        tcp::resolver resolver(ioc);
        auto r = resolver.resolve(opts.address, opts.port);
        tcp::endpoint ep = *r.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort.store(acceptor->local_endpoint().port());
    }

    void runIo() {
        try {
            ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("HTTPServer I/O thread error: {}", e.what());
        }
    }

    // Reads one request and writes its response. Returns true when the body was refused for
    // exceeding the payload limit, in which case the caller should drain before closing.
    template <class Stream>
    net::awaitable<bool> serveOne(Stream& stream) {
        boost::beast::flat_buffer buffer;
        http::request_parser<http::string_body> parser;
        parser.body_limit(static_cast<std::uint64_t>(adapter->GetOptions().limits.maxPayloadBytes));

        boost::system::error_code ec;
        co_await http::async_read(stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));
        if (ec == http::error::body_limit) {
            LOG_WARN("HTTPServer: request body exceeds {} bytes; refused before reading",
                     adapter->GetOptions().limits.maxPayloadBytes);
            auto res = adapter->MakePayloadTooLargeResponse(parser.get().version());
            co_await http::async_write(stream, res, net::use_awaitable);
            co_return true;
        }
        if (ec) {
            throw boost::system::system_error(ec);
        }
        auto res = adapter->Handle(parser.get());
        co_await http::async_write(stream, res, net::use_awaitable);
        co_return false;
    }

    // Discard the unread remainder of a refused request so the peer receives the response
    // instead of a connection reset.
    net::awaitable<void> drain(boost::beast::tcp_stream& stream) {
        stream.expires_after(std::chrono::seconds(5));
        std::vector<char> scratch(kDrainChunk);
        std::uint64_t total = 0;
        boost::system::error_code ec;
        while (total < kMaxDrainBytes) {
            std::size_t n = co_await stream.async_read_some(net::buffer(scratch), net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                break;
            }
            total += n;
        }
        co_return;
    }

    net::awaitable<void> session_plain(tcp::socket socket) {
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            const bool refused = co_await serveOne(stream);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
            if (refused) {
                co_await drain(stream);
            }
        } catch (const std::exception& e) {
            if (!running.load()) {
                // Suppress shutdown-related errors; log at DEBUG only in debug builds
#ifdef _DEBUG
                LOG_DEBUG("HTTPServer plain session suppressed during shutdown: {}", e.what());
#endif
            } else {
                LOG_DEBUG("HTTPServer plain session ended: {}", e.what());
            }
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket) {
        try {
            ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serveOne(tls);
            boost::system::error_code ec;
            tls.shutdown(ec);
        } catch (const std::exception& e) {
            if (!running.load()) {
                // Suppress shutdown-related errors; log at DEBUG only in debug builds
                #ifdef _DEBUG
                LOG_DEBUG("HTTPServer TLS session suppressed during shutdown: {}", e.what());
                #endif
            } else {
                LOG_DEBUG("HTTPServer TLS session ended: {}", e.what());
            }
        }
        co_return;
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (sslCtx) {
                    net::co_spawn(ioc, session_tls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ioc, session_plain(std::move(socket)), net::detached);
                }
            }
        } catch (const std::exception& e) {
            if (!running.load()) {
                // Suppress shutdown-related errors (e.g., operation_aborted when acceptor is closed); log at DEBUG only in debug builds
                #ifdef _DEBUG
                LOG_DEBUG("HTTPServer accept suppressed during shutdown: {}", e.what());
                #endif
            } else {
                LOG_ERROR("HTTPServer accept error: {}", e.what());
            }
        }
        co_return;
    }
};

HTTPServer::HTTPServer(const Options& opts, std::shared_ptr<const HttpTransportAdapter> adapter)
    : pImpl(std::make_unique<Impl>(opts, std::move(adapter))) {}

HTTPServer::~HTTPServer() = default;

std::future<void> HTTPServer::Start() {
    std::promise<void> ready; auto fut = ready.get_future();
    try {
        pImpl->bind();
        pImpl->running.store(true);
        net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
        const std::size_t threads = std::max<std::size_t>(1u, pImpl->opts.threads);
        for (std::size_t i = 0; i < threads; ++i) {
            pImpl->ioThreads.emplace_back([this]() { pImpl->runIo(); });
        }
        LOG_INFO("HTTPServer listening on {}://{}:{} ({} I/O thread{})", pImpl->opts.scheme, pImpl->opts.address,
                 pImpl->boundPort.load(), threads, threads == 1u ? "" : "s");
        ready.set_value();
    } catch (const std::exception& e) {
        pImpl->running.store(false);
        LOG_ERROR("HTTPServer failed to start: {}", e.what());
        ready.set_exception(std::current_exception());
    }
    return fut;
}

std::future<void> HTTPServer::Stop() {
    std::promise<void> done; auto fut = done.get_future();
    pImpl->running.store(false);
    pImpl->ioc.stop();
    pImpl->joinThreads();
    if (pImpl->acceptor) {
        boost::system::error_code ec;
        pImpl->acceptor->close(ec);
    }
    done.set_value();
    return fut;
}

std::uint16_t HTTPServer::BoundPort() const {
    return pImpl->boundPort.load();
}

} // namespace stridemcp
