//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: STRIDE threat modeling MCP server over HTTP
//==========================================================================================================

#include "logging/Logger.h"
#include "env/EnvVars.h"
#include "stridemcp/Config.h"
#include "stridemcp/HTTPServer.hpp"
#include "stridemcp/HttpTransportAdapter.h"
#include "stridemcp/JsonRpcRouter.h"
#include "stridemcp/ToolRegistry.h"
#include "stridemcp/errors/ErrorSanitizer.h"
#include "stridemcp/tools/StrideTools.h"

#include <csignal>
#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

using namespace stridemcp;

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--listen")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    if (auto logFile = getArgValue(argc, argv, "--log-file").value_or(GetEnvOrDefault("STRIDEMCP_LOG_FILE", "")); !logFile.empty()) {
        if (!Logger::setLogFile(logFile)) {
            LOG_WARN("Continuing with stderr logging only");
        }
    }

    ServerConfig config = LoadServerConfigFromEnv();
    if (auto listen = getArgValue(argc, argv, "--listen"); listen.has_value()) {
        try {
            const std::size_t threads = config.listen.server.threads;
            config.listen = ParseListenUri(listen.value());
            config.listen.server.threads = threads;
        } catch (const std::invalid_argument& e) {
            LOG_ERROR("Invalid --listen value: {}", e.what());
            return 2;
        }
    }

    try {
        auto registry = std::make_shared<ToolRegistry>();
        tools::RegisterStrideTools(*registry);
        std::shared_ptr<const ToolRegistry> tools = registry;

        auto sanitizer = std::make_shared<const errors::ErrorSanitizer>();
        std::shared_ptr<const IJsonRpcRouter> router = MakeJsonRpcRouter(config.serverInfo, tools, sanitizer);

        HttpTransportAdapter::Options adapterOpts;
        adapterOpts.endpointPath = config.listen.endpointPath;
        adapterOpts.limits = config.limits;
        auto adapter = std::make_shared<const HttpTransportAdapter>(adapterOpts, config.serverInfo, tools, router, sanitizer);

        HTTPServer server(config.listen.server, adapter);
        server.Start().get();
        LOG_INFO("{} {} ready at {}://{}:{}{}", config.serverInfo.implementation.name,
                 config.serverInfo.implementation.version, config.listen.server.scheme,
                 config.listen.server.address, server.BoundPort(), config.listen.endpointPath);

        // Block until SIGINT/SIGTERM
        boost::asio::io_context signalIoc;
        boost::asio::signal_set signals(signalIoc, SIGINT, SIGTERM);
        signals.async_wait([](const boost::system::error_code& ec, int signo) {
            if (!ec) {
                LOG_INFO("Received signal {}; shutting down", signo);
            }
        });
        signalIoc.run();

        server.Stop().get();
        LOG_INFO("Server stopped");
    } catch (const std::exception& e) {
        LOG_ERROR("Server failed: {}", e.what());
        return 1;
    }
    return 0;
}
