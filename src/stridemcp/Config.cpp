//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Immutable server configuration and its environment loader
//==========================================================================================================

#include "stridemcp/Config.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace stridemcp {

namespace {

constexpr const char* kDefaultListen = "http://0.0.0.0:8787/mcp";

void trim(std::string& s) {
    auto notSpace = [](unsigned char c){ return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
}

// Applies an optional numeric override; invalid values are reported and leave target untouched.
template <typename T>
void applyUnsigned(const char* name, T& target) {
    try {
        if (auto v = GetEnvUnsigned(name)) {
            target = static_cast<T>(v.value());
        }
    } catch (const std::invalid_argument& e) {
        LOG_WARN("Config: {}; using default {}", e.what(), target);
    }
}

} // namespace

ListenConfig ParseListenUri(const std::string& uri) {
    ListenConfig out;
    out.server.scheme = "http";

    std::string cfg = uri;
    trim(cfg);

    // Detect scheme
    auto startsWith = [](const std::string& s, const char* pfx){ return s.rfind(pfx, 0) == 0; };
    if (startsWith(cfg, "http://")) {
        cfg = cfg.substr(7);
    } else if (startsWith(cfg, "https://")) {
        out.server.scheme = "https";
        cfg = cfg.substr(8);
    } else if (cfg.find("://") != std::string::npos) {
        throw std::invalid_argument("unsupported scheme in listen URI: " + uri);
    }

    // Split query params
    std::string hostPortPath = cfg;
    std::string query;
    auto qpos = cfg.find('?');
    if (qpos != std::string::npos) {
        hostPortPath = cfg.substr(0, qpos);
        query = cfg.substr(qpos + 1);
    }

    // Split path component
    std::string hostPort = hostPortPath;
    auto slash = hostPortPath.find('/');
    if (slash != std::string::npos) {
        hostPort = hostPortPath.substr(0, slash);
        std::string path = hostPortPath.substr(slash);
        if (path.size() > 1u) {
            out.endpointPath = path;
        }
    }
    trim(hostPort);

    // Parse host[:port] including IPv6 in [addr]:port form
    if (!hostPort.empty()) {
        if (hostPort.front() == '[') {
            auto rb = hostPort.find(']');
            if (rb == std::string::npos) {
                throw std::invalid_argument("unterminated IPv6 address in listen URI: " + uri);
            }
            out.server.address = hostPort.substr(1, rb - 1);
            if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
                out.server.port = hostPort.substr(rb + 2);
            }
        } else {
            auto colon = hostPort.rfind(':');
            if (colon != std::string::npos) {
                out.server.address = hostPort.substr(0, colon);
                out.server.port = hostPort.substr(colon + 1);
            } else {
                out.server.address = hostPort;
            }
        }
        trim(out.server.address);
        trim(out.server.port);
        if (out.server.address.empty()) out.server.address = "0.0.0.0";
        if (out.server.port.empty()) out.server.port = "8787"; // default
    }

    const bool portOk = !out.server.port.empty() && out.server.port.size() <= 5u &&
        std::all_of(out.server.port.begin(), out.server.port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; }) &&
        std::stoul(out.server.port) <= 65535ul;
    if (!portOk) {
        throw std::invalid_argument("invalid port in listen URI: " + uri);
    }

    // Parse query parameters: cert, key
    if (!query.empty()) {
        std::stringstream ss(query);
        std::string kv;
        while (std::getline(ss, kv, '&')) {
            auto eq = kv.find('=');
            std::string key = (eq == std::string::npos) ? kv : kv.substr(0, eq);
            std::string val = (eq == std::string::npos) ? std::string() : kv.substr(eq + 1);
            if (key == "cert") out.server.certFile = val;
            else if (key == "key") out.server.keyFile = val;
        }
    }
    if (out.server.scheme == "https" && (out.server.certFile.empty() || out.server.keyFile.empty())) {
        throw std::invalid_argument("https listen URI requires cert and key parameters");
    }
    return out;
}

ServerConfig LoadServerConfigFromEnv() {
    FUNC_SCOPE();
    ServerConfig cfg;
    cfg.listen = ParseListenUri(kDefaultListen);

    const std::string listen = GetEnvOrDefault("STRIDEMCP_LISTEN", "");
    if (!listen.empty()) {
        try {
            cfg.listen = ParseListenUri(listen);
        } catch (const std::invalid_argument& e) {
            LOG_WARN("Config: STRIDEMCP_LISTEN rejected ({}); using default {}", e.what(), kDefaultListen);
        }
    }

    applyUnsigned("STRIDEMCP_IO_THREADS", cfg.listen.server.threads);
    applyUnsigned("STRIDEMCP_MAX_PAYLOAD_BYTES", cfg.limits.maxPayloadBytes);
    applyUnsigned("STRIDEMCP_MAX_JSON_DEPTH", cfg.limits.maxJsonDepth);
    if (cfg.limits.maxJsonDepth > validation::kMaxSupportedJsonDepth) {
        LOG_WARN("Config: STRIDEMCP_MAX_JSON_DEPTH={} exceeds the supported maximum; using {}",
                 cfg.limits.maxJsonDepth, validation::kMaxSupportedJsonDepth);
        cfg.limits.maxJsonDepth = validation::kMaxSupportedJsonDepth;
    }
    applyUnsigned("STRIDEMCP_MAX_OBJECT_KEYS", cfg.limits.maxObjectKeys);
    applyUnsigned("STRIDEMCP_MAX_ARRAY_LENGTH", cfg.limits.maxArrayLength);
    applyUnsigned("STRIDEMCP_MAX_STRING_LENGTH", cfg.limits.maxStringLength);

    LOG_INFO("Config: listen={}://{}:{}{} threads={} maxPayloadBytes={} maxJsonDepth={} maxObjectKeys={} "
             "maxArrayLength={} maxStringLength={}",
             cfg.listen.server.scheme, cfg.listen.server.address, cfg.listen.server.port, cfg.listen.endpointPath,
             cfg.listen.server.threads, cfg.limits.maxPayloadBytes, cfg.limits.maxJsonDepth,
             cfg.limits.maxObjectKeys, cfg.limits.maxArrayLength, cfg.limits.maxStringLength);
    return cfg;
}

} // namespace stridemcp
