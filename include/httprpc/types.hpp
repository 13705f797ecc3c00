// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <variant>

namespace httprpc
{

// =============================================================================
// Type Aliases
// =============================================================================

/// JSON type alias for cleaner API
using json = nlohmann::json;

/// JSON-RPC request ID (can be string or integer)
using JsonRpcId = std::variant<std::string, int64_t>;

/// Extra HTTP headers sent with every request
using HttpHeaders = std::map<std::string, std::string>;

// Forward declarations
class IHttpTransport;

/// JSON-RPC protocol version written into every envelope
inline constexpr const char* kJsonRpcVersion = "2.0";

/// Convert JsonRpcId to JSON
inline json id_to_json(const JsonRpcId& id)
{
    return std::visit([](const auto& v) -> json { return v; }, id);
}

/// Parse JsonRpcId from JSON
inline JsonRpcId id_from_json(const json& j)
{
    if (j.is_string())
        return j.get<std::string>();
    else if (j.is_number_integer())
        return j.get<int64_t>();
    throw std::invalid_argument("Invalid JSON-RPC id type");
}

/// Render an id for log and error messages
inline std::string id_to_string(const JsonRpcId& id)
{
    if (auto* s = std::get_if<std::string>(&id))
        return *s;
    return std::to_string(std::get<int64_t>(id));
}

// =============================================================================
// Options
// =============================================================================

/// Options for the built-in HTTP transport
struct HttpTransportOptions
{
    /// Time allowed to establish the TCP connection (0 = no timeout)
    std::chrono::milliseconds connect_timeout{5000};

    /// Time allowed for each send/receive on the socket (0 = no timeout)
    std::chrono::milliseconds io_timeout{30000};

    /// Upper bound on a response body, guards against runaway servers
    size_t max_response_size = 64 * 1024 * 1024;
};

/// Factory used by an owning client to create its transport
using TransportFactory = std::function<std::unique_ptr<IHttpTransport>()>;

/// Options for RpcClient
struct RpcClientOptions
{
    /// JSON-RPC endpoint, e.g. "http://localhost:10002/jsonrpc"
    std::string endpoint;

    /// Externally managed transport. When set, the client borrows it and
    /// never closes it. When empty, the client owns its transports.
    std::shared_ptr<IHttpTransport> transport;

    /// How owned transports are created. Defaults to an HttpTransport built
    /// from transport_options.
    TransportFactory transport_factory;

    /// Settings for the default HttpTransport
    HttpTransportOptions transport_options;

    /// Extra headers added to every request
    HttpHeaders headers;
};

} // namespace httprpc
