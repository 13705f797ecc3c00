// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file client.hpp
/// @brief RpcClient for issuing JSON-RPC 2.0 calls over HTTP

#include <httprpc/errors.hpp>
#include <httprpc/id_generator.hpp>
#include <httprpc/jsonrpc.hpp>
#include <httprpc/transport.hpp>
#include <httprpc/types.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>

namespace httprpc
{

// =============================================================================
// Request Builder Helpers (for unit testing request JSON shape)
// =============================================================================

/// Build the envelope for a call
/// @throws std::invalid_argument if method is empty or params is not null, an array or an object
JsonRpcRequest build_call_request(const std::string& method, const json& params, JsonRpcId id);

/// Build the envelope for a notification (no id)
/// @throws std::invalid_argument if method is empty or params is not null, an array or an object
JsonRpcRequest build_notification(const std::string& method, const json& params);

// =============================================================================
// RpcClient
// =============================================================================

/// JSON-RPC 2.0 client for a single HTTP endpoint
///
/// Each call() or notify() performs one POST round trip and correlates the
/// answer by waiting for it, so no pending-request table is kept. Failures
/// are reported as RpcError subclasses, checked in this order:
/// TransportError, HttpStatusError, MalformedResponseError (unparseable body),
/// ProtocolError, MalformedResponseError (missing result).
///
/// Transport ownership:
/// - Borrowed: a transport passed in the options is used for every call and
///   never closed.
/// - Owned: with no transport given, open() creates one that is reused until
///   close(). Calls made while nothing is open create a transport for that
///   call alone and release it when the call ends, on every path.
///
/// The destructor calls close(), so a stack instance is a scoped resource:
/// @code
/// httprpc::RpcClient client("http://localhost:10002/jsonrpc");
/// client.open();
/// auto result = client.call("tasks/send", {{"id", "42"}});
/// @endcode
///
/// Safe for concurrent use from multiple threads.
class RpcClient
{
  public:
    /// @throws std::invalid_argument if options.endpoint is empty
    explicit RpcClient(RpcClientOptions options);

    /// @param endpoint JSON-RPC endpoint URL
    /// @param transport Optional externally managed transport (borrowed)
    explicit RpcClient(std::string endpoint, std::shared_ptr<IHttpTransport> transport = nullptr);

    /// Destructor - closes an owned transport
    ~RpcClient();

    // Non-copyable, non-movable (owns a mutex and possibly a transport)
    RpcClient(const RpcClient&) = delete;
    RpcClient& operator=(const RpcClient&) = delete;
    RpcClient(RpcClient&&) = delete;
    RpcClient& operator=(RpcClient&&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Create the owned transport reused by subsequent calls.
    /// No-op if a transport is already open or the transport is borrowed.
    void open();

    /// Release the owned transport. Idempotent; never touches a borrowed one.
    void close();

    /// True if a transport is currently available for reuse
    bool is_open() const;

    /// True if the client owns (and therefore closes) its transport
    bool is_owner() const
    {
        return !options_.transport;
    }

    const std::string& endpoint() const
    {
        return options_.endpoint;
    }

    // =========================================================================
    // Calls
    // =========================================================================

    /// Send a request and wait for its result
    /// @param method Method name (non-empty)
    /// @param params Null (omitted), an array or an object
    /// @param id Request id; a random UUID string is generated when omitted
    /// @return The "result" member, converted to T
    /// @throws TransportError, HttpStatusError, ProtocolError, MalformedResponseError
    template <typename T = json>
    T call(
        const std::string& method,
        const json& params = nullptr,
        std::optional<JsonRpcId> id = std::nullopt
    )
    {
        json result = call_json(method, params, std::move(id));

        if constexpr (std::is_same_v<T, json>)
        {
            return result;
        }
        else
        {
            try
            {
                return result.get<T>();
            }
            catch (const json::exception& e)
            {
                throw MalformedResponseError(
                    "Unexpected result type from " + method + ": " + e.what(),
                    result.dump(),
                    method
                );
            }
        }
    }

    /// Send a notification. The response body is never read.
    /// @throws TransportError, HttpStatusError
    void notify(const std::string& method, const json& params = nullptr);

  private:
    class TransportLease;

    json call_json(const std::string& method, const json& params, std::optional<JsonRpcId> id);

    /// Deliver one envelope and check the HTTP status
    HttpResponse send(const JsonRpcRequest& request, const std::string& context);

    /// Borrowed, session or freshly created per-call transport
    TransportLease acquire();

    std::unique_ptr<IHttpTransport> make_transport() const;

    RpcClientOptions options_;
    IdGenerator ids_;

    mutable std::mutex mutex_;
    std::shared_ptr<IHttpTransport> session_;
};

} // namespace httprpc
