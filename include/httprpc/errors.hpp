// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file errors.hpp
/// @brief Exception taxonomy surfaced by RpcClient

#include <httprpc/types.hpp>
#include <stdexcept>
#include <string>
#include <utility>

namespace httprpc
{

// =============================================================================
// Error Kinds
// =============================================================================

/// Discriminator for the four failure layers
enum class RpcErrorKind
{
    Transport,         ///< Network/IO failure, nothing usable came back
    HttpStatus,        ///< Delivered, but the HTTP status was not 2xx
    Protocol,          ///< Valid envelope carrying a server-reported error
    MalformedResponse, ///< Delivered with 2xx, body violates the envelope contract
};

/// Human readable name of an error kind
inline const char* to_string(RpcErrorKind kind)
{
    switch (kind)
    {
    case RpcErrorKind::Transport:
        return "transport";
    case RpcErrorKind::HttpStatus:
        return "http_status";
    case RpcErrorKind::Protocol:
        return "protocol";
    case RpcErrorKind::MalformedResponse:
        return "malformed_response";
    }
    return "unknown";
}

// =============================================================================
// Exceptions
// =============================================================================

/// Base class of every error raised by RpcClient
///
/// Catch this to handle all failures at once and branch on kind(), or catch
/// the concrete subclasses.
class RpcError : public std::runtime_error
{
  public:
    RpcErrorKind kind() const
    {
        return kind_;
    }

    /// Method name of the failed call (empty when raised below the client)
    const std::string& method() const
    {
        return method_;
    }

  protected:
    RpcError(RpcErrorKind kind, const std::string& message, std::string method = {})
        : std::runtime_error(message), kind_(kind), method_(std::move(method))
    {
    }

  private:
    RpcErrorKind kind_;
    std::string method_;
};

/// Exception thrown when the transport fails to complete a round trip
class TransportError : public RpcError
{
  public:
    explicit TransportError(const std::string& cause)
        : RpcError(RpcErrorKind::Transport, cause), cause_(cause)
    {
    }

    TransportError(const std::string& message, std::string cause, std::string method)
        : RpcError(RpcErrorKind::Transport, message, std::move(method)), cause_(std::move(cause))
    {
    }

    /// Underlying cause, without the method context
    const std::string& cause() const
    {
        return cause_;
    }

  private:
    std::string cause_;
};

/// Exception thrown when the server answers with a non-2xx status
class HttpStatusError : public RpcError
{
  public:
    HttpStatusError(const std::string& message, int status, std::string body, std::string method)
        : RpcError(RpcErrorKind::HttpStatus, message, std::move(method)), status_(status),
          body_(std::move(body))
    {
    }

    int status() const
    {
        return status_;
    }
    const std::string& body() const
    {
        return body_;
    }

  private:
    int status_;
    std::string body_;
};

/// Exception thrown for a well-formed error response
class ProtocolError : public RpcError
{
  public:
    ProtocolError(int code, std::string message, json data, json response_id, std::string method)
        : RpcError(
              RpcErrorKind::Protocol,
              "JSON-RPC Error " + std::to_string(code) + ": " + message,
              std::move(method)
          ),
          code_(code), message_(std::move(message)), data_(std::move(data)),
          response_id_(std::move(response_id))
    {
    }

    int code() const
    {
        return code_;
    }
    const std::string& message() const
    {
        return message_;
    }
    const json& data() const
    {
        return data_;
    }

    /// The id echoed by the server, as sent (string, integer or null).
    /// Not necessarily equal to the request id.
    const json& response_id() const
    {
        return response_id_;
    }

  private:
    int code_;
    std::string message_;
    json data_;
    json response_id_;
};

/// Exception thrown when a 2xx body does not satisfy the response envelope
class MalformedResponseError : public RpcError
{
  public:
    MalformedResponseError(const std::string& message, std::string body, std::string method)
        : RpcError(RpcErrorKind::MalformedResponse, message, std::move(method)),
          body_(std::move(body))
    {
    }

    /// Raw response body, kept for diagnostics
    const std::string& body() const
    {
        return body_;
    }

  private:
    std::string body_;
};

/// Whether a failure is worth retrying by the caller.
/// Transport failures and 408/429/5xx statuses are; everything else is terminal.
inline bool is_retryable(const RpcError& error)
{
    switch (error.kind())
    {
    case RpcErrorKind::Transport:
        return true;
    case RpcErrorKind::HttpStatus:
    {
        auto* http = dynamic_cast<const HttpStatusError*>(&error);
        if (!http)
            return false;
        return http->status() == 408 || http->status() == 429 || http->status() >= 500;
    }
    case RpcErrorKind::Protocol:
    case RpcErrorKind::MalformedResponse:
        return false;
    }
    return false;
}

} // namespace httprpc
