// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file transport_http.hpp
/// @brief HTTP/1.1 transport built on cpp-httplib

#include <atomic>
#include <httprpc/transport.hpp>
#include <httprpc/types.hpp>

namespace httprpc
{

// =============================================================================
// HttpTransport
// =============================================================================

/// Transport that sends each request on its own connection
///
/// Every post() builds an httplib::Client for the endpoint, sends one request
/// and reads the response to completion, so concurrent post() calls never
/// share state. Redirects are not followed. Only http:// URLs are supported.
class HttpTransport : public IHttpTransport
{
  public:
    explicit HttpTransport(HttpTransportOptions options = {}) : options_(std::move(options)) {}

    ~HttpTransport() override
    {
        close();
    }

    // Non-copyable
    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    HttpResponse post(const HttpRequest& request) override;

    void close() override
    {
        open_ = false;
    }

    bool is_open() const override
    {
        return open_;
    }

    const HttpTransportOptions& options() const
    {
        return options_;
    }

  private:
    HttpTransportOptions options_;
    std::atomic<bool> open_{true};
};

} // namespace httprpc
