// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <httprpc/errors.hpp>
#include <httprpc/types.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace httprpc
{

// =============================================================================
// URL
// =============================================================================

/// Parsed http:// endpoint
struct Url
{
    std::string scheme;
    std::string host;
    int port = 80;
    std::string target = "/"; // path + query, sent on the request line

    /// Parse "scheme://host[:port][/path][?query]"
    /// @throws std::invalid_argument on malformed input
    static Url parse(const std::string& text);
};

inline Url Url::parse(const std::string& text)
{
    Url url;

    auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0)
        throw std::invalid_argument("Invalid URL (missing scheme): " + text);

    url.scheme = text.substr(0, scheme_end);
    std::transform(
        url.scheme.begin(),
        url.scheme.end(),
        url.scheme.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); }
    );

    size_t authority_start = scheme_end + 3;
    size_t authority_end = text.find_first_of("/?#", authority_start);
    std::string authority = text.substr(
        authority_start,
        authority_end == std::string::npos ? std::string::npos : authority_end - authority_start
    );
    if (authority_end != std::string::npos)
    {
        url.target = text.substr(authority_end);
        auto fragment = url.target.find('#');
        if (fragment != std::string::npos)
            url.target.erase(fragment);
        if (url.target.empty() || url.target[0] != '/')
            url.target = "/" + url.target;
    }

    if (authority.find('@') != std::string::npos)
        throw std::invalid_argument("Invalid URL (credentials are not supported): " + text);

    std::string port_str;
    if (!authority.empty() && authority[0] == '[')
    {
        // IPv6 literal
        auto close = authority.find(']');
        if (close == std::string::npos)
            throw std::invalid_argument("Invalid URL (unterminated IPv6 literal): " + text);
        url.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size())
        {
            if (authority[close + 1] != ':')
                throw std::invalid_argument("Invalid URL: " + text);
            port_str = authority.substr(close + 2);
        }
    }
    else
    {
        auto colon = authority.rfind(':');
        url.host = authority.substr(0, colon);
        if (colon != std::string::npos)
            port_str = authority.substr(colon + 1);
    }

    if (url.host.empty())
        throw std::invalid_argument("Invalid URL (missing host): " + text);

    if (!port_str.empty())
    {
        bool digits = std::all_of(
            port_str.begin(), port_str.end(), [](unsigned char c) { return std::isdigit(c) != 0; }
        );
        if (!digits || port_str.size() > 5)
            throw std::invalid_argument("Invalid URL (bad port): " + text);
        url.port = std::stoi(port_str);
        if (url.port <= 0 || url.port > 65535)
            throw std::invalid_argument("Invalid URL (port out of range): " + text);
    }
    else if (url.scheme == "https")
    {
        url.port = 443;
    }

    return url;
}

// =============================================================================
// HTTP Messages
// =============================================================================

/// A single HTTP POST to be delivered by a transport
struct HttpRequest
{
    std::string url;
    HttpHeaders headers;
    std::string body;
};

/// A complete HTTP response
struct HttpResponse
{
    int status = 0;
    std::string reason;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    bool is_success() const
    {
        return status >= 200 && status < 300;
    }

    /// Case-insensitive header lookup (first match)
    std::optional<std::string> header(const std::string& name) const
    {
        auto equal_ci = [](const std::string& a, const std::string& b)
        {
            return a.size() == b.size() &&
                   std::equal(
                       a.begin(),
                       a.end(),
                       b.begin(),
                       [](unsigned char x, unsigned char y) { return std::tolower(x) == std::tolower(y); }
                   );
        };
        for (const auto& [key, value] : headers)
        {
            if (equal_ci(key, name))
                return value;
        }
        return std::nullopt;
    }
};

// =============================================================================
// Transport Interface
// =============================================================================

/// Abstract interface for a request/response HTTP transport
///
/// Implementations deliver one POST and return the complete response. They
/// must be safe for concurrent post() calls from multiple threads, since a
/// single transport may be shared by several clients.
class IHttpTransport
{
  public:
    virtual ~IHttpTransport() = default;

    /// Deliver a request and wait for the full response
    /// @return The response, whatever its status code
    /// @throws TransportError if no complete response could be obtained
    virtual HttpResponse post(const HttpRequest& request) = 0;

    /// Release the transport's resources
    virtual void close() = 0;

    /// Check if transport is open
    virtual bool is_open() const = 0;
};

} // namespace httprpc
