// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <httprpc/logging.hpp>
#include <httprpc/transport_http.hpp>

#include <httplib.h>

#include <string>

namespace httprpc
{

HttpResponse HttpTransport::post(const HttpRequest& request)
{
    if (!open_)
        throw TransportError("Transport is closed");

    Url url;
    try
    {
        url = Url::parse(request.url);
    }
    catch (const std::invalid_argument& e)
    {
        throw TransportError(e.what());
    }
    if (url.scheme != "http")
        throw TransportError("Unsupported URL scheme '" + url.scheme + "' in " + request.url);

    LOG4CPLUS_DEBUG(
        transport_logger(),
        "POST " << url.host << ":" << url.port << url.target << " (" << request.body.size()
                << " bytes)"
    );

    httplib::Client cli(url.host, url.port);
    cli.set_connection_timeout(options_.connect_timeout);
    cli.set_read_timeout(options_.io_timeout);
    cli.set_write_timeout(options_.io_timeout);
    cli.set_keep_alive(false);
    cli.set_follow_location(false);

    httplib::Request req;
    req.method = "POST";
    req.path = url.target;
    req.body = request.body;
    for (const auto& [name, value] : request.headers)
        req.set_header(name, value);

    // Collect the body ourselves so oversized responses are cut off while reading
    std::string body;
    bool too_large = false;
    req.content_receiver = [&](const char* data, size_t size, uint64_t, uint64_t)
    {
        if (body.size() + size > options_.max_response_size)
        {
            too_large = true;
            return false;
        }
        body.append(data, size);
        return true;
    };

    auto result = cli.send(req);
    if (too_large)
        throw TransportError(
            "HTTP response exceeds maximum size of " + std::to_string(options_.max_response_size) +
            " bytes"
        );
    if (!result)
        throw TransportError(
            "POST to " + url.host + ":" + std::to_string(url.port) +
            " failed: " + httplib::to_string(result.error())
        );

    HttpResponse response;
    response.status = result->status;
    response.reason = result->reason;
    for (const auto& [name, value] : result->headers)
        response.headers.emplace_back(name, value);
    response.body = std::move(body);

    LOG4CPLUS_DEBUG(
        transport_logger(),
        "HTTP " << response.status << " from " << url.host << ":" << url.port << " ("
                << response.body.size() << " bytes)"
    );
    return response;
}

} // namespace httprpc
