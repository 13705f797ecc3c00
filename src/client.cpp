// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <httprpc/client.hpp>
#include <httprpc/logging.hpp>
#include <httprpc/transport_http.hpp>

namespace httprpc
{

namespace
{

void validate(const std::string& method, const json& params)
{
    if (method.empty())
        throw std::invalid_argument("JSON-RPC method name must not be empty");
    if (!params.is_null() && !params.is_array() && !params.is_object())
        throw std::invalid_argument(
            "JSON-RPC params must be an array or an object, got " + std::string(params.type_name())
        );
}

} // namespace

// =============================================================================
// Request Builder Helpers (exposed for unit testing)
// =============================================================================

JsonRpcRequest build_call_request(const std::string& method, const json& params, JsonRpcId id)
{
    validate(method, params);
    return JsonRpcRequest{method, params, std::move(id)};
}

JsonRpcRequest build_notification(const std::string& method, const json& params)
{
    validate(method, params);
    return JsonRpcRequest{method, params, std::nullopt};
}

// =============================================================================
// TransportLease
// =============================================================================

/// Scoped hold on a transport for one round trip. A transport created for
/// this round trip alone is closed when the lease goes out of scope.
class RpcClient::TransportLease
{
  public:
    TransportLease(std::shared_ptr<IHttpTransport> transport, bool release)
        : transport_(std::move(transport)), release_(release)
    {
    }

    ~TransportLease()
    {
        if (!release_ || !transport_)
            return;
        try
        {
            transport_->close();
        }
        catch (const std::exception& e)
        {
            LOG4CPLUS_WARN(client_logger(), "Failed to release per-call transport: " << e.what());
        }
    }

    TransportLease(TransportLease&& other) noexcept
        : transport_(std::move(other.transport_)), release_(other.release_)
    {
        other.release_ = false;
    }

    TransportLease(const TransportLease&) = delete;
    TransportLease& operator=(const TransportLease&) = delete;
    TransportLease& operator=(TransportLease&&) = delete;

    IHttpTransport* operator->() const
    {
        return transport_.get();
    }

  private:
    std::shared_ptr<IHttpTransport> transport_;
    bool release_;
};

// =============================================================================
// Constructor / Destructor
// =============================================================================

RpcClient::RpcClient(RpcClientOptions options) : options_(std::move(options))
{
    if (options_.endpoint.empty())
        throw std::invalid_argument("RpcClient endpoint must not be empty");
}

RpcClient::RpcClient(std::string endpoint, std::shared_ptr<IHttpTransport> transport)
    : RpcClient(
          [&]
          {
              RpcClientOptions options;
              options.endpoint = std::move(endpoint);
              options.transport = std::move(transport);
              return options;
          }()
      )
{
}

RpcClient::~RpcClient()
{
    try
    {
        close();
    }
    catch (const std::exception& e)
    {
        LOG4CPLUS_WARN(client_logger(), "Failed to close transport for " << options_.endpoint << ": " << e.what());
    }
}

// =============================================================================
// Lifecycle
// =============================================================================

void RpcClient::open()
{
    if (!is_owner())
        return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (session_)
        return;
    session_ = make_transport();
    LOG4CPLUS_DEBUG(client_logger(), "Opened transport for " << options_.endpoint);
}

void RpcClient::close()
{
    if (!is_owner())
        return;

    std::shared_ptr<IHttpTransport> transport;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transport = std::move(session_);
        session_.reset();
    }

    if (transport)
    {
        transport->close();
        LOG4CPLUS_DEBUG(client_logger(), "Closed transport for " << options_.endpoint);
    }
}

bool RpcClient::is_open() const
{
    if (!is_owner())
        return options_.transport->is_open();

    std::lock_guard<std::mutex> lock(mutex_);
    return session_ != nullptr;
}

std::unique_ptr<IHttpTransport> RpcClient::make_transport() const
{
    if (!options_.transport_factory)
        return std::make_unique<HttpTransport>(options_.transport_options);

    auto transport = options_.transport_factory();
    if (!transport)
        throw TransportError("Transport factory returned no transport");
    return transport;
}

RpcClient::TransportLease RpcClient::acquire()
{
    if (!is_owner())
        return TransportLease(options_.transport, false);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_)
            return TransportLease(session_, false);
    }

    // Nothing open: this round trip gets a transport of its own
    return TransportLease(make_transport(), true);
}

// =============================================================================
// Calls
// =============================================================================

HttpResponse RpcClient::send(const JsonRpcRequest& request, const std::string& context)
{
    HttpRequest http;
    http.url = options_.endpoint;
    http.headers = options_.headers;
    http.headers["Content-Type"] = "application/json";
    if (http.headers.find("Accept") == http.headers.end())
        http.headers["Accept"] = "application/json";

    try
    {
        http.body = request.to_json().dump();
    }
    catch (const json::type_error& e)
    {
        throw std::invalid_argument("Cannot serialize JSON-RPC request: " + std::string(e.what()));
    }

    HttpResponse response;
    try
    {
        auto transport = acquire();
        response = transport->post(http);
    }
    catch (const TransportError& e)
    {
        LOG4CPLUS_DEBUG(client_logger(), "Request error " << context << ": " << e.cause());
        throw TransportError("Request error " + context + ": " + e.cause(), e.cause(), request.method);
    }

    if (!response.is_success())
    {
        LOG4CPLUS_DEBUG(client_logger(), "HTTP " << response.status << " " << context);
        throw HttpStatusError(
            "HTTP error " + context + ": " + std::to_string(response.status) + " - " + response.body,
            response.status,
            response.body,
            request.method
        );
    }

    return response;
}

json RpcClient::call_json(const std::string& method, const json& params, std::optional<JsonRpcId> id)
{
    JsonRpcId request_id = id ? std::move(*id) : JsonRpcId{ids_.next()};
    auto request = build_call_request(method, params, request_id);

    LOG4CPLUS_DEBUG(client_logger(), "call " << method << " id=" << id_to_string(request_id));
    auto response = send(request, "calling " + method);

    json body;
    try
    {
        body = json::parse(response.body);
    }
    catch (const json::parse_error&)
    {
        throw MalformedResponseError(
            "Invalid JSON response from server: " + response.body, response.body, method
        );
    }
    if (!body.is_object())
        throw MalformedResponseError(
            "Invalid JSON response from server: " + response.body, response.body, method
        );

    JsonRpcResponse envelope;
    try
    {
        envelope = JsonRpcResponse::from_json(body);
    }
    catch (const std::invalid_argument& e)
    {
        throw MalformedResponseError(
            "Invalid JSON-RPC response: " + std::string(e.what()) + ". Response: " + response.body,
            response.body,
            method
        );
    }

    // An error member wins over a result member
    if (envelope.is_error())
    {
        auto& err = *envelope.error;
        LOG4CPLUS_DEBUG(client_logger(), "call " << method << " failed: " << err.code << " " << err.message);
        throw ProtocolError(err.code, err.message, err.data, envelope.id, method);
    }

    if (!envelope.result)
        throw MalformedResponseError(
            "Invalid JSON-RPC response: 'result' field missing. Response: " + response.body,
            response.body,
            method
        );

    if (body.contains("id") && envelope.id != id_to_json(request_id))
    {
        LOG4CPLUS_WARN(
            client_logger(),
            "Response ID '" << envelope.id.dump() << "' does not match request ID '"
                            << id_to_json(request_id).dump() << "' for method " << method
        );
    }

    return std::move(*envelope.result);
}

void RpcClient::notify(const std::string& method, const json& params)
{
    auto request = build_notification(method, params);

    LOG4CPLUS_DEBUG(client_logger(), "notify " << method);
    send(request, "sending notification " + method);
}

} // namespace httprpc
