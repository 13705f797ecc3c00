// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file jsonrpc.hpp
/// @brief JSON-RPC 2.0 envelope types

#include <cstdint>
#include <httprpc/types.hpp>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace httprpc
{

/// Standard JSON-RPC 2.0 error codes
enum class JsonRpcErrorCode : int
{
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,

    // Server errors (-32000 to -32099)
    ServerError = -32000,
};

// =============================================================================
// JSON-RPC 2.0 Message Types
// =============================================================================

/// JSON-RPC 2.0 Request
struct JsonRpcRequest
{
    std::string method;
    json params;
    std::optional<JsonRpcId> id; // nullopt for notifications

    json to_json() const
    {
        json j = {{"jsonrpc", kJsonRpcVersion}, {"method", method}};
        if (!params.is_null())
            j["params"] = params;
        if (id)
            j["id"] = id_to_json(*id);
        return j;
    }

    static JsonRpcRequest from_json(const json& j)
    {
        JsonRpcRequest req;
        req.method = j.at("method").get<std::string>();
        if (j.contains("params"))
            req.params = j.at("params");
        if (j.contains("id") && !j.at("id").is_null())
            req.id = id_from_json(j.at("id"));
        return req;
    }

    bool is_notification() const
    {
        return !id.has_value();
    }
};

/// JSON-RPC 2.0 Error object
struct JsonRpcErrorObject
{
    int code = 0;
    std::string message;
    json data;

    json to_json() const
    {
        json j = {{"code", code}, {"message", message}};
        if (!data.is_null())
            j["data"] = data;
        return j;
    }

    /// @throws std::invalid_argument unless j is an object with an integer
    ///         "code" and a string "message"
    static JsonRpcErrorObject from_json(const json& j)
    {
        if (!j.is_object())
            throw std::invalid_argument("error member is not an object");
        if (!j.contains("code") || !j.at("code").is_number_integer())
            throw std::invalid_argument("error member has no integer code");
        const auto& code = j.at("code");
        bool in_range = code.is_number_unsigned()
                            ? code.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
                            : code.get<int64_t>() >= std::numeric_limits<int>::min() &&
                                  code.get<int64_t>() <= std::numeric_limits<int>::max();
        if (!in_range)
            throw std::invalid_argument("error member code " + code.dump() + " is out of range");
        if (!j.contains("message") || !j.at("message").is_string())
            throw std::invalid_argument("error member has no string message");

        JsonRpcErrorObject err;
        err.code = code.get<int>();
        err.message = j.at("message").get<std::string>();
        if (j.contains("data"))
            err.data = j.at("data");
        return err;
    }
};

/// JSON-RPC 2.0 Response
///
/// The id is kept as raw JSON so a server-rewritten or null id can be
/// surfaced to the caller untouched.
struct JsonRpcResponse
{
    json id;
    std::optional<json> result;
    std::optional<JsonRpcErrorObject> error;

    json to_json() const
    {
        json j = {{"jsonrpc", kJsonRpcVersion}, {"id", id}};
        if (result)
            j["result"] = *result;
        if (error)
            j["error"] = error->to_json();
        return j;
    }

    /// Decode a response envelope. A null "error" member counts as absent.
    /// @throws std::invalid_argument if j is not an object or the error member is invalid
    static JsonRpcResponse from_json(const json& j)
    {
        if (!j.is_object())
            throw std::invalid_argument("response is not a JSON object");

        JsonRpcResponse resp;
        if (j.contains("id"))
            resp.id = j.at("id");
        if (j.contains("result"))
            resp.result = j.at("result");
        if (j.contains("error") && !j.at("error").is_null())
            resp.error = JsonRpcErrorObject::from_json(j.at("error"));
        return resp;
    }

    bool is_error() const
    {
        return error.has_value();
    }
};

} // namespace httprpc
