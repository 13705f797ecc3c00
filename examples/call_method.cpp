// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

/// @file call_method.cpp
/// @brief Call one JSON-RPC method and print the result
///
/// Usage: call_method <endpoint> <method> [params-json]
/// e.g.   call_method http://localhost:10002 tasks/send '{"id":"42"}'

#include <chrono>
#include <httprpc/httprpc.hpp>
#include <iostream>
#include <string>

int main(int argc, char** argv)
{
    if (argc < 3)
    {
        std::cerr << "usage: " << argv[0] << " <endpoint> <method> [params-json]\n";
        return 2;
    }

    httprpc::init_logging("log4cplus.properties");

    httprpc::json params;
    if (argc > 3)
    {
        try
        {
            params = httprpc::json::parse(argv[3]);
        }
        catch (const httprpc::json::parse_error& e)
        {
            std::cerr << "Invalid params JSON: " << e.what() << "\n";
            return 2;
        }
    }

    try
    {
        httprpc::RpcClientOptions options;
        options.endpoint = argv[1];
        options.transport_options.io_timeout = std::chrono::seconds(10);

        httprpc::RpcClient client(options);
        client.open();

        auto result = client.call(argv[2], params);
        std::cout << result.dump(2) << "\n";
        return 0;
    }
    catch (const httprpc::ProtocolError& e)
    {
        std::cerr << "JSON-RPC Error: " << e.code() << " - " << e.message() << "\n";
        if (!e.data().is_null())
            std::cerr << "Error Data: " << e.data().dump() << "\n";
    }
    catch (const httprpc::HttpStatusError& e)
    {
        std::cerr << "HTTP Error: " << e.status() << "\n";
        std::cerr << "Response body: " << e.body() << "\n";
    }
    catch (const httprpc::RpcError& e)
    {
        std::cerr << httprpc::to_string(e.kind()) << " error: " << e.what() << "\n";
        if (httprpc::is_retryable(e))
            std::cerr << "(the request may be retried)\n";
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        return 2;
    }
    return 1;
}
