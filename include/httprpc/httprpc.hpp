// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file httprpc.hpp
/// @brief Master include for the httprpc library
///
/// This header includes all public API headers for convenience.
/// You can also include individual headers for finer-grained control.

#include <httprpc/client.hpp>
#include <httprpc/errors.hpp>
#include <httprpc/id_generator.hpp>
#include <httprpc/jsonrpc.hpp>
#include <httprpc/logging.hpp>
#include <httprpc/transport.hpp>
#include <httprpc/transport_http.hpp>
#include <httprpc/types.hpp>

namespace httprpc
{

/// Library version string
inline constexpr const char* kVersion = "0.1.0";

} // namespace httprpc
