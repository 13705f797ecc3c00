// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file logging.hpp
/// @brief log4cplus loggers used by the library

#include <log4cplus/logger.h>
#include <log4cplus/loggingmacros.h>
#include <string>

namespace httprpc
{

/// Parent logger "httprpc"
log4cplus::Logger& library_logger();

/// Logger "httprpc.client": requests, failures, id mismatch warnings
log4cplus::Logger& client_logger();

/// Logger "httprpc.transport": connection and HTTP level events
log4cplus::Logger& transport_logger();

/// Configure log4cplus from a properties file.
/// Falls back to a basic console configuration at INFO level when the file
/// is missing or cannot be loaded.
void init_logging(const std::string& config_path);

} // namespace httprpc
