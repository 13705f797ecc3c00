// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <httprpc/logging.hpp>

#include <filesystem>
#include <log4cplus/configurator.h>
#include <log4cplus/helpers/loglog.h>

namespace httprpc
{

log4cplus::Logger& library_logger()
{
    static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("httprpc"));
    return logger;
}

log4cplus::Logger& client_logger()
{
    static log4cplus::Logger logger =
        log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("httprpc.client"));
    return logger;
}

log4cplus::Logger& transport_logger()
{
    static log4cplus::Logger logger =
        log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("httprpc.transport"));
    return logger;
}

void init_logging(const std::string& config_path)
{
    try
    {
        std::filesystem::path path(config_path);
        if (!path.is_absolute())
            path = std::filesystem::current_path() / path;
        if (std::filesystem::exists(path))
        {
            log4cplus::PropertyConfigurator::doConfigure(LOG4CPLUS_STRING_TO_TSTRING(path.string()));
            LOG4CPLUS_DEBUG(library_logger(), "Logging configured from " << path.string());
            return;
        }
    }
    catch (const std::exception& e)
    {
        log4cplus::helpers::LogLog::getLogLog()->error(
            LOG4CPLUS_TEXT("Failed to load logging config: ") + LOG4CPLUS_STRING_TO_TSTRING(e.what())
        );
    }

    log4cplus::BasicConfigurator fallback;
    fallback.configure();
    log4cplus::Logger::getRoot().setLogLevel(log4cplus::INFO_LOG_LEVEL);
    LOG4CPLUS_INFO(library_logger(), "No logging config at " << config_path << ", using console defaults");
}

} // namespace httprpc
