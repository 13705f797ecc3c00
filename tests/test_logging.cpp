// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>
#include <httprpc/logging.hpp>
#include <log4cplus/appender.h>
#include <log4cplus/spi/loggingevent.h>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

using namespace httprpc;

namespace
{

/// Records every event that reaches it, with its level
class RecordingAppender : public log4cplus::Appender
{
  public:
    ~RecordingAppender() override
    {
        destructorImpl();
    }

    void close() override {}

    std::vector<std::pair<log4cplus::LogLevel, std::string>> events() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

  protected:
    void append(const log4cplus::spi::InternalLoggingEvent& event) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.emplace_back(event.getLogLevel(), LOG4CPLUS_TSTRING_TO_STRING(event.getMessage()));
    }

  private:
    mutable std::mutex mutex_;
    std::vector<std::pair<log4cplus::LogLevel, std::string>> events_;
};

} // namespace

TEST(LoggingTest, LoggerNamesFormOneHierarchy)
{
    EXPECT_EQ(LOG4CPLUS_TSTRING_TO_STRING(library_logger().getName()), "httprpc");
    EXPECT_EQ(LOG4CPLUS_TSTRING_TO_STRING(client_logger().getName()), "httprpc.client");
    EXPECT_EQ(LOG4CPLUS_TSTRING_TO_STRING(transport_logger().getName()), "httprpc.transport");
    EXPECT_EQ(
        LOG4CPLUS_TSTRING_TO_STRING(client_logger().getParent().getName()),
        LOG4CPLUS_TSTRING_TO_STRING(library_logger().getName())
    );
}

TEST(LoggingTest, MissingConfigFallsBackAndSaysSo)
{
    log4cplus::SharedAppenderPtr appender(new RecordingAppender);
    library_logger().addAppender(appender);

    init_logging("no-such-dir/httprpc-missing.properties");

    library_logger().removeAppender(appender);

    EXPECT_TRUE(library_logger().isEnabledFor(log4cplus::INFO_LOG_LEVEL));
    EXPECT_FALSE(library_logger().isEnabledFor(log4cplus::DEBUG_LOG_LEVEL));

    auto events = static_cast<RecordingAppender&>(*appender).events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].first, log4cplus::INFO_LOG_LEVEL);
    EXPECT_NE(events[0].second.find("no-such-dir/httprpc-missing.properties"), std::string::npos);
}
