#include "core/LoggingChannels.h"

#include <gtest/gtest.h>

#include <memory>
#include <thread>
#include <vector>

using namespace NixBlitz;

TEST(LoggingChannelsTest, ConcurrentFirstUseYieldsOneLoggerPerChannel)
{
    std::vector<std::shared_ptr<spdlog::logger>> loggers(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < loggers.size(); ++i) {
        threads.emplace_back(
            [&loggers, i] { loggers[i] = LoggingChannels::get(LogChannel::Install); });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& logger : loggers) {
        ASSERT_NE(logger, nullptr);
        EXPECT_EQ(logger, loggers.front());
    }
    EXPECT_EQ(loggers.front()->name(), toString(LogChannel::Install));
}

TEST(LoggingChannelsTest, ChannelLevelsCanBeOverriddenFromString)
{
    auto network = LoggingChannels::get(LogChannel::Network);
    LoggingChannels::configureFromString("network:warn");

    EXPECT_EQ(network->level(), spdlog::level::warn);
    EXPECT_EQ(LoggingChannels::get(LogChannel::Network), network);

    LoggingChannels::configureFromString("network:info");
    EXPECT_EQ(network->level(), spdlog::level::info);
}
