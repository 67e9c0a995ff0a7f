#include "system-engine/network/UpdateProtocol.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <set>
#include <vector>

using namespace NixBlitz;
using namespace NixBlitz::System;

TEST(UpdateProtocolTest, DecodesAllCommands)
{
    EXPECT_TRUE(std::holds_alternative<SystemApi::SwitchConfig>(
        UpdateProtocol::decode("\"SwitchConfig\"").value().getVariant()));
    EXPECT_TRUE(std::holds_alternative<SystemApi::Reboot>(
        UpdateProtocol::decode("\"Reboot\"").value().getVariant()));
    EXPECT_TRUE(std::holds_alternative<SystemApi::DevReset>(
        UpdateProtocol::decode(R"({"DevReset": null})").value().getVariant()));
}

TEST(UpdateProtocolTest, RejectsInstallerCommands)
{
    const auto result = UpdateProtocol::decode("\"PerformSystemCheck\"");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().message, "Unknown variant: PerformSystemCheck");
}

TEST(UpdateProtocolTest, EncodesEvents)
{
    EXPECT_EQ(UpdateProtocol::encode(SystemApi::StateChanged{ State::Switching{} }),
        R"({"StateChanged":"Switching"})");
    EXPECT_EQ(UpdateProtocol::encode(SystemApi::StateChanged{ State::UpdateFailed{ "exit 1" } }),
        R"({"StateChanged":{"UpdateFailed":"exit 1"}})");
    EXPECT_EQ(UpdateProtocol::encode(SystemApi::UpdateLog{ "copying path" }),
        R"({"UpdateLog":"copying path"})");
    EXPECT_EQ(UpdateProtocol::encode(SystemApi::Error{ "boom" }), R"({"Error":"boom"})");
}

TEST(UpdateProtocolTest, EventsDecodeOnTheClientSide)
{
    const auto decoded = UpdateProtocol::decodeEvent(R"({"StateChanged":"UpdateSucceeded"})");

    ASSERT_TRUE(decoded.isValue());
    const auto* changed = std::get_if<SystemApi::StateChanged>(&decoded.value().getVariant());
    ASSERT_NE(changed, nullptr);
    EXPECT_EQ(State::getCurrentStateName(changed->state), "UpdateSucceeded");
}

TEST(UpdateProtocolTest, CommandsEncodeAsBareNames)
{
    EXPECT_EQ(UpdateProtocol::encodeCommand(SystemApi::SwitchConfig{}), "\"SwitchConfig\"");
}

TEST(UpdateProtocolTest, EveryCommandRoundTrips)
{
    const std::vector<SystemApi::ClientCommand> commands = {
        SystemApi::SwitchConfig{},
        SystemApi::DevReset{},
        SystemApi::Reboot{},
    };

    std::set<size_t> covered;
    for (const auto& command : commands) {
        SCOPED_TRACE(SystemApi::getCommandName(command));
        covered.insert(command.getVariant().index());

        const auto decoded = UpdateProtocol::decode(UpdateProtocol::encodeCommand(command));

        ASSERT_TRUE(decoded.isValue()) << decoded.errorValue().message;
        EXPECT_TRUE(decoded.value() == command);
    }
    EXPECT_EQ(covered.size(), std::variant_size_v<SystemApi::ClientCommand::Variant>);
}

TEST(UpdateProtocolTest, EveryEventAndStateRoundTrips)
{
    const std::vector<SystemApi::ServerEvent> events = {
        SystemApi::StateChanged{ State::Idle{} },
        SystemApi::StateChanged{ State::Switching{} },
        SystemApi::StateChanged{ State::UpdateFailed{ "Switch failed with exit code 1" } },
        SystemApi::StateChanged{ State::UpdateSucceeded{} },
        SystemApi::UpdateLog{ "[STDERR] activating the configuration..." },
        SystemApi::Error{ "Failed to reboot: permission denied" },
    };

    std::set<size_t> eventsCovered;
    std::set<size_t> statesCovered;
    for (const auto& event : events) {
        SCOPED_TRACE(UpdateProtocol::encode(event));
        eventsCovered.insert(event.getVariant().index());
        if (const auto* changed = std::get_if<SystemApi::StateChanged>(&event.getVariant())) {
            statesCovered.insert(changed->state.getVariant().index());
        }

        const auto decoded = UpdateProtocol::decodeEvent(UpdateProtocol::encode(event));

        ASSERT_TRUE(decoded.isValue()) << decoded.errorValue().message;
        EXPECT_TRUE(decoded.value() == event);
    }
    EXPECT_EQ(eventsCovered.size(), std::variant_size_v<SystemApi::ServerEvent::Variant>);
    EXPECT_EQ(statesCovered.size(), std::variant_size_v<State::Any::Variant>);
}
