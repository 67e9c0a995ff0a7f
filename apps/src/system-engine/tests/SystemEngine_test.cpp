#include "system-engine/SystemEngine.h"
#include <chrono>
#include <functional>
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace NixBlitz;
using namespace NixBlitz::System;

namespace {

std::vector<SystemApi::ServerEvent> drain(Subscription<SystemApi::ServerEvent>& subscription)
{
    std::vector<SystemApi::ServerEvent> events;
    while (auto item = subscription.tryReceive()) {
        auto* event = std::get_if<SystemApi::ServerEvent>(&item.value());
        if (!event) {
            break;
        }
        events.push_back(std::move(*event));
    }
    return events;
}

template <typename T>
std::vector<T> eventsOf(const std::vector<SystemApi::ServerEvent>& events)
{
    std::vector<T> matching;
    for (const auto& event : events) {
        if (const auto* typed = std::get_if<T>(&event.getVariant())) {
            matching.push_back(*typed);
        }
    }
    return matching;
}

std::vector<std::string> stateNames(const std::vector<SystemApi::ServerEvent>& events)
{
    std::vector<std::string> names;
    for (const auto& changed : eventsOf<SystemApi::StateChanged>(events)) {
        names.push_back(State::getCurrentStateName(changed.state));
    }
    return names;
}

bool waitUntil(const std::function<bool()>& condition)
{
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!condition()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

} // namespace

class SystemEngineTest : public ::testing::Test {
protected:
    void createEngine(const std::string& script)
    {
        engine.reset();
        dependencies.spawnProcess = [this, script](const CommandLine& command) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                spawned.push_back(command);
            }
            return ProcessSupervisor::spawn(CommandLine{ "/bin/sh", { "-c", script } });
        };
        dependencies.markChangesApplied = [this] {
            ++markCalls;
            return Result<std::monostate, ApiError>::okay(std::monostate{});
        };
        dependencies.reboot = [this] {
            ++rebootCalls;
            return Result<std::monostate, ApiError>::okay(std::monostate{});
        };
        recreate();
    }

    void recreate()
    {
        SystemConfig config;
        config.work_dir = "/home/admin/nixblitz";
        config.demo = demo;
        engine = std::make_unique<SystemEngine>(SystemEngine::TestMode{
            .dependencies = dependencies,
            .config = config,
        });
        subscription = engine->eventBus().subscribe();
    }

    void TearDown() override
    {
        subscription.reset();
        engine.reset();
    }

    size_t spawnedCount()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return spawned.size();
    }

    SystemEngine::Dependencies dependencies;
    bool demo = false;
    std::mutex mutex;
    std::vector<CommandLine> spawned;
    int markCalls = 0;
    int rebootCalls = 0;
    std::unique_ptr<SystemEngine> engine;
    std::shared_ptr<Subscription<SystemApi::ServerEvent>> subscription;
};

TEST_F(SystemEngineTest, SuccessfulSwitchMarksChangesAppliedAndReturnsToIdle)
{
    createEngine("echo 'building the system configuration'; echo 'activating' >&2");

    engine->handleEvent(SystemApi::SwitchConfig{});
    engine->waitForSwitches();

    const auto events = drain(*subscription);
    EXPECT_EQ(stateNames(events), (std::vector<std::string>{ "Switching", "Idle" }));
    const auto logs = eventsOf<SystemApi::UpdateLog>(events);
    ASSERT_EQ(logs.size(), 2u);
    EXPECT_TRUE(logs[0].line == "[STDERR] activating" || logs[1].line == "[STDERR] activating");
    EXPECT_TRUE(eventsOf<SystemApi::Error>(events).empty());
    EXPECT_EQ(markCalls, 1);

    ASSERT_EQ(spawned.size(), 1u);
    EXPECT_EQ(spawned[0].program, "doas");
    EXPECT_EQ(
        spawned[0].args,
        (std::vector<std::string>{ "nixblitz", "apply", "--work-dir", "/home/admin/nixblitz" }));
}

TEST_F(SystemEngineTest, FailedSwitchEndsInUpdateFailed)
{
    createEngine("echo 'error: attribute missing' >&2; exit 1");

    engine->handleEvent(SystemApi::SwitchConfig{});
    engine->waitForSwitches();

    const auto events = drain(*subscription);
    EXPECT_EQ(stateNames(events), (std::vector<std::string>{ "Switching", "UpdateFailed" }));
    const auto errors = eventsOf<SystemApi::Error>(events);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].message, "Switch failed with exit code 1");
    EXPECT_EQ(markCalls, 0);

    const auto state = engine->currentState();
    const auto* failed = std::get_if<State::UpdateFailed>(&state.getVariant());
    ASSERT_NE(failed, nullptr);
    EXPECT_EQ(failed->message, "Switch failed with exit code 1");
}

TEST_F(SystemEngineTest, MarkChangesAppliedFailureIsReported)
{
    createEngine("true");
    dependencies.markChangesApplied = [] {
        return Result<std::monostate, ApiError>::error(ApiError("read-only file system"));
    };
    recreate();

    engine->handleEvent(SystemApi::SwitchConfig{});
    engine->waitForSwitches();

    const auto errors = eventsOf<SystemApi::Error>(drain(*subscription));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].message, "Failed to mark changes applied: read-only file system");
    EXPECT_EQ(engine->getCurrentStateName(), "Idle");
}

TEST_F(SystemEngineTest, SwitchIsRejectedWhileSwitching)
{
    createEngine("sleep 1");
    engine->handleEvent(SystemApi::SwitchConfig{});
    ASSERT_EQ(engine->getCurrentStateName(), "Switching");
    drain(*subscription);

    engine->handleEvent(SystemApi::SwitchConfig{});

    const auto errors = eventsOf<SystemApi::Error>(drain(*subscription));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].message, "Command SwitchConfig not supported in state Switching");
    engine->waitForSwitches();
    EXPECT_EQ(spawnedCount(), 1u);
}

TEST_F(SystemEngineTest, SwitchCanBeRetriedAfterFailure)
{
    createEngine("exit 2");
    engine->handleEvent(SystemApi::SwitchConfig{});
    engine->waitForSwitches();
    ASSERT_EQ(engine->getCurrentStateName(), "UpdateFailed");
    drain(*subscription);

    engine->handleEvent(SystemApi::SwitchConfig{});
    engine->waitForSwitches();

    const auto events = drain(*subscription);
    EXPECT_EQ(stateNames(events), (std::vector<std::string>{ "Switching", "UpdateFailed" }));
    EXPECT_EQ(spawnedCount(), 2u);
}

TEST_F(SystemEngineTest, DetachedSwitchOutputIsNotBroadcast)
{
    createEngine("sleep 1; echo 'late line'; echo 'late error' >&2");
    engine->handleEvent(SystemApi::SwitchConfig{});
    engine->handleEvent(SystemApi::DevReset{});
    drain(*subscription);

    engine->waitForSwitches();

    const auto events = drain(*subscription);
    EXPECT_TRUE(eventsOf<SystemApi::UpdateLog>(events).empty());
    EXPECT_TRUE(stateNames(events).empty());
    EXPECT_EQ(markCalls, 0);
}

TEST_F(SystemEngineTest, SwitchConfigWaitsForDetachedSwitchToExit)
{
    createEngine("sleep 1");
    engine->handleEvent(SystemApi::SwitchConfig{});
    ASSERT_TRUE(waitUntil([this] { return spawnedCount() == 1; }));
    engine->handleEvent(SystemApi::DevReset{});
    drain(*subscription);

    engine->handleEvent(SystemApi::SwitchConfig{});

    const auto errors = eventsOf<SystemApi::Error>(drain(*subscription));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].message, "A previous build is still running");
    EXPECT_EQ(engine->getCurrentStateName(), "Idle");

    engine->waitForSwitches();
    EXPECT_FALSE(engine->switchInProgress());
    engine->handleEvent(SystemApi::SwitchConfig{});
    EXPECT_EQ(engine->getCurrentStateName(), "Switching");
    engine->waitForSwitches();
    EXPECT_EQ(spawnedCount(), 2u);
}

TEST_F(SystemEngineTest, FinishedSwitchWorkersAreReaped)
{
    createEngine("true");
    engine->handleEvent(SystemApi::SwitchConfig{});
    ASSERT_TRUE(waitUntil([this] { return !engine->switchInProgress(); }));
    EXPECT_EQ(engine->getCurrentStateName(), "Idle");
    EXPECT_EQ(engine->switchWorkerCount(), 1u);

    engine->handleEvent(SystemApi::SwitchConfig{});

    EXPECT_EQ(engine->switchWorkerCount(), 1u);
    engine->waitForSwitches();
    EXPECT_EQ(engine->switchWorkerCount(), 0u);
}

TEST_F(SystemEngineTest, DevResetReturnsToIdleAndDetachesSwitch)
{
    createEngine("sleep 1; exit 1");
    engine->handleEvent(SystemApi::SwitchConfig{});

    engine->handleEvent(SystemApi::DevReset{});
    EXPECT_EQ(engine->getCurrentStateName(), "Idle");
    engine->waitForSwitches();

    const auto events = drain(*subscription);
    EXPECT_EQ(stateNames(events), (std::vector<std::string>{ "Switching", "Idle" }));
    EXPECT_TRUE(eventsOf<SystemApi::Error>(events).empty());
    EXPECT_EQ(engine->getCurrentStateName(), "Idle");
}

TEST_F(SystemEngineTest, RebootCallsCollaboratorWithoutStateChange)
{
    createEngine("true");

    engine->handleEvent(SystemApi::Reboot{});

    EXPECT_EQ(rebootCalls, 1);
    EXPECT_TRUE(drain(*subscription).empty());
    EXPECT_EQ(engine->getCurrentStateName(), "Idle");
}

TEST_F(SystemEngineTest, RebootFailureIsReported)
{
    createEngine("true");
    dependencies.reboot = [] {
        return Result<std::monostate, ApiError>::error(ApiError("exit code 1"));
    };
    recreate();

    engine->handleEvent(SystemApi::Reboot{});

    const auto errors = eventsOf<SystemApi::Error>(drain(*subscription));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].message, "Failed to reboot: exit code 1");
}

TEST_F(SystemEngineTest, DemoModeSkipsRebootAndUsesScriptedSwitch)
{
    demo = true;
    createEngine("true");

    engine->handleEvent(SystemApi::Reboot{});
    EXPECT_EQ(rebootCalls, 0);

    const auto command = engine->switchCommand();
    EXPECT_EQ(command.program, "/bin/sh");
    ASSERT_EQ(command.args.size(), 2u);
    EXPECT_NE(command.args[1].find("[PostSwitch]"), std::string::npos);
}
