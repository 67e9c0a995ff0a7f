#pragma once

#include "core/ApiError.h"
#include "core/CommandProcessor.h"
#include "core/EventBus.h"
#include "core/ProcessSupervisor.h"
#include "core/Result.h"
#include "core/StateMachineBase.h"
#include "core/StateStore.h"
#include "core/network/ObserverHub.h"
#include "system-engine/SystemConfig.h"
#include "system-engine/api/ClientCommand.h"
#include "system-engine/api/ServerEvent.h"
#include "system-engine/network/UpdateProtocol.h"
#include "system-engine/states/State.h"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace NixBlitz {
namespace System {

/**
 * @brief Switches an installed NixBlitz system to its current project configuration.
 */
class SystemEngine : public StateMachineBase {
public:
    struct Dependencies {
        std::function<std::unique_ptr<ProcessStream>(const CommandLine&)> spawnProcess;
        std::function<Result<std::monostate, ApiError>()> markChangesApplied;
        std::function<Result<std::monostate, ApiError>()> reboot;
    };

    struct TestMode {
        Dependencies dependencies;
        SystemConfig config;
    };

    explicit SystemEngine(const SystemConfig& config);
    explicit SystemEngine(TestMode mode);
    ~SystemEngine();

    Result<std::monostate, std::string> start();
    void stop();

    void mainLoopRun();
    void requestExit();

    void queueEvent(const SystemApi::ClientCommand& command);
    void processEvents();
    void handleEvent(const SystemApi::ClientCommand& command);

    std::string getCurrentStateName() const;
    State::Any currentState() const;

    StateStore<State::Any>& stateStore() { return store_; }
    EventBus<SystemApi::ServerEvent>& eventBus() { return bus_; }
    Network::ObserverHub<UpdateProtocol>& observers() { return *observers_; }
    const SystemConfig& config() const { return config_; }

    void publishError(const std::string& message);

    // Starts the switch worker. Called on entering Switching.
    void startSwitch();
    void waitForSwitches();

    // True while any switch worker, current or detached by DevReset, is still running.
    bool switchInProgress() const { return activeSwitches_.load() > 0; }
    size_t switchWorkerCount();

    uint64_t switchGeneration() const { return switchGeneration_.load(); }

    CommandLine switchCommand() const;
    CommandLine rebootCommand() const;

private:
    void handleDevReset();
    void handleReboot();

    void transitionTo(State::Any newState);
    void initializeDefaultDependencies();

    void runSwitch(uint64_t generation);
    void publishLog(uint64_t generation, std::string line);
    void reapFinishedSwitches();
    void finishSwitch(uint64_t generation, State::Any finalState);
    CommandLine withPrivilege(std::string program, std::vector<std::string> args) const;

    SystemConfig config_;
    Dependencies dependencies_;
    CommandProcessor<SystemApi::ClientCommand> commands_;
    StateStore<State::Any> store_{ State::Idle{} };
    EventBus<SystemApi::ServerEvent> bus_;
    std::unique_ptr<Network::ObserverHub<UpdateProtocol>> observers_;

    struct SwitchWorker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    std::atomic<uint64_t> switchGeneration_{ 0 };
    std::atomic<int> activeSwitches_{ 0 };
    std::mutex workersMutex_;
    std::vector<SwitchWorker> workers_;
};

} // namespace System
} // namespace NixBlitz
