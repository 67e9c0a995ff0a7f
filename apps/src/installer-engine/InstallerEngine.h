#pragma once

#include "core/ApiError.h"
#include "core/CommandProcessor.h"
#include "core/EventBus.h"
#include "core/ProcessSupervisor.h"
#include "core/Result.h"
#include "core/StateMachineBase.h"
#include "core/StateStore.h"
#include "core/SystemInfo.h"
#include "core/network/ObserverHub.h"
#include "installer-engine/InstallSteps.h"
#include "installer-engine/InstallerConfig.h"
#include "installer-engine/api/ClientCommand.h"
#include "installer-engine/api/ServerEvent.h"
#include "installer-engine/network/InstallProtocol.h"
#include "installer-engine/states/State.h"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace NixBlitz {
namespace Installer {

/**
 * @brief Drives a NixBlitz installation from system check to installed disk.
 *
 * Commands from all observers are queued and handled one at a time on the main loop
 * thread. The install build runs on a worker thread that only touches the state through
 * the state store, and only while its build generation is current.
 */
class InstallerEngine : public StateMachineBase {
public:
    struct Dependencies {
        std::function<SystemSummary()> systemSummary;
        std::function<CheckResult(const SystemSummary&)> systemCheck;
        std::function<ProcessList()> processList;
        std::function<Result<std::vector<DiskInfo>, ApiError>()> listDisks;
        std::function<Result<std::vector<std::string>, ApiError>()> enabledApps;
        std::function<std::unique_ptr<ProcessStream>(const CommandLine&)> spawnProcess;
    };

    struct TestMode {
        Dependencies dependencies;
        InstallerConfig config;
    };

    explicit InstallerEngine(const InstallerConfig& config);
    explicit InstallerEngine(TestMode mode);
    ~InstallerEngine();

    Result<std::monostate, std::string> start();
    void stop();

    void mainLoopRun();
    void requestExit();

    void queueEvent(const InstallApi::ClientCommand& command);
    void processEvents();
    void handleEvent(const InstallApi::ClientCommand& command);

    std::string getCurrentStateName() const;
    State::Any currentState() const;

    StateStore<State::Any>& stateStore() { return store_; }
    EventBus<InstallApi::ServerEvent>& eventBus() { return bus_; }
    Network::ObserverHub<InstallProtocol>& observers() { return *observers_; }
    const InstallerConfig& config() const { return config_; }

    void publish(const InstallApi::ServerEvent& event);
    void publishError(const std::string& message);

    Result<std::vector<DiskInfo>, ApiError> listDisks();
    Result<std::vector<std::string>, ApiError> enabledApps();

    void selectDisk(const std::string& path);
    // The selected disk, else the configured default disk.
    std::optional<std::string> installDisk() const;

    // Starts the disko-install worker for installDisk(). Called on entering Installing.
    void startBuild();

    // Blocks until every build worker has exited.
    void waitForBuilds();

    // True while any build worker, current or detached by DevReset, is still running.
    bool buildInProgress() const { return activeBuilds_.load() > 0; }
    size_t buildWorkerCount();

    uint64_t buildGeneration() const { return buildGeneration_.load(); }

    CommandLine installCommand(const std::string& disk) const;
    std::vector<CommandLine> copyConfigCommands(const std::string& disk) const;

private:
    friend struct InstallerEngineTestAccessor;

    void handlePerformSystemCheck();
    void handleGetSystemSummary();
    void handleGetProcessList();
    void handleDevReset();

    void transitionTo(State::Any newState);
    void initializeDefaultDependencies();

    void runBuild(uint64_t generation, const std::string& disk);
    void publishLog(uint64_t generation, std::string line);
    void reapFinishedBuilds();
    void publishStepUpdates(uint64_t generation, const StepTracker& tracker,
        const std::vector<InstallStep>& updates);
    void failBuild(uint64_t generation, StepTracker& tracker, const std::string& message);
    void finishBuild(uint64_t generation, State::Any finalState);
    Result<std::monostate, ApiError> copyConfig(uint64_t generation, const std::string& disk);
    Result<ProcessCompleted, ApiError> runLogged(uint64_t generation, const CommandLine& command);
    CommandLine withPrivilege(std::string program, std::vector<std::string> args) const;

    InstallerConfig config_;
    Dependencies dependencies_;
    CommandProcessor<InstallApi::ClientCommand> commands_;
    StateStore<State::Any> store_{ State::Idle{} };
    EventBus<InstallApi::ServerEvent> bus_;
    std::unique_ptr<Network::ObserverHub<InstallProtocol>> observers_;
    std::optional<std::string> selectedDisk_;

    struct BuildWorker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    std::atomic<uint64_t> buildGeneration_{ 0 };
    std::atomic<int> activeBuilds_{ 0 };
    std::mutex workersMutex_;
    std::vector<BuildWorker> workers_;
};

} // namespace Installer
} // namespace NixBlitz
