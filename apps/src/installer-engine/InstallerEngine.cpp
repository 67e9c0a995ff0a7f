#include "InstallerEngine.h"
#include "core/LoggingChannels.h"
#include "core/Project.h"
#include "core/StateLifecycle.h"

#include <chrono>

namespace NixBlitz {
namespace Installer {

namespace {

constexpr const char* kConfigMountPoint = "/mnt/data/config";

// Prints the disko-install landmarks with pauses, so the whole pipeline can be exercised
// without touching a disk.
constexpr const char* kDemoInstallScript = "echo \"unpacking 'github:NixOS/nixpkgs'\"; sleep 1; "
                                           "echo 'these 42 derivations will be built:'; sleep 4; "
                                           "echo '+ sgdisk --zap-all /dev/demo'; sleep 1; "
                                           "echo 'mount /dev/disk/by-partlabel/disk-main-root "
                                           "/mnt'; sleep 1; "
                                           "echo 'Copying store paths to /mnt'; sleep 3; "
                                           "echo 'installing the boot loader...'; sleep 1; "
                                           "echo 'installation finished!'";

} // namespace

InstallerEngine::InstallerEngine(const InstallerConfig& config)
    : config_(config), bus_(static_cast<size_t>(config.event_capacity))
{
    initializeDefaultDependencies();
    observers_ = std::make_unique<Network::ObserverHub<InstallProtocol>>(
        store_, bus_, [this](InstallApi::ClientCommand command) { queueEvent(command); });
}

InstallerEngine::InstallerEngine(TestMode mode)
    : config_(std::move(mode.config)),
      dependencies_(std::move(mode.dependencies)),
      bus_(static_cast<size_t>(config_.event_capacity))
{
    observers_ = std::make_unique<Network::ObserverHub<InstallProtocol>>(
        store_, bus_, [this](InstallApi::ClientCommand command) { queueEvent(command); });
}

InstallerEngine::~InstallerEngine()
{
    stop();
}

void InstallerEngine::initializeDefaultDependencies()
{
    dependencies_.systemSummary = [] { return SystemInfo::collectSummary(); };
    dependencies_.systemCheck = [](const SystemSummary& summary) {
        return SystemInfo::performSystemCheck(summary);
    };
    dependencies_.processList = [] { return SystemInfo::collectProcesses(); };
    dependencies_.listDisks = [] { return SystemInfo::listDisks(); };
    dependencies_.enabledApps = [this] { return Project(config_.work_dir).enabledApps(); };
    dependencies_.spawnProcess = [](const CommandLine& command) {
        return ProcessSupervisor::spawn(command);
    };
}

Result<std::monostate, std::string> InstallerEngine::start()
{
    auto listenResult = observers_->listen(config_.port, config_.bind_address);
    if (listenResult.isError()) {
        return listenResult;
    }

    LOG_INFO(Network, "installer-engine listening on {}:{}", config_.bind_address, config_.port);
    return Result<std::monostate, std::string>::okay(std::monostate{});
}

void InstallerEngine::stop()
{
    if (observers_) {
        observers_->stop();
    }
    commands_.close();
    waitForBuilds();
    bus_.close();
}

void InstallerEngine::mainLoopRun()
{
    LOG_INFO(State, "Starting main event loop");
    transitionTo(State::Idle{});

    while (!shouldExit()) {
        processEvents();
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    LOG_INFO(State, "Main event loop exiting (shouldExit=true)");
}

void InstallerEngine::requestExit()
{
    setShouldExit(true);
}

void InstallerEngine::queueEvent(const InstallApi::ClientCommand& command)
{
    LOG_INFO(State, "Queueing command: {}", InstallApi::getCommandName(command));
    commands_.enqueue(command);
}

void InstallerEngine::processEvents()
{
    commands_.drainInto(*this);
}

std::string InstallerEngine::getCurrentStateName() const
{
    return State::getCurrentStateName(store_.read());
}

State::Any InstallerEngine::currentState() const
{
    return store_.read();
}

void InstallerEngine::publish(const InstallApi::ServerEvent& event)
{
    bus_.publish(event);
}

void InstallerEngine::publishError(const std::string& message)
{
    LOG_WARN(State, "Error: {}", message);
    bus_.publish(InstallApi::Error{ message });
}

void InstallerEngine::handleEvent(const InstallApi::ClientCommand& command)
{
    LOG_INFO(State, "Handling command: {}", InstallApi::getCommandName(command));
    const auto& variant = command.getVariant();

    // Commands that are valid in any state.
    if (std::holds_alternative<InstallApi::PerformSystemCheck>(variant)) {
        handlePerformSystemCheck();
        return;
    }
    if (std::holds_alternative<InstallApi::GetSystemSummary>(variant)) {
        handleGetSystemSummary();
        return;
    }
    if (std::holds_alternative<InstallApi::GetProcessList>(variant)) {
        handleGetProcessList();
        return;
    }
    if (std::holds_alternative<InstallApi::DevReset>(variant)) {
        handleDevReset();
        return;
    }

    State::Any current = store_.read();
    std::visit(
        [this, &current](auto&& cmd) {
            std::visit(
                [this, &cmd, &current](auto&& state) -> void {
                    if constexpr (requires { state.onEvent(cmd, *this); }) {
                        State::Any newState = state.onEvent(cmd, *this);
                        // States are values; staying put leaves the store untouched.
                        if (!isSameStateKind(newState, current)) {
                            transitionTo(std::move(newState));
                        }
                    }
                    else {
                        publishError(
                            std::string("Command ") + cmd.name() + " not supported in state "
                            + state.name());
                    }
                },
                current.getVariant());
        },
        variant);
}

void InstallerEngine::handlePerformSystemCheck()
{
    const State::Any previous = store_.read();
    if (std::holds_alternative<State::Installing>(previous.getVariant())) {
        publishError("Command PerformSystemCheck not supported in state Installing");
        return;
    }

    transitionTo(State::PerformingCheck{});

    try {
        const SystemSummary summary = dependencies_.systemSummary();
        CheckResult result = dependencies_.systemCheck(summary);
        LOG_INFO(
            System,
            "System check: {} ({} issues)",
            result.is_compatible ? "compatible" : "not compatible",
            result.issues.size());
        transitionTo(State::SystemCheckCompleted{ .result = std::move(result) });
    }
    catch (const std::exception& e) {
        publishError(std::string("System check failed: ") + e.what());
        transitionTo(previous);
    }
}

void InstallerEngine::handleGetSystemSummary()
{
    try {
        publish(InstallApi::SystemSummaryUpdated{ dependencies_.systemSummary() });
    }
    catch (const std::exception& e) {
        publishError(std::string("Failed to read system summary: ") + e.what());
    }
}

void InstallerEngine::handleGetProcessList()
{
    try {
        publish(InstallApi::ProcessListUpdated{ dependencies_.processList() });
    }
    catch (const std::exception& e) {
        publishError(std::string("Failed to read process list: ") + e.what());
    }
}

void InstallerEngine::handleDevReset()
{
    // A running build keeps going but can no longer touch the state.
    const uint64_t generation = ++buildGeneration_;
    LOG_INFO(State, "DevReset (build generation now {})", generation);
    selectedDisk_.reset();
    transitionTo(State::Idle{});
}

Result<std::vector<DiskInfo>, ApiError> InstallerEngine::listDisks()
{
    try {
        return dependencies_.listDisks();
    }
    catch (const std::exception& e) {
        return Result<std::vector<DiskInfo>, ApiError>::error(ApiError(e.what()));
    }
}

Result<std::vector<std::string>, ApiError> InstallerEngine::enabledApps()
{
    try {
        return dependencies_.enabledApps();
    }
    catch (const std::exception& e) {
        return Result<std::vector<std::string>, ApiError>::error(ApiError(e.what()));
    }
}

void InstallerEngine::selectDisk(const std::string& path)
{
    LOG_INFO(Install, "Install disk selected: {}", path);
    selectedDisk_ = path;
}

std::optional<std::string> InstallerEngine::installDisk() const
{
    if (selectedDisk_.has_value()) {
        return selectedDisk_;
    }
    if (!config_.default_disk.empty()) {
        return config_.default_disk;
    }
    return std::nullopt;
}

void InstallerEngine::transitionTo(State::Any newState)
{
    State::Any oldState = store_.read();
    const std::string oldStateName = State::getCurrentStateName(oldState);

    invokeOnExit(oldState, *this);

    store_.replace(std::move(newState), [this](const State::Any& committed) {
        bus_.publish(InstallApi::StateChanged{ committed });
    });

    State::Any entered = store_.read();
    LOG_INFO(
        State,
        "Installer::StateMachine: {} -> {}",
        oldStateName,
        State::getCurrentStateName(entered));

    const auto expectedIndex = entered.getVariant().index();
    entered = invokeOnEnter(std::move(entered), *this);
    if (entered.getVariant().index() != expectedIndex) {
        transitionTo(std::move(entered));
    }
}

CommandLine InstallerEngine::withPrivilege(std::string program, std::vector<std::string> args) const
{
    if (config_.privilege_command.empty()) {
        return CommandLine{ std::move(program), std::move(args) };
    }
    args.insert(args.begin(), std::move(program));
    return CommandLine{ config_.privilege_command, std::move(args) };
}

CommandLine InstallerEngine::installCommand(const std::string& disk) const
{
    if (config_.demo) {
        return CommandLine{ "/bin/sh", { "-c", kDemoInstallScript } };
    }
    const std::string flake = config_.work_dir + "/src#" + config_.nixos_config;
    return withPrivilege("disko-install", { "--flake", flake, "--disk", "main", disk });
}

std::vector<CommandLine> InstallerEngine::copyConfigCommands(const std::string& disk) const
{
    const std::string partition =
        disk.rfind("/dev/nvme", 0) == 0 ? disk + "p3" : disk + "3";

    return {
        withPrivilege("mkdir", { "-p", kConfigMountPoint }),
        withPrivilege("mount", { partition, kConfigMountPoint }),
        withPrivilege("rsync", { "-av", "--delete", config_.work_dir, kConfigMountPoint }),
        withPrivilege("chown", { "-R", "1000:100", kConfigMountPoint }),
    };
}

void InstallerEngine::startBuild()
{
    const auto disk = installDisk();
    if (!disk.has_value()) {
        // Installing is only entered with a disk; keep the failure observable anyway.
        publishError("No install disk selected");
        transitionTo(State::InstallFailed{ .message = "No install disk selected" });
        return;
    }

    const uint64_t generation = buildGeneration_.load();
    LOG_INFO(Install, "Starting installation on {} (build {})", disk.value(), generation);

    std::lock_guard<std::mutex> lock(workersMutex_);
    reapFinishedBuilds();

    auto finished = std::make_shared<std::atomic<bool>>(false);
    ++activeBuilds_;
    workers_.push_back(BuildWorker{
        .thread = std::thread([this, generation, finished, target = disk.value()] {
            runBuild(generation, target);
            finished->store(true);
            --activeBuilds_;
        }),
        .finished = finished,
    });
}

// Requires workersMutex_.
void InstallerEngine::reapFinishedBuilds()
{
    std::erase_if(workers_, [](BuildWorker& worker) {
        if (!worker.finished->load()) {
            return false;
        }
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
        return true;
    });
}

size_t InstallerEngine::buildWorkerCount()
{
    std::lock_guard<std::mutex> lock(workersMutex_);
    return workers_.size();
}

void InstallerEngine::waitForBuilds()
{
    std::vector<BuildWorker> workers;
    {
        std::lock_guard<std::mutex> lock(workersMutex_);
        workers.swap(workers_);
    }
    if (!workers.empty()) {
        LOG_INFO(Install, "Waiting for {} build worker(s) to exit", workers.size());
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

void InstallerEngine::runBuild(uint64_t generation, const std::string& disk)
{
    StepTracker tracker;
    publishStepUpdates(generation, tracker, tracker.begin());

    const CommandLine command = installCommand(disk);
    auto stream = dependencies_.spawnProcess(command);

    std::optional<ProcessCompleted> completed;
    std::optional<std::string> spawnError;
    while (auto item = stream->next()) {
        if (const auto* out = std::get_if<ProcessStdout>(&item.value())) {
            publishLog(generation, out->line);
            publishStepUpdates(generation, tracker, tracker.observeLine(out->line));
        }
        else if (const auto* err = std::get_if<ProcessStderr>(&item.value())) {
            publishLog(generation, "[STDERR] " + err->line);
            publishStepUpdates(generation, tracker, tracker.observeLine(err->line));
        }
        else if (const auto* done = std::get_if<ProcessCompleted>(&item.value())) {
            completed = *done;
        }
        else if (const auto* error = std::get_if<ProcessError>(&item.value())) {
            spawnError = error->message;
        }
    }

    if (spawnError.has_value()) {
        failBuild(generation, tracker, spawnError.value());
        return;
    }
    if (!completed.has_value() || !completed->success()) {
        const std::string status = completed.has_value() ? completed->describe() : "unknown";
        failBuild(generation, tracker, "Installation failed with exit code " + status);
        return;
    }

    publishStepUpdates(generation, tracker, tracker.finishAll());

    if (config_.copy_config && !config_.demo) {
        auto copied = copyConfig(generation, disk);
        if (copied.isError()) {
            failBuild(generation, tracker, "Failed to copy config: " + copied.errorValue().message);
            return;
        }
    }

    LOG_INFO(Install, "Installation on {} succeeded", disk);
    finishBuild(generation, State::InstallSucceeded{ .steps = tracker.steps() });
}

void InstallerEngine::publishLog(uint64_t generation, std::string line)
{
    // A build detached by DevReset is only logged locally.
    if (generation != buildGeneration_.load()) {
        LOG_DEBUG(Install, "Build {} (detached): {}", generation, line);
        return;
    }
    publish(InstallApi::InstallLog{ std::move(line) });
}

void InstallerEngine::publishStepUpdates(
    uint64_t generation, const StepTracker& tracker, const std::vector<InstallStep>& updates)
{
    if (updates.empty()) {
        return;
    }

    store_.update(
        [this, generation, &tracker](State::Any& state) {
            auto* installing = std::get_if<State::Installing>(&state.getVariant());
            if (!installing || generation != buildGeneration_.load()) {
                return false;
            }
            installing->steps = tracker.steps();
            return true;
        },
        [this, &updates](const State::Any&) {
            for (const auto& step : updates) {
                bus_.publish(InstallApi::InstallStepUpdate{ step });
            }
        });
}

void InstallerEngine::failBuild(
    uint64_t generation, StepTracker& tracker, const std::string& message)
{
    LOG_ERROR(Install, "{}", message);
    if (generation == buildGeneration_.load()) {
        publishError(message);
    }
    publishStepUpdates(generation, tracker, tracker.failCurrent(message));
    finishBuild(generation, State::InstallFailed{ .message = message });
}

void InstallerEngine::finishBuild(uint64_t generation, State::Any finalState)
{
    const std::string finalName = State::getCurrentStateName(finalState);
    const bool applied = store_.update(
        [this, generation, &finalState](State::Any& state) {
            if (!std::holds_alternative<State::Installing>(state.getVariant())
                || generation != buildGeneration_.load()) {
                return false;
            }
            state = std::move(finalState);
            return true;
        },
        [this](const State::Any& committed) {
            bus_.publish(InstallApi::StateChanged{ committed });
        });

    if (applied) {
        LOG_INFO(State, "Installer::StateMachine: Installing -> {}", finalName);
    }
    else {
        LOG_INFO(Install, "Build {} finished after reset; result discarded", generation);
    }
}

Result<std::monostate, ApiError> InstallerEngine::copyConfig(
    uint64_t generation, const std::string& disk)
{
    LOG_INFO(Install, "Copying project config to {}", disk);
    for (const auto& command : copyConfigCommands(disk)) {
        auto result = runLogged(generation, command);
        if (result.isError()) {
            return Result<std::monostate, ApiError>::error(result.errorValue());
        }
        if (!result.value().success()) {
            return Result<std::monostate, ApiError>::error(ApiError(
                "'" + command.toString() + "' exited with " + result.value().describe()));
        }
    }
    return Result<std::monostate, ApiError>::okay(std::monostate{});
}

Result<ProcessCompleted, ApiError> InstallerEngine::runLogged(
    uint64_t generation, const CommandLine& command)
{
    auto stream = dependencies_.spawnProcess(command);

    std::optional<ProcessCompleted> completed;
    while (auto item = stream->next()) {
        if (const auto* out = std::get_if<ProcessStdout>(&item.value())) {
            publishLog(generation, out->line);
        }
        else if (const auto* err = std::get_if<ProcessStderr>(&item.value())) {
            publishLog(generation, "[STDERR] " + err->line);
        }
        else if (const auto* done = std::get_if<ProcessCompleted>(&item.value())) {
            completed = *done;
        }
        else if (const auto* error = std::get_if<ProcessError>(&item.value())) {
            return Result<ProcessCompleted, ApiError>::error(ApiError(error->message));
        }
    }

    if (!completed.has_value()) {
        return Result<ProcessCompleted, ApiError>::error(
            ApiError("Process ended without an exit status: " + command.toString()));
    }
    return Result<ProcessCompleted, ApiError>::okay(completed.value());
}

} // namespace Installer
} // namespace NixBlitz
