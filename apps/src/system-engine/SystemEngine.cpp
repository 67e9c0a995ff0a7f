#include "SystemEngine.h"
#include "core/LoggingChannels.h"
#include "core/Project.h"
#include "core/StateLifecycle.h"

#include <chrono>
#include <optional>

namespace NixBlitz {
namespace System {

namespace {

constexpr const char* kDemoSwitchScript = "echo '[Deps] fetching flake inputs'; sleep 1; "
                                          "echo '[Build] building the system configuration'; "
                                          "sleep 3; "
                                          "echo '[Bootloader] updating the boot loader'; sleep 1; "
                                          "echo '[PostSwitch] restarting changed services'; "
                                          "sleep 1; "
                                          "echo 'switch finished'";

} // namespace

SystemEngine::SystemEngine(const SystemConfig& config)
    : config_(config), bus_(static_cast<size_t>(config.event_capacity))
{
    initializeDefaultDependencies();
    observers_ = std::make_unique<Network::ObserverHub<UpdateProtocol>>(
        store_, bus_, [this](SystemApi::ClientCommand command) { queueEvent(command); });
}

SystemEngine::SystemEngine(TestMode mode)
    : config_(std::move(mode.config)),
      dependencies_(std::move(mode.dependencies)),
      bus_(static_cast<size_t>(config_.event_capacity))
{
    observers_ = std::make_unique<Network::ObserverHub<UpdateProtocol>>(
        store_, bus_, [this](SystemApi::ClientCommand command) { queueEvent(command); });
}

SystemEngine::~SystemEngine()
{
    stop();
}

void SystemEngine::initializeDefaultDependencies()
{
    dependencies_.spawnProcess = [](const CommandLine& command) {
        return ProcessSupervisor::spawn(command);
    };
    dependencies_.markChangesApplied = [this] {
        return Project(config_.work_dir).markChangesApplied();
    };
    dependencies_.reboot = [this]() -> Result<std::monostate, ApiError> {
        auto result = ProcessSupervisor::runToCompletion(rebootCommand());
        if (result.isError()) {
            return Result<std::monostate, ApiError>::error(result.errorValue());
        }
        if (!result.value().success()) {
            return Result<std::monostate, ApiError>::error(
                ApiError("exit code " + result.value().describe()));
        }
        return Result<std::monostate, ApiError>::okay(std::monostate{});
    };
}

Result<std::monostate, std::string> SystemEngine::start()
{
    auto listenResult = observers_->listen(config_.port, config_.bind_address);
    if (listenResult.isError()) {
        return listenResult;
    }

    LOG_INFO(Network, "system-engine listening on {}:{}", config_.bind_address, config_.port);
    return Result<std::monostate, std::string>::okay(std::monostate{});
}

void SystemEngine::stop()
{
    if (observers_) {
        observers_->stop();
    }
    commands_.close();
    waitForSwitches();
    bus_.close();
}

void SystemEngine::mainLoopRun()
{
    LOG_INFO(State, "Starting main event loop");
    transitionTo(State::Idle{});

    while (!shouldExit()) {
        processEvents();
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    LOG_INFO(State, "Main event loop exiting (shouldExit=true)");
}

void SystemEngine::requestExit()
{
    setShouldExit(true);
}

void SystemEngine::queueEvent(const SystemApi::ClientCommand& command)
{
    LOG_INFO(State, "Queueing command: {}", SystemApi::getCommandName(command));
    commands_.enqueue(command);
}

void SystemEngine::processEvents()
{
    commands_.drainInto(*this);
}

std::string SystemEngine::getCurrentStateName() const
{
    return State::getCurrentStateName(store_.read());
}

State::Any SystemEngine::currentState() const
{
    return store_.read();
}

void SystemEngine::publishError(const std::string& message)
{
    LOG_WARN(Update, "Error: {}", message);
    bus_.publish(SystemApi::Error{ message });
}

void SystemEngine::handleEvent(const SystemApi::ClientCommand& command)
{
    LOG_INFO(State, "Handling command: {}", SystemApi::getCommandName(command));
    const auto& variant = command.getVariant();

    if (std::holds_alternative<SystemApi::DevReset>(variant)) {
        handleDevReset();
        return;
    }
    if (std::holds_alternative<SystemApi::Reboot>(variant)) {
        handleReboot();
        return;
    }

    State::Any current = store_.read();
    std::visit(
        [this, &current](auto&& cmd) {
            std::visit(
                [this, &cmd, &current](auto&& state) -> void {
                    if constexpr (requires { state.onEvent(cmd, *this); }) {
                        State::Any newState = state.onEvent(cmd, *this);
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

void SystemEngine::handleDevReset()
{
    const uint64_t generation = ++switchGeneration_;
    LOG_INFO(State, "DevReset (switch generation now {})", generation);
    transitionTo(State::Idle{});
}

void SystemEngine::handleReboot()
{
    if (config_.demo) {
        LOG_INFO(Update, "Demo mode: skipping reboot");
        return;
    }

    LOG_INFO(Update, "Rebooting");
    Result<std::monostate, ApiError> result;
    try {
        result = dependencies_.reboot();
    }
    catch (const std::exception& e) {
        result = Result<std::monostate, ApiError>::error(ApiError(e.what()));
    }
    if (result.isError()) {
        publishError("Failed to reboot: " + result.errorValue().message);
    }
}

void SystemEngine::transitionTo(State::Any newState)
{
    State::Any oldState = store_.read();
    const std::string oldStateName = State::getCurrentStateName(oldState);

    invokeOnExit(oldState, *this);

    store_.replace(std::move(newState), [this](const State::Any& committed) {
        bus_.publish(SystemApi::StateChanged{ committed });
    });

    State::Any entered = store_.read();
    LOG_INFO(
        State, "System::StateMachine: {} -> {}", oldStateName, State::getCurrentStateName(entered));

    const auto expectedIndex = entered.getVariant().index();
    entered = invokeOnEnter(std::move(entered), *this);
    if (entered.getVariant().index() != expectedIndex) {
        transitionTo(std::move(entered));
    }
}

CommandLine SystemEngine::withPrivilege(std::string program, std::vector<std::string> args) const
{
    if (config_.privilege_command.empty()) {
        return CommandLine{ std::move(program), std::move(args) };
    }
    args.insert(args.begin(), std::move(program));
    return CommandLine{ config_.privilege_command, std::move(args) };
}

CommandLine SystemEngine::switchCommand() const
{
    if (config_.demo) {
        return CommandLine{ "/bin/sh", { "-c", kDemoSwitchScript } };
    }
    return withPrivilege(config_.apply_command, { "apply", "--work-dir", config_.work_dir });
}

CommandLine SystemEngine::rebootCommand() const
{
    return withPrivilege("systemctl", { "reboot" });
}

void SystemEngine::startSwitch()
{
    const uint64_t generation = switchGeneration_.load();
    LOG_INFO(Update, "Starting switch (generation {})", generation);

    std::lock_guard<std::mutex> lock(workersMutex_);
    reapFinishedSwitches();

    auto finished = std::make_shared<std::atomic<bool>>(false);
    ++activeSwitches_;
    workers_.push_back(SwitchWorker{
        .thread = std::thread([this, generation, finished] {
            runSwitch(generation);
            finished->store(true);
            --activeSwitches_;
        }),
        .finished = finished,
    });
}

// Requires workersMutex_.
void SystemEngine::reapFinishedSwitches()
{
    std::erase_if(workers_, [](SwitchWorker& worker) {
        if (!worker.finished->load()) {
            return false;
        }
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
        return true;
    });
}

size_t SystemEngine::switchWorkerCount()
{
    std::lock_guard<std::mutex> lock(workersMutex_);
    return workers_.size();
}

void SystemEngine::waitForSwitches()
{
    std::vector<SwitchWorker> workers;
    {
        std::lock_guard<std::mutex> lock(workersMutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

void SystemEngine::runSwitch(uint64_t generation)
{
    auto stream = dependencies_.spawnProcess(switchCommand());

    std::optional<ProcessCompleted> completed;
    std::optional<std::string> spawnError;
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
            spawnError = error->message;
        }
    }

    const bool current = generation == switchGeneration_.load();

    std::optional<std::string> failure;
    if (spawnError.has_value()) {
        failure = "Failed to start switch: " + spawnError.value();
    }
    else if (!completed.has_value() || !completed->success()) {
        const std::string status = completed.has_value() ? completed->describe() : "unknown";
        failure = "Switch failed with exit code " + status;
    }

    if (failure.has_value()) {
        LOG_ERROR(Update, "{}", failure.value());
        if (current) {
            publishError(failure.value());
        }
        finishSwitch(generation, State::UpdateFailed{ .message = failure.value() });
        return;
    }

    LOG_INFO(Update, "Switch succeeded");
    if (current) {
        Result<std::monostate, ApiError> marked;
        try {
            marked = dependencies_.markChangesApplied();
        }
        catch (const std::exception& e) {
            marked = Result<std::monostate, ApiError>::error(ApiError(e.what()));
        }
        if (marked.isError()) {
            publishError("Failed to mark changes applied: " + marked.errorValue().message);
        }
    }
    finishSwitch(generation, State::Idle{});
}

void SystemEngine::publishLog(uint64_t generation, std::string line)
{
    if (generation != switchGeneration_.load()) {
        LOG_DEBUG(Update, "Switch {} (detached): {}", generation, line);
        return;
    }
    bus_.publish(SystemApi::UpdateLog{ std::move(line) });
}

void SystemEngine::finishSwitch(uint64_t generation, State::Any finalState)
{
    const std::string finalName = State::getCurrentStateName(finalState);
    const bool applied = store_.update(
        [this, generation, &finalState](State::Any& state) {
            if (!std::holds_alternative<State::Switching>(state.getVariant())
                || generation != switchGeneration_.load()) {
                return false;
            }
            state = std::move(finalState);
            return true;
        },
        [this](const State::Any& committed) {
            bus_.publish(SystemApi::StateChanged{ committed });
        });

    if (applied) {
        LOG_INFO(State, "System::StateMachine: Switching -> {}", finalName);
    }
    else {
        LOG_INFO(Update, "Switch {} finished after reset; result discarded", generation);
    }
}

} // namespace System
} // namespace NixBlitz
