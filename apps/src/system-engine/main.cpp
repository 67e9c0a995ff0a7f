#include "SystemEngine.h"
#include "core/ConfigLoader.h"
#include "core/EngineEnvironment.h"
#include "core/LoggingChannels.h"
#include <args.hxx>
#include <csignal>
#include <filesystem>
#include <iostream>

using namespace NixBlitz;

#ifndef NIXBLITZ_VERSION
#define NIXBLITZ_VERSION "dev"
#endif

static System::SystemEngine* g_engine = nullptr;

void signalHandler(int signum)
{
    SLOG_INFO("Interrupt signal ({}) received, shutting down...", signum);
    if (g_engine) {
        g_engine->requestExit();
    }
}

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "NixBlitz System Engine",
        "Applies NixBlitz configuration changes to the running system.");
    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::ValueFlag<uint16_t> portArg(
        parser, "port", "WebSocket port (default: 3000)", { 'p', "port" });
    args::ValueFlag<std::string> bindArg(
        parser, "address", "Bind address (default: 127.0.0.1)", { "bind" });
    args::ValueFlag<std::string> workDirArg(
        parser, "path", "NixBlitz project directory", { "work-dir" });
    args::Flag demoArg(parser, "demo", "Simulate the system switch", { "demo" });
    args::ValueFlag<std::string> configDir(
        parser, "config-dir", "Directory holding system-engine.json", { "config-dir" });
    args::ValueFlag<std::string> logConfig(
        parser,
        "log-config",
        "Path to logging config JSON file (default: logging-config.json)",
        { "log-config" },
        "logging-config.json");
    args::ValueFlag<std::string> logChannels(
        parser,
        "channels",
        "Override log channels (e.g., update:debug,*:off)",
        { 'C', "channels" });

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    LoggingChannels::initializeFromConfig(args::get(logConfig), "system-engine");
    if (logChannels) {
        LoggingChannels::configureFromString(args::get(logChannels));
        SLOG_INFO("Applied channel overrides: {}", args::get(logChannels));
    }

    if (configDir) {
        ConfigLoader::setConfigDir(args::get(configDir));
    }
    auto configResult =
        ConfigLoader::loadOrDefault("system-engine.json", System::SystemConfig{});
    if (configResult.isError()) {
        SLOG_ERROR("Failed to load config: {}", configResult.errorValue());
        return 1;
    }
    System::SystemConfig config = configResult.value();

    applyEnvironmentOverrides(config);
    if (portArg) {
        config.port = args::get(portArg);
    }
    if (bindArg) {
        config.bind_address = args::get(bindArg);
    }
    if (workDirArg) {
        config.work_dir = args::get(workDirArg);
    }
    if (demoArg) {
        config.demo = true;
    }

    if (config.work_dir.empty()) {
        std::cerr << "Error: no work directory given (--work-dir or NIXBLITZ_WORK_DIR)"
                  << std::endl;
        return 1;
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(config.work_dir, ec)) {
        std::cerr << "Error: work directory '" << config.work_dir << "' does not exist"
                  << std::endl;
        return 1;
    }

    SLOG_INFO(
        "nixblitz system-engine {} starting in {} mode (work dir {})",
        NIXBLITZ_VERSION,
        config.demo ? "DEMO" : "LIVE",
        config.work_dir);

    System::SystemEngine engine(config);
    g_engine = &engine;

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    auto startResult = engine.start();
    if (startResult.isError()) {
        SLOG_ERROR("Failed to start system-engine: {}", startResult.errorValue());
        return 1;
    }

    engine.mainLoopRun();
    engine.stop();
    g_engine = nullptr;
    SLOG_INFO("system-engine shut down cleanly");
    return 0;
}
