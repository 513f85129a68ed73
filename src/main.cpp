/**
 * @file main.cpp
 * @brief certstalker entry point
 *
 * Discovers hostnames of a domain from Certificate Transparency providers
 * and optionally checks which hostname:port endpoints are live.
 */

#include "app/cli_options.h"
#include "app/enumeration_runner.h"
#include "certstalker/common/exceptions.h"
#include "certstalker/common/logger.h"
#include "certstalker/utils/task_group.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>

using namespace certstalker;

int main(int argc, char* argv[]) {
    app::CliOptions cli;
    try {
        cli = app::parseCommandLine(argc, argv);
    } catch (const common::CertStalkerException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Use --help for usage information" << std::endl;
        return app::EXIT_USAGE;
    }

    if (cli.showHelp) {
        std::cout << cli.usage << std::endl;
        return app::EXIT_OK;
    }

    const common::Config& config = cli.config;
    common::Logger::initialize("certstalker", config.effectiveLogLevel(),
                               !config.logFile.empty(), config.logFile);

    spdlog::info("certstalker starting: {} domain(s), format {}, liveness {}",
                 config.domains.size(), static_cast<int>(config.outputFormat),
                 config.checkLiveness ? "on" : "off");

    int exitCode = app::EXIT_OK;
    try {
        app::EnumerationRunner runner(config);
        exitCode = runner.run();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        exitCode = app::EXIT_NO_DATA;
    }

    // Workers abandoned at a run timeout finish their current network call
    // (bounded by the HTTP / probe timeouts) before static destruction starts
    auto grace = std::chrono::seconds(
        std::max(config.httpTimeoutSeconds, config.probeTimeoutSeconds * 3) + 5);
    auto& workers = utils::WorkerTracker::instance();
    if (!workers.waitForIdle(grace)) {
        spdlog::warn("{} worker(s) still running after {}s; exiting without cleanup",
                     workers.running(), grace.count());
        common::Logger::flush();
        std::_Exit(exitCode);
    }

    common::Logger::flush();
    return exitCode;
}
