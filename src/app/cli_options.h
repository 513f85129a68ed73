/**
 * @file cli_options.h
 * @brief Command line parsing for the certstalker executable
 */
#pragma once

#include "certstalker/common/config.h"

#include <string>
#include <vector>

namespace certstalker::app {

/// Process exit status
enum ExitCode {
    EXIT_OK = 0,
    EXIT_NO_DATA = 1,
    EXIT_USAGE = 2
};

struct CliOptions {
    common::Config config;
    bool showHelp = false;
    std::string usage;      // Rendered option help
};

/**
 * @brief Build the run configuration: defaults, then environment, then flags
 *
 * The key file (--keys-file) and domain file (--domain-file) are read here.
 *
 * @throws common::ConfigException on unknown flags, missing required flags or
 *         invalid values
 */
CliOptions parseCommandLine(int argc, const char* const argv[]);

/**
 * @brief One domain per line; blank lines and '#' comments skipped
 * @throws common::ConfigException if the file cannot be read or holds no domain
 */
std::vector<std::string> loadDomainFile(const std::string& path);

/**
 * @brief Output file for one domain of the run
 *
 * "{domain}" in the pattern is replaced by the domain. Without the
 * placeholder the pattern is used as is for a single-domain run and
 * prefixed with "<domain>_" (in its directory) otherwise.
 */
std::string outputPathFor(const std::string& pattern, const std::string& domain, size_t domainCount);

} // namespace certstalker::app
