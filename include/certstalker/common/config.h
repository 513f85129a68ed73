/**
 * @file config.h
 * @brief Run configuration for certstalker
 *
 * A plain value passed explicitly to every component that needs it.
 * There is no process-wide configuration instance.
 */
#pragma once

#include <map>
#include <string>
#include <vector>

namespace certstalker::common {

/// Provider id -> ordered list of API keys
using ApiKeyTable = std::map<std::string, std::vector<std::string>>;

/// Output projection selector
enum class OutputFormat {
    DETAILED = 1,
    ENDPOINTS_ONLY = 2
};

// =============================================================================
// Run Configuration
// =============================================================================
struct Config {
    // Input
    std::vector<std::string> domains;
    std::string outputPath;
    OutputFormat outputFormat = OutputFormat::DETAILED;

    // Liveness
    bool checkLiveness = false;
    std::vector<int> extraPorts;
    std::string userAgent =
        "Mozilla/5.0 (Macintosh; Intel Mac OS X 10.15; rv:109.0) Gecko/20100101 Firefox/113.0";
    std::string proxyUrl;
    int probeTimeoutSeconds = 5;
    int probeWorkers = 20;
    double probeRateLimit = 0.0;  // requests per second, 0 = unlimited

    // Certificate sources
    ApiKeyTable apiKeys;
    int httpTimeoutSeconds = 30;
    int maxFetchAttempts = 3;
    int certSpotterMaxPages = 5;

    // Key rotation policy
    int keyBaseBackoffSeconds = 5;
    int keyMaxBackoffSeconds = 300;
    int maxConcurrentPerKey = 1;

    // Whole-run deadline, 0 = none
    int runTimeoutSeconds = 0;

    // Logging
    bool debug = false;
    std::string logLevel;  // empty: derived from debug
    std::string logFile;

    /// Ports probed by default before user-supplied extras
    static const std::vector<int>& defaultPorts();

    /**
     * @brief Default ports followed by extra ports, duplicates removed, order kept
     */
    std::vector<int> probePorts() const;

    /**
     * @brief Effective log level ("debug" when debug is set and no explicit level)
     */
    std::string effectiveLogLevel() const;

    /**
     * @brief Override settings from CERTSTALKER_* environment variables
     * @throws ConfigException on unparsable numeric values
     */
    void loadFromEnv();

    /**
     * @brief Merge a JSON key table: { "certspotter": ["k1", "k2"], ... }
     * @throws ConfigException if the file cannot be read or has the wrong shape
     */
    void loadKeysFile(const std::string& path);

    /**
     * @brief Check value ranges
     * @throws ConfigException on the first invalid value
     */
    void validate() const;
};

/**
 * @brief Parse a comma-separated port list ("8080, 9000")
 * @throws ConfigException on a non-numeric or out-of-range entry
 */
std::vector<int> parsePortList(const std::string& csv);

/**
 * @brief Parse a comma-separated key list, dropping blanks
 */
std::vector<std::string> parseKeyList(const std::string& csv);

} // namespace certstalker::common
