/**
 * @file enumeration_runner.h
 * @brief Wires the engine from a Config and runs it for every domain
 */
#pragma once

#include "certstalker/aggregator/aggregator.h"
#include "certstalker/common/config.h"

#include <functional>
#include <memory>
#include <string>

namespace certstalker::app {

class EnumerationRunner {
public:
    /**
     * @brief Builds one aggregator per domain
     *
     * Every domain is a separate run: key cooldowns, disabled keys and
     * leases held by abandoned tasks never carry over to the next domain.
     */
    using AggregatorFactory = std::function<std::shared_ptr<aggregator::Aggregator>()>;

    /**
     * @brief Build HTTP clients, sources, key manager and prober from config
     */
    explicit EnumerationRunner(common::Config config);

    /**
     * @brief Use a custom aggregator factory
     * @throws std::invalid_argument if factory is empty
     */
    EnumerationRunner(common::Config config, AggregatorFactory factory);

    /**
     * @brief Enumerate every configured domain and write its output file
     *
     * A failed domain does not stop the remaining ones.
     *
     * @return EXIT_OK, EXIT_NO_DATA if any domain had no data (or its output
     *         could not be written), EXIT_USAGE if any domain was invalid
     */
    int run();

    /**
     * @brief Production factory for config
     *
     * HTTP clients, sources and the prober are stateless between runs and are
     * built once; each call creates a fresh KeyRateManager and Aggregator.
     */
    static AggregatorFactory makeAggregatorFactory(const common::Config& config);

private:
    int runDomain(const std::string& domain);

    common::Config config_;
    AggregatorFactory factory_;
};

} // namespace certstalker::app
