/**
 * @file enumeration_runner.cpp
 * @brief Run orchestration for the CLI
 */
#include "enumeration_runner.h"
#include "cli_options.h"

#include "certstalker/common/exceptions.h"
#include "certstalker/http/http_client.h"
#include "certstalker/liveness/endpoint_checker.h"
#include "certstalker/liveness/liveness_prober.h"
#include "certstalker/liveness/tcp_connector.h"
#include "certstalker/output/result_projection.h"
#include "certstalker/sources/certspotter_source.h"
#include "certstalker/sources/crtsh_source.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace certstalker::app {

EnumerationRunner::EnumerationRunner(common::Config config)
    : config_(std::move(config)),
      factory_(makeAggregatorFactory(config_)) {}

EnumerationRunner::EnumerationRunner(common::Config config, AggregatorFactory factory)
    : config_(std::move(config)),
      factory_(std::move(factory)) {
    if (!factory_) {
        throw std::invalid_argument("AggregatorFactory cannot be empty");
    }
}

EnumerationRunner::AggregatorFactory EnumerationRunner::makeAggregatorFactory(const common::Config& config) {
    // Provider API traffic: certificates verified, no proxy
    auto apiClient = std::make_shared<http::HttpClient>();

    sources::SourceOptions sourceOptions;
    sourceOptions.timeoutSeconds = config.httpTimeoutSeconds;
    sourceOptions.userAgent = config.userAgent;
    sourceOptions.maxPages = config.certSpotterMaxPages;

    std::vector<std::shared_ptr<sources::ICertificateSource>> sources = {
        std::make_shared<sources::CertSpotterSource>(apiClient, sourceOptions),
        std::make_shared<sources::CrtShSource>(apiClient, sourceOptions)
    };

    keys::KeyPolicy policy;
    policy.baseBackoff = std::chrono::seconds(config.keyBaseBackoffSeconds);
    policy.maxBackoff = std::chrono::seconds(config.keyMaxBackoffSeconds);
    policy.maxConcurrentPerKey = static_cast<size_t>(config.maxConcurrentPerKey);

    std::shared_ptr<liveness::LivenessProber> prober;
    if (config.checkLiveness) {
        // Probe traffic: self-signed and mismatched certificates still count as live
        auto probeClient = std::make_shared<http::HttpClient>(config.proxyUrl, false);

        liveness::CheckerOptions checkerOptions;
        checkerOptions.timeoutSeconds = config.probeTimeoutSeconds;
        checkerOptions.userAgent = config.userAgent;
        checkerOptions.tcpFallback = config.proxyUrl.empty();

        auto checker = std::make_shared<liveness::HttpEndpointChecker>(
            probeClient, std::make_shared<liveness::TcpConnector>(), checkerOptions);

        liveness::ProberOptions proberOptions;
        proberOptions.workers = static_cast<size_t>(config.probeWorkers);
        proberOptions.rateLimit = config.probeRateLimit;
        prober = std::make_shared<liveness::LivenessProber>(checker, proberOptions);
    }

    auto options = aggregator::AggregatorOptions::fromConfig(config);
    auto apiKeys = config.apiKeys;

    return [sources, prober, options, apiKeys, policy]() {
        auto keyManager = std::make_shared<keys::KeyRateManager>(apiKeys, policy);
        return std::make_shared<aggregator::Aggregator>(sources, keyManager, options, prober);
    };
}

int EnumerationRunner::run() {
    int exitCode = EXIT_OK;
    for (const auto& domain : config_.domains) {
        exitCode = std::max(exitCode, runDomain(domain));
    }
    return exitCode;
}

int EnumerationRunner::runDomain(const std::string& domain) {
    spdlog::info("=== Enumerating {} ===", domain);

    try {
        model::AggregatedResult result = factory_()->enumerate(domain);

        for (const auto& report : result.getProviderReports()) {
            if (!report.succeeded()) {
                spdlog::warn("[Runner] Partial failure: {} {} ({})", report.provider,
                             model::providerStatusToString(report.status), report.error);
            }
        }

        std::string path = outputPathFor(config_.outputPath, result.getDomain(), config_.domains.size());
        output::writeJsonFile(path, output::project(result, config_.outputFormat, config_.debug));

        spdlog::info("[Runner] {}: {} hostnames from {} certificates", result.getDomain(),
                     result.getHostnames().size(), result.getCertificates().size());
        return EXIT_OK;

    } catch (const common::InvalidDomainException& e) {
        spdlog::error("[Runner] {}", e.what());
        return EXIT_USAGE;
    } catch (const common::NoDataAvailableException& e) {
        spdlog::error("[Runner] {}", e.what());
        return EXIT_NO_DATA;
    } catch (const common::CertStalkerException& e) {
        spdlog::error("[Runner] {}: {}", domain, e.what());
        return EXIT_NO_DATA;
    }
}

} // namespace certstalker::app
