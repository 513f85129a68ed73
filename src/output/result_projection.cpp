/**
 * @file result_projection.cpp
 * @brief JSON projections
 */
#include "certstalker/output/result_projection.h"
#include "certstalker/common/exceptions.h"
#include "certstalker/utils/time_utils.h"

#include <spdlog/spdlog.h>

#include <fstream>

namespace certstalker::output {

namespace {

Json::Value optionalTime(const std::optional<std::chrono::system_clock::time_point>& tp) {
    return tp ? Json::Value(utils::formatIso8601(*tp)) : Json::Value(Json::nullValue);
}

Json::Value livenessToJson(const model::LivenessResult& r) {
    Json::Value item;
    item["hostname"] = r.endpoint.hostname;
    item["port"] = r.endpoint.port;
    item["reachable"] = r.reachable;
    item["checkedAt"] = utils::formatIso8601(r.checkedAt, true);
    if (!r.protocol.empty()) {
        item["protocol"] = r.protocol;
    }
    if (r.statusCode) {
        item["statusCode"] = *r.statusCode;
    }
    if (r.error) {
        item["error"] = *r.error;
    }
    return item;
}

} // anonymous namespace

Json::Value toDetailedJson(const model::AggregatedResult& result) {
    Json::Value root;
    root["runId"] = result.getRunId();
    root["domain"] = result.getDomain();
    root["generatedAt"] = utils::formatIso8601(result.getGeneratedAt());

    Json::Value ports(Json::arrayValue);
    for (int port : result.getPorts()) {
        ports.append(port);
    }
    root["ports"] = ports;

    Json::Value providers(Json::arrayValue);
    for (const auto& report : result.getProviderReports()) {
        Json::Value item;
        item["provider"] = report.provider;
        item["status"] = model::providerStatusToString(report.status);
        item["attempts"] = report.attempts;
        item["certificates"] = static_cast<Json::UInt64>(report.certificateCount);
        item["hostnames"] = static_cast<Json::UInt64>(report.hostnameCount);
        if (!report.error.empty()) {
            item["error"] = report.error;
        }
        providers.append(item);
    }
    root["providers"] = providers;

    Json::Value certificates(Json::arrayValue);
    for (const auto& cert : result.getCertificates()) {
        Json::Value item;
        item["provider"] = cert.getProvider();
        item["id"] = cert.getSourceId();
        item["issuer"] = cert.getIssuer();
        item["notBefore"] = optionalTime(cert.getNotBefore());
        item["notAfter"] = optionalTime(cert.getNotAfter());
        Json::Value sans(Json::arrayValue);
        for (const auto& san : cert.getSubjectAlternativeNames()) {
            sans.append(san);
        }
        item["subjectAlternativeNames"] = sans;
        certificates.append(item);
    }
    root["certificates"] = certificates;

    Json::Value hostnames(Json::arrayValue);
    for (const auto& entry : result.getHostnames().entries()) {
        Json::Value item;
        item["hostname"] = entry.hostname;
        Json::Value sources(Json::arrayValue);
        for (const auto& provider : entry.sourceProviders) {
            sources.append(provider);
        }
        item["sources"] = sources;
        hostnames.append(item);
    }
    root["hostnames"] = hostnames;

    if (result.getLiveliness()) {
        Json::Value liveliness(Json::arrayValue);
        for (const auto& [endpoint, r] : *result.getLiveliness()) {
            liveliness.append(livenessToJson(r));
        }
        root["liveliness"] = liveliness;
    }

    return root;
}

Json::Value toEndpointsJson(const model::AggregatedResult& result, bool includeUnreachable) {
    Json::Value endpoints(Json::arrayValue);

    if (result.getLiveliness()) {
        for (const auto& [endpoint, r] : *result.getLiveliness()) {
            if (!r.reachable && !includeUnreachable) {
                continue;
            }
            Json::Value item;
            item["hostname"] = endpoint.hostname;
            item["port"] = endpoint.port;
            item["reachable"] = r.reachable;
            if (r.statusCode) {
                item["statusCode"] = *r.statusCode;
            }
            if (r.error) {
                item["error"] = *r.error;
            }
            endpoints.append(item);
        }
        return endpoints;
    }

    // Liveness not checked
    for (const auto& target : model::expandTargets(result.getHostnames().hostnames(), result.getPorts())) {
        Json::Value item;
        item["hostname"] = target.hostname;
        item["port"] = target.port;
        item["reachable"] = Json::Value(Json::nullValue);
        endpoints.append(item);
    }
    return endpoints;
}

Json::Value project(const model::AggregatedResult& result, common::OutputFormat format,
                    bool includeUnreachable) {
    if (format == common::OutputFormat::ENDPOINTS_ONLY) {
        return toEndpointsJson(result, includeUnreachable);
    }
    return toDetailedJson(result);
}

std::string toJsonString(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "    ";
    return Json::writeString(builder, value);
}

void writeJsonFile(const std::string& path, const Json::Value& value) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        throw common::CertStalkerException("Cannot open output file: " + path);
    }
    out << toJsonString(value) << '\n';
    out.close();
    if (!out) {
        throw common::CertStalkerException("Failed to write output file: " + path);
    }
    spdlog::info("[Output] Results written to {}", path);
}

} // namespace certstalker::output
