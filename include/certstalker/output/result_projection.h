/**
 * @file result_projection.h
 * @brief Read-only JSON projections of an AggregatedResult
 *
 * - Detailed (format 1): run metadata, provider reports, certificates,
 *   hostnames and liveness results when present
 * - Endpoints-only (format 2): flat [{hostname, port, reachable}] list
 */
#pragma once

#include "certstalker/common/config.h"
#include "certstalker/model/aggregated_result.h"

#include <json/json.h>

#include <string>

namespace certstalker::output {

/**
 * @brief Full projection (format 1)
 */
Json::Value toDetailedJson(const model::AggregatedResult& result);

/**
 * @brief Flat endpoint list (format 2)
 *
 * With liveness results, unreachable endpoints are listed only when
 * includeUnreachable is set. Without them, every hostname x port is
 * listed with "reachable": null.
 */
Json::Value toEndpointsJson(const model::AggregatedResult& result, bool includeUnreachable);

/**
 * @brief Select the projection for format
 */
Json::Value project(const model::AggregatedResult& result, common::OutputFormat format,
                    bool includeUnreachable);

/**
 * @brief Serialize with 4-space indentation
 */
std::string toJsonString(const Json::Value& value);

/**
 * @brief Write value to path (truncating)
 * @throws common::CertStalkerException if the file cannot be written
 */
void writeJsonFile(const std::string& path, const Json::Value& value);

} // namespace certstalker::output
