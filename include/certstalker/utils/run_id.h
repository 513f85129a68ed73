/**
 * @file run_id.h
 * @brief Enumeration run identifiers (random UUID v4)
 */
#pragma once

#include <string>

namespace certstalker::utils {

/**
 * @brief New random run id in lowercase 8-4-4-4-12 form
 * @throws std::runtime_error if the OpenSSL RNG cannot produce bytes
 */
std::string generateRunId();

/// True for a lowercase UUID v4 with the RFC 4122 variant
bool isRunId(const std::string& id);

} // namespace certstalker::utils
