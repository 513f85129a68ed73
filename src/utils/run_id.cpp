/**
 * @file run_id.cpp
 * @brief Run id generation on the OpenSSL RNG
 */

#include "certstalker/utils/run_id.h"

#include <openssl/rand.h>

#include <array>
#include <stdexcept>

namespace certstalker::utils {

namespace {

constexpr char HEX[] = "0123456789abcdef";

bool isDashPosition(size_t i) {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

} // anonymous namespace

std::string generateRunId() {
    std::array<unsigned char, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed while generating run id");
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);   // version 4
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);   // RFC 4122 variant

    std::string id;
    id.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            id += '-';
        }
        id += HEX[bytes[i] >> 4];
        id += HEX[bytes[i] & 0x0F];
    }
    return id;
}

bool isRunId(const std::string& id) {
    if (id.size() != 36) {
        return false;
    }
    for (size_t i = 0; i < id.size(); ++i) {
        char c = id[i];
        if (isDashPosition(i)) {
            if (c != '-') return false;
        } else if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    return id[14] == '4' && (id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b');
}

} // namespace certstalker::utils
