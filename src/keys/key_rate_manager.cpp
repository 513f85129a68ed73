/**
 * @file key_rate_manager.cpp
 * @brief Implementation of the API key rotation manager
 */

#include "certstalker/keys/key_rate_manager.h"
#include "certstalker/common/exceptions.h"
#include "certstalker/utils/string_utils.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace certstalker::keys {

std::string keyOutcomeToString(KeyOutcome outcome) {
    switch (outcome) {
        case KeyOutcome::SUCCESS: return "success";
        case KeyOutcome::RATE_LIMITED: return "rate_limited";
        case KeyOutcome::AUTH_REJECTED: return "auth_rejected";
        case KeyOutcome::TRANSPORT_FAILURE: return "transport_failure";
        case KeyOutcome::PARSE_FAILURE: return "parse_failure";
    }
    return "unknown";
}

// --- ApiKeyLease Implementation ---

ApiKeyLease::~ApiKeyLease() {
    release();
}

void ApiKeyLease::release() {
    if (!released_ && manager_) {
        manager_->releaseKey(provider_, key_);
        released_ = true;
    }
}

// --- KeyRateManager Implementation ---

KeyRateManager::KeyRateManager(const common::ApiKeyTable& keys, KeyPolicy policy, Clock clock)
    : policy_(policy),
      clock_(clock ? std::move(clock) : Clock([]() { return std::chrono::steady_clock::now(); })) {
    if (policy_.maxConcurrentPerKey == 0) {
        policy_.maxConcurrentPerKey = 1;
    }
    if (policy_.maxBackoff < policy_.baseBackoff) {
        policy_.maxBackoff = policy_.baseBackoff;
    }

    for (const auto& [provider, list] : keys) {
        ProviderState state;
        std::set<std::string> seen;
        for (const auto& raw : list) {
            std::string key = utils::trim(raw);
            if (key.empty() || !seen.insert(key).second) {
                continue;
            }
            KeyState ks;
            ks.key = key;
            state.keys.push_back(std::move(ks));
        }
        spdlog::info("[KeyRateManager] Provider {}: {} key(s)", provider, state.keys.size());
        providers_[utils::toLowerCase(provider)] = std::move(state);
    }
}

ApiKeyLease KeyRateManager::acquire(const std::string& provider) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = providers_.find(provider);
    if (it == providers_.end() || it->second.keys.empty()) {
        throw common::NoKeyAvailableException(provider);
    }

    ProviderState& state = it->second;
    const auto now = clock_();
    const size_t count = state.keys.size();

    for (size_t step = 0; step < count; ++step) {
        size_t index = (state.cursor + step) % count;
        KeyState& ks = state.keys[index];

        if (ks.disabled || ks.cooldownUntil > now ||
            ks.inFlight >= policy_.maxConcurrentPerKey) {
            continue;
        }

        ks.inFlight++;
        state.cursor = (index + 1) % count;
        spdlog::debug("[KeyRateManager] Acquired {} for {} (inFlight={})",
                      utils::keyFingerprint(ks.key), provider, ks.inFlight);
        return ApiKeyLease(provider, ks.key, this);
    }

    spdlog::debug("[KeyRateManager] All {} key(s) of {} unavailable", count, provider);
    throw common::NoKeyAvailableException(provider);
}

void KeyRateManager::report(const std::string& provider, const std::string& key,
                            KeyOutcome outcome, std::optional<int> retryAfterSeconds) {
    std::lock_guard<std::mutex> lock(mutex_);

    KeyState* ks = findKey(provider, key);
    if (!ks) {
        return;
    }

    switch (outcome) {
        case KeyOutcome::SUCCESS:
            ks->consecutiveRateLimits = 0;
            ks->cooldownUntil = {};
            break;

        case KeyOutcome::RATE_LIMITED: {
            ks->consecutiveRateLimits++;
            auto window = backoffFor(ks->consecutiveRateLimits);
            if (retryAfterSeconds.has_value() && *retryAfterSeconds > 0) {
                window = std::min(std::max(window, std::chrono::seconds(*retryAfterSeconds)),
                                  policy_.maxBackoff);
            }
            ks->cooldownUntil = clock_() + window;
            spdlog::warn("[KeyRateManager] {} of {} rate limited, cooling down for {}s",
                         utils::keyFingerprint(key), provider, window.count());
            break;
        }

        case KeyOutcome::AUTH_REJECTED:
            if (!ks->disabled) {
                ks->disabled = true;
                spdlog::warn("[KeyRateManager] {} of {} rejected, disabled for this run",
                             utils::keyFingerprint(key), provider);
            }
            break;

        case KeyOutcome::TRANSPORT_FAILURE:
        case KeyOutcome::PARSE_FAILURE:
            spdlog::debug("[KeyRateManager] {} of {}: {} (key state unchanged)",
                          utils::keyFingerprint(key), provider, keyOutcomeToString(outcome));
            break;
    }
}

bool KeyRateManager::hasKeys(const std::string& provider) const {
    return keyCount(provider) > 0;
}

size_t KeyRateManager::keyCount(const std::string& provider) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(provider);
    return it == providers_.end() ? 0 : it->second.keys.size();
}

std::vector<KeyRateManager::KeyStats> KeyRateManager::getStats(const std::string& provider) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<KeyStats> stats;
    auto it = providers_.find(provider);
    if (it == providers_.end()) {
        return stats;
    }
    const auto now = clock_();
    for (const auto& ks : it->second.keys) {
        stats.push_back(KeyStats{
            utils::keyFingerprint(ks.key),
            ks.disabled,
            ks.cooldownUntil > now,
            ks.inFlight,
            ks.consecutiveRateLimits
        });
    }
    return stats;
}

std::optional<std::chrono::steady_clock::time_point> KeyRateManager::cooldownUntil(
    const std::string& provider, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const KeyState* ks = findKey(provider, key);
    if (!ks || ks->cooldownUntil <= clock_()) {
        return std::nullopt;
    }
    return ks->cooldownUntil;
}

bool KeyRateManager::isDisabled(const std::string& provider, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const KeyState* ks = findKey(provider, key);
    return ks != nullptr && ks->disabled;
}

void KeyRateManager::releaseKey(const std::string& provider, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    KeyState* ks = findKey(provider, key);
    if (ks && ks->inFlight > 0) {
        ks->inFlight--;
    }
}

KeyRateManager::KeyState* KeyRateManager::findKey(const std::string& provider,
                                                  const std::string& key) {
    auto it = providers_.find(provider);
    if (it == providers_.end()) {
        return nullptr;
    }
    for (auto& ks : it->second.keys) {
        if (ks.key == key) {
            return &ks;
        }
    }
    return nullptr;
}

const KeyRateManager::KeyState* KeyRateManager::findKey(const std::string& provider,
                                                        const std::string& key) const {
    return const_cast<KeyRateManager*>(this)->findKey(provider, key);
}

std::chrono::seconds KeyRateManager::backoffFor(int consecutiveRateLimits) const {
    // base * 2^(n-1), capped
    auto window = policy_.baseBackoff;
    for (int i = 1; i < consecutiveRateLimits; ++i) {
        window *= 2;
        if (window >= policy_.maxBackoff) {
            return policy_.maxBackoff;
        }
    }
    return std::min(window, policy_.maxBackoff);
}

} // namespace certstalker::keys
