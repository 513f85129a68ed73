/**
 * @file key_rate_manager.h
 * @brief Per-provider API key rotation and rate-limit backoff
 *
 * Owns the API keys of every provider for one run:
 * - Round-robin selection from a per-provider cursor
 * - Exponential cooldown on rate limiting, reset on success
 * - Permanent disabling of rejected keys
 * - A cap on outstanding requests per key
 *
 * acquire() never blocks: when no key is usable it throws
 * NoKeyAvailableException and the caller decides whether to go
 * anonymous or skip the provider.
 */
#pragma once

#include "certstalker/common/config.h"

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace certstalker::keys {

/// Result of one request made with a key
enum class KeyOutcome {
    SUCCESS,
    RATE_LIMITED,
    AUTH_REJECTED,
    TRANSPORT_FAILURE,
    PARSE_FAILURE
};

std::string keyOutcomeToString(KeyOutcome outcome);

struct KeyPolicy {
    std::chrono::seconds baseBackoff{5};
    std::chrono::seconds maxBackoff{300};
    size_t maxConcurrentPerKey = 1;
};

class KeyRateManager;

/**
 * @brief RAII lease on an API key
 *
 * Holds one of the key's concurrency slots; the slot is returned to the
 * manager when the lease is destroyed or released.
 */
class ApiKeyLease {
private:
    std::string provider_;
    std::string key_;
    KeyRateManager* manager_;  // Non-owning pointer to manager
    bool released_;

public:
    ApiKeyLease(std::string provider, std::string key, KeyRateManager* manager)
        : provider_(std::move(provider)), key_(std::move(key)),
          manager_(manager), released_(false) {}

    ~ApiKeyLease();

    ApiKeyLease(const ApiKeyLease&) = delete;
    ApiKeyLease& operator=(const ApiKeyLease&) = delete;

    ApiKeyLease(ApiKeyLease&& other) noexcept
        : provider_(std::move(other.provider_)), key_(std::move(other.key_)),
          manager_(other.manager_), released_(other.released_) {
        other.manager_ = nullptr;
        other.released_ = true;
    }

    ApiKeyLease& operator=(ApiKeyLease&& other) noexcept {
        if (this != &other) {
            release();
            provider_ = std::move(other.provider_);
            key_ = std::move(other.key_);
            manager_ = other.manager_;
            released_ = other.released_;
            other.manager_ = nullptr;
            other.released_ = true;
        }
        return *this;
    }

    const std::string& key() const { return key_; }
    const std::string& provider() const { return provider_; }

    bool isValid() const { return manager_ != nullptr && !released_; }

    /**
     * @brief Return the concurrency slot early
     */
    void release();
};

/**
 * @brief Thread-safe key pool for all providers of a run
 */
class KeyRateManager {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    /**
     * @param keys Provider id -> ordered key list (blank and repeated keys dropped)
     * @param policy Backoff and concurrency limits
     * @param clock Time source, injectable for tests
     */
    explicit KeyRateManager(const common::ApiKeyTable& keys,
                            KeyPolicy policy = KeyPolicy(),
                            Clock clock = Clock());

    KeyRateManager(const KeyRateManager&) = delete;
    KeyRateManager& operator=(const KeyRateManager&) = delete;

    /**
     * @brief Lease the next usable key of provider (round-robin)
     *
     * A key is usable when it is not disabled, its cooldown has elapsed and
     * it has a free concurrency slot.
     *
     * @throws common::NoKeyAvailableException if no key qualifies (or none is configured)
     */
    ApiKeyLease acquire(const std::string& provider);

    /**
     * @brief Record the outcome of a request made with key
     *
     * RATE_LIMITED starts or extends the cooldown, AUTH_REJECTED disables the
     * key for the rest of the run, SUCCESS clears the cooldown state. Other
     * outcomes leave the key untouched. Unknown keys are ignored.
     *
     * @param retryAfterSeconds Provider-requested wait, raises the cooldown up to the cap
     */
    void report(const std::string& provider, const std::string& key, KeyOutcome outcome,
                std::optional<int> retryAfterSeconds = std::nullopt);

    /// True if at least one key is configured for provider
    bool hasKeys(const std::string& provider) const;

    size_t keyCount(const std::string& provider) const;

    /// Key state snapshot (fingerprinted, never the raw key)
    struct KeyStats {
        std::string fingerprint;
        bool disabled;
        bool coolingDown;
        size_t inFlight;
        int consecutiveRateLimits;
    };

    std::vector<KeyStats> getStats(const std::string& provider) const;

    /**
     * @brief Cooldown end of key, nullopt when the key is not cooling down
     */
    std::optional<std::chrono::steady_clock::time_point> cooldownUntil(
        const std::string& provider, const std::string& key) const;

    bool isDisabled(const std::string& provider, const std::string& key) const;

private:
    struct KeyState {
        std::string key;
        std::chrono::steady_clock::time_point cooldownUntil{};
        int consecutiveRateLimits = 0;
        bool disabled = false;
        size_t inFlight = 0;
    };

    struct ProviderState {
        std::vector<KeyState> keys;
        size_t cursor = 0;
    };

    friend class ApiKeyLease;

    /// Called by ApiKeyLease
    void releaseKey(const std::string& provider, const std::string& key);

    KeyState* findKey(const std::string& provider, const std::string& key);
    const KeyState* findKey(const std::string& provider, const std::string& key) const;

    std::chrono::seconds backoffFor(int consecutiveRateLimits) const;

    KeyPolicy policy_;
    Clock clock_;
    std::map<std::string, ProviderState> providers_;
    mutable std::mutex mutex_;
};

} // namespace certstalker::keys
