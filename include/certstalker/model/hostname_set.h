/**
 * @file hostname_set.h
 * @brief Deduplicated hostname entries with their source providers
 */
#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

namespace certstalker::model {

/**
 * @brief One discovered hostname and the providers that reported it
 */
struct HostnameEntry {
    std::string hostname;                   // Lowercase, valid DNS name
    std::set<std::string> sourceProviders;  // Never empty

    bool operator==(const HostnameEntry& other) const {
        return hostname == other.hostname && sourceProviders == other.sourceProviders;
    }
};

/**
 * @brief Set of HostnameEntry keyed by lowercase hostname
 *
 * Two names are the same entry when they are byte-equal after lowercasing.
 * merge() unions provider sets, so it is idempotent and commutative, and
 * iteration is always in lexicographic hostname order.
 */
class HostnameSet {
public:
    /**
     * @brief Add one hostname reported by a provider
     * @return false if the name is not a valid hostname or provider is empty
     */
    bool add(const std::string& hostname, const std::string& provider);

    /** @brief Union another set into this one */
    void merge(const HostnameSet& other);

    bool contains(const std::string& hostname) const;

    /**
     * @brief Providers for a hostname (empty set if absent)
     */
    std::set<std::string> providersOf(const std::string& hostname) const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    /// Entries in lexicographic hostname order
    std::vector<HostnameEntry> entries() const;

    /// Hostnames in lexicographic order
    std::vector<std::string> hostnames() const;

    bool operator==(const HostnameSet& other) const { return entries_ == other.entries_; }
    bool operator!=(const HostnameSet& other) const { return !(*this == other); }

private:
    std::map<std::string, std::set<std::string>> entries_;
};

} // namespace certstalker::model
