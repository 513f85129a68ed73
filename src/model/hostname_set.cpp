#include "certstalker/model/hostname_set.h"
#include "certstalker/model/domain.h"

namespace certstalker::model {

bool HostnameSet::add(const std::string& hostname, const std::string& provider) {
    if (provider.empty()) {
        return false;
    }
    auto canonical = normalizeHostname(hostname);
    if (!canonical) {
        return false;
    }
    entries_[*canonical].insert(provider);
    return true;
}

void HostnameSet::merge(const HostnameSet& other) {
    for (const auto& [hostname, providers] : other.entries_) {
        entries_[hostname].insert(providers.begin(), providers.end());
    }
}

bool HostnameSet::contains(const std::string& hostname) const {
    auto canonical = normalizeHostname(hostname);
    return canonical && entries_.count(*canonical) > 0;
}

std::set<std::string> HostnameSet::providersOf(const std::string& hostname) const {
    auto canonical = normalizeHostname(hostname);
    if (!canonical) {
        return {};
    }
    auto it = entries_.find(*canonical);
    return it == entries_.end() ? std::set<std::string>{} : it->second;
}

std::vector<HostnameEntry> HostnameSet::entries() const {
    std::vector<HostnameEntry> result;
    result.reserve(entries_.size());
    for (const auto& [hostname, providers] : entries_) {
        result.push_back(HostnameEntry{hostname, providers});
    }
    return result;
}

std::vector<std::string> HostnameSet::hostnames() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace certstalker::model
