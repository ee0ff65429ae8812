#include "provider_registry.hpp"

#include <algorithm>
#include <mutex>
#include <unordered_set>

namespace avatarlink {
namespace provider {

bool ProviderRegistry::add_provider(std::shared_ptr<ISpeakAdapter> adapter, std::string &error) {
    if (!adapter) {
        error = "Provider adapter is null";
        return false;
    }
    const std::string name = adapter->descriptor().name;
    if (name.empty()) {
        error = "Provider name must not be empty";
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = by_name_.find(name);
    if (it != by_name_.end()) {
        std::replace(ordered_.begin(), ordered_.end(), it->second, adapter);
        it->second = std::move(adapter);
    } else {
        ordered_.push_back(adapter);
        by_name_.emplace(name, std::move(adapter));
    }
    return true;
}

bool ProviderRegistry::remove_provider(const std::string &name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = by_name_.find(name);
    if (it == by_name_.end()) {
        return false;
    }
    ordered_.erase(std::remove(ordered_.begin(), ordered_.end(), it->second), ordered_.end());
    by_name_.erase(it);
    return true;
}

bool ProviderRegistry::replace_all(std::vector<std::shared_ptr<ISpeakAdapter>> adapters, std::string &error) {
    std::unordered_map<std::string, std::shared_ptr<ISpeakAdapter>> next;
    std::unordered_set<std::string> seen;

    for (const auto &adapter : adapters) {
        if (!adapter) {
            error = "Provider adapter is null";
            return false;
        }
        const std::string &name = adapter->descriptor().name;
        if (name.empty()) {
            error = "Provider name must not be empty";
            return false;
        }
        if (!seen.insert(name).second) {
            error = "Duplicate provider name: " + name;
            return false;
        }
        next.emplace(name, adapter);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    ordered_ = std::move(adapters);
    by_name_ = std::move(next);
    return true;
}

std::shared_ptr<ISpeakAdapter> ProviderRegistry::get_provider(const std::string &name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = by_name_.find(name);
    if (it != by_name_.end()) {
        return it->second;
    }
    return nullptr;
}

std::vector<std::shared_ptr<ISpeakAdapter>> ProviderRegistry::get_all_providers() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return ordered_;
}

std::vector<std::string> ProviderRegistry::get_provider_names() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<std::string> names;
    names.reserve(ordered_.size());
    for (const auto &adapter : ordered_) {
        names.push_back(adapter->descriptor().name);
    }
    return names;
}

bool ProviderRegistry::has_provider(const std::string &name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return by_name_.find(name) != by_name_.end();
}

size_t ProviderRegistry::provider_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return ordered_.size();
}

void ProviderRegistry::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    ordered_.clear();
    by_name_.clear();
}

}  // namespace provider
}  // namespace avatarlink
