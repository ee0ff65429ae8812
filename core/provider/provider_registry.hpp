#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "i_speak_adapter.hpp"

namespace avatarlink {
namespace provider {

/**
 * @brief Thread-safe registry of configured speak adapters
 *
 * Wraps the provider set with std::shared_mutex:
 * - Concurrent reads from delivery threads, the health prober and HTTP handlers
 * - Exclusive writes when the provider set is replaced on config reload
 *
 * Readers receive shared_ptr copies, so an in-flight delivery keeps its
 * adapter alive even if a reload removes the provider mid-attempt.
 *
 * Registration order is preserved; snapshots are returned in the order
 * providers appear in configuration.
 */
class ProviderRegistry {
public:
    ProviderRegistry() = default;
    ~ProviderRegistry() = default;

    // Non-copyable, non-movable (manages mutex)
    ProviderRegistry(const ProviderRegistry &) = delete;
    ProviderRegistry &operator=(const ProviderRegistry &) = delete;
    ProviderRegistry(ProviderRegistry &&) = delete;
    ProviderRegistry &operator=(ProviderRegistry &&) = delete;

    /**
     * @brief Add or replace one adapter, keyed by descriptor().name
     *
     * @param adapter Must not be null
     * @param error Set when the adapter is rejected
     * @return false if adapter is null or its name is empty
     */
    bool add_provider(std::shared_ptr<ISpeakAdapter> adapter, std::string &error);

    bool remove_provider(const std::string &name);

    /**
     * @brief Atomically swap in a new provider set
     *
     * Validates the whole set first (non-null, non-empty unique names); on
     * failure the current set is left untouched.
     */
    bool replace_all(std::vector<std::shared_ptr<ISpeakAdapter>> adapters, std::string &error);

    std::shared_ptr<ISpeakAdapter> get_provider(const std::string &name) const;

    // Snapshot in registration order
    std::vector<std::shared_ptr<ISpeakAdapter>> get_all_providers() const;

    std::vector<std::string> get_provider_names() const;

    bool has_provider(const std::string &name) const;

    size_t provider_count() const;

    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::vector<std::shared_ptr<ISpeakAdapter>> ordered_;
    std::unordered_map<std::string, std::shared_ptr<ISpeakAdapter>> by_name_;
};

}  // namespace provider
}  // namespace avatarlink
