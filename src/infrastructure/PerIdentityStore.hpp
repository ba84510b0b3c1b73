/**
 * @file PerIdentityStore.hpp
 * @brief Map of identity -> state where each identity has its own lock.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace healthiq::infrastructure {

/**
 * @class PerIdentityStore
 * @brief Serializes work on one identity without blocking the others.
 *
 * The store-wide mutex only guards the identity map lookup/insert; the callback
 * runs under the identity's own mutex.
 */
template <typename State>
class PerIdentityStore {
public:
    /** @brief Runs @p fn on the identity's state (created on first use) under its lock. */
    template <typename F>
    decltype(auto) withState(const std::string& identity, F&& fn) {
        auto entry = entryFor(identity, true);
        std::lock_guard<std::mutex> lock(entry->mutex);
        return fn(entry->state);
    }

    /**
     * @brief Runs @p fn on an existing identity's state under its lock.
     * @return std::nullopt when the identity has never been written.
     */
    template <typename F>
    auto withExisting(const std::string& identity, F&& fn) const
        -> std::optional<std::decay_t<decltype(fn(std::declval<const State&>()))>> {
        auto entry = entryFor(identity, false);
        if (!entry) return std::nullopt;
        std::lock_guard<std::mutex> lock(entry->mutex);
        return fn(static_cast<const State&>(entry->state));
    }

    /** @brief Mutating variant of withExisting; never creates the identity. */
    template <typename F>
    auto modifyExisting(const std::string& identity, F&& fn)
        -> std::optional<std::decay_t<decltype(fn(std::declval<State&>()))>> {
        auto entry = entryFor(identity, false);
        if (!entry) return std::nullopt;
        std::lock_guard<std::mutex> lock(entry->mutex);
        return fn(entry->state);
    }

    std::vector<std::string> identities() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::string> ids;
        ids.reserve(m_entries.size());
        for (const auto& [id, entry] : m_entries) ids.push_back(id);
        return ids;
    }

private:
    struct Entry {
        std::mutex mutex;
        State state;
    };

    std::shared_ptr<Entry> entryFor(const std::string& identity, bool create) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(identity);
        if (it != m_entries.end()) return it->second;
        if (!create) return nullptr;
        auto entry = std::make_shared<Entry>();
        m_entries.emplace(identity, entry);
        return entry;
    }

    mutable std::mutex m_mutex;
    mutable std::map<std::string, std::shared_ptr<Entry>> m_entries;
};

} // namespace healthiq::infrastructure
