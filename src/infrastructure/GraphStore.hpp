/**
 * @file GraphStore.hpp
 * @brief In-memory store of per-identity concept graphs.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/HealthGraph.hpp"
#include "infrastructure/PerIdentityStore.hpp"

namespace healthiq::infrastructure {

/**
 * @class GraphStore
 * @brief Owns one HealthGraph per identity. Created once and injected where needed.
 *
 * Upsert-and-increment sequences for one identity run atomically under that
 * identity's lock; different identities proceed in parallel.
 */
class GraphStore {
public:
    /** @brief Mutates the identity's graph under its lock, creating it if absent. */
    template <typename F>
    decltype(auto) update(const std::string& identity, F&& fn) {
        return m_graphs.withState(identity, std::forward<F>(fn));
    }

    /** @brief Copy of the identity's graph, or std::nullopt if nothing was ingested yet. */
    std::optional<domain::HealthGraph> snapshot(const std::string& identity) const;

    /** @brief Summary of the identity's graph; an empty summary for unknown identities. */
    domain::GraphSummary summarize(const std::string& identity, size_t topN) const;

    /** @brief Replaces the identity's graph (used when restoring persisted state). */
    void replace(const std::string& identity, domain::HealthGraph graph);

    std::vector<std::string> identities() const { return m_graphs.identities(); }

private:
    PerIdentityStore<domain::HealthGraph> m_graphs;
};

} // namespace healthiq::infrastructure
