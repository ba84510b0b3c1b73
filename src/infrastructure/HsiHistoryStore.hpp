/**
 * @file HsiHistoryStore.hpp
 * @brief Append-only history of HSI snapshots per identity.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/HSIScore.hpp"
#include "infrastructure/PerIdentityStore.hpp"

namespace healthiq::infrastructure {

class HsiHistoryStore {
public:
    void append(const std::string& identity, domain::HSIScore score) {
        m_history.withState(identity, [&score](std::vector<domain::HSIScore>& history) {
            history.push_back(std::move(score));
        });
    }

    /**
     * @brief Calls @p next with the latest snapshot and appends the score it returns.
     *
     * Runs under the identity's lock, so concurrent calls for one identity see each
     * other's snapshots in append order. Nothing is appended if @p next throws.
     */
    template <typename F>
    domain::HSIScore appendNext(const std::string& identity, F&& next) {
        return m_history.withState(identity, [&next](std::vector<domain::HSIScore>& history) {
            std::optional<domain::HSIScore> previous;
            if (!history.empty()) previous = history.back();
            domain::HSIScore score = next(previous);
            history.push_back(score);
            return score;
        });
    }

    /** @brief Most recently appended snapshot, if any. */
    std::optional<domain::HSIScore> latest(const std::string& identity) const {
        auto last = m_history.withExisting(identity, [](const std::vector<domain::HSIScore>& history) {
            return history.empty() ? std::optional<domain::HSIScore>{} : history.back();
        });
        return last ? *last : std::optional<domain::HSIScore>{};
    }

    /** @brief Snapshots oldest first; empty for unknown identities. */
    std::vector<domain::HSIScore> history(const std::string& identity) const {
        auto all = m_history.withExisting(identity, [](const std::vector<domain::HSIScore>& history) {
            return history;
        });
        return all.value_or(std::vector<domain::HSIScore>{});
    }

    /** @brief Replaces an identity's history with persisted snapshots. */
    void restore(const std::string& identity, std::vector<domain::HSIScore> snapshots) {
        m_history.withState(identity, [&snapshots](std::vector<domain::HSIScore>& history) {
            history = std::move(snapshots);
        });
    }

private:
    PerIdentityStore<std::vector<domain::HSIScore>> m_history;
};

} // namespace healthiq::infrastructure
