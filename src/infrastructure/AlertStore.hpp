/**
 * @file AlertStore.hpp
 * @brief Per-identity alert persistence with duplicate suppression.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/Alert.hpp"
#include "infrastructure/PerIdentityStore.hpp"

namespace healthiq::infrastructure {

/**
 * @class AlertStore
 * @brief Holds every alert ever accepted for an identity.
 *
 * At most one unacknowledged alert per rule type survives inside the dedup
 * window. Acknowledgment is the only mutation and cannot be undone.
 */
class AlertStore {
public:
    explicit AlertStore(std::chrono::hours dedupWindow = std::chrono::hours(24));

    /**
     * @brief Accepts @p alert unless an unacknowledged alert of the same rule type
     *        was triggered within the dedup window before it.
     * @return The stored alert with its assigned id, or std::nullopt if suppressed.
     */
    std::optional<domain::UserAlert> save(const std::string& identity, domain::UserAlert alert);

    /** @brief Unacknowledged alerts, newest first. */
    std::vector<domain::UserAlert> activeAlerts(const std::string& identity) const;

    /** @brief Every stored alert in insertion order. */
    std::vector<domain::UserAlert> allAlerts(const std::string& identity) const;

    /**
     * @brief Marks an alert acknowledged at @p at.
     * @return false for an unknown identity or id, or an alert already acknowledged.
     */
    bool acknowledge(const std::string& identity, const std::string& alertId, domain::TimePoint at);

    /**
     * @brief Reloads persisted alerts for an identity, replacing what is held.
     * @throws std::runtime_error if two alerts share an id.
     */
    void restore(const std::string& identity, std::vector<domain::UserAlert> alerts);

private:
    struct IdentityAlerts {
        std::vector<domain::UserAlert> alerts;
        long nextSequence = 1;
    };

    std::chrono::hours m_dedupWindow;
    PerIdentityStore<IdentityAlerts> m_alerts;
};

} // namespace healthiq::infrastructure
