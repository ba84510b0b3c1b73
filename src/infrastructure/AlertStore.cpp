/**
 * @file AlertStore.cpp
 * @brief Implementation of AlertStore.
 */

#include "infrastructure/AlertStore.hpp"

#include <algorithm>
#include <iostream>
#include <set>
#include <stdexcept>

namespace healthiq::infrastructure {

using namespace healthiq::domain;

namespace {

constexpr const char* kIdPrefix = "alert-";

/** @brief Numeric suffix of ids this store issued, 0 for foreign ids. */
long SequenceOf(const std::string& id) {
    std::string prefix = kIdPrefix;
    if (id.compare(0, prefix.size(), prefix) != 0 || id.size() == prefix.size()) return 0;
    long value = 0;
    for (size_t i = prefix.size(); i < id.size(); ++i) {
        if (id[i] < '0' || id[i] > '9') return 0;
        value = value * 10 + (id[i] - '0');
    }
    return value;
}

} // namespace

AlertStore::AlertStore(std::chrono::hours dedupWindow) : m_dedupWindow(dedupWindow) {}

std::optional<UserAlert> AlertStore::save(const std::string& identity, UserAlert alert) {
    return m_alerts.withState(identity, [&](IdentityAlerts& state) -> std::optional<UserAlert> {
        for (const auto& existing : state.alerts) {
            if (existing.acknowledged || existing.ruleType != alert.ruleType) continue;
            // Replays may run with an earlier clock, so the gap counts in both directions.
            auto gap = existing.triggeredAt > alert.triggeredAt ? existing.triggeredAt - alert.triggeredAt
                                                                : alert.triggeredAt - existing.triggeredAt;
            if (gap <= m_dedupWindow) {
                std::clog << "[AlertStore] Suppressed duplicate " << RuleTypeToString(alert.ruleType)
                          << " alert for " << identity << " (active: " << existing.id << ")" << std::endl;
                return std::nullopt;
            }
        }

        alert.id = kIdPrefix + std::to_string(state.nextSequence++);
        alert.acknowledged = false;
        alert.acknowledgedAt.reset();
        state.alerts.push_back(alert);
        return alert;
    });
}

std::vector<UserAlert> AlertStore::activeAlerts(const std::string& identity) const {
    auto active = m_alerts.withExisting(identity, [](const IdentityAlerts& state) {
        std::vector<UserAlert> out;
        for (const auto& alert : state.alerts) {
            if (!alert.acknowledged) out.push_back(alert);
        }
        std::stable_sort(out.begin(), out.end(), [](const UserAlert& a, const UserAlert& b) {
            return a.triggeredAt > b.triggeredAt;
        });
        return out;
    });
    return active.value_or(std::vector<UserAlert>{});
}

std::vector<UserAlert> AlertStore::allAlerts(const std::string& identity) const {
    auto all = m_alerts.withExisting(identity, [](const IdentityAlerts& state) { return state.alerts; });
    return all.value_or(std::vector<UserAlert>{});
}

bool AlertStore::acknowledge(const std::string& identity, const std::string& alertId, TimePoint at) {
    auto acknowledged = m_alerts.modifyExisting(identity, [&](IdentityAlerts& state) {
        for (auto& alert : state.alerts) {
            if (alert.id != alertId) continue;
            if (alert.acknowledged) return false;
            alert.acknowledged = true;
            alert.acknowledgedAt = at;
            return true;
        }
        return false;
    });
    return acknowledged.value_or(false);
}

void AlertStore::restore(const std::string& identity, std::vector<UserAlert> alerts) {
    std::set<std::string> ids;
    long nextSequence = 1;
    for (const auto& alert : alerts) {
        if (!ids.insert(alert.id).second) {
            throw std::runtime_error("Duplicate alert id in snapshot: " + alert.id);
        }
        nextSequence = std::max(nextSequence, SequenceOf(alert.id) + 1);
    }

    m_alerts.withState(identity, [&](IdentityAlerts& state) {
        state.alerts = std::move(alerts);
        state.nextSequence = nextSequence;
    });
}

} // namespace healthiq::infrastructure
