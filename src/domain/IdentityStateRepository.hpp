/**
 * @file IdentityStateRepository.hpp
 * @brief Interface for persisting everything the analytics service keeps per identity.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

#include "domain/Alert.hpp"
#include "domain/HSIScore.hpp"
#include "domain/HealthEvent.hpp"
#include "domain/HealthGraph.hpp"

namespace healthiq::domain {

/**
 * @struct IdentitySnapshot
 * @brief Durable state of one identity.
 */
struct IdentitySnapshot {
    std::vector<HealthEvent> events;     ///< Processed events in ingestion order.
    HealthGraph graph;
    std::vector<UserAlert> alerts;       ///< Insertion order, acknowledged ones included.
    std::vector<HSIScore> hsiHistory;    ///< Oldest first.
};

/**
 * @class IdentityStateRepository
 * @brief Abstract interface for snapshot storage.
 */
class IdentityStateRepository {
public:
    virtual ~IdentityStateRepository() = default;

    /** @brief Persists the whole snapshot, replacing any previous one. */
    virtual void save(const std::string& identity, const IdentitySnapshot& snapshot) = 0;

    /**
     * @brief Loads a snapshot.
     * @return std::nullopt if nothing was ever saved for @p identity.
     */
    virtual std::optional<IdentitySnapshot> load(const std::string& identity) = 0;

    /** @brief Identities that have a saved snapshot. */
    virtual std::vector<std::string> listIdentities() = 0;
};

} // namespace healthiq::domain
