/**
 * @file IdentityStateRepositoryFs.hpp
 * @brief File system implementation of IdentityStateRepository.
 */

#pragma once

#include <memory>
#include <string>

#include "domain/IdentityStateRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace healthiq::infrastructure {

/**
 * @class IdentityStateRepositoryFs
 * @brief Stores each identity under <root>/identities/<identity>/ as JSON files.
 *
 * Layout: events.json, graph.json, alerts.json, hsi_history.json. Writes go
 * through the shared PersistenceService, so a save is visible to load() only
 * after the service has flushed.
 */
class IdentityStateRepositoryFs : public domain::IdentityStateRepository {
public:
    IdentityStateRepositoryFs(std::string stateRoot, std::shared_ptr<PersistenceService> persistence);

    void save(const std::string& identity, const domain::IdentitySnapshot& snapshot) override;

    /** @throws MalformedEventError or std::runtime_error on a corrupt snapshot file. */
    std::optional<domain::IdentitySnapshot> load(const std::string& identity) override;

    std::vector<std::string> listIdentities() override;

private:
    /** @throws std::invalid_argument for identities that are not a plain directory name. */
    std::string identityDir(const std::string& identity) const;

    std::string m_stateRoot;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace healthiq::infrastructure
