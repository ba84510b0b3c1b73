/**
 * @file IdentityStateRepositoryFs.cpp
 * @brief Implementation of IdentityStateRepositoryFs.
 */

#include "infrastructure/IdentityStateRepositoryFs.hpp"
#include "infrastructure/JsonCodec.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace healthiq::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

constexpr const char* kEventsFile = "events.json";
constexpr const char* kGraphFile = "graph.json";
constexpr const char* kAlertsFile = "alerts.json";
constexpr const char* kHistoryFile = "hsi_history.json";

/** @brief Parses a snapshot file; a missing file yields @p fallback. */
json ReadJsonFile(const fs::path& path, json fallback) {
    if (!fs::exists(path)) return fallback;
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open snapshot file: " + path.string());
    }
    try {
        json j;
        in >> j;
        return j;
    } catch (const json::exception& e) {
        std::cerr << "[IdentityStateRepositoryFs] Corrupt snapshot file " << path << ": " << e.what() << std::endl;
        throw std::runtime_error("Corrupt snapshot file " + path.string() + ": " + e.what());
    }
}

} // namespace

IdentityStateRepositoryFs::IdentityStateRepositoryFs(std::string stateRoot, std::shared_ptr<PersistenceService> persistence)
    : m_stateRoot(std::move(stateRoot)), m_persistence(std::move(persistence)) {
    if (!m_persistence) {
        throw std::invalid_argument("IdentityStateRepositoryFs requires a PersistenceService");
    }
}

std::string IdentityStateRepositoryFs::identityDir(const std::string& identity) const {
    bool plain = !identity.empty() && identity != "." && identity != ".."
        && identity.find('/') == std::string::npos && identity.find('\\') == std::string::npos;
    if (!plain) {
        throw std::invalid_argument("Invalid identity for file storage: '" + identity + "'");
    }
    return (fs::path(m_stateRoot) / "identities" / identity).string();
}

void IdentityStateRepositoryFs::save(const std::string& identity, const domain::IdentitySnapshot& snapshot) {
    fs::path dir = identityDir(identity);

    json alerts = json::array();
    for (const auto& alert : snapshot.alerts) alerts.push_back(JsonCodec::EncodeAlert(alert));
    json history = json::array();
    for (const auto& score : snapshot.hsiHistory) history.push_back(JsonCodec::EncodeHSIScore(score));

    m_persistence->saveTextAsync((dir / kEventsFile).string(), JsonCodec::EncodeEvents(snapshot.events).dump(2));
    m_persistence->saveTextAsync((dir / kGraphFile).string(), JsonCodec::EncodeGraph(snapshot.graph).dump(2));
    m_persistence->saveTextAsync((dir / kAlertsFile).string(), alerts.dump(2));
    m_persistence->saveTextAsync((dir / kHistoryFile).string(), history.dump(2));
}

std::optional<domain::IdentitySnapshot> IdentityStateRepositoryFs::load(const std::string& identity) {
    fs::path dir = identityDir(identity);
    if (!fs::exists(dir)) return std::nullopt;

    domain::IdentitySnapshot snapshot;
    snapshot.events = JsonCodec::DecodeEvents(ReadJsonFile(dir / kEventsFile, json::array()));

    json graph = ReadJsonFile(dir / kGraphFile, json(nullptr));
    if (!graph.is_null()) snapshot.graph = JsonCodec::DecodeGraph(graph);

    for (const auto& alert : ReadJsonFile(dir / kAlertsFile, json::array())) {
        snapshot.alerts.push_back(JsonCodec::DecodeAlert(alert));
    }
    for (const auto& score : ReadJsonFile(dir / kHistoryFile, json::array())) {
        snapshot.hsiHistory.push_back(JsonCodec::DecodeHSIScore(score));
    }
    return snapshot;
}

std::vector<std::string> IdentityStateRepositoryFs::listIdentities() {
    std::vector<std::string> identities;
    fs::path root = fs::path(m_stateRoot) / "identities";
    if (!fs::exists(root)) return identities;

    for (const auto& entry : fs::directory_iterator(root)) {
        if (entry.is_directory()) identities.push_back(entry.path().filename().string());
    }
    std::sort(identities.begin(), identities.end());
    return identities;
}

} // namespace healthiq::infrastructure
