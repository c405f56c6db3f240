/**
 * @file OrgDirectory.cpp
 * @brief Implementation of OrgDirectory.
 */

#include "infrastructure/OrgDirectory.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include "infrastructure/JsonCodec.hpp"

namespace tasksmind::infrastructure {

using json = nlohmann::json;

std::shared_ptr<OrgDirectory> OrgDirectory::FromJson(const json& seed) {
    auto directory = std::make_shared<OrgDirectory>();

    if (seed.contains("org_units") && seed["org_units"].is_array()) {
        for (const auto& item : seed["org_units"]) {
            try {
                directory->addUnit(JsonCodec::OrgUnitFromJson(item));
            } catch (const std::exception& e) {
                std::cerr << "[OrgDirectory] Skipping malformed org unit: " << e.what() << std::endl;
            }
        }
    }
    if (seed.contains("authorities") && seed["authorities"].is_array()) {
        for (const auto& item : seed["authorities"]) {
            try {
                directory->addAuthority(JsonCodec::AuthorityFromJson(item));
            } catch (const std::exception& e) {
                std::cerr << "[OrgDirectory] Skipping malformed authority: " << e.what() << std::endl;
            }
        }
    }
    return directory;
}

std::shared_ptr<OrgDirectory> OrgDirectory::LoadFromFile(const std::string& path) {
    if (path.empty() || !std::filesystem::exists(path)) {
        std::cerr << "[OrgDirectory] Seed file not found: " << path << std::endl;
        return std::make_shared<OrgDirectory>();
    }

    try {
        std::ifstream f(path);
        json seed = json::parse(f);
        auto directory = FromJson(seed);
        std::cout << "[OrgDirectory] Loaded " << directory->unitCount() << " org units and "
                  << directory->authorityCount() << " authorities from " << path << std::endl;
        return directory;
    } catch (const std::exception& e) {
        std::cerr << "[OrgDirectory] Error reading " << path << ": " << e.what() << std::endl;
    }
    return std::make_shared<OrgDirectory>();
}

void OrgDirectory::addUnit(const domain::OrgUnit& unit) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_units[unit.id] = unit;
}

void OrgDirectory::addAuthority(const domain::Authority& authority) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_authorities.push_back(authority);
}

size_t OrgDirectory::unitCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_units.size();
}

size_t OrgDirectory::authorityCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_authorities.size();
}

std::optional<std::string> OrgDirectory::getParent(const std::string& orgUnitId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_units.find(orgUnitId);
    if (it == m_units.end()) return std::nullopt;
    return it->second.parentId;
}

std::optional<domain::OrgUnit> OrgDirectory::getUnit(const std::string& orgUnitId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_units.find(orgUnitId);
    if (it == m_units.end()) return std::nullopt;
    return it->second;
}

std::vector<domain::Authority> OrgDirectory::listByOrgUnit(const std::string& orgUnitId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<domain::Authority> result;
    for (const auto& authority : m_authorities) {
        if (authority.orgUnitId == orgUnitId) result.push_back(authority);
    }
    return result;
}

} // namespace tasksmind::infrastructure
