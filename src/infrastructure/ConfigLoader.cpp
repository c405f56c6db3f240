/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include "infrastructure/PathUtils.hpp"

namespace tasksmind::infrastructure {

using json = nlohmann::json;
using namespace tasksmind::domain::engine;

namespace {

template <typename T>
void Assign(const json& j, const char* key, T& target) {
    if (j.contains(key) && !j[key].is_null()) {
        target = j[key].get<T>();
    }
}

void ApplyPriority(const json& j, PriorityConfig& p) {
    Assign(j, "base", p.base);
    Assign(j, "urgency_weight", p.urgencyWeight);
    Assign(j, "originator_weight", p.originatorWeight);
    Assign(j, "keyword_weight", p.keywordWeight);
    Assign(j, "status_weight", p.statusWeight);
    Assign(j, "urgency_default", p.urgencyDefault);
    Assign(j, "originator_default", p.originatorDefault);
    Assign(j, "status_default", p.statusDefault);
    Assign(j, "keyword_boost_base", p.keywordBoostBase);
    Assign(j, "keyword_boost_step", p.keywordBoostStep);
    Assign(j, "keyword_boost_cap", p.keywordBoostCap);

    if (j.contains("urgency_steps") && j["urgency_steps"].is_array()) {
        p.urgencySteps.clear();
        for (const auto& step : j["urgency_steps"]) {
            p.urgencySteps.push_back({step.at("max_days").get<long>(), step.at("score").get<double>()});
        }
    }
    if (j.contains("originators") && j["originators"].is_array()) {
        p.originators.clear();
        for (const auto& entry : j["originators"]) {
            p.originators.push_back({entry.at("pattern").get<std::string>(), entry.at("weight").get<double>()});
        }
    }
    if (j.contains("status_weights") && j["status_weights"].is_object()) {
        p.statusWeights = j["status_weights"].get<std::map<std::string, double>>();
    }
}

// Counts must be at least 1; anything else keeps the current value.
void AssignCount(const json& j, const char* key, size_t& target) {
    if (!j.contains(key) || j[key].is_null()) return;
    const long value = j[key].get<long>();
    if (value < 1) {
        std::cerr << "[ConfigLoader] authority." << key << " must be at least 1 (got " << value
                  << "); keeping " << target << "." << std::endl;
        return;
    }
    target = static_cast<size_t>(value);
}

void ApplyAuthority(const json& j, AuthorityConfig& a) {
    AssignCount(j, "default_limit", a.defaultLimit);
    AssignCount(j, "max_ancestor_depth", a.maxAncestorDepth);

    // Confidence stays within [0.4, 0.9]: floor <= start, a non-negative step.
    double start = a.confidenceStart;
    double step = a.confidenceStep;
    double floor = a.confidenceFloor;
    Assign(j, "confidence_start", start);
    Assign(j, "confidence_step", step);
    Assign(j, "confidence_floor", floor);
    if (floor < 0.4 || start > 0.9 || floor > start || step < 0.0) {
        std::cerr << "[ConfigLoader] Invalid authority confidence (start " << start << ", step " << step
                  << ", floor " << floor << "); keeping " << a.confidenceStart << "/" << a.confidenceStep
                  << "/" << a.confidenceFloor << "." << std::endl;
    } else {
        a.confidenceStart = start;
        a.confidenceStep = step;
        a.confidenceFloor = floor;
    }

    Assign(j, "fallback_id", a.fallbackId);
    Assign(j, "fallback_title", a.fallbackTitle);
    Assign(j, "fallback_grade", a.fallbackGrade);
    Assign(j, "fallback_rationale", a.fallbackRationale);
}

void ApplyRisk(const json& j, RiskConfig& r) {
    Assign(j, "red_threshold", r.redThreshold);
    Assign(j, "amber_threshold", r.amberThreshold);
    Assign(j, "baseline_probability", r.baselineProbability);
    Assign(j, "red_probability", r.redProbability);
    Assign(j, "amber_probability", r.amberProbability);
    Assign(j, "overdue_probability", r.overdueProbability);
    Assign(j, "red_driver", r.redDriver);
    Assign(j, "amber_driver", r.amberDriver);
    Assign(j, "overdue_driver", r.overdueDriver);
    Assign(j, "default_driver", r.defaultDriver);
    Assign(j, "recommended_actions", r.recommendedActions);
}

} // namespace

void ConfigLoader::ApplyEngineOverrides(const json& j, EngineConfig& config) {
    if (!j.is_object()) return;

    if (j.contains("keyword_routes") && j["keyword_routes"].is_array()) {
        config.keywordRoutes.clear();
        for (const auto& route : j["keyword_routes"]) {
            config.keywordRoutes.push_back({route.at("keyword").get<std::string>(),
                                            route.at("org_unit_id").get<std::string>()});
        }
    }
    if (j.contains("priority")) ApplyPriority(j["priority"], config.priority);
    if (j.contains("authority")) ApplyAuthority(j["authority"], config.authority);
    if (j.contains("risk")) ApplyRisk(j["risk"], config.risk);
    if (j.contains("quality")) {
        Assign(j["quality"], "min_description_length", config.quality.minDescriptionLength);
    }
    if (j.contains("summary")) {
        const json& s = j["summary"];
        Assign(s, "red_threshold", config.summary.redThreshold);
        Assign(s, "amber_threshold", config.summary.amberThreshold);
        Assign(s, "max_tags", config.summary.maxTags);
        Assign(s, "comment_excerpt_length", config.summary.commentExcerptLength);
    }
}

Settings ConfigLoader::FromJson(const json& j) {
    Settings settings;
    if (j.contains("server") && j["server"].is_object()) {
        Assign(j["server"], "host", settings.host);
        Assign(j["server"], "port", settings.port);
    }
    Assign(j, "seed_file", settings.seedFile);
    if (j.contains("engine")) {
        ApplyEngineOverrides(j["engine"], settings.engine);
    }
    return settings;
}

Settings ConfigLoader::Load(const std::string& path) {
    std::filesystem::path configPath(path);
    if (!std::filesystem::exists(configPath)) {
        std::cout << "[ConfigLoader] " << path << " not found; using defaults." << std::endl;
        return Settings{};
    }

    try {
        std::ifstream f(configPath);
        json j;
        f >> j;

        Settings settings = FromJson(j);
        if (!settings.seedFile.empty() && std::filesystem::path(settings.seedFile).is_relative()) {
            settings.seedFile = (configPath.parent_path() / settings.seedFile).string();
        }
        return settings;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << "; using defaults." << std::endl;
    }
    return Settings{};
}

std::string ConfigLoader::DefaultSettingsPath() {
    return (PathUtils::GetSettingsDir() / "settings.json").string();
}

} // namespace tasksmind::infrastructure
