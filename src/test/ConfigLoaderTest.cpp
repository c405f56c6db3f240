#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "infrastructure/ConfigLoader.hpp"
#include "test/TestSupport.hpp"

using namespace tasksmind::infrastructure;
using tasksmind::test::Near;
namespace fs = std::filesystem;

namespace {

fs::path WriteFile(const fs::path& dir, const std::string& name, const std::string& content) {
    fs::path p = dir / name;
    std::ofstream out(p);
    out << content;
    return p;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    const fs::path dir = fs::temp_directory_path() / "tasksmind_config_test";
    fs::remove_all(dir);
    fs::create_directories(dir);

    // Missing file: defaults.
    {
        Settings s = ConfigLoader::Load((dir / "absent.json").string());
        assert(s.host == "0.0.0.0");
        assert(s.port == 8080);
        assert(s.seedFile.empty());
        assert(s.engine.keywordRoutes.size() == 8);
        assert(s.engine.authority.defaultLimit == 3);
    }

    // Malformed file: defaults.
    {
        auto p = WriteFile(dir, "broken.json", "{ \"server\": { \"port\": ");
        Settings s = ConfigLoader::Load(p.string());
        assert(s.port == 8080);
    }

    // Full document with overrides; untouched keys keep their defaults.
    {
        auto p = WriteFile(dir, "settings.json", R"({
            "server": { "host": "127.0.0.1", "port": 9090 },
            "seed_file": "org_seed.json",
            "engine": {
                "keyword_routes": [ { "keyword": "range", "org_unit_id": "RANGE_CONTROL" } ],
                "priority": {
                    "base": 0.1,
                    "urgency_steps": [ { "max_days": 1, "score": 1.0 } ],
                    "originators": [ { "pattern": "FORSCOM", "weight": 0.9 } ],
                    "status_weights": { "open": 0.3 }
                },
                "authority": { "default_limit": 5, "fallback_title": "Duty Officer" },
                "risk": { "amber_threshold": 0.55, "recommended_actions": [ "Call the owner" ] },
                "quality": { "min_description_length": 50 },
                "summary": { "max_tags": 2 }
            }
        })");
        Settings s = ConfigLoader::Load(p.string());
        assert(s.host == "127.0.0.1");
        assert(s.port == 9090);
        assert(fs::path(s.seedFile) == dir / "org_seed.json");

        const auto& e = s.engine;
        assert(e.keywordRoutes.size() == 1);
        assert(e.keywordRoutes[0].keyword == "range" && e.keywordRoutes[0].orgUnitId == "RANGE_CONTROL");
        assert(Near(e.priority.base, 0.1));
        assert(Near(e.priority.urgencyWeight, 0.35));
        assert(e.priority.urgencySteps.size() == 1 && e.priority.urgencySteps[0].maxDays == 1);
        assert(e.priority.originators.size() == 1 && e.priority.originators[0].pattern == "FORSCOM");
        assert(e.priority.statusWeights.size() == 1 && Near(e.priority.statusWeights.at("open"), 0.3));
        assert(e.authority.defaultLimit == 5);
        assert(e.authority.fallbackTitle == "Duty Officer");
        assert(e.authority.fallbackId == "DEFAULT");
        assert(Near(e.risk.amberThreshold, 0.55));
        assert(Near(e.risk.redThreshold, 0.8));
        assert(e.risk.recommendedActions.size() == 1);
        assert(e.quality.minDescriptionLength == 50);
        assert(e.summary.maxTags == 2);
        assert(e.summary.commentExcerptLength == 80);
    }

    // Absolute seed paths are kept as written.
    {
        const std::string absolute = (dir / "elsewhere" / "seed.json").string();
        nlohmann::json j = {{"seed_file", absolute}};
        auto p = WriteFile(dir, "absolute.json", j.dump());
        assert(ConfigLoader::Load(p.string()).seedFile == absolute);
    }

    // Type errors surface from FromJson.
    {
        bool threw = false;
        try {
            ConfigLoader::FromJson(nlohmann::json{{"server", {{"port", "eighty"}}}});
        } catch (const nlohmann::json::exception&) {
            threw = true;
        }
        assert(threw);
    }

    // Out-of-range authority settings are rejected; the defaults stay.
    {
        Settings s = ConfigLoader::FromJson(nlohmann::json::parse(R"({
            "engine": { "authority": {
                "default_limit": 0, "max_ancestor_depth": -3,
                "confidence_start": 0.95, "confidence_floor": 0.2,
                "fallback_grade": "O6"
            } }
        })"));
        const auto& a = s.engine.authority;
        assert(a.defaultLimit == 3);
        assert(a.maxAncestorDepth == 64);
        assert(Near(a.confidenceStart, 0.9));
        assert(Near(a.confidenceStep, 0.1));
        assert(Near(a.confidenceFloor, 0.4));
        assert(a.fallbackGrade == "O6");

        Settings inverted = ConfigLoader::FromJson(nlohmann::json::parse(
            R"({ "engine": { "authority": { "confidence_start": 0.5, "confidence_floor": 0.6 } } })"));
        assert(Near(inverted.engine.authority.confidenceStart, 0.9));
        assert(Near(inverted.engine.authority.confidenceFloor, 0.4));

        Settings narrowed = ConfigLoader::FromJson(nlohmann::json::parse(
            R"({ "engine": { "authority": { "confidence_start": 0.8, "confidence_step": 0.05, "confidence_floor": 0.5 } } })"));
        assert(Near(narrowed.engine.authority.confidenceStart, 0.8));
        assert(Near(narrowed.engine.authority.confidenceStep, 0.05));
        assert(Near(narrowed.engine.authority.confidenceFloor, 0.5));
    }

    // The default settings file lives under $XDG_CONFIG_HOME/TasksMind.
    setenv("XDG_CONFIG_HOME", dir.string().c_str(), 1);
    assert(fs::path(ConfigLoader::DefaultSettingsPath()) == dir / "TasksMind" / "settings.json");
    setenv("XDG_CONFIG_HOME", "", 1);
    assert(fs::path(ConfigLoader::DefaultSettingsPath()).filename() == "settings.json");

    fs::remove_all(dir);
    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}
