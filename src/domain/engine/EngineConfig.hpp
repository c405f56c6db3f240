/**
 * @file EngineConfig.hpp
 * @brief Tunable tables and thresholds for the prioritization engine.
 *
 * Every component binds a copy of this configuration at construction, so a
 * deployment can swap tables (e.g. from settings.json) without touching the
 * rule logic. Default member values reproduce the production constants.
 */

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace tasksmind::domain::engine {

/**
 * @struct KeywordRoute
 * @brief Maps a keyword found in task text to the staff section that owns it.
 */
struct KeywordRoute {
    std::string keyword;
    std::string orgUnitId;
};

/**
 * @struct OriginatorWeight
 * @brief Weight for originators whose name contains @ref pattern.
 */
struct OriginatorWeight {
    std::string pattern;
    double weight;
};

/**
 * @struct UrgencyStep
 * @brief Urgency applied when days remaining is at most @ref maxDays.
 */
struct UrgencyStep {
    long maxDays;
    double score;
};

struct PriorityConfig {
    double base = 0.2;
    double urgencyWeight = 0.35;
    double originatorWeight = 0.25;
    double keywordWeight = 0.15;
    double statusWeight = 0.05;

    /// Evaluated in order; the first step with days <= maxDays applies.
    std::vector<UrgencyStep> urgencySteps = {
        {0, 1.0},
        {3, 0.85},
        {7, 0.7},
        {14, 0.5},
    };
    double urgencyDefault = 0.3;

    /// Order is significant: the first matching pattern wins.
    std::vector<OriginatorWeight> originators = {
        {"HQDA", 1.0},
        {"ACOM", 0.85},
        {"ASCC", 0.8},
        {"DRU", 0.75},
    };
    double originatorDefault = 0.6;

    std::map<std::string, double> statusWeights = {
        {"draft", 0.4},
        {"in_work", 0.6},
        {"open", 0.7},
        {"overdue", 1.0},
    };
    double statusDefault = 0.5;

    double keywordBoostBase = 0.2;
    double keywordBoostStep = 0.1;
    double keywordBoostCap = 0.4;
};

struct AuthorityConfig {
    size_t defaultLimit = 3;
    double confidenceStart = 0.9;
    double confidenceStep = 0.1;
    double confidenceFloor = 0.4;
    size_t maxAncestorDepth = 64;

    std::string fallbackId = "DEFAULT";
    std::string fallbackTitle = "Org Chief";
    std::string fallbackGrade = "GS-15";
    std::string fallbackRationale = "No authority records available; defaulting to org chief.";
};

struct RiskConfig {
    double redThreshold = 0.8;
    double amberThreshold = 0.6;
    double baselineProbability = 0.2;
    double redProbability = 0.75;
    double amberProbability = 0.5;
    double overdueProbability = 0.9;

    std::string redDriver = "High priority score indicates urgency";
    std::string amberDriver = "Moderate urgency from suspense/prior history";
    std::string overdueDriver = "Task already overdue";
    std::string defaultDriver = "No major risk factors detected";
    std::vector<std::string> recommendedActions = {
        "Confirm staffing plan",
        "Send reminder via notification service",
    };
};

struct QualityConfig {
    size_t minDescriptionLength = 30; ///< In Unicode code points.
};

struct SummaryConfig {
    double redThreshold = 0.8;
    double amberThreshold = 0.5;
    size_t maxTags = 3;
    size_t commentExcerptLength = 80;
};

struct EngineConfig {
    /// Shared by priority keyword boost and routing; order is significant.
    std::vector<KeywordRoute> keywordRoutes = {
        {"readiness", "OPS_G3"},
        {"training", "OPS_G3"},
        {"intel", "INTEL_G2"},
        {"logistics", "LOG_G4"},
        {"personnel", "PERS_G1"},
        {"legal", "JA"},
        {"chaplain", "CHAP"},
        {"communications", "G6_CIO"},
    };
    PriorityConfig priority;
    AuthorityConfig authority;
    RiskConfig risk;
    QualityConfig quality;
    SummaryConfig summary;
};

} // namespace tasksmind::domain::engine
