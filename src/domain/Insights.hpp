/**
 * @file Insights.hpp
 * @brief Read-side value objects produced by the prioritization engine.
 */

#pragma once
#include <string>
#include <vector>

namespace tasksmind::domain {

/**
 * @struct AuthoritySuggestion
 * @brief A candidate approving authority with a confidence in [0.4, 0.9].
 */
struct AuthoritySuggestion {
    std::string authorityId;
    std::string title;
    std::string orgUnitId;
    std::string grade;
    double confidence = 0.0;
    std::string rationale;
};

/**
 * @enum RiskLevel
 * @brief Discrete lateness-risk tier.
 */
enum class RiskLevel {
    Green,
    Amber,
    Red
};

inline std::string RiskLevelToString(RiskLevel level) {
    switch (level) {
        case RiskLevel::Green: return "green";
        case RiskLevel::Amber: return "amber";
        case RiskLevel::Red: return "red";
    }
    return "green";
}

struct RiskInsight {
    std::string taskId;
    RiskLevel riskLevel = RiskLevel::Green;
    double lateProbability = 0.0;
    std::vector<std::string> drivers;
    std::vector<std::string> recommendedActions;
};

/**
 * @enum Severity
 * @brief Ordered severity of a quality issue.
 */
enum class Severity {
    Low,
    Medium,
    High
};

inline std::string SeverityToString(Severity s) {
    switch (s) {
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
    }
    return "low";
}

struct QualityIssue {
    std::string code;
    Severity severity = Severity::Low;
    std::string message;
};

struct QualityCheckResult {
    std::string taskId;
    std::vector<QualityIssue> issues;
    bool passed = true;
};

/**
 * @struct TaskSummary
 * @brief Template-based digest of a task and its discussion.
 */
struct TaskSummary {
    std::string summary;
    RiskLevel riskLevel = RiskLevel::Green;
    std::vector<std::string> keyPoints;
};

} // namespace tasksmind::domain
