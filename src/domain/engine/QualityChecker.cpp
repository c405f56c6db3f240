/**
 * @file QualityChecker.cpp
 * @brief Implementation of QualityChecker.
 */

#include "domain/engine/QualityChecker.hpp"
#include <algorithm>
#include "domain/engine/TextUtils.hpp"

namespace tasksmind::domain::engine {

QualityChecker::QualityChecker(EngineConfig config) {
    const size_t minLength = config.quality.minDescriptionLength;

    addRule({"DESC_LEN", Severity::Medium,
             "Description is brief; Army 25-50 recommends more context.",
             [minLength](const TaskSnapshot& task) { return Utf8Length(task.description) < minLength; }});

    addRule({"ARIMS_TAG", Severity::Low,
             "ARIMS record series missing; add before final approval.",
             [](const TaskSnapshot& task) { return !task.recordSeriesId || task.recordSeriesId->empty(); }});
}

void QualityChecker::addRule(QualityRule rule) {
    m_rules.push_back(std::move(rule));
}

QualityCheckResult QualityChecker::check(const TaskSnapshot& task) const {
    QualityCheckResult result;
    result.taskId = task.id;

    for (const auto& rule : m_rules) {
        if (rule.violated && rule.violated(task)) {
            result.issues.push_back({rule.code, rule.severity, rule.message});
        }
    }

    result.passed = std::none_of(result.issues.begin(), result.issues.end(),
                                 [](const QualityIssue& issue) { return issue.severity >= Severity::Medium; });
    return result;
}

} // namespace tasksmind::domain::engine
