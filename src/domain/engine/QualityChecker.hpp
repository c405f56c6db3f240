/**
 * @file QualityChecker.hpp
 * @brief Completeness rules evaluated against a task.
 */

#pragma once

#include <functional>
#include <string>
#include <vector>
#include "domain/Insights.hpp"
#include "domain/Task.hpp"
#include "domain/engine/EngineConfig.hpp"

namespace tasksmind::domain::engine {

/**
 * @struct QualityRule
 * @brief Emits an issue with the given code and severity when @ref violated returns true.
 */
struct QualityRule {
    std::string code;
    Severity severity;
    std::string message;
    std::function<bool(const TaskSnapshot&)> violated;
};

/**
 * @class QualityChecker
 * @brief Runs every rule (no short-circuit); a task passes when no issue
 *        of medium severity or above is found.
 *
 * Rules are registered at construction time; check() is safe to call
 * concurrently once setup is done.
 */
class QualityChecker {
public:
    explicit QualityChecker(EngineConfig config = EngineConfig{});

    QualityCheckResult check(const TaskSnapshot& task) const;

    void addRule(QualityRule rule);

    const std::vector<QualityRule>& rules() const { return m_rules; }

private:
    std::vector<QualityRule> m_rules;
};

} // namespace tasksmind::domain::engine
