/**
 * @file PriorityScorer.hpp
 * @brief Computes the urgency score stamped onto every task.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/Date.hpp"
#include "domain/Task.hpp"
#include "domain/engine/EngineConfig.hpp"

namespace tasksmind::domain::engine {

/**
 * @class PriorityScorer
 * @brief Weighted sum of urgency, originator, keyword and status sub-scores.
 *
 * Total and deterministic: unknown originators, statuses and empty text
 * degrade to the configured defaults. The result is clamped to 1.0 and
 * rounded to two decimals.
 */
class PriorityScorer {
public:
    explicit PriorityScorer(EngineConfig config = EngineConfig{});

    /**
     * @brief Scores a task against the given current date.
     * @return A value in [0, 1] rounded to two decimals.
     */
    double score(const TaskSnapshot& task, const Date& today) const;

    /** @brief Step function of days remaining until the suspense date. */
    double urgencyScore(const Date& suspenseDate, const Date& today) const;

    /** @brief Case-insensitive substring match against the ordered originator table. */
    double originatorScore(const std::string& originator) const;

    /** @brief Boost for section keywords found in tags and description. */
    double keywordBoost(const std::vector<std::string>& tags, const std::string& description) const;

    double statusWeight(TaskStatus status) const;

private:
    EngineConfig m_config;
};

} // namespace tasksmind::domain::engine
