/**
 * @file TaskSummarizer.hpp
 * @brief Template-based task digest (no language model involved).
 */

#pragma once

#include <string>
#include <vector>
#include "domain/Insights.hpp"
#include "domain/Task.hpp"
#include "domain/engine/EngineConfig.hpp"

namespace tasksmind::domain::engine {

/**
 * @class TaskSummarizer
 * @brief Highlights urgency, originator and the first comment of a task.
 *
 * The risk level uses its own thresholds (red >= 0.8, amber >= 0.5), which
 * differ from RiskAssessor's.
 */
class TaskSummarizer {
public:
    explicit TaskSummarizer(EngineConfig config = EngineConfig{});

    /**
     * @param task A stored task (an unscored task summarizes as score 0).
     * @param comments Comment bodies, oldest first.
     */
    TaskSummary summarize(const TaskSnapshot& task, const std::vector<std::string>& comments) const;

private:
    SummaryConfig m_config;
};

} // namespace tasksmind::domain::engine
