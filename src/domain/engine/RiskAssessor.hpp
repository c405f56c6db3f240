/**
 * @file RiskAssessor.hpp
 * @brief Derives a lateness-risk tier from a scored task.
 */

#pragma once

#include "domain/Insights.hpp"
#include "domain/Task.hpp"
#include "domain/engine/EngineConfig.hpp"

namespace tasksmind::domain::engine {

class RiskAssessor {
public:
    explicit RiskAssessor(EngineConfig config = EngineConfig{});

    /**
     * @brief Assesses lateness risk. An overdue status always yields red.
     * @throws std::invalid_argument if the task has not been scored.
     */
    RiskInsight assess(const TaskSnapshot& task) const;

private:
    RiskConfig m_config;
};

} // namespace tasksmind::domain::engine
