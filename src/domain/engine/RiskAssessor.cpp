/**
 * @file RiskAssessor.cpp
 * @brief Implementation of RiskAssessor.
 */

#include "domain/engine/RiskAssessor.hpp"
#include <stdexcept>
#include "domain/engine/TextUtils.hpp"

namespace tasksmind::domain::engine {

RiskAssessor::RiskAssessor(EngineConfig config)
    : m_config(std::move(config.risk)) {}

RiskInsight RiskAssessor::assess(const TaskSnapshot& task) const {
    if (!task.priorityScore) {
        throw std::invalid_argument("Risk assessment requires a scored task: " + task.id);
    }
    const double score = *task.priorityScore;

    RiskInsight insight;
    insight.taskId = task.id;
    insight.riskLevel = RiskLevel::Green;
    double probability = m_config.baselineProbability;

    if (score >= m_config.redThreshold) {
        insight.riskLevel = RiskLevel::Red;
        probability = m_config.redProbability;
        insight.drivers.push_back(m_config.redDriver);
    } else if (score >= m_config.amberThreshold) {
        insight.riskLevel = RiskLevel::Amber;
        probability = m_config.amberProbability;
        insight.drivers.push_back(m_config.amberDriver);
    }

    // Applied last so that an overdue task is always red.
    if (task.status == TaskStatus::Overdue) {
        insight.riskLevel = RiskLevel::Red;
        probability = m_config.overdueProbability;
        insight.drivers.push_back(m_config.overdueDriver);
    }

    if (insight.drivers.empty()) {
        insight.drivers.push_back(m_config.defaultDriver);
    }
    insight.lateProbability = Round2(probability);
    insight.recommendedActions = m_config.recommendedActions;
    return insight;
}

} // namespace tasksmind::domain::engine
