/**
 * @file PriorityScorer.cpp
 * @brief Implementation of PriorityScorer.
 */

#include "domain/engine/PriorityScorer.hpp"
#include <algorithm>
#include <set>
#include "domain/engine/TextUtils.hpp"

namespace tasksmind::domain::engine {

PriorityScorer::PriorityScorer(EngineConfig config)
    : m_config(std::move(config)) {}

double PriorityScorer::score(const TaskSnapshot& task, const Date& today) const {
    const PriorityConfig& p = m_config.priority;
    double total = p.base;
    total += p.urgencyWeight * urgencyScore(task.suspenseDate, today);
    total += p.originatorWeight * originatorScore(task.originator);
    total += p.keywordWeight * keywordBoost(task.tags, task.description);
    total += p.statusWeight * statusWeight(task.status);
    return Round2(std::clamp(total, 0.0, 1.0));
}

double PriorityScorer::urgencyScore(const Date& suspenseDate, const Date& today) const {
    const long days = today.daysUntil(suspenseDate);
    for (const auto& step : m_config.priority.urgencySteps) {
        if (days <= step.maxDays) return step.score;
    }
    return m_config.priority.urgencyDefault;
}

double PriorityScorer::originatorScore(const std::string& originator) const {
    const std::string upper = ToUpper(originator);
    for (const auto& entry : m_config.priority.originators) {
        if (upper.find(ToUpper(entry.pattern)) != std::string::npos) {
            return entry.weight;
        }
    }
    return m_config.priority.originatorDefault;
}

double PriorityScorer::keywordBoost(const std::vector<std::string>& tags, const std::string& description) const {
    std::vector<std::string> parts = tags;
    parts.push_back(description);
    const std::string text = JoinNormalized(parts);

    std::set<std::string> matched;
    for (const auto& route : m_config.keywordRoutes) {
        const std::string keyword = Normalize(route.keyword);
        if (!keyword.empty() && text.find(keyword) != std::string::npos) {
            matched.insert(keyword);
        }
    }
    if (matched.empty()) return 0.0;

    const PriorityConfig& p = m_config.priority;
    return std::min(p.keywordBoostBase + p.keywordBoostStep * static_cast<double>(matched.size()), p.keywordBoostCap);
}

double PriorityScorer::statusWeight(TaskStatus status) const {
    const auto& weights = m_config.priority.statusWeights;
    auto it = weights.find(StatusToString(status));
    if (it != weights.end()) return it->second;
    return m_config.priority.statusDefault;
}

} // namespace tasksmind::domain::engine
