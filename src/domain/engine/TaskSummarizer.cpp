/**
 * @file TaskSummarizer.cpp
 * @brief Implementation of TaskSummarizer.
 */

#include "domain/engine/TaskSummarizer.hpp"
#include <algorithm>
#include <sstream>
#include "domain/engine/TextUtils.hpp"

namespace tasksmind::domain::engine {

namespace {

// Two-decimal scores print as "0.84"; whole numbers keep a trailing ".0".
std::string FormatScore(double score) {
    std::ostringstream ss;
    ss << score;
    std::string out = ss.str();
    if (out.find('.') == std::string::npos && out.find('e') == std::string::npos) {
        out += ".0";
    }
    return out;
}

} // namespace

TaskSummarizer::TaskSummarizer(EngineConfig config)
    : m_config(std::move(config.summary)) {}

TaskSummary TaskSummarizer::summarize(const TaskSnapshot& task, const std::vector<std::string>& comments) const {
    const double score = task.priorityScore.value_or(0.0);

    TaskSummary summary;
    if (score >= m_config.redThreshold) {
        summary.keyPoints.push_back("High priority task");
    }
    summary.keyPoints.push_back("Due " + task.suspenseDate.toIsoString());
    if (!task.tags.empty()) {
        std::string tags;
        const size_t n = std::min(m_config.maxTags, task.tags.size());
        for (size_t i = 0; i < n; ++i) {
            if (i > 0) tags += ", ";
            tags += task.tags[i];
        }
        summary.keyPoints.push_back("Tags: " + tags);
    }
    if (!comments.empty()) {
        summary.keyPoints.push_back("Recent feedback snippets: " +
                                    Utf8Prefix(comments.front(), m_config.commentExcerptLength) + "...");
    }

    summary.summary = "Task " + task.id + " from " + task.originator + " focuses on " + task.title +
                      ". Classification " + ClassificationToString(task.classification) +
                      ". Priority score " + FormatScore(score) + ".";

    if (score >= m_config.redThreshold) {
        summary.riskLevel = RiskLevel::Red;
    } else if (score >= m_config.amberThreshold) {
        summary.riskLevel = RiskLevel::Amber;
    } else {
        summary.riskLevel = RiskLevel::Green;
    }
    return summary;
}

} // namespace tasksmind::domain::engine
