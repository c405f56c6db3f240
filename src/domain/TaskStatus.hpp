/**
 * @file TaskStatus.hpp
 * @brief Value objects for task workflow status and security classification.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace tasksmind::domain {

/**
 * @enum TaskStatus
 * @brief Workflow state of a task.
 */
enum class TaskStatus {
    Draft,
    Open,
    InWork,
    Overdue,
    Closed,
    Unknown ///< Any status text the system does not recognize.
};

/**
 * @enum Classification
 * @brief Security marking carried by a task.
 */
enum class Classification {
    Unclassified,
    Confidential,
    Secret,
    TopSecret
};

inline std::string StatusToString(TaskStatus status) {
    switch (status) {
        case TaskStatus::Draft: return "draft";
        case TaskStatus::Open: return "open";
        case TaskStatus::InWork: return "in_work";
        case TaskStatus::Overdue: return "overdue";
        case TaskStatus::Closed: return "closed";
        default: return "unknown";
    }
}

/**
 * @brief Maps status text to a TaskStatus. Unrecognized text yields Unknown.
 */
inline TaskStatus ParseStatus(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    std::replace(text.begin(), text.end(), '-', '_');
    if (text == "draft") return TaskStatus::Draft;
    if (text == "open") return TaskStatus::Open;
    if (text == "in_work") return TaskStatus::InWork;
    if (text == "overdue") return TaskStatus::Overdue;
    if (text == "closed") return TaskStatus::Closed;
    return TaskStatus::Unknown;
}

inline std::string ClassificationToString(Classification c) {
    switch (c) {
        case Classification::Unclassified: return "unclassified";
        case Classification::Confidential: return "confidential";
        case Classification::Secret: return "secret";
        case Classification::TopSecret: return "top_secret";
    }
    return "unclassified";
}

/**
 * @brief Accepts long names ("secret") and markings ("S", "TS").
 * Unrecognized text degrades to Unclassified.
 */
inline Classification ParseClassification(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    std::replace(text.begin(), text.end(), '-', '_');
    if (text == "c" || text == "confidential") return Classification::Confidential;
    if (text == "s" || text == "secret") return Classification::Secret;
    if (text == "ts" || text == "top_secret") return Classification::TopSecret;
    return Classification::Unclassified;
}

} // namespace tasksmind::domain
