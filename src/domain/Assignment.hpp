/**
 * @file Assignment.hpp
 * @brief Ownership assignment and comment entities attached to a task.
 */

#pragma once
#include <optional>
#include <string>
#include "domain/Date.hpp"

namespace tasksmind::domain {

/**
 * @enum AssigneeType
 * @brief Whether a task is assigned to an organization or a person.
 */
enum class AssigneeType {
    Organization,
    User
};

inline std::string AssigneeTypeToString(AssigneeType t) {
    return t == AssigneeType::User ? "user" : "org";
}

inline AssigneeType ParseAssigneeType(const std::string& text) {
    return text == "user" ? AssigneeType::User : AssigneeType::Organization;
}

/**
 * @struct AssignmentRecord
 * @brief Who owns or supports a task and the state of that assignment.
 */
struct AssignmentRecord {
    long id = 0; ///< Store-assigned; 0 until persisted.
    std::string taskId;
    AssigneeType assigneeType = AssigneeType::Organization;
    std::string assigneeId;
    std::string role;
    std::string state = "pending";
    std::string rationale;
    std::optional<Date> dueOverrideDate;
};

/**
 * @struct Comment
 * @brief A remark left on a task, optionally replying to another comment.
 */
struct Comment {
    long id = 0;
    std::string taskId;
    std::string authorUserId;
    std::string body;
    std::optional<long> parentCommentId;
};

} // namespace tasksmind::domain
