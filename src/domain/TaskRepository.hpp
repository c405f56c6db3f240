/**
 * @file TaskRepository.hpp
 * @brief Interface for storage of tasks and their assignments and comments.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/Assignment.hpp"
#include "domain/Task.hpp"

namespace tasksmind::domain {

/**
 * @class TaskRepository
 * @brief Abstract persistent store for tasks.
 */
class TaskRepository {
public:
    virtual ~TaskRepository() = default;

    /** @brief Inserts a new task. Returns false if the id is already taken. */
    virtual bool insertTask(const TaskSnapshot& task) = 0;

    /** @brief Replaces a stored task. Returns false if it does not exist. */
    virtual bool updateTask(const TaskSnapshot& task) = 0;

    virtual std::optional<TaskSnapshot> findTask(const std::string& taskId) const = 0;

    /** @brief All tasks in insertion order. */
    virtual std::vector<TaskSnapshot> listTasks() const = 0;

    virtual size_t countTasks() const = 0;

    /**
     * @brief Stores an assignment.
     * @return The stored record with its id filled in.
     */
    virtual AssignmentRecord insertAssignment(const AssignmentRecord& assignment) = 0;

    virtual std::vector<AssignmentRecord> listAssignments(const std::string& taskId) const = 0;

    /**
     * @brief Stores a comment.
     * @return The stored comment with its id filled in.
     */
    virtual Comment insertComment(const Comment& comment) = 0;

    virtual std::vector<Comment> listComments(const std::string& taskId) const = 0;
};

} // namespace tasksmind::domain
