/**
 * @file InMemoryTaskRepository.hpp
 * @brief Process-local TaskRepository guarded by a mutex.
 */

#pragma once

#include <map>
#include <mutex>
#include <vector>
#include "domain/TaskRepository.hpp"

namespace tasksmind::infrastructure {

class InMemoryTaskRepository : public domain::TaskRepository {
public:
    bool insertTask(const domain::TaskSnapshot& task) override;
    bool updateTask(const domain::TaskSnapshot& task) override;
    std::optional<domain::TaskSnapshot> findTask(const std::string& taskId) const override;
    std::vector<domain::TaskSnapshot> listTasks() const override;
    size_t countTasks() const override;

    domain::AssignmentRecord insertAssignment(const domain::AssignmentRecord& assignment) override;
    std::vector<domain::AssignmentRecord> listAssignments(const std::string& taskId) const override;

    domain::Comment insertComment(const domain::Comment& comment) override;
    std::vector<domain::Comment> listComments(const std::string& taskId) const override;

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_order; ///< Task ids in insertion order.
    std::map<std::string, domain::TaskSnapshot> m_tasks;
    std::vector<domain::AssignmentRecord> m_assignments;
    std::vector<domain::Comment> m_comments;
    long m_nextAssignmentId = 1;
    long m_nextCommentId = 1;
};

} // namespace tasksmind::infrastructure
