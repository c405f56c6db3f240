/**
 * @file InMemoryTaskRepository.cpp
 * @brief Implementation of InMemoryTaskRepository.
 */

#include "infrastructure/InMemoryTaskRepository.hpp"

namespace tasksmind::infrastructure {

bool InMemoryTaskRepository::insertTask(const domain::TaskSnapshot& task) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_tasks.emplace(task.id, task).second) return false;
    m_order.push_back(task.id);
    return true;
}

bool InMemoryTaskRepository::updateTask(const domain::TaskSnapshot& task) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tasks.find(task.id);
    if (it == m_tasks.end()) return false;
    it->second = task;
    return true;
}

std::optional<domain::TaskSnapshot> InMemoryTaskRepository::findTask(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tasks.find(taskId);
    if (it == m_tasks.end()) return std::nullopt;
    return it->second;
}

std::vector<domain::TaskSnapshot> InMemoryTaskRepository::listTasks() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<domain::TaskSnapshot> result;
    result.reserve(m_order.size());
    for (const auto& id : m_order) {
        result.push_back(m_tasks.at(id));
    }
    return result;
}

size_t InMemoryTaskRepository::countTasks() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

domain::AssignmentRecord InMemoryTaskRepository::insertAssignment(const domain::AssignmentRecord& assignment) {
    std::lock_guard<std::mutex> lock(m_mutex);
    domain::AssignmentRecord stored = assignment;
    stored.id = m_nextAssignmentId++;
    m_assignments.push_back(stored);
    return stored;
}

std::vector<domain::AssignmentRecord> InMemoryTaskRepository::listAssignments(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<domain::AssignmentRecord> result;
    for (const auto& a : m_assignments) {
        if (a.taskId == taskId) result.push_back(a);
    }
    return result;
}

domain::Comment InMemoryTaskRepository::insertComment(const domain::Comment& comment) {
    std::lock_guard<std::mutex> lock(m_mutex);
    domain::Comment stored = comment;
    stored.id = m_nextCommentId++;
    m_comments.push_back(stored);
    return stored;
}

std::vector<domain::Comment> InMemoryTaskRepository::listComments(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<domain::Comment> result;
    for (const auto& c : m_comments) {
        if (c.taskId == taskId) result.push_back(c);
    }
    return result;
}

} // namespace tasksmind::infrastructure
