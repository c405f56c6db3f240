/**
 * @file TaskService.cpp
 * @brief Implementation of TaskService.
 */

#include "application/TaskService.hpp"
#include <cstdio>
#include <iostream>

namespace tasksmind::application {

using namespace tasksmind::domain;

TaskService::TaskService(std::shared_ptr<TaskRepository> repository,
                         std::shared_ptr<const OrgHierarchyReader> hierarchy,
                         std::shared_ptr<const AuthorityLookup> authorities,
                         engine::EngineConfig config,
                         Clock clock)
    : m_repository(std::move(repository)),
      m_clock(std::move(clock)),
      m_scorer(config),
      m_router(std::make_shared<engine::RoutingRecommender>(hierarchy, config)),
      m_assignmentGenerator(m_router),
      m_authorityResolver(hierarchy, authorities, config),
      m_riskAssessor(config),
      m_qualityChecker(config),
      m_summarizer(config) {
    if (!m_repository) {
        throw std::invalid_argument("TaskService requires a task repository");
    }
    if (!m_clock) {
        m_clock = &Date::Today;
    }
}

TaskDetails TaskService::createTask(const TaskSnapshot& draft) {
    const Date today = m_clock();
    TaskSnapshot task = draft;

    AssignmentRecord stored;
    {
        std::lock_guard<std::mutex> lock(m_writeMutex);
        if (task.id.empty()) {
            task.id = generateTaskId(today);
        } else if (m_repository->findTask(task.id)) {
            throw std::invalid_argument("Task id already exists: " + task.id);
        }

        task.priorityScore = m_scorer.score(task, today);
        task.status = TaskStatus::Open;

        if (!m_repository->insertTask(task)) {
            throw std::invalid_argument("Task id already exists: " + task.id);
        }
        stored = m_repository->insertAssignment(m_assignmentGenerator.generate(task));
    }

    std::cout << "[TaskService] Created task " << task.id << " (priority " << *task.priorityScore
              << ") routed to " << stored.assigneeId << ": " << stored.rationale << std::endl;
    return {task, {stored}};
}

std::vector<TaskDetails> TaskService::listTasks(const TaskFilter& filter) const {
    std::vector<TaskDetails> result;
    for (const auto& task : m_repository->listTasks()) {
        if (filter.status && task.status != *filter.status) continue;
        if (filter.dueBefore && !(task.suspenseDate <= *filter.dueBefore)) continue;
        if (filter.orgUnitId && task.orgUnitId != *filter.orgUnitId) continue;
        result.push_back({task, m_repository->listAssignments(task.id)});
    }
    return result;
}

TaskDetails TaskService::getTask(const std::string& taskId) const {
    TaskSnapshot task = loadTask(taskId);
    return {task, m_repository->listAssignments(taskId)};
}

TaskDetails TaskService::updateTask(const std::string& taskId, const TaskPatch& patch) {
    std::lock_guard<std::mutex> lock(m_writeMutex);
    TaskSnapshot task = loadTask(taskId);

    if (patch.title) task.title = *patch.title;
    if (patch.description) task.description = *patch.description;
    if (patch.classification) task.classification = *patch.classification;
    if (patch.suspenseDate) task.suspenseDate = *patch.suspenseDate;
    if (patch.originator) task.originator = *patch.originator;
    if (patch.orgUnitId) task.orgUnitId = *patch.orgUnitId;
    if (patch.recordSeriesId) task.recordSeriesId = *patch.recordSeriesId;
    if (patch.status) task.status = *patch.status;
    if (patch.tags) task.tags = *patch.tags;

    task.priorityScore = m_scorer.score(task, m_clock());
    if (!m_repository->updateTask(task)) {
        throw TaskNotFoundError(taskId);
    }
    return {task, m_repository->listAssignments(taskId)};
}

AssignmentRecord TaskService::addAssignment(const std::string& taskId, AssignmentRecord assignment) {
    loadTask(taskId);
    assignment.taskId = taskId;
    return m_repository->insertAssignment(assignment);
}

std::vector<AssignmentRecord> TaskService::listAssignments(const std::string& taskId) const {
    loadTask(taskId);
    return m_repository->listAssignments(taskId);
}

Comment TaskService::addComment(const std::string& taskId, Comment comment) {
    loadTask(taskId);
    comment.taskId = taskId;
    return m_repository->insertComment(comment);
}

std::vector<Comment> TaskService::listComments(const std::string& taskId) const {
    loadTask(taskId);
    return m_repository->listComments(taskId);
}

TaskSummary TaskService::summarize(const std::string& taskId) const {
    const TaskSnapshot task = loadTask(taskId);
    std::vector<std::string> bodies;
    for (const auto& comment : m_repository->listComments(taskId)) {
        bodies.push_back(comment.body);
    }
    return m_summarizer.summarize(task, bodies);
}

std::vector<AuthoritySuggestion> TaskService::suggestAuthorities(const std::string& taskId) const {
    return m_authorityResolver.suggest(loadTask(taskId));
}

RiskInsight TaskService::assessRisk(const std::string& taskId) const {
    return m_riskAssessor.assess(loadTask(taskId));
}

QualityCheckResult TaskService::checkQuality(const std::string& taskId) const {
    return m_qualityChecker.check(loadTask(taskId));
}

TaskSnapshot TaskService::loadTask(const std::string& taskId) const {
    auto task = m_repository->findTask(taskId);
    if (!task) {
        throw TaskNotFoundError(taskId);
    }
    return *task;
}

// "T-<yy>-<seq>", seq continuing from the stored task count.
std::string TaskService::generateTaskId(const Date& today) const {
    size_t seq = m_repository->countTasks() + 1;
    while (true) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "T-%02d-%06zu", today.year() % 100, seq);
        if (!m_repository->findTask(buf)) return buf;
        ++seq;
    }
}

} // namespace tasksmind::application
