/**
 * @file TaskService.hpp
 * @brief Application service for task intake, updates and engine read-outs.
 */

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "domain/Assignment.hpp"
#include "domain/Insights.hpp"
#include "domain/OrgHierarchyReader.hpp"
#include "domain/TaskRepository.hpp"
#include "domain/engine/AssignmentGenerator.hpp"
#include "domain/engine/AuthorityResolver.hpp"
#include "domain/engine/EngineConfig.hpp"
#include "domain/engine/PriorityScorer.hpp"
#include "domain/engine/QualityChecker.hpp"
#include "domain/engine/RiskAssessor.hpp"
#include "domain/engine/RoutingRecommender.hpp"
#include "domain/engine/TaskSummarizer.hpp"

namespace tasksmind::application {

/**
 * @class TaskNotFoundError
 * @brief Raised when an operation names a task that is not stored.
 */
class TaskNotFoundError : public std::runtime_error {
public:
    explicit TaskNotFoundError(const std::string& taskId)
        : std::runtime_error("Task not found: " + taskId), m_taskId(taskId) {}

    const std::string& taskId() const { return m_taskId; }

private:
    std::string m_taskId;
};

/**
 * @struct TaskDetails
 * @brief A stored task together with its assignments.
 */
struct TaskDetails {
    domain::TaskSnapshot task;
    std::vector<domain::AssignmentRecord> assignments;
};

/**
 * @struct TaskPatch
 * @brief Partial update; only engaged fields are applied.
 */
struct TaskPatch {
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<domain::Classification> classification;
    std::optional<domain::Date> suspenseDate;
    std::optional<std::string> originator;
    std::optional<std::string> orgUnitId;
    std::optional<std::string> recordSeriesId;
    std::optional<domain::TaskStatus> status;
    std::optional<std::vector<std::string>> tags;
};

struct TaskFilter {
    std::optional<domain::TaskStatus> status;
    std::optional<domain::Date> dueBefore; ///< Inclusive.
    std::optional<std::string> orgUnitId;
};

/**
 * @class TaskService
 * @brief Stamps priority and the initial assignment at creation and serves
 *        the engine's read-only insights for stored tasks.
 */
class TaskService {
public:
    using Clock = std::function<domain::Date()>;

    TaskService(std::shared_ptr<domain::TaskRepository> repository,
                std::shared_ptr<const domain::OrgHierarchyReader> hierarchy,
                std::shared_ptr<const domain::AuthorityLookup> authorities,
                domain::engine::EngineConfig config = domain::engine::EngineConfig{},
                Clock clock = &domain::Date::Today);

    /**
     * @brief Creates a task from a draft.
     *
     * The draft is scored as submitted, then opened, stored, and given
     * exactly one routed "owner" assignment.
     * @throws std::invalid_argument if the draft's id is already taken.
     */
    TaskDetails createTask(const domain::TaskSnapshot& draft);

    std::vector<TaskDetails> listTasks(const TaskFilter& filter = TaskFilter{}) const;

    TaskDetails getTask(const std::string& taskId) const;

    /** @brief Applies a patch and re-scores the task. Concurrent patches are serialized. */
    TaskDetails updateTask(const std::string& taskId, const TaskPatch& patch);

    domain::AssignmentRecord addAssignment(const std::string& taskId, domain::AssignmentRecord assignment);
    std::vector<domain::AssignmentRecord> listAssignments(const std::string& taskId) const;

    domain::Comment addComment(const std::string& taskId, domain::Comment comment);
    std::vector<domain::Comment> listComments(const std::string& taskId) const;

    // Read-only engine insights.
    domain::TaskSummary summarize(const std::string& taskId) const;
    std::vector<domain::AuthoritySuggestion> suggestAuthorities(const std::string& taskId) const;
    domain::RiskInsight assessRisk(const std::string& taskId) const;
    domain::QualityCheckResult checkQuality(const std::string& taskId) const;

private:
    domain::TaskSnapshot loadTask(const std::string& taskId) const;
    std::string generateTaskId(const domain::Date& today) const;

    std::shared_ptr<domain::TaskRepository> m_repository;
    Clock m_clock;

    domain::engine::PriorityScorer m_scorer;
    std::shared_ptr<const domain::engine::RoutingRecommender> m_router;
    domain::engine::AssignmentGenerator m_assignmentGenerator;
    domain::engine::AuthorityResolver m_authorityResolver;
    domain::engine::RiskAssessor m_riskAssessor;
    domain::engine::QualityChecker m_qualityChecker;
    domain::engine::TaskSummarizer m_summarizer;

    std::mutex m_writeMutex; ///< Serializes task creation and read-modify-write updates.
};

} // namespace tasksmind::application
