/**
 * @file AssignmentGenerator.cpp
 * @brief Implementation of AssignmentGenerator.
 */

#include "domain/engine/AssignmentGenerator.hpp"
#include <stdexcept>

namespace tasksmind::domain::engine {

AssignmentGenerator::AssignmentGenerator(std::shared_ptr<const RoutingRecommender> router)
    : m_router(std::move(router)) {
    if (!m_router) {
        throw std::invalid_argument("AssignmentGenerator requires a routing recommender");
    }
}

AssignmentRecord AssignmentGenerator::generate(const TaskSnapshot& task) const {
    const RoutingDecision decision = m_router->recommend(task);

    AssignmentRecord assignment;
    assignment.taskId = task.id;
    assignment.assigneeType = AssigneeType::Organization;
    assignment.assigneeId = decision.orgUnitId;
    assignment.role = "owner";
    assignment.state = "pending";
    assignment.rationale = decision.rationale;
    return assignment;
}

} // namespace tasksmind::domain::engine
