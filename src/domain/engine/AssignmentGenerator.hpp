/**
 * @file AssignmentGenerator.hpp
 * @brief Builds the initial ownership assignment for a new task.
 */

#pragma once

#include <memory>
#include "domain/Assignment.hpp"
#include "domain/Task.hpp"
#include "domain/engine/RoutingRecommender.hpp"

namespace tasksmind::domain::engine {

class AssignmentGenerator {
public:
    explicit AssignmentGenerator(std::shared_ptr<const RoutingRecommender> router);

    /**
     * @brief Routes the task once and returns a pending "owner" assignment
     *        for the recommended organization. The caller persists it.
     */
    AssignmentRecord generate(const TaskSnapshot& task) const;

private:
    std::shared_ptr<const RoutingRecommender> m_router;
};

} // namespace tasksmind::domain::engine
