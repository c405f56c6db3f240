/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/TaskService.hpp"
#include "domain/OrgHierarchyReader.hpp"
#include "domain/TaskRepository.hpp"

namespace tasksmind::application {

struct AppServices {
    std::shared_ptr<domain::TaskRepository> taskRepository;
    std::shared_ptr<const domain::OrgHierarchyReader> hierarchy;
    std::shared_ptr<const domain::AuthorityLookup> authorities;
    std::unique_ptr<TaskService> taskService;
};

} // namespace tasksmind::application
