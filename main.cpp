#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/InMemoryTaskRepository.hpp"
#include "infrastructure/OrgDirectory.hpp"
#include "infrastructure/TaskApiServer.hpp"

using namespace tasksmind;

namespace {

infrastructure::TaskApiServer* g_server = nullptr;

void HandleSignal(int) {
    if (g_server) g_server->stop();
}

void PrintUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config <settings.json>] [--seed <seed.json>] [--host <host>] [--port <port>]\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string configPath = infrastructure::ConfigLoader::DefaultSettingsPath();
    std::string seedOverride;
    std::string hostOverride;
    int portOverride = 0;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;
        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else if (arg == "--config" && hasValue) {
            configPath = argv[++i];
        } else if (arg == "--seed" && hasValue) {
            seedOverride = argv[++i];
        } else if (arg == "--host" && hasValue) {
            hostOverride = argv[++i];
        } else if (arg == "--port" && hasValue) {
            portOverride = std::atoi(argv[++i]);
        } else {
            std::cerr << "[Main] Unknown or incomplete argument: " << arg << std::endl;
            PrintUsage(argv[0]);
            return 2;
        }
    }

    infrastructure::Settings settings = infrastructure::ConfigLoader::Load(configPath);
    if (!seedOverride.empty()) settings.seedFile = seedOverride;
    if (!hostOverride.empty()) settings.host = hostOverride;
    if (portOverride > 0) settings.port = portOverride;

    std::cout << "TasksMind - task prioritization and routing service starting..." << std::endl;

    application::AppServices services;
    auto directory = infrastructure::OrgDirectory::LoadFromFile(settings.seedFile);
    services.hierarchy = directory;
    services.authorities = directory;
    services.taskRepository = std::make_shared<infrastructure::InMemoryTaskRepository>();
    services.taskService = std::make_unique<application::TaskService>(
        services.taskRepository, services.hierarchy, services.authorities, settings.engine);

    infrastructure::TaskApiServer server(*services.taskService);
    g_server = &server;
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    if (!server.listen(settings.host, settings.port)) {
        std::cerr << "[Main] Failed to listen on " << settings.host << ":" << settings.port << std::endl;
        g_server = nullptr;
        return 1;
    }

    g_server = nullptr;
    std::cout << "[Main] Shut down cleanly." << std::endl;
    return 0;
}
