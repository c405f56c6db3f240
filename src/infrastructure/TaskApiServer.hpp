/**
 * @file TaskApiServer.hpp
 * @brief HTTP/JSON surface over TaskService.
 */

#pragma once

#include <memory>
#include <string>

namespace httplib {
class Server;
}

namespace tasksmind::application {
class TaskService;
}

namespace tasksmind::infrastructure {

/**
 * @class TaskApiServer
 * @brief Routes task endpoints to TaskService using cpp-httplib.
 *
 * Unknown tasks map to 404 and malformed payloads to 400, both with a
 * {"detail": "..."} body.
 */
class TaskApiServer {
public:
    explicit TaskApiServer(application::TaskService& service);
    ~TaskApiServer();

    /** @brief Binds and serves until stop() is called. Blocks. */
    bool listen(const std::string& host, int port);

    /** @brief Binds to an ephemeral port and returns it (-1 on failure). */
    int bindToAnyPort(const std::string& host);

    /** @brief Serves on a socket bound by bindToAnyPort(). Blocks. */
    bool listenAfterBind();

    void stop();
    bool isRunning() const;

private:
    void registerRoutes();

    application::TaskService& m_service;
    std::unique_ptr<httplib::Server> m_server;
};

} // namespace tasksmind::infrastructure
