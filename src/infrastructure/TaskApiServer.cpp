/**
 * @file TaskApiServer.cpp
 * @brief Implementation of TaskApiServer.
 */

#include "infrastructure/TaskApiServer.hpp"
#include <httplib.h>
#include <iostream>
#include <nlohmann/json.hpp>
#include "application/TaskService.hpp"
#include "infrastructure/JsonCodec.hpp"

namespace tasksmind::infrastructure {

using json = nlohmann::json;

namespace {

void SendJson(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void SendError(httplib::Response& res, int status, const std::string& detail) {
    SendJson(res, status, {{"detail", detail}});
}

// Maps service and decoding failures onto HTTP status codes.
template <typename Fn>
void Handle(httplib::Response& res, Fn&& fn) {
    try {
        fn();
    } catch (const application::TaskNotFoundError&) {
        SendError(res, 404, "Task not found");
    } catch (const json::exception& e) {
        SendError(res, 400, e.what());
    } catch (const std::invalid_argument& e) {
        SendError(res, 400, e.what());
    } catch (const std::exception& e) {
        std::cerr << "[TaskApiServer] Internal error: " << e.what() << std::endl;
        SendError(res, 500, "Internal server error");
    }
}

} // namespace

TaskApiServer::TaskApiServer(application::TaskService& service)
    : m_service(service), m_server(std::make_unique<httplib::Server>()) {
    registerRoutes();
}

TaskApiServer::~TaskApiServer() {
    stop();
}

bool TaskApiServer::listen(const std::string& host, int port) {
    std::cout << "[TaskApiServer] Listening on " << host << ":" << port << std::endl;
    return m_server->listen(host, port);
}

int TaskApiServer::bindToAnyPort(const std::string& host) {
    return m_server->bind_to_any_port(host);
}

bool TaskApiServer::listenAfterBind() {
    return m_server->listen_after_bind();
}

void TaskApiServer::stop() {
    if (m_server && m_server->is_running()) {
        m_server->stop();
    }
}

bool TaskApiServer::isRunning() const {
    return m_server->is_running();
}

void TaskApiServer::registerRoutes() {
    auto& svr = *m_server;
    auto& service = m_service;

    svr.Get("/healthz", [](const httplib::Request&, httplib::Response& res) {
        SendJson(res, 200, {{"status", "healthy"}});
    });

    auto createTask = [&service](const httplib::Request& req, httplib::Response& res) {
        Handle(res, [&] {
            auto draft = JsonCodec::TaskFromJson(json::parse(req.body));
            SendJson(res, 200, JsonCodec::ToJson(service.createTask(draft)));
        });
    };

    auto listTasks = [&service](const httplib::Request& req, httplib::Response& res) {
        Handle(res, [&] {
            application::TaskFilter filter;
            if (req.has_param("status")) {
                filter.status = domain::ParseStatus(req.get_param_value("status"));
            }
            if (req.has_param("due_before")) {
                // Accepts a bare date or a datetime; only the date part matters.
                filter.dueBefore = JsonCodec::DateFromString(req.get_param_value("due_before").substr(0, 10), "due_before");
            }
            if (req.has_param("org")) {
                filter.orgUnitId = req.get_param_value("org");
            }
            json body = json::array();
            for (const auto& details : service.listTasks(filter)) {
                body.push_back(JsonCodec::ToJson(details));
            }
            SendJson(res, 200, body);
        });
    };

    // The collection is served with and without a trailing slash.
    for (const char* path : {"/tasks", "/tasks/"}) {
        svr.Post(path, createTask);
        svr.Get(path, listTasks);
    }

    svr.Get(R"(/tasks/([^/]+))", [&service](const httplib::Request& req, httplib::Response& res) {
        Handle(res, [&] {
            SendJson(res, 200, JsonCodec::ToJson(service.getTask(req.matches[1])));
        });
    });

    svr.Patch(R"(/tasks/([^/]+))", [&service](const httplib::Request& req, httplib::Response& res) {
        Handle(res, [&] {
            auto patch = JsonCodec::TaskPatchFromJson(json::parse(req.body));
            SendJson(res, 200, JsonCodec::ToJson(service.updateTask(req.matches[1], patch)));
        });
    });

    svr.Post(R"(/tasks/([^/]+)/assignments)", [&service](const httplib::Request& req, httplib::Response& res) {
        Handle(res, [&] {
            auto assignment = JsonCodec::AssignmentFromJson(json::parse(req.body));
            SendJson(res, 200, JsonCodec::ToJson(service.addAssignment(req.matches[1], assignment)));
        });
    });

    svr.Get(R"(/tasks/([^/]+)/assignments)", [&service](const httplib::Request& req, httplib::Response& res) {
        Handle(res, [&] {
            json body = json::array();
            for (const auto& a : service.listAssignments(req.matches[1])) {
                body.push_back(JsonCodec::ToJson(a));
            }
            SendJson(res, 200, body);
        });
    });

    svr.Post(R"(/tasks/([^/]+)/comments)", [&service](const httplib::Request& req, httplib::Response& res) {
        Handle(res, [&] {
            auto comment = JsonCodec::CommentFromJson(json::parse(req.body));
            SendJson(res, 200, JsonCodec::ToJson(service.addComment(req.matches[1], comment)));
        });
    });

    svr.Get(R"(/tasks/([^/]+)/comments)", [&service](const httplib::Request& req, httplib::Response& res) {
        Handle(res, [&] {
            json body = json::array();
            for (const auto& c : service.listComments(req.matches[1])) {
                body.push_back(JsonCodec::ToJson(c));
            }
            SendJson(res, 200, body);
        });
    });

    svr.Get(R"(/tasks/([^/]+)/summary)", [&service](const httplib::Request& req, httplib::Response& res) {
        Handle(res, [&] {
            SendJson(res, 200, JsonCodec::ToJson(service.summarize(req.matches[1])));
        });
    });

    svr.Get(R"(/tasks/([^/]+)/authority-suggestions)", [&service](const httplib::Request& req, httplib::Response& res) {
        Handle(res, [&] {
            json body = json::array();
            for (const auto& s : service.suggestAuthorities(req.matches[1])) {
                body.push_back(JsonCodec::ToJson(s));
            }
            SendJson(res, 200, body);
        });
    });

    svr.Get(R"(/tasks/([^/]+)/risk)", [&service](const httplib::Request& req, httplib::Response& res) {
        Handle(res, [&] {
            SendJson(res, 200, JsonCodec::ToJson(service.assessRisk(req.matches[1])));
        });
    });

    svr.Get(R"(/tasks/([^/]+)/quality-check)", [&service](const httplib::Request& req, httplib::Response& res) {
        Handle(res, [&] {
            SendJson(res, 200, JsonCodec::ToJson(service.checkQuality(req.matches[1])));
        });
    });
}

} // namespace tasksmind::infrastructure
