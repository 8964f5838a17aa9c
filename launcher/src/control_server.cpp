#include "control_server.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

namespace {

constexpr int DEFAULT_OUTCOME_LIMIT = 20;
constexpr int MAX_OUTCOME_LIMIT = 500;

void reply(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(2), "application/json");
}

void reply_error(httplib::Response& res, int status, const std::string& message) {
    reply(res, status, nlohmann::json{{"error", message}});
}

} // namespace

ControlServer::ControlServer(const std::string& service_name, LaunchQueue& queue, LaunchDatabase& db,
                             SolanaRpc& rpc, LaunchDefaults defaults)
    : service_name_(service_name), queue_(queue), db_(db), rpc_(rpc), defaults_(defaults), running_(false) {
    server_ = std::make_unique<httplib::Server>();
    setup_routes();
}

ControlServer::~ControlServer() {
    stop();
}

void ControlServer::start(const std::string& host, int port) {
    if (running_) {
        return;
    }

    if (port == 0) {
        port_ = server_->bind_to_any_port(host.c_str());
    } else {
        port_ = server_->bind_to_port(host.c_str(), port) ? port : -1;
    }
    if (port_ < 0) {
        throw NetworkError("Cannot bind control server to " + host + ":" + std::to_string(port));
    }

    running_ = true;
    server_thread_ = std::thread([this, host]() {
        spdlog::info("Control server listening on {}:{}", host, port_);
        if (!server_->listen_after_bind()) {
            spdlog::error("Control server on port {} exited with an error", port_);
        }
    });
}

void ControlServer::stop() {
    if (running_) {
        running_ = false;
        server_->stop();
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
        spdlog::info("Control server stopped");
    }
}

bool ControlServer::is_running() const {
    return running_;
}

void ControlServer::setup_routes() {
    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        handle_health(res);
    });

    server_->Get("/queue", [this](const httplib::Request&, httplib::Response& res) {
        auto status = queue_.status();
        nlohmann::json body = status.to_json();
        body["mode"] = to_string(queue_.mode());
        body["pending"] = queue_.pending();
        reply(res, 200, body);
    });

    server_->Post("/launches", [this](const httplib::Request& req, httplib::Response& res) {
        handle_submit(req, res);
    });

    server_->Get("/outcomes", [this](const httplib::Request& req, httplib::Response& res) {
        int limit = DEFAULT_OUTCOME_LIMIT;
        if (req.has_param("limit")) {
            try {
                limit = std::stoi(req.get_param_value("limit"));
            } catch (const std::exception&) {
                reply_error(res, 400, "limit must be an integer");
                return;
            }
            if (limit < 1 || limit > MAX_OUTCOME_LIMIT) {
                reply_error(res, 400, "limit must be between 1 and " + std::to_string(MAX_OUTCOME_LIMIT));
                return;
            }
        }

        try {
            nlohmann::json body = nlohmann::json::array();
            for (const auto& outcome : db_.recent_outcomes(limit)) {
                body.push_back(outcome.to_json());
            }
            reply(res, 200, body);
        } catch (const std::exception& e) {
            spdlog::error("Outcome listing failed: {}", e.what());
            reply_error(res, 500, e.what());
        }
    });

    server_->Post("/queue/pause", [this](const httplib::Request&, httplib::Response& res) {
        queue_.pause();
        reply(res, 200, nlohmann::json{{"paused", true}});
    });

    server_->Post("/queue/resume", [this](const httplib::Request&, httplib::Response& res) {
        queue_.resume();
        reply(res, 200, nlohmann::json{{"paused", false}});
    });

    server_->Delete("/queue", [this](const httplib::Request&, httplib::Response& res) {
        size_t removed = queue_.clear();
        reply(res, 200, nlohmann::json{{"cleared", removed}});
    });

    server_->set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (res.body.empty()) {
            reply_error(res, res.status, "Not Found");
        }
    });
}

void ControlServer::handle_health(httplib::Response& res) {
    nlohmann::json health_status;
    health_status["service"] = service_name_;
    health_status["status"] = "healthy";
    health_status["timestamp"] = util::current_iso8601();

    bool db_healthy = db_.is_healthy();
    bool rpc_healthy = rpc_.is_healthy();
    bool queue_healthy = queue_.status().persistence_healthy;
    health_status["components"]["database"] = db_healthy ? "healthy" : "unhealthy";
    health_status["components"]["rpc"] = rpc_healthy ? "healthy" : "unhealthy";
    health_status["components"]["queue_persistence"] = queue_healthy ? "healthy" : "unhealthy";

    // Local storage failures stop the service from working; a slow node only degrades it
    int code = 200;
    if (!db_healthy || !queue_healthy) {
        health_status["status"] = "unhealthy";
        code = 503;
    } else if (!rpc_healthy) {
        health_status["status"] = "degraded";
    }
    reply(res, code, health_status);
}

void ControlServer::handle_submit(const httplib::Request& req, httplib::Response& res) {
    if (req.get_header_value("Content-Type").find("application/json") == std::string::npos) {
        reply_error(res, 415, "Content-Type must be application/json");
        return;
    }

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(req.body);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::warn("Rejected launch submission with invalid JSON: {}", e.what());
        reply_error(res, 400, "Invalid JSON");
        return;
    }

    try {
        auto request = LaunchRequest::from_json(body, defaults_);
        request.validate();

        bool registered = db_.register_request(request);
        bool queued = queue_.enqueue(request.id);
        reply(res, 202, nlohmann::json{{"id", request.id},
                                       {"registered", registered},
                                       {"queued", queued},
                                       {"queue_size", queue_.status().queue_size}});
    } catch (const ValidationError& e) {
        spdlog::warn("Rejected launch submission: {}", e.what());
        reply_error(res, 400, e.what());
    } catch (const std::exception& e) {
        spdlog::error("Launch submission failed: {}", e.what());
        reply_error(res, 500, e.what());
    }
}
