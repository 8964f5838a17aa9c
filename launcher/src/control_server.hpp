#pragma once
#include "launch_database.hpp"
#include "launch_queue.hpp"
#include "solana_client.hpp"
#include "types.hpp"
#include <httplib.h>
#include <atomic>
#include <memory>
#include <string>
#include <thread>

// HTTP control surface for the queue plus the health endpoint.
class ControlServer {
public:
    ControlServer(const std::string& service_name, LaunchQueue& queue, LaunchDatabase& db, SolanaRpc& rpc,
                  LaunchDefaults defaults);
    ~ControlServer();

    // Binds before returning; port 0 picks a free port. Throws NetworkError
    // when the address cannot be bound.
    void start(const std::string& host, int port);
    void stop();
    bool is_running() const;
    int port() const { return port_; }

private:
    void setup_routes();
    void handle_health(httplib::Response& res);
    void handle_submit(const httplib::Request& req, httplib::Response& res);

    std::string service_name_;
    LaunchQueue& queue_;
    LaunchDatabase& db_;
    SolanaRpc& rpc_;
    LaunchDefaults defaults_;

    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_;
    int port_ = 0;
};
