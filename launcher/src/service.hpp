#pragma once
#include "clock.hpp"
#include "config.hpp"
#include "constants.hpp"
#include "control_server.hpp"
#include "launch_database.hpp"
#include "launch_queue.hpp"
#include "pubkey.hpp"
#include "queue_store.hpp"
#include "request_pipeline.hpp"
#include "solana_client.hpp"
#include "transaction_builder.hpp"
#include "transaction_submitter.hpp"
#include <atomic>
#include <chrono>
#include <memory>

// Owns every component of the launcher. The queue and the control server
// exist only while run() is serving; the one-shot commands use the pipeline
// directly.
class Service {
public:
    explicit Service(const Config& config);
    ~Service();

    // Serves until stop(); then pauses the queue and stops the server
    void run();
    // Safe to call from a signal handler; only flips the run flag
    void stop();

    LaunchResult launch_once(const LaunchRequest& request);
    SellResult sell_once(const PublicKey& mint);

    LaunchDefaults launch_defaults() const;

private:
    void log_status();

    const Config& config_;
    SystemClock clock_;
    SolanaClient rpc_;
    Keypair payer_;
    const ProtocolConstants& constants_;
    TransactionBuilder builder_;
    TransactionSubmitter submitter_;
    LaunchDatabase db_;
    RequestPipeline pipeline_;
    QueueStore store_;

    std::unique_ptr<LaunchQueue> queue_;
    std::unique_ptr<ControlServer> server_;

    std::atomic<bool> running_{false};
};
