#include "launch_database.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <sqlite3.h>
#include <mutex>

namespace {

std::string column_text(sqlite3_stmt* stmt, int column) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? std::string(text) : std::string();
}

} // namespace

class LaunchDatabase::Impl {
public:
    Impl(const std::string& db_path) : db_path_(db_path), db_(nullptr) {
        if (!initialize()) {
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            throw PersistenceError("Failed to initialize database at " + db_path_);
        }
    }

    ~Impl() {
        if (db_) {
            sqlite3_close(db_);
        }
    }

    bool initialize() {
        int rc = sqlite3_open(db_path_.c_str(), &db_);
        if (rc != SQLITE_OK) {
            spdlog::error("Cannot open database: {}", db_ ? sqlite3_errmsg(db_) : "out of memory");
            return false;
        }

        if (!create_tables()) {
            return false;
        }

        spdlog::info("Database initialized at: {}", db_path_);
        return true;
    }

    bool register_request(const LaunchRequest& request) {
        std::lock_guard<std::mutex> lock(db_mutex_);

        warn_on_symbol_reuse(request.symbol);

        const char* sql = R"(
            INSERT OR IGNORE INTO launch_requests
                (request_id, name, symbol, metadata_url, initial_buy_sol, slippage_pct, priority_fee_sol, created_at)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?)
        )";
        sqlite3_stmt* stmt;

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw PersistenceError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
        }

        std::string created_at = util::current_iso8601();
        sqlite3_bind_text(stmt, 1, request.id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, request.name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, request.symbol.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, request.metadata_url.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(stmt, 5, request.initial_buy_sol);
        sqlite3_bind_double(stmt, 6, request.slippage_pct);
        sqlite3_bind_double(stmt, 7, request.priority_fee_sol);
        sqlite3_bind_text(stmt, 8, created_at.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            throw PersistenceError(std::string("Failed to insert request: ") + sqlite3_errmsg(db_));
        }

        if (sqlite3_changes(db_) == 0) {
            spdlog::debug("Request {} already registered", request.id);
            return false;
        }

        spdlog::info("Registered request {} ({} / {})", request.id, request.name, request.symbol);
        return true;
    }

    LaunchRequest resolve(const std::string& request_id) {
        std::lock_guard<std::mutex> lock(db_mutex_);

        const char* sql = R"(
            SELECT request_id, name, symbol, metadata_url, initial_buy_sol, slippage_pct, priority_fee_sol
            FROM launch_requests WHERE request_id = ?
        )";
        sqlite3_stmt* stmt;

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw PersistenceError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
        }

        sqlite3_bind_text(stmt, 1, request_id.c_str(), -1, SQLITE_TRANSIENT);

        LaunchRequest request;
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            request.id = column_text(stmt, 0);
            request.name = column_text(stmt, 1);
            request.symbol = column_text(stmt, 2);
            request.metadata_url = column_text(stmt, 3);
            request.initial_buy_sol = sqlite3_column_double(stmt, 4);
            request.slippage_pct = sqlite3_column_double(stmt, 5);
            request.priority_fee_sol = sqlite3_column_double(stmt, 6);
        }
        sqlite3_finalize(stmt);

        if (rc == SQLITE_DONE) {
            throw ValidationError("Unknown request id: " + request_id);
        }
        if (rc != SQLITE_ROW) {
            throw PersistenceError(std::string("Failed to read request: ") + sqlite3_errmsg(db_));
        }
        return request;
    }

    void record(const Outcome& outcome) {
        std::lock_guard<std::mutex> lock(db_mutex_);

        const char* sql = R"(
            INSERT INTO launch_outcomes
                (request_id, success, token_address, deploy_signature, sell_signature,
                 sol_spent, sol_received, profit_loss, status, error, created_at)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        )";
        sqlite3_stmt* stmt;

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw PersistenceError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
        }

        std::string created_at = outcome.timestamp.empty() ? util::current_iso8601() : outcome.timestamp;
        sqlite3_bind_text(stmt, 1, outcome.request_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 2, outcome.success ? 1 : 0);
        sqlite3_bind_text(stmt, 3, outcome.token_address.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, outcome.deploy_signature.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 5, outcome.sell_signature.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(outcome.sol_spent));
        sqlite3_bind_int64(stmt, 7, static_cast<sqlite3_int64>(outcome.sol_received));
        sqlite3_bind_int64(stmt, 8, outcome.profit_loss);
        sqlite3_bind_text(stmt, 9, to_string(outcome.status), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 10, outcome.error.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 11, created_at.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            throw PersistenceError(std::string("Failed to insert outcome: ") + sqlite3_errmsg(db_));
        }

        spdlog::info("Recorded outcome for {}: {}", outcome.request_id, to_string(outcome.status));
    }

    std::vector<Outcome> recent_outcomes(int limit) {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::vector<Outcome> outcomes;

        const char* sql = R"(
            SELECT request_id, success, token_address, deploy_signature, sell_signature,
                   sol_spent, sol_received, profit_loss, status, error, created_at
            FROM launch_outcomes ORDER BY id DESC LIMIT ?
        )";
        sqlite3_stmt* stmt;

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw PersistenceError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
        }

        sqlite3_bind_int(stmt, 1, limit);

        std::vector<std::string> statuses;
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            Outcome outcome;
            outcome.request_id = column_text(stmt, 0);
            outcome.success = sqlite3_column_int(stmt, 1) != 0;
            outcome.token_address = column_text(stmt, 2);
            outcome.deploy_signature = column_text(stmt, 3);
            outcome.sell_signature = column_text(stmt, 4);
            outcome.sol_spent = static_cast<uint64_t>(sqlite3_column_int64(stmt, 5));
            outcome.sol_received = static_cast<uint64_t>(sqlite3_column_int64(stmt, 6));
            outcome.profit_loss = sqlite3_column_int64(stmt, 7);
            statuses.push_back(column_text(stmt, 8));
            outcome.error = column_text(stmt, 9);
            outcome.timestamp = column_text(stmt, 10);
            outcomes.push_back(std::move(outcome));
        }

        sqlite3_finalize(stmt);

        for (size_t i = 0; i < outcomes.size(); ++i) {
            outcomes[i].status = outcome_status_from_string(statuses[i]);
        }
        return outcomes;
    }

    bool is_healthy() const {
        std::lock_guard<std::mutex> lock(db_mutex_);

        if (!db_) {
            return false;
        }

        // Simple health check - try to query sqlite_master
        const char* sql = "SELECT name FROM sqlite_master WHERE type='table' LIMIT 1";
        sqlite3_stmt* stmt;

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        return rc == SQLITE_ROW || rc == SQLITE_DONE;
    }

private:
    // Caller holds db_mutex_
    void warn_on_symbol_reuse(const std::string& symbol) {
        const char* sql = R"(
            SELECT COUNT(*) FROM launch_requests r
            JOIN launch_outcomes o ON o.request_id = r.request_id
            WHERE r.symbol = ? AND o.status != 'failed'
        )";
        sqlite3_stmt* stmt;

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db_));
            return;
        }

        sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
        int launched = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            launched = sqlite3_column_int(stmt, 0);
        }
        sqlite3_finalize(stmt);

        if (launched > 0) {
            spdlog::warn("Ticker {} already launched {} time(s)", symbol, launched);
        }
    }

    bool create_tables() {
        const char* create_launch_requests = R"(
            CREATE TABLE IF NOT EXISTS launch_requests (
                request_id TEXT PRIMARY KEY,
                name TEXT NOT NULL,
                symbol TEXT NOT NULL,
                metadata_url TEXT NOT NULL,
                initial_buy_sol REAL NOT NULL,
                slippage_pct REAL NOT NULL,
                priority_fee_sol REAL NOT NULL,
                created_at TEXT NOT NULL
            )
        )";

        const char* create_launch_outcomes = R"(
            CREATE TABLE IF NOT EXISTS launch_outcomes (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                request_id TEXT NOT NULL,
                success INTEGER NOT NULL,
                token_address TEXT,
                deploy_signature TEXT,
                sell_signature TEXT,
                sol_spent INTEGER NOT NULL DEFAULT 0,
                sol_received INTEGER NOT NULL DEFAULT 0,
                profit_loss INTEGER NOT NULL DEFAULT 0,
                status TEXT NOT NULL,
                error TEXT,
                created_at TEXT NOT NULL
            )
        )";

        const char* create_indices = R"(
            CREATE INDEX IF NOT EXISTS idx_launch_requests_symbol ON launch_requests(symbol);
            CREATE INDEX IF NOT EXISTS idx_launch_outcomes_request_id ON launch_outcomes(request_id);
            CREATE INDEX IF NOT EXISTS idx_launch_outcomes_status ON launch_outcomes(status);
        )";

        char* err_msg = nullptr;

        if (sqlite3_exec(db_, create_launch_requests, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            spdlog::error("Failed to create launch_requests table: {}", err_msg);
            sqlite3_free(err_msg);
            return false;
        }

        if (sqlite3_exec(db_, create_launch_outcomes, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            spdlog::error("Failed to create launch_outcomes table: {}", err_msg);
            sqlite3_free(err_msg);
            return false;
        }

        if (sqlite3_exec(db_, create_indices, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            spdlog::error("Failed to create indices: {}", err_msg);
            sqlite3_free(err_msg);
            return false;
        }

        return true;
    }

    std::string db_path_;
    sqlite3* db_;
    mutable std::mutex db_mutex_;
};

// Public interface implementation
LaunchDatabase::LaunchDatabase(const std::string& db_path)
    : pImpl_(std::make_unique<Impl>(db_path)) {}

LaunchDatabase::~LaunchDatabase() = default;

bool LaunchDatabase::register_request(const LaunchRequest& request) {
    return pImpl_->register_request(request);
}

LaunchRequest LaunchDatabase::resolve(const std::string& request_id) {
    return pImpl_->resolve(request_id);
}

void LaunchDatabase::record(const Outcome& outcome) {
    pImpl_->record(outcome);
}

std::vector<Outcome> LaunchDatabase::recent_outcomes(int limit) {
    return pImpl_->recent_outcomes(limit);
}

bool LaunchDatabase::is_healthy() const {
    return pImpl_->is_healthy();
}
