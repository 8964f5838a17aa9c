#include "solana_client.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>

namespace {

// JSON-RPC code for a transaction that failed preflight simulation
constexpr int SEND_TRANSACTION_PREFLIGHT_FAILURE = -32002;

std::optional<std::string> error_text(const nlohmann::json& err) {
    if (err.is_null()) {
        return std::nullopt;
    }
    return err.dump();
}

} // namespace

class SolanaClient::Impl {
public:
    Impl(const Config& config) {
        // Split the RPC URL into "scheme://host[:port]" and the request path
        const auto& url = config.solana_rpc_url;
        auto scheme_end = url.find("://");
        if (scheme_end == std::string::npos) {
            spdlog::error("Invalid Solana RPC URL format: {}", url);
            throw ValidationError("Invalid Solana RPC URL: " + url);
        }
        auto slash_pos = url.find('/', scheme_end + 3);
        if (slash_pos != std::string::npos) {
            rpc_origin_ = url.substr(0, slash_pos);
            rpc_path_ = url.substr(slash_pos);
        } else {
            rpc_origin_ = url;
            rpc_path_ = "/";
        }
        read_timeout_seconds_ = std::max(30, config.confirm_timeout_seconds);

        spdlog::info("Solana client configured for {}, path: {}", rpc_origin_, rpc_path_);
    }

    Blockhash get_latest_blockhash() {
        auto result = call("getLatestBlockhash", nlohmann::json::array({nlohmann::json{{"commitment", "confirmed"}}}));
        auto blockhash = result.at("value").at("blockhash").get<std::string>();
        spdlog::debug("Latest blockhash: {}", blockhash);
        return PublicKey::from_base58(blockhash);
    }

    std::string send_transaction(const std::string& base64_tx) {
        nlohmann::json params = nlohmann::json::array({
            base64_tx,
            {
                {"encoding", "base64"},
                {"skipPreflight", false},
                {"preflightCommitment", "confirmed"}
            }
        });

        auto response = post(make_request("sendTransaction", params));
        if (response.contains("error")) {
            const auto& error = response.at("error");
            int code = error.value("code", 0);
            std::string message = error.value("message", std::string("unknown error"));
            if (code == SEND_TRANSACTION_PREFLIGHT_FAILURE) {
                std::string logs;
                if (error.contains("data") && error.at("data").contains("logs") &&
                    error.at("data").at("logs").is_array()) {
                    for (const auto& line : error.at("data").at("logs")) {
                        logs += "\n  " + line.get<std::string>();
                    }
                }
                spdlog::debug("Preflight logs:{}", logs);
                throw ProgramRejection("Transaction rejected in simulation: " + message);
            }
            throw NetworkError(fmt::format("sendTransaction failed ({}): {}", code, message));
        }
        return response.at("result").get<std::string>();
    }

    std::optional<SignatureStatus> get_signature_status(const std::string& signature) {
        nlohmann::json params = nlohmann::json::array({
            nlohmann::json::array({signature}),
            {{"searchTransactionHistory", true}}
        });
        auto result = call("getSignatureStatuses", params);
        const auto& entry = result.at("value").at(0);
        if (entry.is_null()) {
            return std::nullopt;
        }

        SignatureStatus status;
        if (entry.contains("confirmationStatus") && entry.at("confirmationStatus").is_string()) {
            status.confirmation_status = entry.at("confirmationStatus").get<std::string>();
        }
        if (entry.contains("err")) {
            status.err = error_text(entry.at("err"));
        }
        return status;
    }

    std::optional<AccountInfo> get_account_info(const PublicKey& address) {
        nlohmann::json params = nlohmann::json::array({
            address.to_base58(),
            {{"encoding", "base64"}, {"commitment", "confirmed"}}
        });
        auto result = call("getAccountInfo", params);
        const auto& value = result.at("value");
        if (value.is_null()) {
            return std::nullopt;
        }

        AccountInfo info;
        info.lamports = value.at("lamports").get<uint64_t>();
        info.owner = PublicKey::from_base58(value.at("owner").get<std::string>());
        info.executable = value.value("executable", false);
        info.data = util::base64_decode(value.at("data").at(0).get<std::string>());
        return info;
    }

    uint64_t get_token_account_balance(const PublicKey& token_account) {
        nlohmann::json params = nlohmann::json::array({
            token_account.to_base58(),
            {{"commitment", "confirmed"}}
        });
        auto result = call("getTokenAccountBalance", params);
        // Amount is a decimal string of base units
        return util::parse_u64(result.at("value").at("amount").get<std::string>());
    }

    std::optional<TransactionMeta> get_transaction(const std::string& signature) {
        nlohmann::json params = nlohmann::json::array({
            signature,
            {
                {"encoding", "json"},
                {"commitment", "confirmed"},
                {"maxSupportedTransactionVersion", 0}
            }
        });
        auto result = call("getTransaction", params);
        if (result.is_null()) {
            return std::nullopt;
        }

        TransactionMeta meta;
        for (const auto& key : result.at("transaction").at("message").at("accountKeys")) {
            meta.account_keys.push_back(PublicKey::from_base58(key.get<std::string>()));
        }
        const auto& m = result.at("meta");
        meta.pre_balances = m.at("preBalances").get<std::vector<uint64_t>>();
        meta.post_balances = m.at("postBalances").get<std::vector<uint64_t>>();
        if (m.contains("err")) {
            meta.err = error_text(m.at("err"));
        }
        return meta;
    }

    uint64_t get_balance(const PublicKey& address) {
        nlohmann::json params = nlohmann::json::array({
            address.to_base58(),
            {{"commitment", "confirmed"}}
        });
        auto result = call("getBalance", params);
        uint64_t lamports = result.at("value").get<uint64_t>();
        spdlog::debug("Balance for {}: {} lamports", address.to_base58(), lamports);
        return lamports;
    }

    bool is_healthy() {
        try {
            auto result = call("getHealth", nlohmann::json::array());
            return result.is_string() && result.get<std::string>() == "ok";
        } catch (const std::exception& e) {
            spdlog::error("Solana health check failed: {}", e.what());
            return false;
        }
    }

    // A 200 reply of the wrong shape is the node's fault; report it as one
    template <typename Fn>
    auto read_reply(const char* method, Fn&& read) -> decltype(read()) {
        try {
            return read();
        } catch (const nlohmann::json::exception& e) {
            throw NetworkError(fmt::format("Unexpected {} response: {}", method, e.what()));
        } catch (const EncodingError& e) {
            throw NetworkError(fmt::format("Unexpected {} response: {}", method, e.what()));
        }
    }

private:
    nlohmann::json make_request(const std::string& method, const nlohmann::json& params) {
        return {
            {"jsonrpc", "2.0"},
            {"id", ++request_id_},
            {"method", method},
            {"params", params}
        };
    }

    // Result member of a successful call; an RPC error object becomes NetworkError
    nlohmann::json call(const std::string& method, const nlohmann::json& params) {
        auto response = post(make_request(method, params));
        if (response.contains("error")) {
            const auto& error = response.at("error");
            throw NetworkError(fmt::format("{} failed ({}): {}", method, error.value("code", 0),
                                           error.value("message", std::string("unknown error"))));
        }
        if (!response.contains("result")) {
            throw NetworkError(method + " returned no result");
        }
        return response.at("result");
    }

    nlohmann::json post(const nlohmann::json& request) const {
        httplib::Client client(rpc_origin_);
        client.set_connection_timeout(10, 0);
        client.set_read_timeout(read_timeout_seconds_, 0);

        httplib::Headers headers = {
            {"Content-Type", "application/json"}
        };

        auto response = client.Post(rpc_path_.c_str(), headers, request.dump(), "application/json");
        if (!response) {
            throw NetworkError(fmt::format("Solana RPC {} unreachable: {}", request.at("method").get<std::string>(),
                                           httplib::to_string(response.error())));
        }
        if (response->status != 200) {
            throw NetworkError(fmt::format("Solana RPC {} returned HTTP {}",
                                           request.at("method").get<std::string>(), response->status));
        }

        try {
            return nlohmann::json::parse(response->body);
        } catch (const nlohmann::json::exception& e) {
            throw NetworkError(std::string("Malformed Solana RPC response: ") + e.what());
        }
    }

    std::string rpc_origin_;
    std::string rpc_path_;
    int read_timeout_seconds_ = 30;
    std::atomic<uint64_t> request_id_{0};
};

// Public interface implementation
SolanaClient::SolanaClient(const Config& config)
    : pImpl_(std::make_unique<Impl>(config)) {}

SolanaClient::~SolanaClient() = default;

Blockhash SolanaClient::get_latest_blockhash() {
    return pImpl_->read_reply("getLatestBlockhash", [&] { return pImpl_->get_latest_blockhash(); });
}

std::string SolanaClient::send_transaction(const std::string& base64_tx) {
    return pImpl_->read_reply("sendTransaction", [&] { return pImpl_->send_transaction(base64_tx); });
}

std::optional<SignatureStatus> SolanaClient::get_signature_status(const std::string& signature) {
    return pImpl_->read_reply("getSignatureStatuses", [&] { return pImpl_->get_signature_status(signature); });
}

std::optional<AccountInfo> SolanaClient::get_account_info(const PublicKey& address) {
    return pImpl_->read_reply("getAccountInfo", [&] { return pImpl_->get_account_info(address); });
}

uint64_t SolanaClient::get_token_account_balance(const PublicKey& token_account) {
    return pImpl_->read_reply("getTokenAccountBalance",
                              [&] { return pImpl_->get_token_account_balance(token_account); });
}

std::optional<TransactionMeta> SolanaClient::get_transaction(const std::string& signature) {
    return pImpl_->read_reply("getTransaction", [&] { return pImpl_->get_transaction(signature); });
}

uint64_t SolanaClient::get_balance(const PublicKey& address) {
    return pImpl_->read_reply("getBalance", [&] { return pImpl_->get_balance(address); });
}

bool SolanaClient::is_healthy() {
    return pImpl_->is_healthy();
}
