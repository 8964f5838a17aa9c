#pragma once
#include "config.hpp"
#include "pubkey.hpp"
#include "transaction.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct AccountInfo {
    uint64_t lamports = 0;
    PublicKey owner;
    std::vector<uint8_t> data;
    bool executable = false;
};

struct SignatureStatus {
    std::string confirmation_status;  // processed | confirmed | finalized
    std::optional<std::string> err;

    bool is_confirmed() const { return confirmation_status == "confirmed" || confirmation_status == "finalized"; }
};

// Balances of a confirmed transaction, indexed like account_keys
struct TransactionMeta {
    std::vector<PublicKey> account_keys;
    std::vector<uint64_t> pre_balances;
    std::vector<uint64_t> post_balances;
    std::optional<std::string> err;
};

// The JSON-RPC calls the launcher makes. Failures to reach the node throw
// NetworkError; a preflight rejection of sendTransaction throws ProgramRejection.
class SolanaRpc {
public:
    virtual ~SolanaRpc() = default;

    virtual Blockhash get_latest_blockhash() = 0;
    // Returns the signature the node reports for the broadcast
    virtual std::string send_transaction(const std::string& base64_tx) = 0;
    virtual std::optional<SignatureStatus> get_signature_status(const std::string& signature) = 0;
    virtual std::optional<AccountInfo> get_account_info(const PublicKey& address) = 0;
    // Raw token amount (base units)
    virtual uint64_t get_token_account_balance(const PublicKey& token_account) = 0;
    virtual std::optional<TransactionMeta> get_transaction(const std::string& signature) = 0;
    virtual uint64_t get_balance(const PublicKey& address) = 0;
    virtual bool is_healthy() = 0;
};

class SolanaClient : public SolanaRpc {
public:
    explicit SolanaClient(const Config& config);
    ~SolanaClient() override;

    Blockhash get_latest_blockhash() override;
    std::string send_transaction(const std::string& base64_tx) override;
    std::optional<SignatureStatus> get_signature_status(const std::string& signature) override;
    std::optional<AccountInfo> get_account_info(const PublicKey& address) override;
    uint64_t get_token_account_balance(const PublicKey& token_account) override;
    std::optional<TransactionMeta> get_transaction(const std::string& signature) override;
    uint64_t get_balance(const PublicKey& address) override;
    bool is_healthy() override;

    // Non-copyable
    SolanaClient(const SolanaClient&) = delete;
    SolanaClient& operator=(const SolanaClient&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
