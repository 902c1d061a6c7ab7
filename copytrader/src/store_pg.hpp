#pragma once

#include "models.hpp"
#include <string>
#include <vector>
#include <pqxx/pqxx>

class WalletRepository {
public:
    virtual ~WalletRepository() = default;
    virtual bool user_exists(const std::string& wallet_address) = 0;
    virtual void create_user(const std::string& wallet_address) = 0;
    virtual std::vector<TrackedWallet> get_tracked_wallets(const std::string& user_id) = 0;
    virtual std::vector<CopyTradeSettings> get_copy_trade_settings(const std::string& user_id) = 0;
    virtual void insert_transaction_log(const TransactionLog& log) = 0;
    virtual bool ping() = 0;
};

class PostgresStore : public WalletRepository {
public:
    explicit PostgresStore(const std::string& dsn);

    void init_schema();

    bool user_exists(const std::string& wallet_address) override;
    void create_user(const std::string& wallet_address) override;
    std::vector<TrackedWallet> get_tracked_wallets(const std::string& user_id) override;
    std::vector<CopyTradeSettings> get_copy_trade_settings(const std::string& user_id) override;
    void insert_transaction_log(const TransactionLog& log) override;
    bool ping() override;

private:
    std::string dsn_;
    pqxx::connection make_connection();
};
