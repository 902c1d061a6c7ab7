#include "store_pg.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <optional>

namespace {

std::optional<std::string> opt_string(const pqxx::field& f) {
    if (f.is_null()) return std::nullopt;
    return f.as<std::string>();
}

} // namespace

PostgresStore::PostgresStore(const std::string& dsn) : dsn_(dsn) {
    spdlog::info("PostgresStore initialized: {}", util::redact_url(dsn));
}

pqxx::connection PostgresStore::make_connection() {
    return pqxx::connection(dsn_);
}

void PostgresStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS users (
                id UUID DEFAULT gen_random_uuid() PRIMARY KEY,
                wallet_address TEXT UNIQUE NOT NULL,
                created_at TIMESTAMPTZ DEFAULT CURRENT_TIMESTAMP,
                updated_at TIMESTAMPTZ DEFAULT CURRENT_TIMESTAMP
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS tracked_wallets (
                id UUID DEFAULT gen_random_uuid() PRIMARY KEY,
                user_id TEXT REFERENCES users(wallet_address) ON DELETE CASCADE,
                wallet_address TEXT NOT NULL,
                is_active BOOLEAN DEFAULT true,
                created_at TIMESTAMPTZ DEFAULT CURRENT_TIMESTAMP,
                updated_at TIMESTAMPTZ DEFAULT CURRENT_TIMESTAMP,
                UNIQUE (user_id, wallet_address)
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS copy_trade_settings (
                id UUID DEFAULT gen_random_uuid() PRIMARY KEY,
                user_id TEXT REFERENCES users(wallet_address) ON DELETE CASCADE,
                tracked_wallet_id UUID REFERENCES tracked_wallets(id) ON DELETE CASCADE,
                is_enabled BOOLEAN DEFAULT false,
                trade_amount_sol DECIMAL(18, 9) NOT NULL,
                max_slippage DECIMAL(5, 2) DEFAULT 1.00,
                max_open_positions INT DEFAULT 1,
                allow_additional_buys BOOLEAN DEFAULT false,
                match_sell_percentage BOOLEAN DEFAULT false,
                allowed_tokens TEXT[],
                use_allowed_tokens_list BOOLEAN DEFAULT false,
                min_sol_balance DECIMAL(18, 9) DEFAULT 0.01,
                created_at TIMESTAMPTZ DEFAULT CURRENT_TIMESTAMP,
                updated_at TIMESTAMPTZ DEFAULT CURRENT_TIMESTAMP,
                UNIQUE (user_id, tracked_wallet_id)
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS transactions (
                id UUID DEFAULT gen_random_uuid() PRIMARY KEY,
                user_id TEXT REFERENCES users(wallet_address) ON DELETE CASCADE,
                tracked_wallet_id UUID REFERENCES tracked_wallets(id) ON DELETE SET NULL,
                signature TEXT NOT NULL,
                transaction_type TEXT NOT NULL,
                token_address TEXT NOT NULL,
                amount DECIMAL(18, 9) NOT NULL,
                price_sol DECIMAL(18, 9) NOT NULL,
                timestamp TIMESTAMPTZ DEFAULT CURRENT_TIMESTAMP
            )
        )");

        txn.commit();
        spdlog::info("Database schema initialized");

    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw;
    }
}

bool PostgresStore::user_exists(const std::string& wallet_address) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        auto result = txn.exec_params(
            "SELECT 1 FROM users WHERE wallet_address = $1", wallet_address);
        txn.commit();
        return !result.empty();

    } catch (const std::exception& e) {
        spdlog::error("Failed to look up user {}: {}", wallet_address, e.what());
        throw;
    }
}

void PostgresStore::create_user(const std::string& wallet_address) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec_params(
            "INSERT INTO users (wallet_address) VALUES ($1) "
            "ON CONFLICT (wallet_address) DO NOTHING",
            wallet_address);
        txn.commit();
        spdlog::info("Created user {}", wallet_address);

    } catch (const std::exception& e) {
        spdlog::error("Failed to create user {}: {}", wallet_address, e.what());
        throw;
    }
}

std::vector<TrackedWallet> PostgresStore::get_tracked_wallets(const std::string& user_id) {
    std::vector<TrackedWallet> wallets;
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        auto result = txn.exec_params(
            "SELECT id::text, user_id, wallet_address, is_active, "
            "created_at::text, updated_at::text "
            "FROM tracked_wallets WHERE user_id = $1 ORDER BY created_at",
            user_id);
        txn.commit();

        for (const auto& row : result) {
            TrackedWallet w;
            w.id = opt_string(row[0]);
            w.user_id = opt_string(row[1]);
            w.wallet_address = row[2].as<std::string>();
            w.is_active = row[3].is_null() ? true : row[3].as<bool>();
            w.created_at = opt_string(row[4]);
            w.updated_at = opt_string(row[5]);
            wallets.push_back(std::move(w));
        }
        return wallets;

    } catch (const std::exception& e) {
        spdlog::error("Failed to load tracked wallets for {}: {}", user_id, e.what());
        throw;
    }
}

std::vector<CopyTradeSettings> PostgresStore::get_copy_trade_settings(const std::string& user_id) {
    std::vector<CopyTradeSettings> settings;
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        auto result = txn.exec_params(
            "SELECT id::text, user_id, tracked_wallet_id::text, is_enabled, "
            "trade_amount_sol::float8, max_slippage::float8, max_open_positions, "
            "array_to_json(allowed_tokens)::text, use_allowed_tokens_list, "
            "allow_additional_buys, match_sell_percentage, min_sol_balance::float8, "
            "created_at::text, updated_at::text "
            "FROM copy_trade_settings WHERE user_id = $1 ORDER BY created_at",
            user_id);
        txn.commit();

        for (const auto& row : result) {
            CopyTradeSettings s;
            s.id = opt_string(row[0]);
            s.user_id = opt_string(row[1]);
            s.tracked_wallet_id = row[2].is_null() ? "" : row[2].as<std::string>();
            s.is_enabled = !row[3].is_null() && row[3].as<bool>();
            s.trade_amount_sol = row[4].as<double>();
            s.max_slippage = row[5].is_null() ? 1.0 : row[5].as<double>();
            s.max_open_positions = row[6].is_null() ? 1 : row[6].as<int>();
            if (!row[7].is_null()) {
                s.allowed_tokens = nlohmann::json::parse(row[7].as<std::string>())
                                       .get<std::vector<std::string>>();
            }
            s.use_allowed_tokens_list = !row[8].is_null() && row[8].as<bool>();
            s.allow_additional_buys = !row[9].is_null() && row[9].as<bool>();
            s.match_sell_percentage = !row[10].is_null() && row[10].as<bool>();
            s.min_sol_balance = row[11].is_null() ? 0.01 : row[11].as<double>();
            s.created_at = opt_string(row[12]);
            s.updated_at = opt_string(row[13]);
            settings.push_back(std::move(s));
        }
        return settings;

    } catch (const std::exception& e) {
        spdlog::error("Failed to load copy trade settings for {}: {}", user_id, e.what());
        throw;
    }
}

void PostgresStore::insert_transaction_log(const TransactionLog& log) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec_params(
            "INSERT INTO transactions (id, user_id, tracked_wallet_id, signature, "
            "transaction_type, token_address, amount, price_sol, timestamp) "
            "VALUES ($1::uuid, $2, $3::uuid, $4, $5, $6, $7, $8, $9::timestamptz)",
            log.id, log.user_id, log.tracked_wallet_id, log.signature,
            to_string(log.transaction_type), log.token_address,
            log.amount, log.price_sol, log.timestamp);
        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to insert transaction {}: {}", log.signature, e.what());
        throw;
    }
}

bool PostgresStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec("SELECT 1");
        txn.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Postgres ping failed: {}", e.what());
        return false;
    }
}
