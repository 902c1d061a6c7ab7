#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

enum class TransactionType { Buy, Sell, Transfer, Unknown };
enum class DexType { PumpFun, Raydium, Unknown };
enum class WalletStateChangeType { Added, Archived, Unarchived, Updated, Deleted };
enum class ConnectionType { WebSocket, Redis, Database, WalletService };
enum class ConnectionStatus { Connected, Disconnected, Error, Reconnecting, Connecting };
enum class PriceSource { Pyth, Raydium };

std::string to_string(TransactionType t);
std::string to_string(DexType d);
std::string to_string(WalletStateChangeType c);
std::string to_string(ConnectionType c);
std::string to_string(ConnectionStatus s);
std::string to_string(PriceSource s);

TransactionType parse_transaction_type(const std::string& s);
DexType parse_dex_type(const std::string& s);
WalletStateChangeType parse_wallet_state_change_type(const std::string& s);
ConnectionType parse_connection_type(const std::string& s);
ConnectionStatus parse_connection_status(const std::string& s);
PriceSource parse_price_source(const std::string& s);

struct TrackedWallet {
    std::optional<std::string> id;
    std::optional<std::string> user_id;
    std::string wallet_address;
    bool is_active = true;
    std::optional<std::string> created_at;
    std::optional<std::string> updated_at;
};

struct CopyTradeSettings {
    std::optional<std::string> id;
    std::optional<std::string> user_id;
    std::string tracked_wallet_id;
    bool is_enabled = false;
    double trade_amount_sol = 0.01;
    double max_slippage = 0.1;
    int max_open_positions = 1;
    std::optional<std::vector<std::string>> allowed_tokens;
    bool use_allowed_tokens_list = false;
    bool allow_additional_buys = false;
    bool match_sell_percentage = false;
    double min_sol_balance = 0.01;
    std::optional<std::string> created_at;
    std::optional<std::string> updated_at;

    // Throws ValidationError when an invariant does not hold
    void validate() const;
    bool allows_token(const std::string& token_address) const;
};

// Raw virtual reserves of a bonding curve (lamports / token base units)
struct BondingCurveReserves {
    int64_t virtual_token_reserves = 0;
    int64_t virtual_sol_reserves = 0;
};

// A trade seen on the upstream feed for one of the tracked wallets.
struct ObservedTrade {
    std::string signature;
    std::string token_address;
    std::string token_name;
    std::string token_symbol;
    TransactionType transaction_type = TransactionType::Unknown;
    double amount_token = 0.0;
    double amount_sol = 0.0;
    double price_per_token = 0.0;
    std::string token_image_uri;
    double market_cap = 0.0;
    double usd_market_cap = 0.0;
    int64_t timestamp = 0;
    std::string seller;
    std::string buyer;
    DexType dex_type = DexType::Unknown;

    // Bonding-curve trades only; not part of the wire form
    std::string bonding_curve_key;
    BondingCurveReserves reported_reserves;
};

struct TransactionLog {
    std::string id;
    std::string user_id;
    std::optional<std::string> tracked_wallet_id;
    std::string signature;
    TransactionType transaction_type = TransactionType::Unknown;
    std::string token_address;
    double amount = 0.0;
    double price_sol = 0.0;
    std::string timestamp;

    static TransactionLog from_trade(const ObservedTrade& trade, const std::string& user_id);
};

struct WalletStateChange {
    std::string wallet_address;
    WalletStateChangeType change_type = WalletStateChangeType::Updated;
    std::string timestamp;
    nlohmann::json details;
};

struct ConnectionStatusChange {
    ConnectionType connection_type = ConnectionType::WebSocket;
    ConnectionStatus status = ConnectionStatus::Disconnected;
    std::string timestamp;
    std::optional<std::string> details;
};

struct PriceUpdate {
    std::string token_address;
    double price_sol = 0.0;
    std::optional<double> price_usd;
    double market_cap = 0.0;
    int64_t timestamp = 0;
    DexType dex_type = DexType::Unknown;
    std::optional<double> liquidity;
    std::optional<double> liquidity_usd;
    std::optional<std::string> pool_address;
    // Volume windows are carried on the wire but never computed
    std::optional<double> volume_24h;
    std::optional<double> volume_6h;
    std::optional<double> volume_1h;
    std::optional<double> volume_5m;
};

struct SolPriceUpdate {
    double price_usd = 0.0;
    PriceSource source = PriceSource::Pyth;
    int64_t timestamp = 0;
    std::optional<double> confidence;
};

struct TokenHolding {
    std::string address;
    std::string symbol;
    std::string name;
    std::string balance;
    std::optional<std::string> metadata_uri;
    int decimals = 0;
    double market_cap = 0.0;

    double balance_amount() const;
};

struct WalletInfo {
    double balance = 0.0;
    std::vector<TokenHolding> tokens;
    std::string address;

    const TokenHolding* find_token(const std::string& token_address) const;
    int open_positions() const;
};

// Body sent to the wallet service once a copy trade has gone through.
struct TradeExecutionRequest {
    std::string signature;
    std::string token_address;
    std::string token_name;
    std::string token_symbol;
    TransactionType transaction_type = TransactionType::Unknown;
    double amount_token = 0.0;
    double amount_sol = 0.0;
    double price_per_token = 0.0;
    std::string token_image_uri;

    static TradeExecutionRequest from_trade(const ObservedTrade& trade);
};

void to_json(nlohmann::json& j, const TrackedWallet& w);
void from_json(const nlohmann::json& j, TrackedWallet& w);
void to_json(nlohmann::json& j, const CopyTradeSettings& s);
void from_json(const nlohmann::json& j, CopyTradeSettings& s);
void to_json(nlohmann::json& j, const ObservedTrade& t);
void from_json(const nlohmann::json& j, ObservedTrade& t);
void to_json(nlohmann::json& j, const TransactionLog& l);
void to_json(nlohmann::json& j, const WalletStateChange& c);
void from_json(const nlohmann::json& j, WalletStateChange& c);
void to_json(nlohmann::json& j, const ConnectionStatusChange& c);
void to_json(nlohmann::json& j, const PriceUpdate& p);
void from_json(const nlohmann::json& j, PriceUpdate& p);
void to_json(nlohmann::json& j, const SolPriceUpdate& p);
void from_json(const nlohmann::json& j, SolPriceUpdate& p);
void from_json(const nlohmann::json& j, TokenHolding& t);
void from_json(const nlohmann::json& j, WalletInfo& w);
void to_json(nlohmann::json& j, const TradeExecutionRequest& r);
