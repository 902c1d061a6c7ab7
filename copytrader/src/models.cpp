#include "models.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <fmt/format.h>

using json = nlohmann::json;

namespace {

template <typename T>
std::optional<T> get_optional(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

template <typename T>
json optional_to_json(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

std::string to_string(TransactionType t) {
    switch (t) {
        case TransactionType::Buy: return "Buy";
        case TransactionType::Sell: return "Sell";
        case TransactionType::Transfer: return "Transfer";
        case TransactionType::Unknown: return "Unknown";
    }
    return "Unknown";
}

std::string to_string(DexType d) {
    switch (d) {
        case DexType::PumpFun: return "PumpFun";
        case DexType::Raydium: return "Raydium";
        case DexType::Unknown: return "Unknown";
    }
    return "Unknown";
}

std::string to_string(WalletStateChangeType c) {
    switch (c) {
        case WalletStateChangeType::Added: return "Added";
        case WalletStateChangeType::Archived: return "Archived";
        case WalletStateChangeType::Unarchived: return "Unarchived";
        case WalletStateChangeType::Updated: return "Updated";
        case WalletStateChangeType::Deleted: return "Deleted";
    }
    return "Updated";
}

std::string to_string(ConnectionType c) {
    switch (c) {
        case ConnectionType::WebSocket: return "WebSocket";
        case ConnectionType::Redis: return "Redis";
        case ConnectionType::Database: return "Database";
        case ConnectionType::WalletService: return "WalletService";
    }
    return "WebSocket";
}

std::string to_string(ConnectionStatus s) {
    switch (s) {
        case ConnectionStatus::Connected: return "Connected";
        case ConnectionStatus::Disconnected: return "Disconnected";
        case ConnectionStatus::Error: return "Error";
        case ConnectionStatus::Reconnecting: return "Reconnecting";
        case ConnectionStatus::Connecting: return "Connecting";
    }
    return "Disconnected";
}

std::string to_string(PriceSource s) {
    return s == PriceSource::Pyth ? "Pyth" : "Raydium";
}

TransactionType parse_transaction_type(const std::string& s) {
    if (s == "Buy") return TransactionType::Buy;
    if (s == "Sell") return TransactionType::Sell;
    if (s == "Transfer") return TransactionType::Transfer;
    return TransactionType::Unknown;
}

DexType parse_dex_type(const std::string& s) {
    if (s == "PumpFun") return DexType::PumpFun;
    if (s == "Raydium") return DexType::Raydium;
    return DexType::Unknown;
}

WalletStateChangeType parse_wallet_state_change_type(const std::string& s) {
    if (s == "Added") return WalletStateChangeType::Added;
    if (s == "Archived") return WalletStateChangeType::Archived;
    if (s == "Unarchived") return WalletStateChangeType::Unarchived;
    if (s == "Updated") return WalletStateChangeType::Updated;
    if (s == "Deleted") return WalletStateChangeType::Deleted;
    throw DecodeError(fmt::format("unknown wallet state change type '{}'", s));
}

ConnectionType parse_connection_type(const std::string& s) {
    if (s == "WebSocket") return ConnectionType::WebSocket;
    if (s == "Redis") return ConnectionType::Redis;
    if (s == "Database") return ConnectionType::Database;
    if (s == "WalletService") return ConnectionType::WalletService;
    throw DecodeError(fmt::format("unknown connection type '{}'", s));
}

ConnectionStatus parse_connection_status(const std::string& s) {
    if (s == "Connected") return ConnectionStatus::Connected;
    if (s == "Disconnected") return ConnectionStatus::Disconnected;
    if (s == "Error") return ConnectionStatus::Error;
    if (s == "Reconnecting") return ConnectionStatus::Reconnecting;
    if (s == "Connecting") return ConnectionStatus::Connecting;
    throw DecodeError(fmt::format("unknown connection status '{}'", s));
}

PriceSource parse_price_source(const std::string& s) {
    if (s == "Pyth") return PriceSource::Pyth;
    if (s == "Raydium") return PriceSource::Raydium;
    throw DecodeError(fmt::format("unknown price source '{}'", s));
}

void CopyTradeSettings::validate() const {
    if (!(trade_amount_sol > 0.0)) {
        throw ValidationError(fmt::format("trade_amount_sol must be positive, got {}", trade_amount_sol));
    }
    if (max_slippage < 0.0 || max_slippage > 100.0) {
        throw ValidationError(fmt::format("max_slippage must be within [0, 100], got {}", max_slippage));
    }
    if (max_open_positions < 0) {
        throw ValidationError(fmt::format("max_open_positions must be >= 0, got {}", max_open_positions));
    }
    if (min_sol_balance < 0.0) {
        throw ValidationError(fmt::format("min_sol_balance must be >= 0, got {}", min_sol_balance));
    }
}

bool CopyTradeSettings::allows_token(const std::string& token_address) const {
    if (!use_allowed_tokens_list) {
        return true;
    }
    if (!allowed_tokens) {
        return false;
    }
    return std::find(allowed_tokens->begin(), allowed_tokens->end(), token_address)
        != allowed_tokens->end();
}

TransactionLog TransactionLog::from_trade(const ObservedTrade& trade, const std::string& user_id) {
    TransactionLog log;
    log.id = util::generate_uuid();
    log.user_id = user_id;
    log.signature = trade.signature;
    log.transaction_type = trade.transaction_type;
    log.token_address = trade.token_address;
    log.amount = trade.amount_token;
    log.price_sol = trade.price_per_token;
    log.timestamp = util::current_iso8601();
    return log;
}

double TokenHolding::balance_amount() const {
    try {
        return std::stod(balance);
    } catch (const std::exception&) {
        return 0.0;
    }
}

const TokenHolding* WalletInfo::find_token(const std::string& token_address) const {
    for (const auto& token : tokens) {
        if (token.address == token_address) {
            return &token;
        }
    }
    return nullptr;
}

int WalletInfo::open_positions() const {
    return static_cast<int>(std::count_if(tokens.begin(), tokens.end(),
        [](const TokenHolding& t) { return t.balance_amount() > 0.0; }));
}

TradeExecutionRequest TradeExecutionRequest::from_trade(const ObservedTrade& trade) {
    TradeExecutionRequest req;
    req.signature = trade.signature;
    req.token_address = trade.token_address;
    req.token_name = trade.token_name;
    req.token_symbol = trade.token_symbol;
    req.transaction_type = trade.transaction_type;
    req.amount_token = trade.amount_token;
    req.amount_sol = trade.amount_sol;
    req.price_per_token = trade.price_per_token;
    req.token_image_uri = trade.token_image_uri;
    return req;
}

void to_json(json& j, const TrackedWallet& w) {
    j = json{
        {"id", optional_to_json(w.id)},
        {"user_id", optional_to_json(w.user_id)},
        {"wallet_address", w.wallet_address},
        {"is_active", w.is_active},
        {"created_at", optional_to_json(w.created_at)},
        {"updated_at", optional_to_json(w.updated_at)}
    };
}

void from_json(const json& j, TrackedWallet& w) {
    w.id = get_optional<std::string>(j, "id");
    w.user_id = get_optional<std::string>(j, "user_id");
    w.wallet_address = j.at("wallet_address").get<std::string>();
    w.is_active = j.value("is_active", true);
    w.created_at = get_optional<std::string>(j, "created_at");
    w.updated_at = get_optional<std::string>(j, "updated_at");
}

void to_json(json& j, const CopyTradeSettings& s) {
    j = json{
        {"id", optional_to_json(s.id)},
        {"user_id", optional_to_json(s.user_id)},
        {"tracked_wallet_id", s.tracked_wallet_id},
        {"is_enabled", s.is_enabled},
        {"trade_amount_sol", s.trade_amount_sol},
        {"max_slippage", s.max_slippage},
        {"max_open_positions", s.max_open_positions},
        {"allowed_tokens", optional_to_json(s.allowed_tokens)},
        {"use_allowed_tokens_list", s.use_allowed_tokens_list},
        {"allow_additional_buys", s.allow_additional_buys},
        {"match_sell_percentage", s.match_sell_percentage},
        {"min_sol_balance", s.min_sol_balance},
        {"created_at", optional_to_json(s.created_at)},
        {"updated_at", optional_to_json(s.updated_at)}
    };
}

void from_json(const json& j, CopyTradeSettings& s) {
    s.id = get_optional<std::string>(j, "id");
    s.user_id = get_optional<std::string>(j, "user_id");
    s.tracked_wallet_id = j.at("tracked_wallet_id").get<std::string>();
    s.is_enabled = j.at("is_enabled").get<bool>();
    s.trade_amount_sol = j.at("trade_amount_sol").get<double>();
    s.max_slippage = j.at("max_slippage").get<double>();
    s.max_open_positions = j.value("max_open_positions", 0);
    s.allowed_tokens = get_optional<std::vector<std::string>>(j, "allowed_tokens");
    s.use_allowed_tokens_list = j.at("use_allowed_tokens_list").get<bool>();
    s.allow_additional_buys = j.at("allow_additional_buys").get<bool>();
    s.match_sell_percentage = j.at("match_sell_percentage").get<bool>();
    s.min_sol_balance = j.at("min_sol_balance").get<double>();
    s.created_at = get_optional<std::string>(j, "created_at");
    s.updated_at = get_optional<std::string>(j, "updated_at");
}

void to_json(json& j, const ObservedTrade& t) {
    j = json{
        {"signature", t.signature},
        {"token_address", t.token_address},
        {"token_name", t.token_name},
        {"token_symbol", t.token_symbol},
        {"transaction_type", to_string(t.transaction_type)},
        {"amount_token", t.amount_token},
        {"amount_sol", t.amount_sol},
        {"price_per_token", t.price_per_token},
        {"token_image_uri", t.token_image_uri},
        {"market_cap", t.market_cap},
        {"usd_market_cap", t.usd_market_cap},
        {"timestamp", t.timestamp},
        {"seller", t.seller},
        {"buyer", t.buyer},
        {"dex_type", to_string(t.dex_type)}
    };
}

void from_json(const json& j, ObservedTrade& t) {
    t.signature = j.at("signature").get<std::string>();
    t.token_address = j.at("token_address").get<std::string>();
    t.token_name = j.value("token_name", "");
    t.token_symbol = j.value("token_symbol", "");
    t.transaction_type = parse_transaction_type(j.value("transaction_type", "Unknown"));
    t.amount_token = j.value("amount_token", 0.0);
    t.amount_sol = j.value("amount_sol", 0.0);
    t.price_per_token = j.value("price_per_token", 0.0);
    t.token_image_uri = j.value("token_image_uri", "");
    t.market_cap = j.value("market_cap", 0.0);
    t.usd_market_cap = j.value("usd_market_cap", 0.0);
    t.timestamp = j.value("timestamp", int64_t{0});
    t.seller = j.value("seller", "");
    t.buyer = j.value("buyer", "");
    t.dex_type = parse_dex_type(j.value("dex_type", "Unknown"));
}

void to_json(json& j, const TransactionLog& l) {
    j = json{
        {"id", l.id},
        {"user_id", l.user_id},
        {"tracked_wallet_id", optional_to_json(l.tracked_wallet_id)},
        {"signature", l.signature},
        {"transaction_type", to_string(l.transaction_type)},
        {"token_address", l.token_address},
        {"amount", l.amount},
        {"price_sol", l.price_sol},
        {"timestamp", l.timestamp}
    };
}

void to_json(json& j, const WalletStateChange& c) {
    j = json{
        {"wallet_address", c.wallet_address},
        {"change_type", to_string(c.change_type)},
        {"timestamp", c.timestamp},
        {"details", c.details}
    };
}

void from_json(const json& j, WalletStateChange& c) {
    c.wallet_address = j.at("wallet_address").get<std::string>();
    c.change_type = parse_wallet_state_change_type(j.at("change_type").get<std::string>());
    c.timestamp = j.value("timestamp", "");
    c.details = j.contains("details") ? j.at("details") : json(nullptr);
}

void to_json(json& j, const ConnectionStatusChange& c) {
    j = json{
        {"connection_type", to_string(c.connection_type)},
        {"status", to_string(c.status)},
        {"timestamp", c.timestamp},
        {"details", optional_to_json(c.details)}
    };
}

void to_json(json& j, const PriceUpdate& p) {
    j = json{
        {"token_address", p.token_address},
        {"price_sol", p.price_sol},
        {"price_usd", optional_to_json(p.price_usd)},
        {"market_cap", p.market_cap},
        {"timestamp", p.timestamp},
        {"dex_type", to_string(p.dex_type)},
        {"liquidity", optional_to_json(p.liquidity)},
        {"liquidity_usd", optional_to_json(p.liquidity_usd)},
        {"pool_address", optional_to_json(p.pool_address)},
        {"volume_24h", optional_to_json(p.volume_24h)},
        {"volume_6h", optional_to_json(p.volume_6h)},
        {"volume_1h", optional_to_json(p.volume_1h)},
        {"volume_5m", optional_to_json(p.volume_5m)}
    };
}

void from_json(const json& j, PriceUpdate& p) {
    p.token_address = j.at("token_address").get<std::string>();
    p.price_sol = j.at("price_sol").get<double>();
    p.price_usd = get_optional<double>(j, "price_usd");
    p.market_cap = j.at("market_cap").get<double>();
    p.timestamp = j.at("timestamp").get<int64_t>();
    p.dex_type = parse_dex_type(j.value("dex_type", "Unknown"));
    p.liquidity = get_optional<double>(j, "liquidity");
    p.liquidity_usd = get_optional<double>(j, "liquidity_usd");
    p.pool_address = get_optional<std::string>(j, "pool_address");
    p.volume_24h = get_optional<double>(j, "volume_24h");
    p.volume_6h = get_optional<double>(j, "volume_6h");
    p.volume_1h = get_optional<double>(j, "volume_1h");
    p.volume_5m = get_optional<double>(j, "volume_5m");
}

void to_json(json& j, const SolPriceUpdate& p) {
    j = json{
        {"price_usd", p.price_usd},
        {"source", to_string(p.source)},
        {"timestamp", p.timestamp},
        {"confidence", optional_to_json(p.confidence)}
    };
}

void from_json(const json& j, SolPriceUpdate& p) {
    p.price_usd = j.at("price_usd").get<double>();
    p.source = parse_price_source(j.at("source").get<std::string>());
    p.timestamp = j.at("timestamp").get<int64_t>();
    p.confidence = get_optional<double>(j, "confidence");
}

void from_json(const json& j, TokenHolding& t) {
    t.address = j.at("address").get<std::string>();
    t.symbol = j.value("symbol", "");
    t.name = j.value("name", "");
    const auto& balance = j.at("balance");
    t.balance = balance.is_string() ? balance.get<std::string>() : balance.dump();
    t.metadata_uri = get_optional<std::string>(j, "metadata_uri");
    t.decimals = j.value("decimals", 0);
    t.market_cap = j.value("market_cap", 0.0);
}

void from_json(const json& j, WalletInfo& w) {
    w.balance = j.at("balance").get<double>();
    w.tokens = j.value("tokens", std::vector<TokenHolding>{});
    w.address = j.value("address", "");
}

void to_json(json& j, const TradeExecutionRequest& r) {
    j = json{
        {"signature", r.signature},
        {"token_address", r.token_address},
        {"token_name", r.token_name},
        {"token_symbol", r.token_symbol},
        {"transaction_type", to_string(r.transaction_type)},
        {"amount_token", r.amount_token},
        {"amount_sol", r.amount_sol},
        {"price_per_token", r.price_per_token},
        {"token_image_uri", r.token_image_uri}
    };
}
