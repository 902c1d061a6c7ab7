#pragma once

#include "models.hpp"
#include <variant>
#include <string>
#include <nlohmann/json.hpp>

// Each notification wraps its payload with a self-describing type tag.
template <typename T>
struct Notification {
    T data;
    std::string type_;
};

struct SettingsUpdateNotification : Notification<CopyTradeSettings> {};
struct WalletStateNotification : Notification<WalletStateChange> {};
struct TransactionLoggedNotification : Notification<TransactionLog> {};
struct CopyTradeNotification : Notification<ObservedTrade> {};
struct TrackedWalletNotification : Notification<ObservedTrade> {};
struct PriceUpdateNotification : Notification<PriceUpdate> {};
struct SolPriceUpdateNotification : Notification<SolPriceUpdate> {};
struct ConnectionStatusNotification : Notification<ConnectionStatusChange> {};

namespace event_tags {
    inline constexpr const char* SETTINGS_UPDATED = "settings_updated";
    inline constexpr const char* WALLET_STATE_CHANGE = "wallet_state_change";
    inline constexpr const char* TRANSACTION_LOGGED = "transaction_logged";
    inline constexpr const char* COPY_TRADE_EXECUTED = "copy_trade_executed";
    inline constexpr const char* TRACKED_WALLET_TRADE = "tracked_wallet_trade";
    inline constexpr const char* PRICE_UPDATE = "price_update";
    inline constexpr const char* SOL_PRICE_UPDATE = "sol_price_update";
    inline constexpr const char* CONNECTION_STATUS = "connection_status_changed";
}

using Event = std::variant<
    SettingsUpdateNotification,
    WalletStateNotification,
    TransactionLoggedNotification,
    CopyTradeNotification,
    TrackedWalletNotification,
    PriceUpdateNotification,
    SolPriceUpdateNotification,
    ConnectionStatusNotification>;

inline Event make_settings_updated(CopyTradeSettings s) {
    return SettingsUpdateNotification{{std::move(s), event_tags::SETTINGS_UPDATED}};
}

inline Event make_wallet_state_changed(WalletStateChange c) {
    return WalletStateNotification{{std::move(c), event_tags::WALLET_STATE_CHANGE}};
}

inline Event make_transaction_logged(TransactionLog l) {
    return TransactionLoggedNotification{{std::move(l), event_tags::TRANSACTION_LOGGED}};
}

inline Event make_copy_trade_executed(ObservedTrade t) {
    return CopyTradeNotification{{std::move(t), event_tags::COPY_TRADE_EXECUTED}};
}

inline Event make_tracked_wallet_trade(ObservedTrade t) {
    return TrackedWalletNotification{{std::move(t), event_tags::TRACKED_WALLET_TRADE}};
}

inline Event make_price_updated(PriceUpdate p) {
    return PriceUpdateNotification{{std::move(p), event_tags::PRICE_UPDATE}};
}

inline Event make_sol_price_updated(SolPriceUpdate p) {
    return SolPriceUpdateNotification{{std::move(p), event_tags::SOL_PRICE_UPDATE}};
}

inline Event make_connection_status(ConnectionStatusChange c) {
    return ConnectionStatusNotification{{std::move(c), event_tags::CONNECTION_STATUS}};
}

inline const std::string& event_type(const Event& event) {
    return std::visit([](const auto& n) -> const std::string& { return n.type_; }, event);
}

// Wire envelope: {"type": <tag>, "data": <payload>}
inline nlohmann::json to_envelope(const Event& event) {
    return std::visit([](const auto& n) {
        return nlohmann::json{{"type", n.type_}, {"data", n.data}};
    }, event);
}
