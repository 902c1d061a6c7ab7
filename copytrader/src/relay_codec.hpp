#pragma once

#include "events.hpp"
#include <optional>
#include <string>

namespace relay {
    inline constexpr const char* SETTINGS_CHANNEL = "settings";
    inline constexpr const char* TRACKED_WALLETS_CHANNEL = "tracked_wallets";
    inline constexpr const char* PRICE_UPDATES_CHANNEL = "price_updates";
    inline constexpr const char* SOL_PRICE_UPDATES_CHANNEL = "sol_price_updates";

    std::string encode_settings(const CopyTradeSettings& settings);
    std::string encode_settings_delete(const std::string& settings_id);
    std::string encode_tracked_wallet_update(const std::string& wallet_address, const std::string& action,
                                             bool is_active, const std::optional<std::string>& id);
    std::string encode_wallet_address_update(const std::string& wallet_address, const std::string& action);
    std::string encode_price_update(const PriceUpdate& update);
    std::string encode_sol_price_update(const SolPriceUpdate& update);

    bool is_known_wallet_action(const std::string& action);

    // Converts an inbound relay payload into a bus event. Returns nullopt for
    // payloads that are valid but carry nothing to apply locally (settings
    // deletes, unknown wallet actions, unknown channels). Throws DecodeError
    // on malformed payloads.
    std::optional<Event> decode_message(const std::string& channel, const std::string& payload);
}
