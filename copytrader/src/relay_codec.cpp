#include "relay_codec.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace relay {

namespace {

std::optional<WalletStateChangeType> action_to_change_type(const std::string& action) {
    if (action == "add") return WalletStateChangeType::Added;
    if (action == "archive") return WalletStateChangeType::Archived;
    if (action == "unarchive") return WalletStateChangeType::Unarchived;
    if (action == "delete") return WalletStateChangeType::Deleted;
    return std::nullopt;
}

std::optional<Event> decode_settings(const json& j) {
    if (j.contains("settings_id") && !j.contains("tracked_wallet_id")) {
        spdlog::debug("Settings delete for {} received, nothing to apply",
                      j["settings_id"].is_string() ? j["settings_id"].get<std::string>() : j["settings_id"].dump());
        return std::nullopt;
    }

    auto settings = j.get<CopyTradeSettings>();
    settings.validate();
    return make_settings_updated(std::move(settings));
}

std::optional<Event> decode_tracked_wallet(const json& j) {
    if (!j.contains("action") || !j["action"].is_string()) {
        return std::nullopt;
    }

    auto change_type = action_to_change_type(j["action"].get<std::string>());
    if (!change_type) {
        spdlog::debug("Ignoring wallet action '{}'", j["action"].get<std::string>());
        return std::nullopt;
    }

    WalletStateChange change;
    change.wallet_address = j.at("wallet_address").get<std::string>();
    change.change_type = *change_type;
    change.timestamp = util::current_iso8601();
    change.details = j;
    return make_wallet_state_changed(std::move(change));
}

} // namespace

std::string encode_settings(const CopyTradeSettings& settings) {
    return json(settings).dump();
}

std::string encode_settings_delete(const std::string& settings_id) {
    return json{{"settings_id", settings_id}}.dump();
}

std::string encode_tracked_wallet_update(const std::string& wallet_address, const std::string& action,
                                         bool is_active, const std::optional<std::string>& id) {
    return json{
        {"wallet_address", wallet_address},
        {"action", action},
        {"is_active", is_active},
        {"id", id ? json(*id) : json(nullptr)}
    }.dump();
}

std::string encode_wallet_address_update(const std::string& wallet_address, const std::string& action) {
    return json{{"wallet_address", wallet_address}, {"action", action}}.dump();
}

std::string encode_price_update(const PriceUpdate& update) {
    return json(update).dump();
}

std::string encode_sol_price_update(const SolPriceUpdate& update) {
    return json(update).dump();
}

bool is_known_wallet_action(const std::string& action) {
    return action_to_change_type(action).has_value();
}

std::optional<Event> decode_message(const std::string& channel, const std::string& payload) {
    try {
        auto j = json::parse(payload);

        if (channel == SETTINGS_CHANNEL) {
            return decode_settings(j);
        }
        if (channel == TRACKED_WALLETS_CHANNEL) {
            return decode_tracked_wallet(j);
        }
        if (channel == PRICE_UPDATES_CHANNEL) {
            return make_price_updated(j.get<PriceUpdate>());
        }
        if (channel == SOL_PRICE_UPDATES_CHANNEL) {
            return make_sol_price_updated(j.get<SolPriceUpdate>());
        }

        spdlog::warn("Message on unknown channel {}", channel);
        return std::nullopt;

    } catch (const json::exception& e) {
        throw DecodeError(fmt::format("Malformed payload on {}: {}", channel, e.what()));
    } catch (const ValidationError& e) {
        throw DecodeError(fmt::format("Rejected payload on {}: {}", channel, e.what()));
    }
}

} // namespace relay
