#include "admin_api.hpp"
#include "errors.hpp"
#include "relay_codec.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

AdminApi::AdminApi(std::shared_ptr<RelayPublisher> publisher)
    : publisher_(std::move(publisher)) {}

AdminResponse AdminApi::reply(int status, bool ok, const std::string& message) {
    return {status, json{
        {"ok", ok},
        {"message", message},
        {"ts", util::current_iso8601()}
    }};
}

AdminResponse AdminApi::update_tracked_wallet(const std::string& body) {
    try {
        auto j = json::parse(body);

        if (!j.contains("wallet_address") || !j["wallet_address"].is_string()) {
            return reply(400, false, "wallet_address is required");
        }

        std::string address = j["wallet_address"].get<std::string>();
        if (!util::is_valid_solana_address(address)) {
            return reply(400, false, "Invalid Solana address format.");
        }

        std::string action = j.value("action", "add");
        if (!relay::is_known_wallet_action(action)) {
            return reply(400, false, "Unknown action: " + action);
        }

        if (!j.contains("is_active") && !j.contains("id")) {
            publisher_->publish_wallet_address_update(address, action);
        } else {
            bool is_active = j.value("is_active", action != "archive");
            std::optional<std::string> id;
            if (j.contains("id") && j["id"].is_string()) {
                id = j["id"].get<std::string>();
            }
            publisher_->publish_tracked_wallet_update(address, action, is_active, id);
        }

        spdlog::info("Published wallet {} for {}", action, util::short_address(address));
        return reply(200, true, "Wallet " + action + " published: " + util::short_address(address));

    } catch (const json::exception& e) {
        return reply(400, false, std::string("Malformed request: ") + e.what());
    } catch (const TransportError& e) {
        return reply(503, false, e.what());
    }
}

AdminResponse AdminApi::update_settings(const std::string& body) {
    try {
        auto settings = json::parse(body).get<CopyTradeSettings>();
        settings.validate();

        publisher_->publish_settings_update(settings);
        spdlog::info("Published copy trade settings for tracked wallet {}", settings.tracked_wallet_id);
        return reply(200, true, "Settings published");

    } catch (const json::exception& e) {
        return reply(400, false, std::string("Malformed settings: ") + e.what());
    } catch (const ValidationError& e) {
        return reply(400, false, e.what());
    } catch (const TransportError& e) {
        return reply(503, false, e.what());
    }
}

AdminResponse AdminApi::delete_settings(const std::string& settings_id) {
    if (util::trim(settings_id).empty()) {
        return reply(400, false, "settings id is required");
    }

    try {
        publisher_->publish_settings_delete(settings_id);
        spdlog::info("Published settings delete for {}", settings_id);
        return reply(200, true, "Settings delete published");
    } catch (const TransportError& e) {
        return reply(503, false, e.what());
    }
}

AdminResponse AdminApi::update_sol_price(const std::string& body) {
    try {
        auto j = json::parse(body);

        SolPriceUpdate update;
        update.price_usd = j.at("price_usd").get<double>();
        if (update.price_usd <= 0.0) {
            return reply(400, false, "price_usd must be positive");
        }
        update.source = parse_price_source(j.value("source", "Pyth"));
        update.timestamp = util::current_timestamp_s();
        if (j.contains("confidence") && j["confidence"].is_number()) {
            update.confidence = j["confidence"].get<double>();
        }

        publisher_->publish_sol_price_update(update);
        return reply(200, true, "SOL price published");

    } catch (const json::exception& e) {
        return reply(400, false, std::string("Malformed request: ") + e.what());
    } catch (const DecodeError& e) {
        return reply(400, false, e.what());
    } catch (const TransportError& e) {
        return reply(503, false, e.what());
    }
}
