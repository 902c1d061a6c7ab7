#pragma once

#include "redis_relay.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

struct AdminResponse {
    int status = 200;
    nlohmann::json body;
};

// Operator endpoints that push wallet, settings and SOL price changes onto
// the relay so every running instance picks them up.
class AdminApi {
public:
    explicit AdminApi(std::shared_ptr<RelayPublisher> publisher);

    // {"wallet_address", "action"?, "is_active"?, "id"?}; action defaults to "add"
    AdminResponse update_tracked_wallet(const std::string& body);
    AdminResponse update_settings(const std::string& body);
    AdminResponse delete_settings(const std::string& settings_id);
    // {"price_usd", "source"?, "confidence"?}
    AdminResponse update_sol_price(const std::string& body);

private:
    static AdminResponse reply(int status, bool ok, const std::string& message);

    std::shared_ptr<RelayPublisher> publisher_;
};
