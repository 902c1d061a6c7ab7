#include "feed_parser.hpp"
#include "account_decoder.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <cmath>

using json = nlohmann::json;

namespace {

TransactionType parse_side(const std::string& tx_type) {
    if (tx_type == "buy") return TransactionType::Buy;
    if (tx_type == "sell") return TransactionType::Sell;
    if (tx_type == "transfer") return TransactionType::Transfer;
    return TransactionType::Unknown;
}

DexType parse_pool(const std::string& pool) {
    if (pool == "pump") return DexType::PumpFun;
    if (pool == "raydium") return DexType::Raydium;
    return DexType::Unknown;
}

int64_t to_raw(double ui_amount, int decimals) {
    return static_cast<int64_t>(std::llround(ui_amount * std::pow(10.0, decimals)));
}

} // namespace

std::optional<ObservedTrade> parse_feed_message(const std::string& text, double sol_price_usd) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        throw DecodeError(fmt::format("Feed frame is not JSON: {}", e.what()));
    }

    if (!j.is_object() || !j.contains("signature")) {
        if (j.is_object() && j.contains("errors")) {
            spdlog::warn("Feed notice: {}", j["errors"].dump());
        } else if (j.is_object() && j.contains("message")) {
            spdlog::debug("Feed notice: {}", j["message"].dump());
        }
        return std::nullopt;
    }

    try {
        ObservedTrade trade;
        trade.signature = j.at("signature").get<std::string>();
        trade.token_address = j.at("mint").get<std::string>();
        trade.token_name = j.value("name", "");
        trade.token_symbol = j.value("symbol", "");
        trade.token_image_uri = j.value("uri", "");
        trade.transaction_type = parse_side(j.at("txType").get<std::string>());
        trade.amount_token = j.at("tokenAmount").get<double>();
        trade.amount_sol = j.at("solAmount").get<double>();
        trade.price_per_token = trade.amount_token > 0.0 ? trade.amount_sol / trade.amount_token : 0.0;
        trade.market_cap = j.value("marketCapSol", 0.0);
        trade.usd_market_cap = trade.market_cap * sol_price_usd;
        trade.timestamp = j.value("timestamp", util::current_timestamp_s());
        trade.dex_type = parse_pool(j.value("pool", "pump"));

        const std::string trader = j.value("traderPublicKey", "");
        std::string counterparty = j.value("bondingCurveKey", "");
        if (counterparty.empty()) {
            counterparty = j.value("pool", "");
        }
        if (trade.transaction_type == TransactionType::Sell) {
            trade.seller = trader;
            trade.buyer = counterparty;
        } else {
            trade.buyer = trader;
            trade.seller = counterparty;
        }

        if (trade.dex_type == DexType::PumpFun) {
            trade.bonding_curve_key = j.value("bondingCurveKey", "");
            trade.reported_reserves.virtual_token_reserves =
                to_raw(j.value("vTokensInBondingCurve", 0.0), PUMPFUN_TOKEN_DECIMALS);
            trade.reported_reserves.virtual_sol_reserves =
                to_raw(j.value("vSolInBondingCurve", 0.0), LAMPORTS_DECIMALS);
        }

        return trade;

    } catch (const json::exception& e) {
        throw DecodeError(fmt::format("Malformed trade frame: {}", e.what()));
    }
}
