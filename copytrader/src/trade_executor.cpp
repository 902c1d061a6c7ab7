#include "trade_executor.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

RemoteTradeExecutor::RemoteTradeExecutor(const std::string& base_url, std::shared_ptr<HttpClient> http)
    : base_url_(base_url)
    , http_(std::move(http))
{
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

ExecutionResult RemoteTradeExecutor::submit(const std::string& path, const nlohmann::json& body,
                                            const std::string& token_address) {
    nlohmann::json response;
    try {
        response = http_->post_json(base_url_ + path, body);
    } catch (const TransportError& e) {
        throw ProcessingError(fmt::format("Execution request for {} failed: {}", token_address, e.what()));
    }

    if (!response.value("success", false)) {
        std::string error = response.contains("error") && response["error"].is_string()
            ? response["error"].get<std::string>() : "no error detail";
        throw ProcessingError(fmt::format("Execution rejected for {}: {}", token_address, error));
    }

    ExecutionResult result;
    result.signature = response.value("signature", "");
    result.token_quantity = response.value("token_quantity", 0.0);
    if (response.contains("sol_spent")) {
        result.sol_amount = response.value("sol_spent", 0.0);
    } else {
        result.sol_amount = response.value("sol_received", 0.0);
    }
    return result;
}

ExecutionResult RemoteTradeExecutor::buy(const std::string& token_address, double sol_quantity,
                                         double slippage_tolerance, DexType dex) {
    nlohmann::json body = {
        {"token_address", token_address},
        {"sol_quantity", sol_quantity},
        {"slippage_tolerance", slippage_tolerance},
        {"dex_type", to_string(dex)}
    };
    auto result = submit("/buy", body, token_address);
    spdlog::info("Bought {} for {} SOL ({})", token_address, sol_quantity, result.signature);
    return result;
}

ExecutionResult RemoteTradeExecutor::sell(const std::string& token_address, double token_quantity,
                                          double slippage_tolerance, DexType dex) {
    nlohmann::json body = {
        {"token_address", token_address},
        {"token_quantity", token_quantity},
        {"slippage_tolerance", slippage_tolerance},
        {"dex_type", to_string(dex)}
    };
    auto result = submit("/sell", body, token_address);
    spdlog::info("Sold {} {} ({})", token_quantity, token_address, result.signature);
    return result;
}
