#pragma once

#include "http_client.hpp"
#include "models.hpp"
#include <memory>
#include <string>

struct ExecutionResult {
    std::string signature;
    double token_quantity = 0.0;
    double sol_amount = 0.0;
};

// Venue-specific swap construction and signing live behind this adapter.
class TradeExecutor {
public:
    virtual ~TradeExecutor() = default;
    // Throws ProcessingError when the trade was not executed
    virtual ExecutionResult buy(const std::string& token_address, double sol_quantity,
                                double slippage_tolerance, DexType dex) = 0;
    virtual ExecutionResult sell(const std::string& token_address, double token_quantity,
                                 double slippage_tolerance, DexType dex) = 0;
};

class RemoteTradeExecutor : public TradeExecutor {
public:
    RemoteTradeExecutor(const std::string& base_url, std::shared_ptr<HttpClient> http);

    ExecutionResult buy(const std::string& token_address, double sol_quantity,
                        double slippage_tolerance, DexType dex) override;
    ExecutionResult sell(const std::string& token_address, double token_quantity,
                         double slippage_tolerance, DexType dex) override;

private:
    ExecutionResult submit(const std::string& path, const nlohmann::json& body,
                           const std::string& token_address);

    std::string base_url_;
    std::shared_ptr<HttpClient> http_;
};
