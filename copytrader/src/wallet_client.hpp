#pragma once

#include "connection_monitor.hpp"
#include "http_client.hpp"
#include "models.hpp"
#include <memory>
#include <string>

// Custodial wallet service that holds the server wallet's balances.
class WalletService {
public:
    virtual ~WalletService() = default;
    virtual WalletInfo get_wallet_info() = 0;
    // Records a completed copy trade; throws on rejection
    virtual void handle_trade_execution(const TradeExecutionRequest& request) = 0;
};

class WalletClient : public WalletService {
public:
    WalletClient(const std::string& base_url, std::shared_ptr<HttpClient> http,
                 std::shared_ptr<ConnectionMonitor> monitor = nullptr);

    WalletInfo get_wallet_info() override;
    void handle_trade_execution(const TradeExecutionRequest& request) override;

private:
    std::string base_url_;
    std::shared_ptr<HttpClient> http_;
    std::shared_ptr<ConnectionMonitor> monitor_;

    void report(ConnectionStatus status, const std::string& details = "");
};
