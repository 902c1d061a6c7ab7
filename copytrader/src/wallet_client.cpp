#include "wallet_client.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

WalletClient::WalletClient(const std::string& base_url, std::shared_ptr<HttpClient> http,
                           std::shared_ptr<ConnectionMonitor> monitor)
    : base_url_(base_url)
    , http_(std::move(http))
    , monitor_(std::move(monitor))
{
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

void WalletClient::report(ConnectionStatus status, const std::string& details) {
    if (!monitor_) return;
    if (monitor_->status(ConnectionType::WalletService) == status && details.empty()) return;
    monitor_->update_status(ConnectionType::WalletService, status,
                            details.empty() ? std::nullopt : std::optional<std::string>(details));
}

WalletInfo WalletClient::get_wallet_info() {
    try {
        auto response = http_->post_json(base_url_ + "/wallet/info", nlohmann::json::object());
        auto info = response.get<WalletInfo>();
        report(ConnectionStatus::Connected);
        spdlog::debug("Wallet {} balance={} SOL, {} token(s)", info.address, info.balance, info.tokens.size());
        return info;

    } catch (const nlohmann::json::exception& e) {
        throw TransportError(fmt::format("Malformed wallet info: {}", e.what()));
    } catch (const TransportError& e) {
        report(ConnectionStatus::Error, e.what());
        throw;
    }
}

void WalletClient::handle_trade_execution(const TradeExecutionRequest& request) {
    nlohmann::json response;
    try {
        response = http_->post_json(base_url_ + "/wallet/trade-execution", request);
    } catch (const TransportError& e) {
        report(ConnectionStatus::Error, e.what());
        throw;
    }

    if (!response.value("success", false)) {
        std::string error = response.contains("error") && response["error"].is_string()
            ? response["error"].get<std::string>() : "unknown error";
        throw ProcessingError(fmt::format("Wallet service rejected trade {}: {}", request.signature, error));
    }

    report(ConnectionStatus::Connected);
    spdlog::info("Wallet service recorded trade {}", request.signature);
}
