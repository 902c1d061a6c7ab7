#include "price_relay.hpp"
#include "account_decoder.hpp"
#include "price_calculator.hpp"
#include <spdlog/spdlog.h>

PriceRelay::PriceRelay(EventBus& bus, std::shared_ptr<ChainDataAccessor> chain,
                       std::shared_ptr<RelayPublisher> publisher, const SolPriceTracker& sol_price)
    : subscription_(bus.subscribe())
    , chain_(std::move(chain))
    , publisher_(std::move(publisher))
    , sol_price_(sol_price)
{
}

PriceRelay::~PriceRelay() {
    stop();
}

void PriceRelay::start() {
    stop_.reset();
    thread_ = std::thread([this] { run(); });
}

void PriceRelay::stop() {
    stop_.request_stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void PriceRelay::run() {
    while (!stop_.stop_requested()) {
        auto event = subscription_->recv(std::chrono::milliseconds(500));
        if (event) {
            handle_event(*event);
        }
    }
}

std::optional<PriceUpdate> PriceRelay::price_from_trade(const ObservedTrade& trade) {
    if (trade.dex_type != DexType::PumpFun || trade.bonding_curve_key.empty()) {
        return std::nullopt;
    }

    auto reserves = get_bonding_curve_info(*chain_, trade.bonding_curve_key, trade.reported_reserves);

    double price_sol = bonding_curve_price_sol(reserves);
    PriceCalculator::validate_price_data(price_sol,
                                         static_cast<uint64_t>(reserves.virtual_token_reserves),
                                         static_cast<uint64_t>(reserves.virtual_sol_reserves));

    double sol_usd = sol_price_.get();
    double liquidity_sol = static_cast<double>(reserves.virtual_sol_reserves) / 1e9;

    PriceUpdate update;
    update.token_address = trade.token_address;
    update.price_sol = price_sol;
    update.market_cap = PriceCalculator::calculate_market_cap(price_sol, sol_usd, trade.token_address, *chain_);
    update.timestamp = trade.timestamp;
    update.dex_type = DexType::PumpFun;
    update.liquidity = liquidity_sol;
    update.pool_address = trade.bonding_curve_key;
    if (sol_usd > 0.0) {
        update.price_usd = price_sol * sol_usd;
        update.liquidity_usd = liquidity_sol * sol_usd;
    }
    return update;
}

void PriceRelay::handle_event(const Event& event) {
    const auto* trade = std::get_if<TrackedWalletNotification>(&event);
    if (!trade) {
        return;
    }

    try {
        auto update = price_from_trade(trade->data);
        if (!update) {
            return;
        }
        publisher_->publish_price_update(*update);
        published_++;
        spdlog::debug("Published price {} SOL for {}", update->price_sol, update->token_address);
    } catch (const std::exception& e) {
        spdlog::error("Price relay failed for {} ({}): {}",
                      trade->data.token_address, trade->data.signature, e.what());
    }
}
