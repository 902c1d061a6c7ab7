#include "price_calculator.hpp"
#include "account_decoder.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

namespace {

double scale(uint64_t raw, uint8_t decimals) {
    return static_cast<double>(raw) / std::pow(10.0, decimals);
}

} // namespace

double PriceCalculator::calculate_price_from_raw_balances(uint64_t base_balance, uint64_t quote_balance,
                                                          uint8_t base_decimals, uint8_t quote_decimals) {
    if (base_balance == 0) {
        return 0.0;
    }
    return scale(quote_balance, quote_decimals) / scale(base_balance, base_decimals);
}

double PriceCalculator::calculate_liquidity_sol(uint64_t quote_balance, uint8_t quote_decimals) {
    return scale(quote_balance, quote_decimals) * 2.0;
}

double PriceCalculator::calculate_price_impact(uint64_t base_balance, uint64_t quote_balance,
                                               double trade_amount_sol,
                                               uint8_t base_decimals, uint8_t quote_decimals) {
    double current_price = calculate_price_from_raw_balances(
        base_balance, quote_balance, base_decimals, quote_decimals);
    if (current_price == 0.0) {
        return 0.0;
    }

    // Constant product: x * y = k
    double quote_amount = scale(quote_balance, quote_decimals);
    double new_quote_amount = quote_amount + trade_amount_sol;
    double new_base_balance = (static_cast<double>(base_balance) * quote_amount) / new_quote_amount;

    double new_price = calculate_price_from_raw_balances(
        static_cast<uint64_t>(new_base_balance),
        static_cast<uint64_t>(new_quote_amount * std::pow(10.0, quote_decimals)),
        base_decimals, quote_decimals);

    return std::abs((new_price - current_price) / current_price);
}

double PriceCalculator::calculate_market_cap(double price_sol, double sol_price_usd,
                                             const std::string& token_address,
                                             ChainDataAccessor& chain) {
    try {
        auto data = chain.get_account_data(token_address);
        if (!data) {
            spdlog::warn("Mint account {} not found, market cap unknown", token_address);
            return 0.0;
        }

        auto mint = decode_mint_account(*data);
        double total_supply = mint.ui_supply();
        double market_cap = total_supply * price_sol * sol_price_usd;

        spdlog::debug("Market cap for {}: supply={}, price_sol={}, sol_usd={}, mcap={}",
                      token_address, total_supply, price_sol, sol_price_usd, market_cap);
        return market_cap;

    } catch (const std::exception& e) {
        spdlog::warn("Failed to load mint account for {}: {}", token_address, e.what());
        return 0.0;
    }
}

void PriceCalculator::validate_price_data(double price_sol, uint64_t base_balance, uint64_t quote_balance) {
    if (price_sol < 0.0) {
        throw InvalidPriceError("Negative price");
    }
    if (price_sol > 1000.0) {
        throw InvalidPriceError("Unreasonably high price");
    }
    if (base_balance == 0 || quote_balance == 0) {
        throw InvalidPriceError("Zero balance detected");
    }
}

std::optional<double> PriceCalculator::calculate_vwap(const std::vector<VaultPriceUpdate>& updates) {
    if (updates.empty()) {
        return std::nullopt;
    }

    double total_liquidity = 0.0;
    double weighted_sum = 0.0;
    for (const auto& u : updates) {
        total_liquidity += u.liquidity_sol;
        weighted_sum += u.price_sol * u.liquidity_sol;
    }

    if (total_liquidity == 0.0) {
        return std::nullopt;
    }
    return weighted_sum / total_liquidity;
}

double PriceCalculator::calculate_price_change(double old_price, double new_price) {
    if (old_price == 0.0) {
        return 0.0;
    }
    return ((new_price - old_price) / old_price) * 100.0;
}

double PriceCalculator::get_optimal_trade_size(uint64_t quote_balance, double max_slippage_percent,
                                               uint8_t quote_decimals) {
    return scale(quote_balance, quote_decimals) * (max_slippage_percent / 100.0) * 0.5;
}

PriceUpdate PriceCalculator::convert_to_price_update(const VaultPriceUpdate& vault_update,
                                                     const std::string& pool_address,
                                                     double sol_price_usd,
                                                     ChainDataAccessor& chain) {
    PriceUpdate update;
    update.token_address = vault_update.token_address;
    update.price_sol = vault_update.price_sol;
    update.price_usd = vault_update.price_sol * sol_price_usd;
    update.market_cap = calculate_market_cap(vault_update.price_sol, sol_price_usd,
                                             vault_update.token_address, chain);
    update.timestamp = vault_update.timestamp;
    update.dex_type = DexType::Raydium;
    update.liquidity = vault_update.liquidity_sol;
    update.liquidity_usd = vault_update.liquidity_sol * sol_price_usd;
    update.pool_address = pool_address;
    return update;
}
