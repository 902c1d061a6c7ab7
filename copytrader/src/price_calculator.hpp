#pragma once

#include "chain_data.hpp"
#include "models.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Price derived from one pair of vault balances.
struct VaultPriceUpdate {
    std::string token_address;
    double price_sol = 0.0;
    double liquidity_sol = 0.0;
    int64_t timestamp = 0;
};

class PriceCalculator {
public:
    // SOL per token from raw vault balances; a zero base balance yields 0
    static double calculate_price_from_raw_balances(uint64_t base_balance, uint64_t quote_balance,
                                                    uint8_t base_decimals, uint8_t quote_decimals);

    // Symmetric pool approximation: twice the quote side
    static double calculate_liquidity_sol(uint64_t quote_balance, uint8_t quote_decimals);

    // Fractional price move caused by buying with trade_amount_sol (constant product, approximate)
    static double calculate_price_impact(uint64_t base_balance, uint64_t quote_balance,
                                         double trade_amount_sol,
                                         uint8_t base_decimals, uint8_t quote_decimals);

    // supply * price_sol * sol_price_usd; 0 when the mint cannot be fetched or parsed
    static double calculate_market_cap(double price_sol, double sol_price_usd,
                                       const std::string& token_address,
                                       ChainDataAccessor& chain);

    // Throws InvalidPriceError for negative, absurd or zero-balance data
    static void validate_price_data(double price_sol, uint64_t base_balance, uint64_t quote_balance);

    static std::optional<double> calculate_vwap(const std::vector<VaultPriceUpdate>& updates);

    static double calculate_price_change(double old_price, double new_price);

    static double get_optimal_trade_size(uint64_t quote_balance, double max_slippage_percent,
                                         uint8_t quote_decimals);

    static PriceUpdate convert_to_price_update(const VaultPriceUpdate& vault_update,
                                               const std::string& pool_address,
                                               double sol_price_usd,
                                               ChainDataAccessor& chain);
};
