#pragma once

#include "chain_data.hpp"
#include "models.hpp"
#include <cstdint>
#include <string>
#include <vector>

// On-chain reserves may sit at most this fraction below the reported figures.
constexpr double BONDING_CURVE_MARGIN_OF_ERROR = 0.01;

constexpr int LAMPORTS_DECIMALS = 9;
constexpr int PUMPFUN_TOKEN_DECIMALS = 6;

// SPL token mint account (82 bytes)
struct MintAccount {
    uint64_t supply = 0;
    uint8_t decimals = 0;
    bool is_initialized = false;

    double ui_supply() const;
};

// Reads the virtual reserves at [8,16) and [16,24); throws DecodeError on short input.
BondingCurveReserves decode_bonding_curve_data(const std::vector<uint8_t>& data);

bool reserves_within_threshold(const BondingCurveReserves& on_chain,
                               const BondingCurveReserves& reported);

// Fetches and decodes the curve account. A mismatch against the reported
// reserves is logged; the on-chain values are returned either way.
BondingCurveReserves get_bonding_curve_info(ChainDataAccessor& chain,
                                            const std::string& bonding_curve_address,
                                            const BondingCurveReserves& reported);

MintAccount decode_mint_account(const std::vector<uint8_t>& data);

// SOL per token implied by the curve's virtual reserves.
double bonding_curve_price_sol(const BondingCurveReserves& reserves);
