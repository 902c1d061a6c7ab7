#include "account_decoder.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cmath>

namespace {

constexpr size_t BONDING_CURVE_MIN_LEN = 24;
constexpr size_t MINT_ACCOUNT_LEN = 82;
constexpr size_t MINT_SUPPLY_OFFSET = 36;
constexpr size_t MINT_DECIMALS_OFFSET = 44;
constexpr size_t MINT_INITIALIZED_OFFSET = 45;

uint64_t read_u64_le(const std::vector<uint8_t>& data, size_t offset) {
    uint64_t value = 0;
    for (size_t i = 0; i < 8; i++) {
        value |= static_cast<uint64_t>(data[offset + i]) << (8 * i);
    }
    return value;
}

} // namespace

double MintAccount::ui_supply() const {
    return static_cast<double>(supply) / std::pow(10.0, decimals);
}

BondingCurveReserves decode_bonding_curve_data(const std::vector<uint8_t>& data) {
    if (data.size() < BONDING_CURVE_MIN_LEN) {
        throw DecodeError(fmt::format(
            "Insufficient data to decode bonding curve info: {} bytes", data.size()));
    }

    BondingCurveReserves reserves;
    reserves.virtual_token_reserves = static_cast<int64_t>(read_u64_le(data, 8));
    reserves.virtual_sol_reserves = static_cast<int64_t>(read_u64_le(data, 16));

    spdlog::debug("Decoded bonding curve: token_reserves={}, sol_reserves={}",
                  reserves.virtual_token_reserves, reserves.virtual_sol_reserves);
    return reserves;
}

bool reserves_within_threshold(const BondingCurveReserves& on_chain,
                               const BondingCurveReserves& reported) {
    const double factor = 1.0 - BONDING_CURVE_MARGIN_OF_ERROR;
    return static_cast<double>(on_chain.virtual_sol_reserves) * factor
               < static_cast<double>(reported.virtual_sol_reserves)
        && static_cast<double>(on_chain.virtual_token_reserves) * factor
               < static_cast<double>(reported.virtual_token_reserves);
}

BondingCurveReserves get_bonding_curve_info(ChainDataAccessor& chain,
                                            const std::string& bonding_curve_address,
                                            const BondingCurveReserves& reported) {
    auto data = chain.get_account_data(bonding_curve_address);
    if (!data || data->empty()) {
        throw DecodeError(fmt::format(
            "Bonding curve account {} not found or empty", bonding_curve_address));
    }

    auto on_chain = decode_bonding_curve_data(*data);

    if (!reserves_within_threshold(on_chain, reported)) {
        spdlog::warn("Bonding curve {} differs from reported reserves: chain=({}, {}) reported=({}, {})",
                     bonding_curve_address,
                     on_chain.virtual_token_reserves, on_chain.virtual_sol_reserves,
                     reported.virtual_token_reserves, reported.virtual_sol_reserves);
    }

    return on_chain;
}

MintAccount decode_mint_account(const std::vector<uint8_t>& data) {
    if (data.size() < MINT_ACCOUNT_LEN) {
        throw DecodeError(fmt::format("Mint account too short: {} bytes", data.size()));
    }

    MintAccount mint;
    mint.supply = read_u64_le(data, MINT_SUPPLY_OFFSET);
    mint.decimals = data[MINT_DECIMALS_OFFSET];
    mint.is_initialized = data[MINT_INITIALIZED_OFFSET] != 0;

    if (!mint.is_initialized) {
        throw DecodeError("Mint account is not initialized");
    }
    return mint;
}

double bonding_curve_price_sol(const BondingCurveReserves& reserves) {
    if (reserves.virtual_token_reserves == 0) {
        return 0.0;
    }
    double sol = static_cast<double>(reserves.virtual_sol_reserves) / std::pow(10.0, LAMPORTS_DECIMALS);
    double tokens = static_cast<double>(reserves.virtual_token_reserves) / std::pow(10.0, PUMPFUN_TOKEN_DECIMALS);
    return sol / tokens;
}
