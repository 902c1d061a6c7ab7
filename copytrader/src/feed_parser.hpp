#pragma once

#include "models.hpp"
#include <optional>
#include <string>

// Turns one upstream text frame into an observed trade.
//
// Trade frames carry signature, mint, traderPublicKey, txType, tokenAmount,
// solAmount and marketCapSol, plus optional name/symbol/uri, pool,
// bondingCurveKey, vTokensInBondingCurve, vSolInBondingCurve and timestamp.
// Frames without a signature are acknowledgements or notices and yield
// nullopt. Throws DecodeError on malformed JSON or missing trade fields.
std::optional<ObservedTrade> parse_feed_message(const std::string& text, double sol_price_usd);
