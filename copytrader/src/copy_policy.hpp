#pragma once

#include "models.hpp"
#include <string>

struct CopyDecision {
    bool should_copy = false;
    std::string reason;
    // Buy: SOL to spend. Sell: tokens to sell.
    double quantity = 0.0;

    static CopyDecision skip(std::string why) { return {false, std::move(why), 0.0}; }
    static CopyDecision copy(double quantity) { return {true, "eligible", quantity}; }
};

class CopyTradePolicy {
public:
    virtual ~CopyTradePolicy() = default;
    virtual CopyDecision evaluate(const ObservedTrade& trade, const CopyTradeSettings& settings,
                                  const WalletInfo& wallet) const = 0;
};

// Slippage ceiling, token allow-list, minimum balance, open-position cap
// and sell-size matching.
class RuleBasedCopyPolicy : public CopyTradePolicy {
public:
    CopyDecision evaluate(const ObservedTrade& trade, const CopyTradeSettings& settings,
                          const WalletInfo& wallet) const override;

private:
    CopyDecision evaluate_buy(const ObservedTrade& trade, const CopyTradeSettings& settings,
                              const WalletInfo& wallet) const;
    CopyDecision evaluate_sell(const ObservedTrade& trade, const CopyTradeSettings& settings,
                               const WalletInfo& wallet) const;
};
