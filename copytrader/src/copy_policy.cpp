#include "copy_policy.hpp"
#include <fmt/format.h>
#include <algorithm>

CopyDecision RuleBasedCopyPolicy::evaluate(const ObservedTrade& trade, const CopyTradeSettings& settings,
                                           const WalletInfo& wallet) const {
    if (trade.transaction_type != TransactionType::Buy && trade.transaction_type != TransactionType::Sell) {
        return CopyDecision::skip(fmt::format("{} trades are not copied", to_string(trade.transaction_type)));
    }

    if (settings.max_slippage < 0.0 || settings.max_slippage > 100.0) {
        return CopyDecision::skip(fmt::format("slippage {} outside [0, 100]", settings.max_slippage));
    }

    if (!settings.allows_token(trade.token_address)) {
        return CopyDecision::skip(fmt::format("token {} not in allow-list", trade.token_address));
    }

    if (trade.transaction_type == TransactionType::Buy) {
        return evaluate_buy(trade, settings, wallet);
    }
    return evaluate_sell(trade, settings, wallet);
}

CopyDecision RuleBasedCopyPolicy::evaluate_buy(const ObservedTrade& trade, const CopyTradeSettings& settings,
                                               const WalletInfo& wallet) const {
    if (wallet.balance - settings.trade_amount_sol < settings.min_sol_balance) {
        return CopyDecision::skip(fmt::format("balance {} SOL would drop below minimum {} SOL",
                                              wallet.balance, settings.min_sol_balance));
    }

    const TokenHolding* held = wallet.find_token(trade.token_address);
    bool holding = held && held->balance_amount() > 0.0;

    if (holding && !settings.allow_additional_buys) {
        return CopyDecision::skip("additional buys disabled for held token");
    }

    if (!holding && wallet.open_positions() >= settings.max_open_positions) {
        return CopyDecision::skip(fmt::format("open position cap {} reached", settings.max_open_positions));
    }

    return CopyDecision::copy(settings.trade_amount_sol);
}

CopyDecision RuleBasedCopyPolicy::evaluate_sell(const ObservedTrade& trade, const CopyTradeSettings& settings,
                                                const WalletInfo& wallet) const {
    const TokenHolding* held = wallet.find_token(trade.token_address);
    double held_amount = held ? held->balance_amount() : 0.0;

    if (held_amount <= 0.0) {
        return CopyDecision::skip(fmt::format("no position in {}", trade.token_address));
    }

    if (settings.match_sell_percentage) {
        return CopyDecision::copy(std::min(held_amount, trade.amount_token));
    }
    return CopyDecision::copy(held_amount);
}
