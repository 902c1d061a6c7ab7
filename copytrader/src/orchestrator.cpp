#include "orchestrator.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <optional>

std::string to_string(CopyOutcome outcome) {
    switch (outcome) {
        case CopyOutcome::NoSettings: return "no_settings";
        case CopyOutcome::Disabled: return "disabled";
        case CopyOutcome::Skipped: return "skipped";
        case CopyOutcome::Executed: return "executed";
    }
    return "unknown";
}

CopyTradeOrchestrator::CopyTradeOrchestrator(EventBus& bus,
                                             std::shared_ptr<WalletService> wallet,
                                             std::shared_ptr<TradeExecutor> executor,
                                             std::shared_ptr<CopyTradePolicy> policy,
                                             std::string user_id)
    : bus_(bus)
    , wallet_(std::move(wallet))
    , executor_(std::move(executor))
    , policy_(std::move(policy))
    , user_id_(std::move(user_id))
{
}

CopyOutcome CopyTradeOrchestrator::handle_transaction(const ObservedTrade& trade,
                                                      const std::vector<CopyTradeSettings>& settings) {
    CopyOutcome outcome = CopyOutcome::NoSettings;
    std::optional<std::string> failure;

    // The first settings entry applies to every tracked wallet
    if (!settings.empty()) {
        const auto& active = settings.front();
        if (!active.is_enabled) {
            outcome = CopyOutcome::Disabled;
        } else {
            try {
                outcome = process_copy_trade(trade, active);
            } catch (const std::exception& e) {
                failure = e.what();
                spdlog::error("Copy trade failed for {} (token {}, settings {}): {}",
                              trade.signature, trade.token_address, active.tracked_wallet_id, e.what());
            }
        }
    }

    bus_.emit(make_transaction_logged(TransactionLog::from_trade(trade, user_id_)));
    bus_.emit(make_tracked_wallet_trade(trade));

    if (failure) {
        throw ProcessingError(fmt::format("Copy trade failed for {}: {}", trade.signature, *failure));
    }

    spdlog::debug("Handled {} {} of {}: {}", to_string(trade.transaction_type), trade.signature,
                  trade.token_address, to_string(outcome));
    return outcome;
}

CopyOutcome CopyTradeOrchestrator::process_copy_trade(const ObservedTrade& trade,
                                                      const CopyTradeSettings& settings) {
    WalletInfo wallet;
    try {
        wallet = wallet_->get_wallet_info();
    } catch (const std::exception& e) {
        throw ProcessingError(fmt::format("Failed to get wallet info: {}", e.what()));
    }

    auto decision = policy_->evaluate(trade, settings, wallet);
    if (!decision.should_copy) {
        spdlog::info("Not copying {} of {}: {}", to_string(trade.transaction_type),
                     trade.token_address, decision.reason);
        return CopyOutcome::Skipped;
    }

    ExecutionResult result;
    if (trade.transaction_type == TransactionType::Buy) {
        result = executor_->buy(trade.token_address, decision.quantity, settings.max_slippage, trade.dex_type);
    } else {
        result = executor_->sell(trade.token_address, decision.quantity, settings.max_slippage, trade.dex_type);
    }

    try {
        wallet_->handle_trade_execution(TradeExecutionRequest::from_trade(trade));
    } catch (const std::exception& e) {
        throw ProcessingError(fmt::format("Failed to update wallet after {}: {}", result.signature, e.what()));
    }

    spdlog::info("Copied {} of {} ({} -> {})", to_string(trade.transaction_type),
                 trade.token_address, trade.signature, result.signature);
    bus_.emit(make_copy_trade_executed(trade));
    return CopyOutcome::Executed;
}
