#pragma once

#include "copy_policy.hpp"
#include "event_bus.hpp"
#include "models.hpp"
#include "trade_executor.hpp"
#include "wallet_client.hpp"
#include <memory>
#include <string>
#include <vector>

enum class CopyOutcome { NoSettings, Disabled, Skipped, Executed };

std::string to_string(CopyOutcome outcome);

// Decides whether to replicate one observed trade and carries it out.
// Every handled trade yields exactly one transaction-logged and one
// tracked-wallet-trade event, whatever happens to the copy.
class CopyTradeOrchestrator {
public:
    CopyTradeOrchestrator(EventBus& bus,
                          std::shared_ptr<WalletService> wallet,
                          std::shared_ptr<TradeExecutor> executor,
                          std::shared_ptr<CopyTradePolicy> policy,
                          std::string user_id);

    // Throws ProcessingError when an eligible copy trade failed; the log and
    // notification have already been emitted by then.
    CopyOutcome handle_transaction(const ObservedTrade& trade,
                                   const std::vector<CopyTradeSettings>& settings);

private:
    CopyOutcome process_copy_trade(const ObservedTrade& trade, const CopyTradeSettings& settings);

    EventBus& bus_;
    std::shared_ptr<WalletService> wallet_;
    std::shared_ptr<TradeExecutor> executor_;
    std::shared_ptr<CopyTradePolicy> policy_;
    std::string user_id_;
};
