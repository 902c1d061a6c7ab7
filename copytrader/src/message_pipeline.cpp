#include "message_pipeline.hpp"
#include <spdlog/spdlog.h>

MessagePipeline::MessagePipeline(BlockingQueue<ObservedTrade>& queue,
                                 CopyTradeOrchestrator& orchestrator,
                                 const CopySettingsStore& settings,
                                 const StopToken& stop)
    : queue_(queue)
    , orchestrator_(orchestrator)
    , settings_(settings)
    , stop_(stop)
{
}

void MessagePipeline::run() {
    spdlog::info("Message processor started");
    while (!stop_.stop_requested()) {
        process_next();
    }
    spdlog::info("Message processor stopped ({} processed, {} failed)", processed_.load(), failed_.load());
}

bool MessagePipeline::process_next(std::chrono::milliseconds idle_tick) {
    auto trade = queue_.pop_for(idle_tick);
    if (!trade) {
        return false;
    }

    try {
        orchestrator_.handle_transaction(*trade, settings_.snapshot());
        processed_++;
    } catch (const std::exception& e) {
        failed_++;
        spdlog::error("Error processing transaction {} ({}): {}",
                      trade->signature, trade->token_address, e.what());
    }
    return true;
}
