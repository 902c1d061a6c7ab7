#pragma once

#include "connection_monitor.hpp"
#include "feed_monitor.hpp"
#include "message_pipeline.hpp"
#include "redis_relay.hpp"
#include "solana_rpc.hpp"
#include "store_pg.hpp"
#include <nlohmann/json.hpp>
#include <memory>

class HealthCheck {
public:
    HealthCheck(std::shared_ptr<RelayPublisher> relay,
                std::shared_ptr<WalletRepository> repo,
                std::shared_ptr<SolanaRPC> rpc,
                std::shared_ptr<ConnectionMonitor> connections,
                const MessagePipeline& pipeline,
                const FeedMonitor& feed);

    // Pings redis and postgres once each
    nlohmann::json get_status() const;
    // 200 when the status reports ok, 503 otherwise
    static int http_status(const nlohmann::json& status);

private:
    std::shared_ptr<RelayPublisher> relay_;
    std::shared_ptr<WalletRepository> repo_;
    std::shared_ptr<SolanaRPC> rpc_;
    std::shared_ptr<ConnectionMonitor> connections_;
    const MessagePipeline& pipeline_;
    const FeedMonitor& feed_;
};
