#include "health.hpp"

HealthCheck::HealthCheck(std::shared_ptr<RelayPublisher> relay,
                         std::shared_ptr<WalletRepository> repo,
                         std::shared_ptr<SolanaRPC> rpc,
                         std::shared_ptr<ConnectionMonitor> connections,
                         const MessagePipeline& pipeline,
                         const FeedMonitor& feed)
    : relay_(relay), repo_(repo), rpc_(rpc), connections_(connections),
      pipeline_(pipeline), feed_(feed) {}

nlohmann::json HealthCheck::get_status() const {
    bool redis_ok = relay_->is_healthy();
    bool pg_ok = repo_->ping();

    nlohmann::json status = {
        {"ok", redis_ok && pg_ok},
        {"redis", redis_ok},
        {"postgres", pg_ok},
        {"connections", connections_->to_json()},
        {"pipeline", {
            {"processed", pipeline_.processed()},
            {"failed", pipeline_.failed()},
            {"queued", pipeline_.queued()}
        }},
        {"feed", {
            {"frames_received", feed_.frames_received()},
            {"trades_queued", feed_.trades_queued()},
            {"decode_errors", feed_.decode_errors()}
        }}
    };

    if (rpc_) {
        status["rpc"] = rpc_->is_healthy() ? "up" : "degraded";
    }

    return status;
}

int HealthCheck::http_status(const nlohmann::json& status) {
    return status.value("ok", false) ? 200 : 503;
}
