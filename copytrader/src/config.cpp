#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.feed_ws_url = get_env("FEED_WS_URL");
    cfg.feed_subscribe_method = get_env("FEED_SUBSCRIBE_METHOD", "subscribeAccountTrade");
    cfg.ws_health_check_interval_s = get_env_int("WS_HEALTH_CHECK_INTERVAL_S", 30);
    cfg.ws_connect_timeout_s = get_env_int("WS_CONNECT_TIMEOUT_S", 5);
    cfg.ws_initial_backoff_s = get_env_int("WS_INITIAL_BACKOFF_S", 1);
    cfg.ws_max_backoff_s = get_env_int("WS_MAX_BACKOFF_S", 60);
    cfg.ws_max_retries = get_env_int("WS_MAX_RETRIES", 3);

    cfg.rpc_urls = util::split(get_env("SOLANA_RPC_HTTP_URL", "https://api.mainnet-beta.solana.com"), ',');
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 8000);

    cfg.wallet_service_url = get_env("WALLET_SERVICE_URL");
    cfg.execution_service_url = get_env("EXECUTION_SERVICE_URL");
    cfg.server_wallet_address = get_env("SERVER_WALLET_ADDRESS");

    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.pg_dsn = get_env("PG_DSN");

    cfg.event_bus_capacity = get_env_int("EVENT_BUS_CAPACITY", 100);

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);

    cfg.service_name = get_env("SERVICE_NAME", "copytrader");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (feed_ws_url.empty()) {
        throw std::runtime_error("FEED_WS_URL is required");
    }
    if (pg_dsn.empty()) {
        throw std::runtime_error("PG_DSN is required");
    }
    if (wallet_service_url.empty()) {
        throw std::runtime_error("WALLET_SERVICE_URL is required");
    }
    if (execution_service_url.empty()) {
        throw std::runtime_error("EXECUTION_SERVICE_URL is required");
    }
    if (!util::is_valid_solana_address(server_wallet_address)) {
        throw std::runtime_error("SERVER_WALLET_ADDRESS is missing or not a valid Solana address");
    }
    if (rpc_urls.empty()) {
        throw std::runtime_error("SOLANA_RPC_HTTP_URL is required");
    }
    if (event_bus_capacity <= 0) {
        throw std::runtime_error("EVENT_BUS_CAPACITY must be positive");
    }
    if (ws_initial_backoff_s <= 0 || ws_max_backoff_s < ws_initial_backoff_s) {
        throw std::runtime_error("WS backoff bounds are invalid");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Feed: {}", util::redact_url(feed_ws_url));
    spdlog::info("  RPC endpoints: {}", rpc_urls.size());
    spdlog::info("  WS backoff: {}s..{}s, retries={}", ws_initial_backoff_s, ws_max_backoff_s, ws_max_retries);
}
