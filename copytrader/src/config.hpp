#pragma once

#include <string>
#include <vector>
#include <cstdlib>

struct Config {
    // Upstream trade feed
    std::string feed_ws_url;
    std::string feed_subscribe_method;
    int ws_health_check_interval_s;
    int ws_connect_timeout_s;
    int ws_initial_backoff_s;
    int ws_max_backoff_s;
    int ws_max_retries;

    // Solana RPC (comma separated, rotated on failure)
    std::vector<std::string> rpc_urls;
    int request_timeout_ms;

    // Collaborators
    std::string wallet_service_url;
    std::string execution_service_url;
    std::string server_wallet_address;

    // Redis relay
    std::string redis_url;

    // Postgres
    std::string pg_dsn;

    int event_bus_capacity;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};
