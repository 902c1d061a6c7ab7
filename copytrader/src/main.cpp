#include "admin_api.hpp"
#include "blocking_queue.hpp"
#include "config.hpp"
#include "connection_monitor.hpp"
#include "copy_policy.hpp"
#include "event_bus.hpp"
#include "feed_monitor.hpp"
#include "feed_parser.hpp"
#include "health.hpp"
#include "http_client.hpp"
#include "message_pipeline.hpp"
#include "orchestrator.hpp"
#include "price_relay.hpp"
#include "redis_relay.hpp"
#include "solana_rpc.hpp"
#include "stop_token.hpp"
#include "store_pg.hpp"
#include "trade_executor.hpp"
#include "wallet_client.hpp"
#include "wallet_monitor.hpp"
#include "wallet_state.hpp"
#include "ws_connection.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("copytrader", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void send_admin_response(httplib::Response& res, const AdminResponse& response) {
    res.status = response.status;
    res.set_content(response.body.dump(), "application/json");
}

int main(int argc, char* argv[]) {
    try {
        auto config = std::make_shared<Config>(Config::from_env());
        setup_logging(config->log_level);

        spdlog::info("==============================================");
        spdlog::info("Copy Trader Service v1.0");
        spdlog::info("==============================================");

        config->validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        // Shared state
        EventBus bus(static_cast<size_t>(config->event_bus_capacity));
        auto connections = std::make_shared<ConnectionMonitor>(bus);
        TrackedWalletStore wallets;
        CopySettingsStore settings;
        SolPriceTracker sol_price;
        BlockingQueue<ObservedTrade> trade_queue;
        StopToken stop;

        // External collaborators
        auto pg = std::make_shared<PostgresStore>(config->pg_dsn);
        pg->init_schema();

        auto rpc = std::make_shared<SolanaRPC>(
            config->rpc_urls, std::make_shared<HttpClient>(config->request_timeout_ms));
        auto wallet_client = std::make_shared<WalletClient>(
            config->wallet_service_url, std::make_shared<HttpClient>(config->request_timeout_ms), connections);
        auto executor = std::make_shared<RemoteTradeExecutor>(
            config->execution_service_url, std::make_shared<HttpClient>(config->request_timeout_ms));

        auto publisher = std::make_shared<RelayPublisher>(
            std::make_shared<RedisTransport>(config->redis_url), connections);
        RelaySubscriber subscriber(config->redis_url, bus, connections);

        // Copy trading core
        CopyTradeOrchestrator orchestrator(bus, wallet_client, executor,
                                           std::make_shared<RuleBasedCopyPolicy>(),
                                           config->server_wallet_address);
        MessagePipeline pipeline(trade_queue, orchestrator, settings, stop);

        WebSocketConfig ws_config;
        ws_config.health_check_interval = std::chrono::seconds(config->ws_health_check_interval_s);
        ws_config.connection_timeout = std::chrono::seconds(config->ws_connect_timeout_s);
        ws_config.initial_backoff = std::chrono::seconds(config->ws_initial_backoff_s);
        ws_config.max_backoff = std::chrono::seconds(config->ws_max_backoff_s);
        ws_config.max_retries = config->ws_max_retries;
        ws_config.subscribe_method = config->feed_subscribe_method;

        WebSocketConnectionManager feed_connection(config->feed_ws_url, ws_config, stop, connections);
        FeedMonitor feed(feed_connection, wallets, trade_queue, stop,
                         [&sol_price](const std::string& text) {
                             return parse_feed_message(text, sol_price.get());
                         });

        PriceRelay price_relay(bus, rpc, publisher, sol_price);
        WalletMonitor monitor(pg, bus, wallets, settings, sol_price, pipeline, feed, stop,
                              config->server_wallet_address);
        monitor.initialize();

        auto health = std::make_shared<HealthCheck>(publisher, pg, rpc, connections, pipeline, feed);
        auto admin = std::make_shared<AdminApi>(publisher);

        // Start HTTP health and admin server
        httplib::Server server;

        server.Get("/health", [health](const httplib::Request&, httplib::Response& res) {
            auto status = health->get_status();
            res.set_content(status.dump(), "application/json");
            res.status = HealthCheck::http_status(status);
        });

        server.Post("/wallets", [admin](const httplib::Request& req, httplib::Response& res) {
            send_admin_response(res, admin->update_tracked_wallet(req.body));
        });

        server.Post("/settings", [admin](const httplib::Request& req, httplib::Response& res) {
            send_admin_response(res, admin->update_settings(req.body));
        });

        server.Delete(R"(/settings/([^/]+))", [admin](const httplib::Request& req, httplib::Response& res) {
            send_admin_response(res, admin->delete_settings(req.matches[1]));
        });

        server.Post("/prices/sol", [admin](const httplib::Request& req, httplib::Response& res) {
            send_admin_response(res, admin->update_sol_price(req.body));
        });

        std::thread http_thread([&server, config]() {
            spdlog::info("Starting HTTP server on {}:{}", config->listen_addr, config->listen_port);
            server.listen(config->listen_addr.c_str(), config->listen_port);
        });

        subscriber.start();
        price_relay.start();
        monitor.start();

        spdlog::info("Copy trader started for server wallet {}", config->server_wallet_address);

        // Main loop
        int exit_code = 0;
        while (!shutdown_requested) {
            if (!monitor.tasks_alive()) {
                spdlog::error("A monitoring task exited unexpectedly, shutting down");
                exit_code = 1;
                break;
            }
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        // Shutdown
        spdlog::info("Stopping services...");
        monitor.stop();
        price_relay.stop();
        subscriber.stop();
        server.stop();

        if (http_thread.joinable()) http_thread.join();

        spdlog::info("Shutdown complete");
        return exit_code;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
