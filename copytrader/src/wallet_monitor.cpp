#include "wallet_monitor.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

WalletMonitor::WalletMonitor(std::shared_ptr<WalletRepository> repo,
                             EventBus& bus,
                             TrackedWalletStore& wallets,
                             CopySettingsStore& settings,
                             SolPriceTracker& sol_price,
                             MessagePipeline& pipeline,
                             FeedMonitor& feed,
                             StopToken& stop,
                             std::string user_id)
    : repo_(std::move(repo))
    , subscription_(bus.subscribe())
    , wallets_(wallets)
    , settings_(settings)
    , sol_price_(sol_price)
    , pipeline_(pipeline)
    , feed_(feed)
    , stop_(stop)
    , user_id_(std::move(user_id))
{
}

WalletMonitor::~WalletMonitor() {
    stop();
}

void WalletMonitor::initialize() {
    try {
        if (!repo_->user_exists(user_id_)) {
            spdlog::info("Server user {} not found, creating it", util::short_address(user_id_));
            repo_->create_user(user_id_);
        }

        auto wallets = repo_->get_tracked_wallets(user_id_);
        auto settings = repo_->get_copy_trade_settings(user_id_);

        spdlog::info("Loaded {} tracked wallets and {} copy trade settings",
                     wallets.size(), settings.size());

        wallets_.replace(std::move(wallets));
        settings_.replace(std::move(settings));

    } catch (const std::exception& e) {
        throw InitializationError(std::string("Failed to initialize wallet monitor: ") + e.what());
    }
}

void WalletMonitor::start() {
    if (started_.exchange(true)) {
        return;
    }

    pipeline_thread_ = std::thread([this] {
        try {
            pipeline_.run();
        } catch (const std::exception& e) {
            spdlog::error("Message processor exited: {}", e.what());
        }
        pipeline_finished_ = true;
    });

    feed_thread_ = std::thread([this] {
        try {
            feed_.run();
        } catch (const std::exception& e) {
            spdlog::error("Feed monitor exited: {}", e.what());
        }
        feed_finished_ = true;
    });

    event_thread_ = std::thread([this] { event_loop(); });

    spdlog::info("Wallet monitor started");
}

void WalletMonitor::stop() {
    if (!started_.exchange(false)) {
        return;
    }

    spdlog::info("Stopping wallet monitor...");
    stop_.request_stop();

    // Lets the pipeline finish the trade it is working on
    std::this_thread::sleep_for(DRAIN_PAUSE);

    if (pipeline_thread_.joinable()) pipeline_thread_.join();
    if (feed_thread_.joinable()) feed_thread_.join();
    if (event_thread_.joinable()) event_thread_.join();

    spdlog::info("Wallet monitor stopped");
}

bool WalletMonitor::tasks_alive() const {
    return !pipeline_finished_ && !feed_finished_;
}

void WalletMonitor::event_loop() {
    while (!stop_.stop_requested()) {
        auto event = subscription_->recv(EVENT_WAIT);
        if (event) {
            handle_event(*event);
        }
    }
}

void WalletMonitor::handle_event(const Event& event) {
    if (const auto* n = std::get_if<SettingsUpdateNotification>(&event)) {
        settings_.upsert(n->data);
        spdlog::info("Copy trade settings updated for tracked wallet {}", n->data.tracked_wallet_id);

    } else if (const auto* n = std::get_if<WalletStateNotification>(&event)) {
        wallets_.apply(n->data);
        spdlog::info("Tracked wallet {} {}", util::short_address(n->data.wallet_address),
                     to_string(n->data.change_type));

    } else if (const auto* n = std::get_if<TransactionLoggedNotification>(&event)) {
        try {
            repo_->insert_transaction_log(n->data);
            logs_persisted_++;
        } catch (const std::exception& e) {
            spdlog::error("Failed to persist transaction log {}: {}", n->data.signature, e.what());
        }

    } else if (const auto* n = std::get_if<SolPriceUpdateNotification>(&event)) {
        sol_price_.update(n->data.price_usd);
        spdlog::debug("SOL price updated: ${:.2f}", n->data.price_usd);
    }
}
