#include "redis_relay.hpp"
#include "errors.hpp"
#include "relay_codec.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

RedisTransport::RedisTransport(const std::string& redis_url) {
    redis_ = std::make_shared<sw::redis::Redis>(redis_url);
    spdlog::info("Relay publisher connected to Redis: {}", util::redact_url(redis_url));
}

void RedisTransport::publish(const std::string& channel, const std::string& message) {
    redis_->publish(channel, message);
}

bool RedisTransport::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const sw::redis::Error& e) {
        spdlog::debug("Redis ping failed: {}", e.what());
        return false;
    }
}

RelayPublisher::RelayPublisher(std::shared_ptr<RelayTransport> transport,
                               std::shared_ptr<ConnectionMonitor> monitor,
                               Sleeper sleeper)
    : transport_(std::move(transport))
    , monitor_(std::move(monitor))
    , sleeper_(std::move(sleeper))
{
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

void RelayPublisher::publish_with_retry(const char* channel, const std::string& message, const char* what) {
    int retries = 0;
    std::string errors;

    while (true) {
        try {
            transport_->publish(channel, message);
            if (retries > 0 && monitor_) {
                monitor_->update_status(ConnectionType::Redis, ConnectionStatus::Connected);
            }
            spdlog::debug("Published {} on {}", what, channel);
            return;

        } catch (const std::exception& e) {
            if (!errors.empty()) errors += "; ";
            errors += e.what();

            if (retries >= MAX_RETRIES) {
                auto msg = fmt::format("Failed to publish {} after {} retries: {}", what, MAX_RETRIES, errors);
                spdlog::error(msg);
                if (monitor_) {
                    monitor_->update_status(ConnectionType::Redis, ConnectionStatus::Error, msg);
                }
                throw TransportError(msg);
            }

            retries++;
            spdlog::warn("Publish of {} on {} failed (attempt {}/{}): {}",
                         what, channel, retries, MAX_RETRIES, e.what());
            if (monitor_) {
                monitor_->update_status(ConnectionType::Redis, ConnectionStatus::Reconnecting, std::string(e.what()));
            }
            sleeper_(RECONNECT_DELAY);
        }
    }
}

void RelayPublisher::publish_settings_update(const CopyTradeSettings& settings) {
    publish_with_retry(relay::SETTINGS_CHANNEL, relay::encode_settings(settings), "settings update");
}

void RelayPublisher::publish_settings_delete(const std::string& settings_id) {
    publish_with_retry(relay::SETTINGS_CHANNEL, relay::encode_settings_delete(settings_id), "settings delete");
}

void RelayPublisher::publish_tracked_wallet_update(const std::string& wallet_address, const std::string& action,
                                                   bool is_active, const std::optional<std::string>& id) {
    publish_with_retry(relay::TRACKED_WALLETS_CHANNEL,
                       relay::encode_tracked_wallet_update(wallet_address, action, is_active, id),
                       "wallet update");
}

void RelayPublisher::publish_wallet_address_update(const std::string& wallet_address, const std::string& action) {
    publish_with_retry(relay::TRACKED_WALLETS_CHANNEL,
                       relay::encode_wallet_address_update(wallet_address, action),
                       "wallet address update");
}

void RelayPublisher::publish_price_update(const PriceUpdate& update) {
    publish_with_retry(relay::PRICE_UPDATES_CHANNEL, relay::encode_price_update(update), "price update");
}

void RelayPublisher::publish_sol_price_update(const SolPriceUpdate& update) {
    publish_with_retry(relay::SOL_PRICE_UPDATES_CHANNEL, relay::encode_sol_price_update(update), "SOL price update");
}

bool RelayPublisher::is_healthy() {
    return transport_->ping();
}

RelaySubscriber::RelaySubscriber(const std::string& redis_url, EventBus& bus,
                                 std::shared_ptr<ConnectionMonitor> monitor)
    : redis_url_(redis_url)
    , bus_(bus)
    , monitor_(std::move(monitor))
{
}

RelaySubscriber::~RelaySubscriber() {
    stop();
}

void RelaySubscriber::start() {
    sw::redis::ConnectionOptions opts(redis_url_);
    // consume() wakes up at least once a second to observe stop requests
    opts.socket_timeout = std::chrono::milliseconds(1000);
    redis_ = std::make_shared<sw::redis::Redis>(opts);

    stop_.reset();
    consume_thread_ = std::thread([this] { consume_loop(); });
    keep_alive_thread_ = std::thread([this] { keep_alive_loop(); });
    spdlog::info("Relay subscriber started on {}", util::redact_url(redis_url_));
}

void RelaySubscriber::stop() {
    stop_.request_stop();
    if (consume_thread_.joinable()) {
        consume_thread_.join();
    }
    if (keep_alive_thread_.joinable()) {
        keep_alive_thread_.join();
    }
}

bool RelaySubscriber::handle_message(const std::string& channel, const std::string& payload) {
    received_++;
    try {
        auto event = relay::decode_message(channel, payload);
        if (!event) {
            return false;
        }
        bus_.emit(*event);
        return true;

    } catch (const std::exception& e) {
        dropped_++;
        spdlog::error("Dropping relay message on {}: {}", channel, e.what());
        return false;
    }
}

sw::redis::Subscriber RelaySubscriber::make_subscriber() {
    auto sub = redis_->subscriber();

    sub.on_message([this](std::string channel, std::string msg) {
        handle_message(channel, msg);
    });

    sub.on_meta([](sw::redis::Subscriber::MsgType type, sw::redis::OptionalString channel, long long num) {
        if (type == sw::redis::Subscriber::MsgType::SUBSCRIBE && channel) {
            spdlog::debug("Subscribed to {} ({} active)", *channel, num);
        }
    });

    sub.subscribe({relay::SETTINGS_CHANNEL,
                   relay::TRACKED_WALLETS_CHANNEL,
                   relay::PRICE_UPDATES_CHANNEL,
                   relay::SOL_PRICE_UPDATES_CHANNEL});
    return sub;
}

void RelaySubscriber::consume_loop() {
    while (!stop_.stop_requested()) {
        try {
            auto sub = make_subscriber();
            if (monitor_) {
                monitor_->update_status(ConnectionType::Redis, ConnectionStatus::Connected);
            }

            while (!stop_.stop_requested()) {
                try {
                    sub.consume();
                } catch (const sw::redis::TimeoutError&) {
                    continue;
                }
            }

        } catch (const std::exception& e) {
            spdlog::error("Relay subscription failed: {}", e.what());
            if (monitor_) {
                monitor_->update_status(ConnectionType::Redis, ConnectionStatus::Error, std::string(e.what()));
            }
            if (stop_.wait_for(RESUBSCRIBE_DELAY)) {
                break;
            }
            spdlog::info("Resubscribing to relay channels");
        }
    }
    spdlog::info("Relay subscriber loop ended");
}

// Pings the server over the pooled client, not the subscription socket
// (redis++ Subscriber has no PING). A dead subscription shows up as a
// consume() error instead.
void RelaySubscriber::keep_alive_loop() {
    keep_alive_running_ = true;
    while (!stop_.wait_for(KEEP_ALIVE_INTERVAL)) {
        try {
            redis_->ping();
        } catch (const std::exception& e) {
            // Exits without resubscribing; the consume loop owns recovery
            spdlog::error("Relay keep-alive failed, stopping keep-alive: {}", e.what());
            break;
        }
    }
    keep_alive_running_ = false;
}
