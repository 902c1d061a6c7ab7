#pragma once

#include "backoff.hpp"
#include "connection_monitor.hpp"
#include "stop_token.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

enum class ConnectionState { Disconnected, Connecting, Connected, Subscribed, Closing };

std::string to_string(ConnectionState state);

struct FeedFrame {
    enum class Kind { None, Text, Close, Error };

    Kind kind = Kind::None;
    std::string payload;

    static FeedFrame none() { return {Kind::None, {}}; }
    static FeedFrame text(std::string p) { return {Kind::Text, std::move(p)}; }
    static FeedFrame close(std::string reason) { return {Kind::Close, std::move(reason)}; }
    static FeedFrame error(std::string what) { return {Kind::Error, std::move(what)}; }
};

// One streaming connection to the upstream trade feed.
class FeedConnection {
public:
    virtual ~FeedConnection() = default;

    // No-op while Connected or Subscribed. Throws TransportError once the
    // configured attempts are exhausted.
    virtual void ensure_connection() = 0;
    virtual void subscribe(const std::vector<std::string>& addresses) = 0;
    // Kind::None when nothing arrived within `wait`
    virtual FeedFrame receive_message(std::chrono::milliseconds wait) = 0;
    // Drops the current session; the next ensure_connection reconnects
    virtual void close() = 0;
    // Terminal; errors are logged, never thrown
    virtual void shutdown() = 0;
    virtual ConnectionState state() const = 0;
};

struct WebSocketConfig {
    std::chrono::seconds health_check_interval{30};
    std::chrono::seconds connection_timeout{5};
    std::chrono::seconds initial_backoff{1};
    std::chrono::seconds max_backoff{60};
    int max_retries = 3;
    std::string subscribe_method = "subscribeAccountTrade";
};

struct WsEndpoint {
    bool secure = false;
    std::string host;
    std::string port;
    std::string target;
};

// ws://host[:port][/path] or wss://...; throws ValidationError otherwise
WsEndpoint parse_ws_url(const std::string& url);

std::string build_subscribe_message(const std::string& method, const std::vector<std::string>& addresses);

class WebSocketConnectionManager : public FeedConnection {
public:
    WebSocketConnectionManager(const std::string& url, WebSocketConfig config,
                               const StopToken& stop, std::shared_ptr<ConnectionMonitor> monitor);
    ~WebSocketConnectionManager() override;

    void ensure_connection() override;
    void subscribe(const std::vector<std::string>& addresses) override;
    FeedFrame receive_message(std::chrono::milliseconds wait) override;
    void close() override;
    void shutdown() override;
    ConnectionState state() const override { return state_.load(); }

    class Session;

private:
    void connect_once();
    void teardown(bool graceful);
    void set_state(ConnectionState state);
    void report(ConnectionStatus status, const std::string& details = "");

    WsEndpoint endpoint_;
    WebSocketConfig config_;
    const StopToken& stop_;
    std::shared_ptr<ConnectionMonitor> monitor_;
    ExponentialBackoff backoff_;
    std::unique_ptr<Session> session_;
    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
};
