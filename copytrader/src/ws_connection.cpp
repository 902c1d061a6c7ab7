#include "ws_connection.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <type_traits>

namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = net::ssl;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;
using Clock = std::chrono::steady_clock;

std::string to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Connected: return "Connected";
        case ConnectionState::Subscribed: return "Subscribed";
        case ConnectionState::Closing: return "Closing";
    }
    return "Disconnected";
}

WsEndpoint parse_ws_url(const std::string& url) {
    WsEndpoint ep;
    std::string rest;
    if (url.rfind("wss://", 0) == 0) {
        ep.secure = true;
        rest = url.substr(6);
    } else if (url.rfind("ws://", 0) == 0) {
        rest = url.substr(5);
    } else {
        throw ValidationError(fmt::format("Unsupported feed URL scheme: {}", util::redact_url(url)));
    }

    auto path_pos = rest.find_first_of("/?");
    std::string authority = rest.substr(0, path_pos);
    ep.target = path_pos == std::string::npos ? "/" : rest.substr(path_pos);
    if (ep.target[0] == '?') {
        ep.target = "/" + ep.target;
    }

    auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        ep.host = authority.substr(0, colon);
        ep.port = authority.substr(colon + 1);
    } else {
        ep.host = authority;
        ep.port = ep.secure ? "443" : "80";
    }

    if (ep.host.empty() || ep.port.empty()) {
        throw ValidationError(fmt::format("Feed URL has no host: {}", util::redact_url(url)));
    }
    return ep;
}

std::string build_subscribe_message(const std::string& method, const std::vector<std::string>& addresses) {
    return nlohmann::json{{"method", method}, {"keys", addresses}}.dump();
}

// One connected socket and its private io_context. Sessions are never
// reused: a failed or closed session is destroyed along with any handlers
// still queued on its io_context.
class WebSocketConnectionManager::Session {
public:
    virtual ~Session() = default;
    virtual void connect(const WsEndpoint& ep, std::chrono::seconds timeout,
                         std::chrono::seconds idle_timeout) = 0;
    virtual void write(const std::string& text, std::chrono::seconds timeout) = 0;
    virtual FeedFrame read(std::chrono::milliseconds timeout) = 0;
    virtual void close(std::chrono::seconds timeout) = 0;
};

namespace {

using PlainWs = websocket::stream<beast::tcp_stream>;
using TlsWs = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

struct OpState {
    bool done = false;
    beast::error_code ec;
};

struct ReadState {
    bool done = false;
    beast::error_code ec;
    beast::flat_buffer buffer;
};

template <class WsStream>
class BasicSession : public WebSocketConnectionManager::Session {
public:
    static constexpr bool is_tls = std::is_same<WsStream, TlsWs>::value;

    BasicSession() : ssl_ctx_(ssl::context::tlsv12_client) {
        if constexpr (is_tls) {
            ssl_ctx_.set_default_verify_paths();
            ssl_ctx_.set_verify_mode(ssl::verify_peer);
            ws_ = std::make_unique<WsStream>(ioc_, ssl_ctx_);
        } else {
            ws_ = std::make_unique<WsStream>(ioc_);
        }
    }

    ~BasicSession() override {
        beast::error_code ec;
        beast::get_lowest_layer(*ws_).socket().close(ec);
        ws_.reset();
    }

    void connect(const WsEndpoint& ep, std::chrono::seconds timeout,
                 std::chrono::seconds idle_timeout) override {
        auto deadline = Clock::now() + timeout;

        // Resolve
        tcp::resolver resolver(ioc_);
        auto resolved = std::make_shared<std::pair<OpState, tcp::resolver::results_type>>();
        resolver.async_resolve(ep.host, ep.port,
            [resolved](beast::error_code ec, tcp::resolver::results_type results) {
                resolved->first.ec = ec;
                resolved->second = std::move(results);
                resolved->first.done = true;
            });
        if (!run_until(resolved->first.done, deadline)) {
            resolver.cancel();
            throw TransportError(fmt::format("Resolving {} timed out", ep.host));
        }
        check(resolved->first.ec, "resolve");

        // TCP connect
        auto& lowest = beast::get_lowest_layer(*ws_);
        lowest.expires_after(timeout);
        auto op = std::make_shared<OpState>();
        lowest.async_connect(resolved->second,
            [op](beast::error_code ec, const tcp::endpoint&) {
                op->ec = ec;
                op->done = true;
            });
        wait(op, deadline, "connect");

        // TLS handshake
        if constexpr (is_tls) {
            if (!SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), ep.host.c_str())) {
                throw TransportError(fmt::format("Failed to set SNI host {}", ep.host));
            }
            ws_->next_layer().set_verify_callback(ssl::host_name_verification(ep.host));
            lowest.expires_after(timeout);
            op = std::make_shared<OpState>();
            ws_->next_layer().async_handshake(ssl::stream_base::client,
                [op](beast::error_code ec) {
                    op->ec = ec;
                    op->done = true;
                });
            wait(op, deadline, "TLS handshake");
        }

        // WebSocket upgrade; from here the stream's own timeouts apply
        lowest.expires_never();
        websocket::stream_base::timeout opt;
        opt.handshake_timeout = timeout;
        opt.idle_timeout = idle_timeout;
        opt.keep_alive_pings = true;
        ws_->set_option(opt);

        op = std::make_shared<OpState>();
        ws_->async_handshake(ep.host + ":" + ep.port, ep.target,
            [op](beast::error_code ec) {
                op->ec = ec;
                op->done = true;
            });
        wait(op, Clock::now() + timeout, "websocket handshake");
        ws_->text(true);
    }

    void write(const std::string& text, std::chrono::seconds timeout) override {
        auto message = std::make_shared<std::string>(text);
        auto op = std::make_shared<OpState>();
        ws_->async_write(net::buffer(*message),
            [op, message](beast::error_code ec, std::size_t) {
                op->ec = ec;
                op->done = true;
            });
        wait(op, Clock::now() + timeout, "write");
    }

    FeedFrame read(std::chrono::milliseconds timeout) override {
        if (!read_) {
            read_ = std::make_shared<ReadState>();
            auto state = read_;
            ws_->async_read(state->buffer,
                [state](beast::error_code ec, std::size_t) {
                    state->ec = ec;
                    state->done = true;
                });
        }

        run_until(read_->done, Clock::now() + timeout);
        if (!read_->done) {
            return FeedFrame::none();
        }

        auto state = std::move(read_);
        read_.reset();

        if (state->ec == websocket::error::closed) {
            auto reason = ws_->reason();
            return FeedFrame::close(fmt::format("code {} {}", static_cast<int>(reason.code),
                                                std::string(reason.reason.c_str())));
        }
        if (state->ec) {
            return FeedFrame::error(state->ec.message());
        }
        return FeedFrame::text(beast::buffers_to_string(state->buffer.data()));
    }

    void close(std::chrono::seconds timeout) override {
        if (!ws_->is_open()) {
            return;
        }
        auto op = std::make_shared<OpState>();
        ws_->async_close(websocket::close_code::normal,
            [op](beast::error_code ec) {
                op->ec = ec;
                op->done = true;
            });
        wait(op, Clock::now() + timeout, "close");
    }

private:
    // Runs handlers until `done` flips or the deadline passes.
    bool run_until(const bool& done, Clock::time_point deadline) {
        while (!done) {
            if (ioc_.stopped()) {
                ioc_.restart();
            }
            if (ioc_.run_one_until(deadline) == 0) {
                return done;
            }
        }
        return true;
    }

    void wait(const std::shared_ptr<OpState>& op, Clock::time_point deadline, const char* what) {
        if (!run_until(op->done, deadline)) {
            beast::error_code ignored;
            beast::get_lowest_layer(*ws_).socket().close(ignored);
            throw TransportError(fmt::format("{} timed out", what));
        }
        check(op->ec, what);
    }

    static void check(const beast::error_code& ec, const char* what) {
        if (ec) {
            throw TransportError(fmt::format("{} failed: {}", what, ec.message()));
        }
    }

    ssl::context ssl_ctx_;
    net::io_context ioc_;
    std::unique_ptr<WsStream> ws_;
    std::shared_ptr<ReadState> read_;
};

} // namespace

WebSocketConnectionManager::WebSocketConnectionManager(const std::string& url, WebSocketConfig config,
                                                       const StopToken& stop,
                                                       std::shared_ptr<ConnectionMonitor> monitor)
    : endpoint_(parse_ws_url(url))
    , config_(std::move(config))
    , stop_(stop)
    , monitor_(std::move(monitor))
    , backoff_(config_.initial_backoff, config_.max_backoff)
{
}

WebSocketConnectionManager::~WebSocketConnectionManager() = default;

void WebSocketConnectionManager::set_state(ConnectionState state) {
    auto previous = state_.exchange(state);
    if (previous != state) {
        spdlog::debug("Feed connection {} -> {}", to_string(previous), to_string(state));
    }
}

void WebSocketConnectionManager::report(ConnectionStatus status, const std::string& details) {
    if (monitor_) {
        monitor_->update_status(ConnectionType::WebSocket, status,
                                details.empty() ? std::nullopt : std::optional<std::string>(details));
    }
}

void WebSocketConnectionManager::connect_once() {
    std::unique_ptr<Session> session;
    if (endpoint_.secure) {
        session = std::make_unique<BasicSession<TlsWs>>();
    } else {
        session = std::make_unique<BasicSession<PlainWs>>();
    }
    session->connect(endpoint_, config_.connection_timeout, config_.health_check_interval);
    session_ = std::move(session);
}

void WebSocketConnectionManager::ensure_connection() {
    auto current = state();
    if (current == ConnectionState::Closing) {
        throw TransportError("Feed connection is shut down");
    }
    if (current == ConnectionState::Connected || current == ConnectionState::Subscribed) {
        return;
    }

    const int max_attempts = std::max(1, config_.max_retries);
    int failures = 0;

    while (true) {
        set_state(ConnectionState::Connecting);
        report(ConnectionStatus::Connecting);
        try {
            connect_once();
            set_state(ConnectionState::Connected);
            backoff_.record_success();
            report(ConnectionStatus::Connected);
            spdlog::info("Connected to feed {}:{}{}", endpoint_.host, endpoint_.port, endpoint_.target);
            return;

        } catch (const std::exception& e) {
            session_.reset();
            set_state(ConnectionState::Disconnected);
            failures++;

            if (failures >= max_attempts) {
                report(ConnectionStatus::Error, e.what());
                throw TransportError(fmt::format("Feed connection failed after {} attempts: {}",
                                                 failures, e.what()));
            }

            auto delay = backoff_.next_delay();
            spdlog::warn("Feed connection attempt {}/{} failed: {}; retrying in {}ms",
                         failures, max_attempts, e.what(), delay.count());
            report(ConnectionStatus::Reconnecting, e.what());
            if (stop_.wait_for(delay)) {
                throw TransportError("Stop requested while reconnecting");
            }
        }
    }
}

void WebSocketConnectionManager::subscribe(const std::vector<std::string>& addresses) {
    if (!session_ || (state() != ConnectionState::Connected && state() != ConnectionState::Subscribed)) {
        throw TransportError("Cannot subscribe without a connection");
    }

    try {
        session_->write(build_subscribe_message(config_.subscribe_method, addresses),
                        config_.connection_timeout);
        set_state(ConnectionState::Subscribed);
        backoff_.record_success();
        spdlog::info("Subscribed to {} wallet(s)", addresses.size());

    } catch (const std::exception& e) {
        teardown(false);
        auto delay = backoff_.next_delay();
        spdlog::error("Feed subscription failed: {}; backing off {}ms", e.what(), delay.count());
        report(ConnectionStatus::Error, e.what());
        stop_.wait_for(delay);
        throw TransportError(fmt::format("Subscribe failed: {}", e.what()));
    }
}

FeedFrame WebSocketConnectionManager::receive_message(std::chrono::milliseconds wait) {
    if (!session_) {
        return FeedFrame::error("not connected");
    }

    FeedFrame frame = session_->read(wait);
    switch (frame.kind) {
        case FeedFrame::Kind::Text:
            backoff_.record_success();
            break;
        case FeedFrame::Kind::Close:
            spdlog::info("Feed closed by server: {}", frame.payload);
            teardown(false);
            report(ConnectionStatus::Disconnected, frame.payload);
            break;
        case FeedFrame::Kind::Error:
            spdlog::error("Feed read failed: {}", frame.payload);
            teardown(false);
            report(ConnectionStatus::Error, frame.payload);
            break;
        case FeedFrame::Kind::None:
            break;
    }
    return frame;
}

void WebSocketConnectionManager::teardown(bool graceful) {
    if (session_ && graceful) {
        try {
            session_->close(config_.connection_timeout);
        } catch (const std::exception& e) {
            spdlog::warn("Feed close handshake failed: {}", e.what());
        }
    }
    session_.reset();
    if (state() != ConnectionState::Closing) {
        set_state(ConnectionState::Disconnected);
    }
}

void WebSocketConnectionManager::close() {
    if (!session_) return;
    teardown(true);
    report(ConnectionStatus::Disconnected);
}

void WebSocketConnectionManager::shutdown() {
    set_state(ConnectionState::Closing);
    teardown(true);
    report(ConnectionStatus::Disconnected, "shutdown");
    spdlog::info("Feed connection shut down");
}
