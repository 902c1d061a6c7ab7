#include "connection_monitor.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

ConnectionMonitor::ConnectionMonitor(EventBus& bus) : bus_(bus) {}

void ConnectionMonitor::update_status(ConnectionType type, ConnectionStatus status,
                                      std::optional<std::string> details) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        statuses_[type] = status;
    }

    if (status == ConnectionStatus::Error) {
        spdlog::warn("{} connection: {} ({})", to_string(type), to_string(status), details.value_or(""));
    } else {
        spdlog::debug("{} connection: {}", to_string(type), to_string(status));
    }

    ConnectionStatusChange change;
    change.connection_type = type;
    change.status = status;
    change.timestamp = util::current_iso8601();
    change.details = std::move(details);
    bus_.emit(make_connection_status(std::move(change)));
}

ConnectionStatus ConnectionMonitor::status(ConnectionType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = statuses_.find(type);
    return it == statuses_.end() ? ConnectionStatus::Disconnected : it->second;
}

nlohmann::json ConnectionMonitor::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [type, status] : statuses_) {
        out[to_string(type)] = to_string(status);
    }
    return out;
}
