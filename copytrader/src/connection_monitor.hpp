#pragma once

#include "event_bus.hpp"
#include "models.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// Tracks the latest status of every outbound connection and announces
// transitions on the event bus.
class ConnectionMonitor {
public:
    explicit ConnectionMonitor(EventBus& bus);

    void update_status(ConnectionType type, ConnectionStatus status,
                       std::optional<std::string> details = std::nullopt);

    ConnectionStatus status(ConnectionType type) const;
    nlohmann::json to_json() const;

private:
    EventBus& bus_;
    mutable std::mutex mutex_;
    std::map<ConnectionType, ConnectionStatus> statuses_;
};
