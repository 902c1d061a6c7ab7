#include "solana_rpc.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

SolanaRPC::SolanaRPC(const std::vector<std::string>& rpc_urls, std::shared_ptr<HttpClient> http)
    : rpc_urls_(rpc_urls)
    , http_(std::move(http))
    , current_rpc_index_(0)
{
    if (rpc_urls_.empty()) {
        throw InitializationError("At least one Solana RPC endpoint is required");
    }
}

std::string SolanaRPC::current_url() {
    std::lock_guard<std::mutex> lock(mutex_);
    return rpc_urls_[current_rpc_index_];
}

void SolanaRPC::rotate_rpc() {
    std::lock_guard<std::mutex> lock(mutex_);
    current_rpc_index_ = (current_rpc_index_ + 1) % rpc_urls_.size();
    spdlog::warn("Rotated to RPC endpoint: {}", util::redact_url(rpc_urls_[current_rpc_index_]));
}

nlohmann::json SolanaRPC::make_request(const nlohmann::json& payload) {
    std::string last_error;
    for (size_t attempt = 0; attempt < rpc_urls_.size(); attempt++) {
        try {
            auto response = http_->post_json(current_url(), payload);
            if (response.contains("error")) {
                throw TransportError(fmt::format("RPC error: {}", response["error"].dump()));
            }
            return response;
        } catch (const TransportError& e) {
            last_error = e.what();
            spdlog::error("RPC {} failed: {}", payload.value("method", "?"), last_error);
            rotate_rpc();
        }
    }
    throw TransportError(fmt::format("All RPC endpoints failed: {}", last_error));
}

std::optional<std::vector<uint8_t>> SolanaRPC::get_account_data(const std::string& address) {
    nlohmann::json payload = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"method", "getAccountInfo"},
        {"params", {address, {{"encoding", "base64"}}}}
    };

    auto response = make_request(payload);

    const auto& value = response["result"]["value"];
    if (value.is_null()) {
        return std::nullopt;
    }

    try {
        // data is ["<base64>", "base64"]
        return util::base64_decode(value.at("data").at(0).get<std::string>());
    } catch (const std::exception& e) {
        throw DecodeError(fmt::format("Bad account data for {}: {}", address, e.what()));
    }
}

bool SolanaRPC::is_healthy() {
    nlohmann::json payload = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"method", "getHealth"}
    };

    try {
        auto response = make_request(payload);
        return response.contains("result") && response["result"] == "ok";
    } catch (const TransportError& e) {
        spdlog::warn("RPC health check failed: {}", e.what());
        return false;
    }
}
