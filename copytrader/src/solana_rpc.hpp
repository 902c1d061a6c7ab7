#pragma once

#include "chain_data.hpp"
#include "http_client.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

class SolanaRPC : public ChainDataAccessor {
public:
    SolanaRPC(const std::vector<std::string>& rpc_urls, std::shared_ptr<HttpClient> http);

    std::optional<std::vector<uint8_t>> get_account_data(const std::string& address) override;
    bool is_healthy();

private:
    std::vector<std::string> rpc_urls_;
    std::shared_ptr<HttpClient> http_;
    size_t current_rpc_index_;
    std::mutex mutex_;

    // Tries each endpoint once, rotating on failure
    nlohmann::json make_request(const nlohmann::json& payload);
    std::string current_url();
    void rotate_rpc();
};
