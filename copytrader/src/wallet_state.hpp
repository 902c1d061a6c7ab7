#pragma once

#include "models.hpp"
#include <atomic>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <vector>

// Tracked wallets mirrored from the repository and relay events.
class TrackedWalletStore {
public:
    void replace(std::vector<TrackedWallet> wallets);
    void apply(const WalletStateChange& change);

    std::vector<TrackedWallet> snapshot() const;
    std::vector<std::string> active_addresses() const;

    // Bumped only when the set of active addresses changes
    uint64_t revision() const { return revision_.load(); }

private:
    mutable std::shared_mutex mutex_;
    std::vector<TrackedWallet> wallets_;
    std::atomic<uint64_t> revision_{0};
};

class CopySettingsStore {
public:
    void replace(std::vector<CopyTradeSettings> settings);
    // Update-or-append keyed on tracked_wallet_id
    void upsert(const CopyTradeSettings& settings);

    std::vector<CopyTradeSettings> snapshot() const;
    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::vector<CopyTradeSettings> settings_;
};

// Latest SOL/USD price seen on the relay; 0 until the first update.
class SolPriceTracker {
public:
    void update(double price_usd) { price_usd_.store(price_usd); }
    double get() const { return price_usd_.load(); }

private:
    std::atomic<double> price_usd_{0.0};
};
