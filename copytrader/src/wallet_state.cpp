#include "wallet_state.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>

void TrackedWalletStore::replace(std::vector<TrackedWallet> wallets) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    wallets_ = std::move(wallets);
    revision_++;
}

void TrackedWalletStore::apply(const WalletStateChange& change) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = std::find_if(wallets_.begin(), wallets_.end(), [&](const TrackedWallet& w) {
        return w.wallet_address == change.wallet_address;
    });

    const auto& details = change.details;
    auto detail_id = [&]() -> std::optional<std::string> {
        if (details.is_object() && details.contains("id") && details["id"].is_string()) {
            return details["id"].get<std::string>();
        }
        return std::nullopt;
    };

    bool active_changed = false;
    switch (change.change_type) {
        case WalletStateChangeType::Added:
        case WalletStateChangeType::Unarchived:
            if (it == wallets_.end()) {
                TrackedWallet w;
                w.id = detail_id();
                w.wallet_address = change.wallet_address;
                w.is_active = true;
                w.created_at = change.timestamp;
                wallets_.push_back(std::move(w));
                active_changed = true;
            } else {
                active_changed = !it->is_active;
                it->is_active = true;
                it->updated_at = change.timestamp;
            }
            break;

        case WalletStateChangeType::Archived:
            if (it != wallets_.end()) {
                active_changed = it->is_active;
                it->is_active = false;
                it->updated_at = change.timestamp;
            }
            break;

        case WalletStateChangeType::Deleted:
            if (it != wallets_.end()) {
                active_changed = it->is_active;
                wallets_.erase(it);
            }
            break;

        case WalletStateChangeType::Updated:
            if (it != wallets_.end()) {
                if (details.is_object() && details.contains("is_active") && details["is_active"].is_boolean()) {
                    bool is_active = details["is_active"].get<bool>();
                    active_changed = is_active != it->is_active;
                    it->is_active = is_active;
                }
                if (auto id = detail_id()) {
                    it->id = id;
                }
                it->updated_at = change.timestamp;
            }
            break;
    }

    if (!active_changed) {
        spdlog::debug("Wallet {} {} leaves active set unchanged", change.wallet_address,
                      to_string(change.change_type));
        return;
    }

    revision_++;
    spdlog::info("Wallet {} {}, {} tracked", change.wallet_address,
                 to_string(change.change_type), wallets_.size());
}

std::vector<TrackedWallet> TrackedWalletStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return wallets_;
}

std::vector<std::string> TrackedWalletStore::active_addresses() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& w : wallets_) {
        if (w.is_active) {
            out.push_back(w.wallet_address);
        }
    }
    return out;
}

void CopySettingsStore::replace(std::vector<CopyTradeSettings> settings) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    settings_ = std::move(settings);
}

void CopySettingsStore::upsert(const CopyTradeSettings& settings) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = std::find_if(settings_.begin(), settings_.end(), [&](const CopyTradeSettings& s) {
        return s.tracked_wallet_id == settings.tracked_wallet_id;
    });
    if (it != settings_.end()) {
        *it = settings;
    } else {
        settings_.push_back(settings);
    }
}

std::vector<CopyTradeSettings> CopySettingsStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return settings_;
}

size_t CopySettingsStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return settings_.size();
}
