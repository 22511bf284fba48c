#include "core/cycle_context.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <future>
#include <vector>

namespace fundarb {

// ============================================================================
// InMemoryOpenTimeStore
// ============================================================================

void InMemoryOpenTimeStore::record_open(const std::string& key, WallClock at) {
    std::lock_guard<std::mutex> lock(mutex_);
    open_times_[key] = at;
    spdlog::debug("Recorded open time for {}", key);
}

bool InMemoryOpenTimeStore::remove_open(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool removed = open_times_.erase(key) > 0;
    spdlog::debug("{} open time for {}", removed ? "Removed" : "No tracked", key);
    return removed;
}

std::optional<double> InMemoryOpenTimeStore::age_hours(const std::string& key, WallClock at) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = open_times_.find(key);
    if (it == open_times_.end()) {
        return std::nullopt;
    }
    return hours_between(it->second, at);
}

size_t InMemoryOpenTimeStore::retain_open(const std::set<std::string>& keep) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t dropped = 0;
    for (auto it = open_times_.begin(); it != open_times_.end();) {
        if (keep.count(it->first) == 0) {
            spdlog::debug("Dropping open time for vanished pair {}", it->first);
            it = open_times_.erase(it);
            dropped++;
        } else {
            ++it;
        }
    }
    return dropped;
}

size_t InMemoryOpenTimeStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_times_.size();
}

// ============================================================================
// CooldownStore
// ============================================================================

CooldownStore::CooldownStore(std::chrono::minutes ttl)
    : ttl_(ttl)
{
}

std::string CooldownStore::cooldown_key(const std::string& symbol, Exchange a, Exchange b) {
    std::string first = exchange_to_string(a);
    std::string second = exchange_to_string(b);
    if (second < first) {
        std::swap(first, second);
    }
    return fmt::format("{}-{}-{}", symbol, first, second);
}

void CooldownStore::mark(const std::string& key, WallClock at) {
    std::lock_guard<std::mutex> lock(mutex_);
    marked_[key] = at;
    spdlog::info("Cooling down {} for {}m", key, ttl_.count());
}

bool CooldownStore::is_filtered(const std::string& key, WallClock at) const {
    return remaining_minutes(key, at).has_value();
}

std::optional<int64_t> CooldownStore::remaining_minutes(const std::string& key, WallClock at) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = marked_.find(key);
    if (it == marked_.end()) {
        return std::nullopt;
    }

    auto elapsed = at - it->second;
    if (elapsed >= ttl_) {
        return std::nullopt;
    }

    // Round up, a pair 10s from expiry still reports 1 minute
    auto left = std::chrono::duration_cast<std::chrono::seconds>(ttl_ - elapsed).count();
    return (left + 59) / 60;
}

size_t CooldownStore::purge_expired(WallClock at) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t purged = 0;
    for (auto it = marked_.begin(); it != marked_.end();) {
        if (at - it->second >= ttl_) {
            it = marked_.erase(it);
            purged++;
        } else {
            ++it;
        }
    }
    return purged;
}

size_t CooldownStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return marked_.size();
}

// ============================================================================
// CycleContext
// ============================================================================

CycleContext::CycleContext(std::shared_ptr<PositionOpenTimeStore> open_times, std::chrono::minutes cooldown_ttl)
    : open_times_(open_times ? std::move(open_times) : std::make_shared<InMemoryOpenTimeStore>())
    , cooldowns_(cooldown_ttl)
{
}

void CycleContext::begin_cycle() {
    balances_.clear();
    balances_loaded_ = false;
    cycle_count_++;

    size_t purged = cooldowns_.purge_expired();
    if (purged > 0) {
        spdlog::debug("Cycle {}: {} cool-downs expired", cycle_count_, purged);
    }
}

const std::map<Exchange, Notional>& CycleContext::balances(const std::shared_ptr<BalanceProvider>& provider,
                                                           std::chrono::milliseconds timeout) {
    if (balances_loaded_) {
        return balances_;
    }
    balances_loaded_ = true;

    if (!provider) {
        spdlog::warn("No balance provider, allocating against zero balances");
        return balances_;
    }

    std::vector<std::pair<Exchange, std::future<std::optional<Notional>>>> pending;
    for (Exchange exchange : ALL_EXCHANGES) {
        pending.emplace_back(exchange, std::async(std::launch::async, [provider, exchange, timeout]() {
            return time_utils::call_with_timeout<Notional>([provider, exchange]() {
                return provider->balance(exchange);
            }, timeout);
        }));
    }

    for (auto& [exchange, result] : pending) {
        try {
            auto balance = result.get();
            if (balance) {
                balances_[exchange] = *balance;
            }
        } catch (const std::exception& e) {
            spdlog::warn("Balance unavailable on {}: {}", exchange_to_string(exchange), e.what());
        }
    }

    spdlog::debug("Cycle {}: balances loaded for {} venues", cycle_count_, balances_.size());
    return balances_;
}

} // namespace fundarb
