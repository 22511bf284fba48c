#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <chrono>
#include <memory>
#include <optional>
#include "common/types.hpp"
#include "providers/balance_provider.hpp"

namespace fundarb {

/**
 * When each open pair was opened, keyed by position_key().
 *
 * record_open on execution, remove_open on close. A stale entry would make a
 * reopened pair look old and skip its minimum hold.
 */
class PositionOpenTimeStore {
public:
    virtual ~PositionOpenTimeStore() = default;

    virtual void record_open(const std::string& key, WallClock at) = 0;

    // Returns false when nothing was tracked under key
    virtual bool remove_open(const std::string& key) = 0;

    // nullopt when untracked
    virtual std::optional<double> age_hours(const std::string& key, WallClock at) const = 0;

    // Drops every key not in keep, returns how many were dropped
    virtual size_t retain_open(const std::set<std::string>& keep) = 0;

    virtual size_t size() const = 0;
};

class InMemoryOpenTimeStore : public PositionOpenTimeStore {
public:
    void record_open(const std::string& key, WallClock at) override;
    bool remove_open(const std::string& key) override;
    std::optional<double> age_hours(const std::string& key, WallClock at) const override;
    size_t retain_open(const std::set<std::string>& keep) override;
    size_t size() const override;

private:
    std::map<std::string, WallClock> open_times_;
    mutable std::mutex mutex_;
};

/**
 * Exchange pairs that recently failed to execute. A marked pair is skipped by
 * the allocator until its TTL runs out.
 */
class CooldownStore {
public:
    explicit CooldownStore(std::chrono::minutes ttl = std::chrono::minutes(30));

    // Exchanges in name order, so both leg orientations share one entry
    static std::string cooldown_key(const std::string& symbol, Exchange a, Exchange b);

    void mark(const std::string& key, WallClock at = wall_now());
    bool is_filtered(const std::string& key, WallClock at = wall_now()) const;

    // Minutes until the pair may be retried, nullopt when not filtered
    std::optional<int64_t> remaining_minutes(const std::string& key, WallClock at = wall_now()) const;

    // Drops expired entries, returns how many
    size_t purge_expired(WallClock at = wall_now());

    size_t size() const;
    std::chrono::minutes ttl() const { return ttl_; }

private:
    std::chrono::minutes ttl_;
    std::map<std::string, WallClock> marked_;
    mutable std::mutex mutex_;
};

/**
 * Cross-cycle state owned by the scheduler and handed to every cycle, plus
 * the per-cycle balance cache.
 */
class CycleContext {
public:
    CycleContext(std::shared_ptr<PositionOpenTimeStore> open_times, std::chrono::minutes cooldown_ttl);

    PositionOpenTimeStore& open_times() { return *open_times_; }
    const PositionOpenTimeStore& open_times() const { return *open_times_; }

    CooldownStore& cooldowns() { return cooldowns_; }
    const CooldownStore& cooldowns() const { return cooldowns_; }

    // Invalidates the balance cache
    void begin_cycle();

    // Fetched once per cycle, concurrently, each venue under timeout.
    // Venues that fail are absent.
    const std::map<Exchange, Notional>& balances(const std::shared_ptr<BalanceProvider>& provider,
                                                 std::chrono::milliseconds timeout);

    bool balances_loaded() const { return balances_loaded_; }

    uint64_t cycle_count() const { return cycle_count_; }

private:
    std::shared_ptr<PositionOpenTimeStore> open_times_;
    CooldownStore cooldowns_;

    std::map<Exchange, Notional> balances_;
    bool balances_loaded_{false};
    uint64_t cycle_count_{0};
};

} // namespace fundarb
