#pragma once

#include "tollgate/client/amount.hpp"
#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace tollgate {
namespace client {

// Committed spend per (asset, network) for one UTC-day window.
// Not synchronized; SpendGuard owns it and serializes access.
class SpendLedger {
public:
    using Key = std::pair<std::string, std::string>;  // asset, network

    int64_t window() const { return window_; }

    // Clears all totals and starts the given window
    void reset(int64_t window);

    caf::error add(const std::string& asset, const std::string& network, const Amount& amount);

    std::optional<Amount> committed(const std::string& asset, const std::string& network) const;

    // Sum across networks, expressed with the given decimals
    Amount committed_for_asset(const std::string& asset, uint8_t decimals) const;

    const std::map<Key, Amount>& entries() const { return entries_; }

private:
    int64_t window_ = 0;
    std::map<Key, Amount> entries_;
};

struct SpendDecision {
    bool allowed = false;
    uint64_t hold_id = 0;              // set when allowed
    std::optional<Amount> remaining;   // before this request; nullopt = unlimited
    std::string reason;
};

/**
 * Per-asset daily spend ceiling shared by every pipeline of a process.
 *
 * authorize() checks committed + held + amount against the limit and places
 * a hold in the same critical section, so concurrent callers can never
 * together exceed the limit. commit() moves a hold into the ledger after the
 * payment was accepted; release() drops it after a failed payment.
 */
class SpendGuard {
    // Restricts construction to make(), which validates the limits first
    struct Validated {
        explicit Validated() = default;
    };

public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    SpendGuard(Validated, std::map<std::string, std::string> daily_limits, Clock clock);

    // Limits map asset symbol to a decimal string ("USDC" -> "1.00").
    // Assets without a limit are never denied.
    static caf::expected<std::shared_ptr<SpendGuard>> make(
        std::map<std::string, std::string> daily_limits,
        Clock clock = [] { return std::chrono::system_clock::now(); });

    SpendDecision authorize(const Amount& amount, const std::string& asset, const std::string& network);

    caf::error commit(uint64_t hold_id);
    void release(uint64_t hold_id);

    // Remaining allowance for the active window; nullopt when unlimited
    std::optional<Amount> remaining(const std::string& asset, uint8_t decimals = 6);

    // Committed spend for the active window across networks
    Amount spent(const std::string& asset, uint8_t decimals = 6);

    std::optional<Amount> limit(const std::string& asset, uint8_t decimals = 6) const;

    int64_t current_window();

    // Drops totals and holds; a new window starts at the current time
    void reset();

    size_t pending_holds() const;

    // Index of the UTC day containing t
    static int64_t window_of(std::chrono::system_clock::time_point t);

private:
    struct Hold {
        std::string asset;
        std::string network;
        Amount amount;
    };

    std::map<std::string, std::string> limits_;
    Clock clock_;
    mutable std::mutex mutex_;
    SpendLedger ledger_;
    std::map<uint64_t, Hold> holds_;
    uint64_t next_hold_id_ = 1;

    void roll_window_locked();
    Amount held_for_asset_locked(const std::string& asset, uint8_t decimals) const;
};

} // namespace client
} // namespace tollgate
