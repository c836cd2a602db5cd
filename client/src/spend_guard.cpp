#include "tollgate/client/spend_guard.hpp"
#include "tollgate/client/errors.hpp"
#include <algorithm>
#include <limits>

namespace tollgate {
namespace client {

namespace {

constexpr int64_t kSecondsPerDay = 86400;

// Exact when scaling up; truncates when scaling down
Amount to_scale(const Amount& amount, uint8_t decimals) {
    if (auto exact = amount.rescale(decimals)) {
        return *exact;
    }
    uint64_t value = amount.atomic();
    if (decimals > amount.decimals()) {
        return Amount(std::numeric_limits<uint64_t>::max(), decimals);
    }
    for (uint8_t i = decimals; i < amount.decimals(); ++i) {
        value /= 10;
    }
    return Amount(value, decimals);
}

// Limit text with fractional digits beyond the asset scale truncated
caf::expected<Amount> parse_limit(const std::string& text, uint8_t decimals) {
    auto dot = text.find('.');
    if (dot != std::string::npos && text.size() - dot - 1 > decimals) {
        auto truncated = text.substr(0, dot + 1 + decimals);
        if (truncated.back() == '.') {
            truncated.pop_back();
        }
        return Amount::from_decimal(truncated, decimals);
    }
    return Amount::from_decimal(text, decimals);
}

Amount add_saturating(const Amount& lhs, const Amount& rhs) {
    if (auto sum = lhs.plus(rhs)) {
        return *sum;
    }
    return Amount(std::numeric_limits<uint64_t>::max(), lhs.decimals());
}

} // namespace

void SpendLedger::reset(int64_t window) {
    window_ = window;
    entries_.clear();
}

caf::error SpendLedger::add(const std::string& asset, const std::string& network, const Amount& amount) {
    auto key = Key{asset, network};
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        entries_.emplace(key, amount);
        return caf::error{};
    }
    auto scale = std::max(it->second.decimals(), amount.decimals());
    auto sum = to_scale(it->second, scale).plus(to_scale(amount, scale));
    if (!sum) {
        return sum.error();
    }
    it->second = *sum;
    return caf::error{};
}

std::optional<Amount> SpendLedger::committed(const std::string& asset, const std::string& network) const {
    auto it = entries_.find(Key{asset, network});
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Amount SpendLedger::committed_for_asset(const std::string& asset, uint8_t decimals) const {
    Amount total(0, decimals);
    for (const auto& [key, amount] : entries_) {
        if (key.first == asset) {
            total = add_saturating(total, to_scale(amount, decimals));
        }
    }
    return total;
}

caf::expected<std::shared_ptr<SpendGuard>> SpendGuard::make(std::map<std::string, std::string> daily_limits,
                                                            Clock clock) {
    for (const auto& [asset, text] : daily_limits) {
        auto parsed = parse_limit(text, 6);
        if (!parsed) {
            return caf::make_error(payment_errc::invalid_request,
                                   "invalid daily limit for " + asset + ": '" + text + "'");
        }
    }
    return std::make_shared<SpendGuard>(Validated{}, std::move(daily_limits), std::move(clock));
}

SpendGuard::SpendGuard(Validated, std::map<std::string, std::string> daily_limits, Clock clock)
    : limits_(std::move(daily_limits)), clock_(std::move(clock)) {
    ledger_.reset(window_of(clock_()));
}

int64_t SpendGuard::window_of(std::chrono::system_clock::time_point t) {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
    // Floor division so pre-epoch clocks still map to whole days
    auto day = seconds / kSecondsPerDay;
    if (seconds % kSecondsPerDay < 0) {
        --day;
    }
    return day;
}

void SpendGuard::roll_window_locked() {
    auto window = window_of(clock_());
    if (window != ledger_.window()) {
        ledger_.reset(window);
    }
}

Amount SpendGuard::held_for_asset_locked(const std::string& asset, uint8_t decimals) const {
    Amount total(0, decimals);
    for (const auto& [id, hold] : holds_) {
        if (hold.asset == asset) {
            total = add_saturating(total, to_scale(hold.amount, decimals));
        }
    }
    return total;
}

std::optional<Amount> SpendGuard::limit(const std::string& asset, uint8_t decimals) const {
    auto it = limits_.find(asset);
    if (it == limits_.end()) {
        return std::nullopt;
    }
    auto parsed = parse_limit(it->second, decimals);
    if (!parsed) {
        // Validated in make(); only overflow at a large scale lands here
        return Amount(std::numeric_limits<uint64_t>::max(), decimals);
    }
    return *parsed;
}

SpendDecision SpendGuard::authorize(const Amount& amount, const std::string& asset, const std::string& network) {
    std::lock_guard<std::mutex> lock(mutex_);
    roll_window_locked();

    SpendDecision decision;
    uint8_t scale = amount.decimals();
    for (const auto& [key, committed] : ledger_.entries()) {
        if (key.first == asset) {
            scale = std::max(scale, committed.decimals());
        }
    }
    for (const auto& [id, hold] : holds_) {
        if (hold.asset == asset) {
            scale = std::max(scale, hold.amount.decimals());
        }
    }

    auto ceiling = limit(asset, scale);
    if (ceiling) {
        auto used = add_saturating(ledger_.committed_for_asset(asset, scale), held_for_asset_locked(asset, scale));
        auto remaining = ceiling->saturating_minus(used);
        decision.remaining = to_scale(remaining, amount.decimals());
        if (remaining < to_scale(amount, scale)) {
            decision.allowed = false;
            decision.reason = "daily limit " + ceiling->to_decimal_string() + " " + asset + " leaves "
                              + remaining.to_decimal_string() + ", payment needs " + amount.to_decimal_string();
            return decision;
        }
    }

    decision.allowed = true;
    decision.hold_id = next_hold_id_++;
    holds_.emplace(decision.hold_id, Hold{asset, network, amount});
    return decision;
}

caf::error SpendGuard::commit(uint64_t hold_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = holds_.find(hold_id);
    if (it == holds_.end()) {
        return caf::make_error(payment_errc::invalid_request,
                               "unknown spend hold " + std::to_string(hold_id));
    }
    // A hold authorized before midnight is charged to the window it settles in
    roll_window_locked();
    auto err = ledger_.add(it->second.asset, it->second.network, it->second.amount);
    holds_.erase(it);
    return err;
}

void SpendGuard::release(uint64_t hold_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    holds_.erase(hold_id);
}

std::optional<Amount> SpendGuard::remaining(const std::string& asset, uint8_t decimals) {
    std::lock_guard<std::mutex> lock(mutex_);
    roll_window_locked();
    auto ceiling = limit(asset, decimals);
    if (!ceiling) {
        return std::nullopt;
    }
    auto used = add_saturating(ledger_.committed_for_asset(asset, decimals), held_for_asset_locked(asset, decimals));
    return ceiling->saturating_minus(used);
}

Amount SpendGuard::spent(const std::string& asset, uint8_t decimals) {
    std::lock_guard<std::mutex> lock(mutex_);
    roll_window_locked();
    return ledger_.committed_for_asset(asset, decimals);
}

int64_t SpendGuard::current_window() {
    std::lock_guard<std::mutex> lock(mutex_);
    roll_window_locked();
    return ledger_.window();
}

void SpendGuard::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    holds_.clear();
    ledger_.reset(window_of(clock_()));
}

size_t SpendGuard::pending_holds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return holds_.size();
}

} // namespace client
} // namespace tollgate
