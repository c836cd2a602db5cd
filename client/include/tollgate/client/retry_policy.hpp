#pragma once

#include "tollgate/client/errors.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>

namespace tollgate {
namespace client {

/**
 * Caller-side retry policy for pipeline runs.
 *
 * Implements:
 * - Exponential backoff capped at max_delay_ms
 * - Error classification (only transport_error is retryable; a retry after
 *   any payment-path error risks a second payment)
 * - Retry budget across all attempts
 *
 * The executor and the orchestrator never consult it; only
 * Pipeline::run_with_policy does.
 */
class RetryPolicy {
public:
    struct Config {
        int64_t base_delay_ms = 100;      // Base delay for exponential backoff
        int64_t max_delay_ms = 5000;      // Maximum delay between retries
        int64_t total_timeout_ms = 30000; // Total time across all retries
        int32_t max_retries = 1;          // Resumptions after the first run
    };

    RetryPolicy(const Config& config = Config()) : config_(config) {}

    /**
     * Delay before retry `attempt` (0-based).
     * Formula: delay = base * 2^attempt (capped at max_delay_ms)
     */
    int64_t calculate_backoff_delay(int32_t attempt) const {
        if (attempt >= 62) {
            return config_.max_delay_ms;
        }
        int64_t delay = config_.base_delay_ms * (1LL << attempt);
        return std::min(delay, config_.max_delay_ms);
    }

    bool is_retryable(payment_errc code) const {
        switch (code) {
            case payment_errc::transport_error:
                return true;

            // Payment path: retrying could pay again or hit the same veto
            case payment_errc::challenge_unrecognized:
            case payment_errc::spend_limit_exceeded:
            case payment_errc::signer_error:
            case payment_errc::payment_rejected:
            case payment_errc::insufficient_balance:
            case payment_errc::auth_error:
            case payment_errc::payment_not_accepted:
                return false;

            case payment_errc::invalid_request:
            case payment_errc::http_error:
            case payment_errc::none:
                return false;
        }
        return false;
    }

    /**
     * Check if retry budget is exhausted
     *
     * Returns true if total time spent (including the next backoff delay)
     * reaches total_timeout_ms
     */
    bool is_budget_exhausted(int64_t total_elapsed_ms, int32_t attempt) const {
        if (total_elapsed_ms >= config_.total_timeout_ms) {
            return true;
        }
        return total_elapsed_ms + calculate_backoff_delay(attempt) >= config_.total_timeout_ms;
    }

    int32_t max_retries() const {
        return config_.max_retries;
    }

    int64_t total_timeout_ms() const {
        return config_.total_timeout_ms;
    }

private:
    Config config_;
};

} // namespace client
} // namespace tollgate
