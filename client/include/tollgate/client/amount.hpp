#pragma once

#include <caf/expected.hpp>
#include <cstdint>
#include <string>

namespace tollgate {
namespace client {

/**
 * Exact decimal amount: an integer count of atomic units plus the number of
 * decimal places of the asset (USDC = 6). No floating point is involved in
 * parsing, formatting or comparison.
 */
class Amount {
public:
    Amount() = default;
    Amount(uint64_t atomic_units, uint8_t decimals)
        : atomic_(atomic_units), decimals_(decimals) {}

    // "50000" with decimals 6 -> 0.05
    static caf::expected<Amount> from_atomic(const std::string& atomic_units, uint8_t decimals);

    // "0.05" with decimals 6 -> 50000 atomic units. More fractional digits
    // than decimals is an error, not a rounding.
    static caf::expected<Amount> from_decimal(const std::string& text, uint8_t decimals);

    uint64_t atomic() const { return atomic_; }
    uint8_t decimals() const { return decimals_; }
    bool is_zero() const { return atomic_ == 0; }

    // Exact conversion to another scale; fails when precision would be lost
    // or the value overflows.
    caf::expected<Amount> rescale(uint8_t decimals) const;

    // Both operands must share the same scale.
    caf::expected<Amount> plus(const Amount& other) const;
    Amount saturating_minus(const Amount& other) const;

    std::string atomic_string() const { return std::to_string(atomic_); }

    // Fixed notation with all decimals: 50000/6 -> "0.050000"
    std::string to_decimal_string() const;

    bool operator==(const Amount& other) const {
        return atomic_ == other.atomic_ && decimals_ == other.decimals_;
    }
    bool operator!=(const Amount& other) const { return !(*this == other); }

    // Only meaningful for equal scales.
    bool operator<(const Amount& other) const { return atomic_ < other.atomic_; }
    bool operator<=(const Amount& other) const { return atomic_ <= other.atomic_; }

private:
    uint64_t atomic_ = 0;
    uint8_t decimals_ = 6;
};

} // namespace client
} // namespace tollgate
