#include "tollgate/client/amount.hpp"
#include "tollgate/client/errors.hpp"
#include <limits>

namespace tollgate {
namespace client {

namespace {

constexpr uint8_t kMaxDecimals = 18;

bool checked_mul10(uint64_t& value) {
    if (value > std::numeric_limits<uint64_t>::max() / 10) {
        return false;
    }
    value *= 10;
    return true;
}

bool checked_add(uint64_t& value, uint64_t addend) {
    if (value > std::numeric_limits<uint64_t>::max() - addend) {
        return false;
    }
    value += addend;
    return true;
}

} // namespace

caf::expected<Amount> Amount::from_atomic(const std::string& atomic_units, uint8_t decimals) {
    if (atomic_units.empty() || decimals > kMaxDecimals) {
        return caf::make_error(payment_errc::invalid_request,
                               "invalid atomic amount '" + atomic_units + "'");
    }
    uint64_t value = 0;
    for (char c : atomic_units) {
        if (c < '0' || c > '9') {
            return caf::make_error(payment_errc::invalid_request,
                                   "invalid atomic amount '" + atomic_units + "'");
        }
        if (!checked_mul10(value) || !checked_add(value, static_cast<uint64_t>(c - '0'))) {
            return caf::make_error(payment_errc::invalid_request,
                                   "atomic amount overflows: " + atomic_units);
        }
    }
    return Amount(value, decimals);
}

caf::expected<Amount> Amount::from_decimal(const std::string& text, uint8_t decimals) {
    if (text.empty() || decimals > kMaxDecimals) {
        return caf::make_error(payment_errc::invalid_request, "invalid decimal amount '" + text + "'");
    }
    auto dot = text.find('.');
    std::string whole = text.substr(0, dot);
    std::string fraction = dot == std::string::npos ? std::string() : text.substr(dot + 1);
    if ((whole.empty() && fraction.empty()) || fraction.size() > decimals) {
        return caf::make_error(payment_errc::invalid_request,
                               "amount '" + text + "' does not fit " + std::to_string(decimals) + " decimals");
    }
    fraction.append(decimals - fraction.size(), '0');
    auto digits = (whole.empty() ? std::string("0") : whole) + fraction;
    return from_atomic(digits, decimals);
}

caf::expected<Amount> Amount::rescale(uint8_t decimals) const {
    if (decimals > kMaxDecimals) {
        return caf::make_error(payment_errc::invalid_request, "scale out of range");
    }
    uint64_t value = atomic_;
    if (decimals >= decimals_) {
        for (uint8_t i = decimals_; i < decimals; ++i) {
            if (!checked_mul10(value)) {
                return caf::make_error(payment_errc::invalid_request,
                                       "amount overflows at " + std::to_string(decimals) + " decimals");
            }
        }
    } else {
        for (uint8_t i = decimals; i < decimals_; ++i) {
            if (value % 10 != 0) {
                return caf::make_error(payment_errc::invalid_request,
                                       "amount " + to_decimal_string() + " loses precision at "
                                           + std::to_string(decimals) + " decimals");
            }
            value /= 10;
        }
    }
    return Amount(value, decimals);
}

caf::expected<Amount> Amount::plus(const Amount& other) const {
    if (other.decimals_ != decimals_) {
        return caf::make_error(payment_errc::invalid_request, "scale mismatch");
    }
    uint64_t value = atomic_;
    if (!checked_add(value, other.atomic_)) {
        return caf::make_error(payment_errc::invalid_request, "amount overflow");
    }
    return Amount(value, decimals_);
}

Amount Amount::saturating_minus(const Amount& other) const {
    if (other.atomic_ >= atomic_) {
        return Amount(0, decimals_);
    }
    return Amount(atomic_ - other.atomic_, decimals_);
}

std::string Amount::to_decimal_string() const {
    auto digits = std::to_string(atomic_);
    if (decimals_ == 0) {
        return digits;
    }
    if (digits.size() <= decimals_) {
        digits.insert(0, decimals_ + 1 - digits.size(), '0');
    }
    digits.insert(digits.size() - decimals_, ".");
    return digits;
}

} // namespace client
} // namespace tollgate
