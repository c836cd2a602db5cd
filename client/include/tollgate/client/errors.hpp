#pragma once

#include <caf/default_enum_inspect.hpp>
#include <caf/error.hpp>
#include <caf/fwd.hpp>
#include <caf/is_error_code_enum.hpp>
#include <caf/type_id.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

namespace tollgate {
namespace client {

// Machine-readable error codes for the payment path.
// Only transport_error is eligible for a caller-level retry.
enum class payment_errc : uint8_t {
    none = 0,
    challenge_unrecognized = 1,
    spend_limit_exceeded = 2,
    signer_error = 3,
    payment_rejected = 4,
    insufficient_balance = 5,
    auth_error = 6,
    payment_not_accepted = 7,
    transport_error = 8,
    invalid_request = 9,
    http_error = 10
};

std::string to_string(payment_errc code);

bool from_string(std::string_view input, payment_errc& code);

bool from_integer(std::underlying_type_t<payment_errc> input, payment_errc& code);

template <class Inspector>
bool inspect(Inspector& f, payment_errc& code) {
    return caf::default_enum_inspect(f, code);
}

/**
 * Returns the payment_errc carried by err, or payment_errc::none when err is
 * empty or belongs to another category (e.g. caf::sec).
 */
payment_errc code_of(const caf::error& err);

// True if err carries exactly this payment error code.
bool is(const caf::error& err, payment_errc code);

/**
 * Human-readable rendering "<code>: <context message>" that does not depend
 * on CAF meta objects for foreign categories.
 */
std::string describe(const caf::error& err);

// Must run once per process before any caf::error of this category is built.
void init_global_meta_objects();

} // namespace client
} // namespace tollgate

CAF_BEGIN_TYPE_ID_BLOCK(tollgate, caf::first_custom_type_id)

  CAF_ADD_TYPE_ID(tollgate, (tollgate::client::payment_errc))

CAF_END_TYPE_ID_BLOCK(tollgate)

CAF_ERROR_CODE_ENUM(tollgate::client::payment_errc)
