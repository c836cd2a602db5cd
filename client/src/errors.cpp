#include "tollgate/client/errors.hpp"
#include <caf/init_global_meta_objects.hpp>
#include <caf/message.hpp>
#include <mutex>

namespace tollgate {
namespace client {

std::string to_string(payment_errc code) {
    switch (code) {
        case payment_errc::none:
            return "none";
        case payment_errc::challenge_unrecognized:
            return "challenge_unrecognized";
        case payment_errc::spend_limit_exceeded:
            return "spend_limit_exceeded";
        case payment_errc::signer_error:
            return "signer_error";
        case payment_errc::payment_rejected:
            return "payment_rejected";
        case payment_errc::insufficient_balance:
            return "insufficient_balance";
        case payment_errc::auth_error:
            return "auth_error";
        case payment_errc::payment_not_accepted:
            return "payment_not_accepted";
        case payment_errc::transport_error:
            return "transport_error";
        case payment_errc::invalid_request:
            return "invalid_request";
        case payment_errc::http_error:
            return "http_error";
    }
    return "unknown";
}

bool from_string(std::string_view input, payment_errc& code) {
    for (uint8_t i = 0; i <= static_cast<uint8_t>(payment_errc::http_error); ++i) {
        auto candidate = static_cast<payment_errc>(i);
        if (to_string(candidate) == input) {
            code = candidate;
            return true;
        }
    }
    return false;
}

bool from_integer(std::underlying_type_t<payment_errc> input, payment_errc& code) {
    if (input > static_cast<uint8_t>(payment_errc::http_error)) {
        return false;
    }
    code = static_cast<payment_errc>(input);
    return true;
}

payment_errc code_of(const caf::error& err) {
    if (!err || err.category() != caf::type_id_v<payment_errc>) {
        return payment_errc::none;
    }
    payment_errc code = payment_errc::none;
    if (!from_integer(err.code(), code)) {
        return payment_errc::none;
    }
    return code;
}

bool is(const caf::error& err, payment_errc code) {
    return err && code_of(err) == code;
}

std::string describe(const caf::error& err) {
    if (!err) {
        return "none";
    }
    std::string result;
    if (err.category() == caf::type_id_v<payment_errc>) {
        result = to_string(code_of(err));
    } else {
        result = "error(" + std::to_string(err.category()) + ":" + std::to_string(err.code()) + ")";
    }
    const auto& ctx = err.context();
    if (ctx.match_elements<std::string>()) {
        result += ": ";
        result += ctx.get_as<std::string>(0);
    }
    return result;
}

void init_global_meta_objects() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        caf::init_global_meta_objects<caf::id_block::tollgate>();
        caf::core::init_global_meta_objects();
    });
}

} // namespace client
} // namespace tollgate
