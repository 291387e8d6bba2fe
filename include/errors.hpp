#pragma once
#include <string>
#include <system_error>

namespace zwlink {

enum class errc {
    incomplete = 1,
    checksum_mismatch,
    parse_error,
    ack_timeout,
    nak,
    can,
    response_timeout,
    response_nok,
    callback_timeout,
    callback_nok,
    link_closed,
    aborted,
    timeout,
    unexpected_response
};

const std::error_category& zwlink_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

// ACK timeout, NAK and CAN: the data frame was never acknowledged.
bool is_link_failure(const std::error_code& ec) noexcept;

} // namespace zwlink

namespace std {
template <> struct is_error_code_enum<zwlink::errc> : true_type {};
} // namespace std
