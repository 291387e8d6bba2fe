#include "errors.hpp"

namespace zwlink {

namespace {

class ZwlinkCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "zwlink"; }
  std::string message(int ev) const override {
    switch ((errc)ev) {
    case errc::incomplete:
      return "incomplete frame";
    case errc::checksum_mismatch:
      return "checksum mismatch";
    case errc::parse_error:
      return "command could not be parsed";
    case errc::ack_timeout:
      return "timed out waiting for ACK";
    case errc::nak:
      return "frame was NAKed";
    case errc::can:
      return "frame was cancelled (CAN)";
    case errc::response_timeout:
      return "timed out waiting for response";
    case errc::response_nok:
      return "response indicated failure";
    case errc::callback_timeout:
      return "timed out waiting for callback";
    case errc::callback_nok:
      return "callback indicated failure";
    case errc::link_closed:
      return "link closed";
    case errc::aborted:
      return "aborted";
    case errc::timeout:
      return "timed out";
    case errc::unexpected_response:
      return "unexpected response type";
    }
    return "unknown zwlink error";
  }
};

} // namespace

const std::error_category &zwlink_category() noexcept {
  static ZwlinkCategory cat;
  return cat;
}

std::error_code make_error_code(errc e) noexcept {
  return std::error_code((int)e, zwlink_category());
}

bool is_link_failure(const std::error_code &ec) noexcept {
  return ec == errc::ack_timeout || ec == errc::nak || ec == errc::can;
}

} // namespace zwlink
