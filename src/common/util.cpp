#include "util.hpp"
#include <stdexcept>

namespace zwlink {

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos)
    return false;
  host = s.substr(0, pos);
  if (host.empty())
    return false;
  try {
    int p = std::stoi(s.substr(pos + 1));
    if (p <= 0 || p > 65535)
      return false;
    port = (uint16_t)p;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

std::string to_hex(const uint8_t *data, size_t len) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; i++) {
    out.push_back(digits[data[i] >> 4]);
    out.push_back(digits[data[i] & 0x0F]);
  }
  return out;
}

} // namespace zwlink
