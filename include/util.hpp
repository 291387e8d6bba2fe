#pragma once
#include <string>
#include <cstdint>
#include <cstddef>
#include <vector>

namespace zwlink {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);
std::string to_hex(const uint8_t* data, size_t len);
inline std::string to_hex(const std::vector<uint8_t>& data) { return to_hex(data.data(), data.size()); }

} // namespace zwlink
