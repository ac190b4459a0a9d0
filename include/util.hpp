#pragma once
#include <string>
#include <cstdint>
#include <cstddef>

namespace tftpc {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);
std::string bytes_to_hex(const uint8_t* data, size_t len);

// Decodes UTF-8, replacing every invalid sequence with U+FFFD.
std::string utf8_lossy(const uint8_t* data, size_t len);

} // namespace tftpc
