#include "util.hpp"
#include <stdexcept>

namespace tftpc {

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos || pos == 0)
    return false;
  host = s.substr(0, pos);
  // [::1]:69
  if (host.size() > 2 && host.front() == '[' && host.back() == ']')
    host = host.substr(1, host.size() - 2);
  std::string digits = s.substr(pos + 1);
  if (digits.empty() ||
      digits.find_first_not_of("0123456789") != std::string::npos)
    return false;
  try {
    int p = std::stoi(digits);
    if (p < 0 || p > 65535)
      return false;
    port = (uint16_t)p;
    return true;
  } catch (const std::out_of_range &) {
    return false;
  }
}

std::string bytes_to_hex(const uint8_t *data, size_t len) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; i++) {
    out.push_back(digits[data[i] >> 4]);
    out.push_back(digits[data[i] & 0x0F]);
  }
  return out;
}

static void append_replacement(std::string &out) { out += "\xEF\xBF\xBD"; }

std::string utf8_lossy(const uint8_t *data, size_t len) {
  std::string out;
  out.reserve(len);
  size_t i = 0;
  while (i < len) {
    uint8_t b = data[i];
    if (b < 0x80) {
      out.push_back((char)b);
      i++;
      continue;
    }
    size_t need;
    uint8_t lo = 0x80, hi = 0xBF;
    if (b >= 0xC2 && b <= 0xDF) {
      need = 1;
    } else if (b >= 0xE0 && b <= 0xEF) {
      need = 2;
      if (b == 0xE0)
        lo = 0xA0;
      else if (b == 0xED)
        hi = 0x9F; // no surrogates
    } else if (b >= 0xF0 && b <= 0xF4) {
      need = 3;
      if (b == 0xF0)
        lo = 0x90;
      else if (b == 0xF4)
        hi = 0x8F;
    } else {
      append_replacement(out);
      i++;
      continue;
    }
    // maximal subpart: stop at the first byte that breaks the sequence
    size_t j = 1;
    for (; j <= need && i + j < len; j++) {
      uint8_t c = data[i + j];
      if (c < lo || c > hi)
        break;
      lo = 0x80;
      hi = 0xBF;
    }
    if (j == need + 1) {
      out.append((const char *)data + i, need + 1);
    } else {
      append_replacement(out);
    }
    i += j;
  }
  return out;
}

} // namespace tftpc
