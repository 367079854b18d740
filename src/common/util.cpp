
#include "util.hpp"
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace ecdigest {

bool parse_u64(const std::string &s, uint64_t &out) {
  if (s.empty() || !std::isdigit((unsigned char)s[0]))
    return false;
  errno = 0;
  char *end = nullptr;
  unsigned long long v = std::strtoull(s.c_str(), &end, 10);
  if (errno == ERANGE || end == nullptr || *end != '\0')
    return false;
  out = (uint64_t)v;
  return true;
}

bool parse_log_level(const std::string &s, LogLevel &out) {
  if (s == "trace")
    out = LogLevel::TRACE;
  else if (s == "debug")
    out = LogLevel::DEBUG;
  else if (s == "info")
    out = LogLevel::INFO;
  else if (s == "warn")
    out = LogLevel::WARN;
  else if (s == "error")
    out = LogLevel::ERROR;
  else
    return false;
  return true;
}

static int hex_nibble(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

std::vector<uint8_t> hex_to_bytes(const std::string &hex) {
  std::vector<uint8_t> out;
  if (hex.empty() || (hex.size() % 2) != 0)
    return out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = hex_nibble(hex[i]);
    int lo = hex_nibble(hex[i + 1]);
    if (hi < 0 || lo < 0)
      return {};
    out.push_back((uint8_t)((hi << 4) | lo));
  }
  return out;
}

} // namespace ecdigest
