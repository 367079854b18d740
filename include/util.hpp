
#pragma once
#include <string>
#include <cstdint>
#include <vector>
#include "logging.hpp"

namespace ecdigest {

bool parse_u64(const std::string& s, uint64_t& out);
bool parse_log_level(const std::string& s, LogLevel& out);
std::vector<uint8_t> hex_to_bytes(const std::string& hex);

} // namespace ecdigest
