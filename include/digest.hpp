
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ecdigest {

constexpr size_t kHashSize = 32;

using Hash = std::array<uint8_t, kHashSize>;

bool digest_init();

Hash checksum(const uint8_t* data, size_t len);
Hash checksum(const std::vector<uint8_t>& data);

// SHA-256 over the concatenated list
Hash root_hash(const std::vector<Hash>& hashes);

std::string to_hex(const Hash& h);

} // namespace ecdigest
