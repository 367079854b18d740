
#include "digest.hpp"
#include <sodium.h>

namespace ecdigest {

static_assert(crypto_hash_sha256_BYTES == kHashSize,
              "Hash must hold a SHA-256 digest");

bool digest_init() {
  static const bool ok = sodium_init() >= 0;
  return ok;
}

Hash checksum(const uint8_t *data, size_t len) {
  Hash out{};
  crypto_hash_sha256(out.data(), data, (unsigned long long)len);
  return out;
}

Hash checksum(const std::vector<uint8_t> &data) {
  return checksum(data.data(), data.size());
}

Hash root_hash(const std::vector<Hash> &hashes) {
  crypto_hash_sha256_state st;
  crypto_hash_sha256_init(&st);
  for (const auto &h : hashes)
    crypto_hash_sha256_update(&st, h.data(), h.size());
  Hash out{};
  crypto_hash_sha256_final(&st, out.data());
  return out;
}

std::string to_hex(const Hash &h) {
  char buf[kHashSize * 2 + 1];
  sodium_bin2hex(buf, sizeof(buf), h.data(), h.size());
  return std::string(buf, kHashSize * 2);
}

} // namespace ecdigest
