
#include "fec.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstring>

namespace ecdigest {

namespace {

// GF(2^8) with the 0x11d reducing polynomial and generator 2.
struct GaloisTables {
  uint8_t exp[510];
  uint8_t log[256];
  uint8_t mul[256][256];

  GaloisTables() {
    uint32_t x = 1;
    for (int i = 0; i < 255; i++) {
      exp[i] = (uint8_t)x;
      exp[i + 255] = (uint8_t)x;
      log[x] = (uint8_t)i;
      x <<= 1;
      if (x & 0x100)
        x ^= 0x11d;
    }
    log[0] = 0;
    for (int a = 0; a < 256; a++) {
      for (int b = 0; b < 256; b++) {
        if (a == 0 || b == 0)
          mul[a][b] = 0;
        else
          mul[a][b] = exp[log[a] + log[b]];
      }
    }
  }
};

const GaloisTables &gf() {
  static const GaloisTables tables;
  return tables;
}

uint8_t gf_inv(uint8_t a) {
  const auto &t = gf();
  return t.exp[(255 - t.log[a]) % 255];
}

uint8_t gf_pow(uint8_t a, size_t n) {
  if (n == 0)
    return 1;
  if (a == 0)
    return 0;
  const auto &t = gf();
  return t.exp[(t.log[a] * n) % 255];
}

// Gauss-Jordan elimination on an n x n row-major matrix.
bool invert(std::vector<uint8_t> &m, size_t n, std::vector<uint8_t> &out) {
  const auto &t = gf();
  out.assign(n * n, 0);
  for (size_t i = 0; i < n; i++)
    out[i * n + i] = 1;

  for (size_t c = 0; c < n; c++) {
    size_t pivot = c;
    while (pivot < n && m[pivot * n + c] == 0)
      pivot++;
    if (pivot == n)
      return false;
    if (pivot != c) {
      std::swap_ranges(m.begin() + pivot * n, m.begin() + pivot * n + n,
                       m.begin() + c * n);
      std::swap_ranges(out.begin() + pivot * n, out.begin() + pivot * n + n,
                       out.begin() + c * n);
    }
    uint8_t scale = gf_inv(m[c * n + c]);
    for (size_t j = 0; j < n; j++) {
      m[c * n + j] = t.mul[scale][m[c * n + j]];
      out[c * n + j] = t.mul[scale][out[c * n + j]];
    }
    for (size_t r = 0; r < n; r++) {
      uint8_t f = m[r * n + c];
      if (r == c || f == 0)
        continue;
      for (size_t j = 0; j < n; j++) {
        m[r * n + j] ^= t.mul[f][m[c * n + j]];
        out[r * n + j] ^= t.mul[f][out[c * n + j]];
      }
    }
  }
  return true;
}

} // namespace

ReedSolomon::ReedSolomon(const ShardLayout &layout) : layout_(layout) {
  size_t k = layout_.data_shards;
  size_t total = layout_.total();
  if (k == 0 || total > kMaxTotalShards)
    return;

  const auto &t = gf();
  std::vector<uint8_t> top(k * k);
  for (size_t r = 0; r < k; r++)
    for (size_t c = 0; c < k; c++)
      top[r * k + c] = gf_pow((uint8_t)r, c);
  std::vector<uint8_t> top_inv;
  if (!invert(top, k, top_inv))
    return;

  size_t m = layout_.parity_shards;
  parity_rows_.assign(m * k, 0);
  for (size_t p = 0; p < m; p++) {
    uint8_t row = (uint8_t)(k + p);
    for (size_t j = 0; j < k; j++) {
      uint8_t acc = 0;
      for (size_t c = 0; c < k; c++)
        acc ^= t.mul[gf_pow(row, c)][top_inv[c * k + j]];
      parity_rows_[p * k + j] = acc;
    }
  }
  valid_ = true;
}

std::error_code
ReedSolomon::encode(const uint8_t *data, size_t len,
                    std::vector<std::vector<uint8_t>> &shards) const {
  if (!valid_)
    return errc::invalid_shard_layout;
  if (len == 0)
    return errc::empty_segment;

  size_t k = layout_.data_shards;
  size_t shard_size = (len + k - 1) / k;
  shards.assign(layout_.total(), std::vector<uint8_t>(shard_size, 0));

  size_t offset = 0;
  for (size_t i = 0; i < k && offset < len; i++) {
    size_t n = std::min(shard_size, len - offset);
    std::memcpy(shards[i].data(), data + offset, n);
    offset += n;
  }

  const auto &t = gf();
  for (size_t p = 0; p < layout_.parity_shards; p++) {
    uint8_t *out = shards[k + p].data();
    for (size_t c = 0; c < k; c++) {
      uint8_t coef = parity_rows_[p * k + c];
      if (coef == 0)
        continue;
      const uint8_t *mt = t.mul[coef];
      const uint8_t *in = shards[c].data();
      for (size_t j = 0; j < shard_size; j++)
        out[j] ^= mt[in[j]];
    }
  }
  return {};
}

} // namespace ecdigest
