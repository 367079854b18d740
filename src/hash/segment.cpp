
#include "segment.hpp"
#include "errors.hpp"
#include <asio/post.hpp>
#include <asio/thread_pool.hpp>
#include <algorithm>
#include <thread>

namespace ecdigest {

std::error_code hash_segment(const ErasureCoder &coder, const uint8_t *data,
                             size_t len, SegmentDigest &out) {
  Hash seg = checksum(data, len);
  std::vector<std::vector<uint8_t>> shards;
  if (auto ec = coder.encode(data, len, shards))
    return ec;

  std::vector<Hash> shard_hashes;
  shard_hashes.reserve(shards.size());
  for (const auto &s : shards)
    shard_hashes.push_back(checksum(s));

  out.segment = seg;
  out.shards = std::move(shard_hashes);
  return {};
}

std::error_code HashLists::add(const SegmentDigest &d) {
  if (d.shards.size() != shards.size())
    return errc::invalid_shard_layout;
  segments.push_back(d.segment);
  for (size_t k = 0; k < d.shards.size(); k++)
    shards[k].push_back(d.shards[k]);
  return {};
}

void assemble_roots(const std::vector<Hash> &segment_hashes,
                    const std::vector<std::vector<Hash>> &shard_hashes,
                    std::vector<Hash> &out) {
  out.assign(shard_hashes.size() + 1, Hash{});
  out[0] = root_hash(segment_hashes);
  if (shard_hashes.empty())
    return;

  size_t threads = std::min<size_t>(
      shard_hashes.size(), std::max(1u, std::thread::hardware_concurrency()));
  asio::thread_pool pool(threads);
  for (size_t k = 0; k < shard_hashes.size(); k++) {
    asio::post(pool, [&out, &shard_hashes, k]() {
      out[k + 1] = root_hash(shard_hashes[k]);
    });
  }
  pool.join();
}

} // namespace ecdigest
