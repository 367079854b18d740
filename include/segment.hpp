
#pragma once
#include <cstddef>
#include <cstdint>
#include <system_error>
#include <vector>
#include "digest.hpp"
#include "fec.hpp"

namespace ecdigest {

enum class RedundancyType : uint8_t { ErasureCode = 0, Replica = 1 };

struct SegmentDigest {
    Hash segment{};
    std::vector<Hash> shards;
};

// hashes[0]: root over segment checksums; hashes[k+1]: shard position k
struct IntegrityResult {
    std::vector<Hash> hashes;
    uint64_t content_length{0};
    RedundancyType redundancy{RedundancyType::ErasureCode};
};

struct HashLists {
    std::vector<Hash> segments;
    std::vector<std::vector<Hash>> shards;

    HashLists() = default;
    explicit HashLists(size_t total_shards) : shards(total_shards) {}

    std::error_code add(const SegmentDigest& d);
    size_t count() const { return segments.size(); }
};

std::error_code hash_segment(const ErasureCoder& coder, const uint8_t* data, size_t len,
                             SegmentDigest& out);

void assemble_roots(const std::vector<Hash>& segment_hashes,
                    const std::vector<std::vector<Hash>>& shard_hashes,
                    std::vector<Hash>& out);

} // namespace ecdigest
