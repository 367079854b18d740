
#pragma once
#include <cstddef>
#include <cstdint>
#include <system_error>
#include <vector>

namespace ecdigest {

constexpr size_t kMaxTotalShards = 256;

struct ShardLayout {
    uint16_t data_shards{4};
    uint16_t parity_shards{2};
    size_t total() const { return size_t(data_shards) + parity_shards; }
};

class ErasureCoder {
public:
    virtual ~ErasureCoder() = default;
    virtual const ShardLayout& layout() const = 0;
    virtual std::error_code encode(const uint8_t* data, size_t len,
                                   std::vector<std::vector<uint8_t>>& shards) const = 0;
};

// Systematic Reed-Solomon over GF(2^8)
class ReedSolomon : public ErasureCoder {
public:
    explicit ReedSolomon(const ShardLayout& layout);
    const ShardLayout& layout() const override { return layout_; }
    std::error_code encode(const uint8_t* data, size_t len,
                           std::vector<std::vector<uint8_t>>& shards) const override;
    bool valid() const { return valid_; }
private:
    ShardLayout layout_;
    bool valid_{false};
    // parity_shards x data_shards, row major
    std::vector<uint8_t> parity_rows_;
};

} // namespace ecdigest
