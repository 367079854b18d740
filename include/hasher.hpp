
#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <system_error>
#include <vector>
#include "fec.hpp"
#include "segment.hpp"

namespace ecdigest {

// Not thread-safe. init() again after every finish().
class IntegrityHasher {
public:
    IntegrityHasher(uint64_t segment_size, const ShardLayout& layout);
    IntegrityHasher(uint64_t segment_size, std::shared_ptr<const ErasureCoder> coder);

    void init();
    std::error_code append(const uint8_t* data, size_t len);
    std::error_code append(const std::vector<uint8_t>& data) {
        return append(data.data(), data.size());
    }
    std::error_code finish(IntegrityResult& out);

    const std::vector<uint8_t>& buffered() const { return buffer_; }
    uint64_t content_length() const { return content_len_; }
    size_t segment_count() const { return lists_.count(); }
    uint64_t segment_size() const { return segment_size_; }
    const ShardLayout& layout() const { return coder_->layout(); }

private:
    std::error_code commit_segment(const uint8_t* data, size_t len);

    uint64_t segment_size_;
    std::shared_ptr<const ErasureCoder> coder_;
    std::vector<uint8_t> buffer_;
    HashLists lists_;
    uint64_t content_len_{0};
    bool ready_{false};
};

} // namespace ecdigest
