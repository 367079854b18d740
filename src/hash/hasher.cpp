
#include "hasher.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace ecdigest {

IntegrityHasher::IntegrityHasher(uint64_t segment_size,
                                 const ShardLayout &layout)
    : IntegrityHasher(segment_size, std::make_shared<ReedSolomon>(layout)) {}

IntegrityHasher::IntegrityHasher(uint64_t segment_size,
                                 std::shared_ptr<const ErasureCoder> coder)
    : segment_size_(segment_size), coder_(std::move(coder)) {
  if (!digest_init())
    Logger::instance().log(LogLevel::ERROR, "libsodium initialization failed");
}

void IntegrityHasher::init() {
  buffer_.clear();
  lists_ = HashLists(coder_->layout().total());
  content_len_ = 0;
  ready_ = true;
}

std::error_code IntegrityHasher::append(const uint8_t *data, size_t len) {
  if (!ready_)
    return errc::not_initialized;
  if (segment_size_ == 0)
    return errc::invalid_segment_size;
  if (len > segment_size_)
    return errc::input_too_large;
  if (buffer_.size() >= segment_size_)
    return errc::buffer_overflow;

  size_t prev = buffer_.size();
  if (prev + len < segment_size_) {
    buffer_.insert(buffer_.end(), data, data + len);
    return {};
  }

  // prev < segment_size and len <= segment_size, so at most one full
  // segment plus a remainder shorter than a segment.
  size_t head = (size_t)segment_size_ - prev;
  buffer_.insert(buffer_.end(), data, data + head);
  if (auto ec = commit_segment(buffer_.data(), buffer_.size())) {
    buffer_.resize(prev);
    return ec;
  }
  buffer_.assign(data + head, data + len);
  return {};
}

std::error_code IntegrityHasher::finish(IntegrityResult &out) {
  if (!ready_)
    return errc::not_initialized;
  if (!buffer_.empty()) {
    if (auto ec = commit_segment(buffer_.data(), buffer_.size()))
      return ec;
    buffer_.clear();
  }

  IntegrityResult res;
  assemble_roots(lists_.segments, lists_.shards, res.hashes);
  res.content_length = content_len_;
  res.redundancy = RedundancyType::ErasureCode;
  out = std::move(res);
  ready_ = false;
  return {};
}

std::error_code IntegrityHasher::commit_segment(const uint8_t *data,
                                                size_t len) {
  SegmentDigest d;
  if (auto ec = hash_segment(*coder_, data, len, d)) {
    Logger::instance().log(LogLevel::DEBUG, "segment %zu encode failed: %s",
                           lists_.count(), ec.message().c_str());
    return ec;
  }
  if (auto ec = lists_.add(d))
    return ec;
  content_len_ += len;
  return {};
}

} // namespace ecdigest
