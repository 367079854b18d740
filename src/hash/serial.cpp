
#include "errors.hpp"
#include "integrity.hpp"
#include "logging.hpp"
#include <asio/error.hpp>

namespace ecdigest {

std::error_code compute_integrity_hash_serial(ByteSource &src,
                                              uint64_t segment_size,
                                              const ShardLayout &layout,
                                              IntegrityResult &out) {
  ReedSolomon coder(layout);
  return compute_integrity_hash_serial(src, segment_size, coder, out);
}

std::error_code compute_integrity_hash_serial(ByteSource &src,
                                              uint64_t segment_size,
                                              const ErasureCoder &coder,
                                              IntegrityResult &out) {
  if (segment_size == 0)
    return errc::invalid_segment_size;
  if (!digest_init())
    Logger::instance().log(LogLevel::ERROR, "libsodium initialization failed");

  HashLists lists(coder.layout().total());
  uint64_t content_len = 0;
  std::vector<uint8_t> seg((size_t)segment_size);
  for (;;) {
    std::error_code ec;
    size_t n = read_full(src, seg.data(), seg.size(), ec);
    if (ec) {
      if (ec == asio::error::eof)
        break;
      Logger::instance().log(LogLevel::ERROR, "failed to read content: %s",
                             ec.message().c_str());
      return errc::source_read;
    }

    SegmentDigest d;
    if (auto hec = hash_segment(coder, seg.data(), n, d))
      return hec;
    if (auto aec = lists.add(d))
      return aec;
    content_len += n;
  }

  Logger::instance().log(LogLevel::DEBUG, "serial hash: %zu segments, %llu bytes",
                         lists.count(), (unsigned long long)content_len);

  IntegrityResult res;
  assemble_roots(lists.segments, lists.shards, res.hashes);
  res.content_length = content_len;
  res.redundancy = RedundancyType::ErasureCode;
  out = std::move(res);
  return {};
}

} // namespace ecdigest
