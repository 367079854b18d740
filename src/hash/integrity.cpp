
#include "errors.hpp"
#include "integrity.hpp"
#include "logging.hpp"

namespace ecdigest {

std::error_code compute_integrity_hash(ByteSource &src, uint64_t segment_size,
                                       const ShardLayout &layout,
                                       Strategy strategy,
                                       IntegrityResult &out) {
  if (strategy == Strategy::Serial)
    return compute_integrity_hash_serial(src, segment_size, layout, out);
  return compute_integrity_hash_parallel(src, segment_size, layout, out);
}

std::error_code compute_integrity_hash(ByteSource &src, const HashConfig &cfg,
                                       IntegrityResult &out) {
  return compute_integrity_hash(src, cfg.segment_size, cfg.layout,
                                cfg.strategy, out);
}

std::error_code compute_hash_from_buffer(const std::vector<uint8_t> &content,
                                         uint64_t segment_size,
                                         const ShardLayout &layout,
                                         IntegrityResult &out) {
  BufferSource src(content);
  return compute_integrity_hash(src, segment_size, layout, Strategy::Parallel,
                                out);
}

std::error_code compute_hash_from_file(const std::string &path,
                                       uint64_t segment_size,
                                       const ShardLayout &layout,
                                       IntegrityResult &out) {
  FileSource src;
  if (auto ec = src.open(path)) {
    Logger::instance().log(LogLevel::ERROR, "failed to open file %s: %s",
                           path.c_str(), ec.message().c_str());
    return errc::open_failed;
  }
  return compute_integrity_hash(src, segment_size, layout, Strategy::Parallel,
                                out);
}

} // namespace ecdigest
