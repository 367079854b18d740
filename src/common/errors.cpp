
#include "errors.hpp"

namespace ecdigest {

namespace {

class EcdigestCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "ecdigest"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
    case errc::input_too_large:
      return "data chunk is larger than the segment size";
    case errc::buffer_overflow:
      return "pending buffer reached the segment size";
    case errc::not_initialized:
      return "hasher must be initialized before use";
    case errc::invalid_segment_size:
      return "segment size must be positive";
    case errc::invalid_shard_layout:
      return "invalid number of data or parity shards";
    case errc::empty_segment:
      return "segment has no data to encode";
    case errc::source_read:
      return "failed to read content";
    case errc::open_failed:
      return "failed to open file";
    case errc::missing_segment:
      return "segment hash missing after workers finished";
    }
    return "unknown ecdigest error";
  }
};

} // namespace

const std::error_category &ecdigest_category() {
  static EcdigestCategory cat;
  return cat;
}

std::error_code make_error_code(errc e) {
  return std::error_code(static_cast<int>(e), ecdigest_category());
}

} // namespace ecdigest
