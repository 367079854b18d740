
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>
#include "fec.hpp"
#include "logging.hpp"
#include "segment.hpp"
#include "source.hpp"

namespace ecdigest {

constexpr uint64_t kDefaultSegmentSize = 16 * 1024 * 1024;
constexpr size_t kJobQueueCapacity = 100;
constexpr size_t kMaxWorkers = 5;

enum class Strategy { Parallel, Serial };

struct HashConfig {
    uint64_t segment_size{kDefaultSegmentSize};
    ShardLayout layout{};
    Strategy strategy{Strategy::Parallel};
    LogLevel log_level{LogLevel::INFO};
};

size_t worker_count();

std::error_code compute_integrity_hash_serial(ByteSource& src, uint64_t segment_size,
                                              const ShardLayout& layout, IntegrityResult& out);
std::error_code compute_integrity_hash_serial(ByteSource& src, uint64_t segment_size,
                                              const ErasureCoder& coder, IntegrityResult& out);

std::error_code compute_integrity_hash_parallel(ByteSource& src, uint64_t segment_size,
                                                const ShardLayout& layout, IntegrityResult& out);
std::error_code compute_integrity_hash_parallel(ByteSource& src, uint64_t segment_size,
                                                const ErasureCoder& coder, IntegrityResult& out);

std::error_code compute_integrity_hash(ByteSource& src, uint64_t segment_size,
                                       const ShardLayout& layout, Strategy strategy,
                                       IntegrityResult& out);
std::error_code compute_integrity_hash(ByteSource& src, const HashConfig& cfg,
                                       IntegrityResult& out);

std::error_code compute_hash_from_buffer(const std::vector<uint8_t>& content,
                                         uint64_t segment_size, const ShardLayout& layout,
                                         IntegrityResult& out);

std::error_code compute_hash_from_file(const std::string& path, uint64_t segment_size,
                                       const ShardLayout& layout, IntegrityResult& out);

} // namespace ecdigest
