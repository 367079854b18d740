
#include "errors.hpp"
#include "integrity.hpp"
#include "logging.hpp"
#include "work_queue.hpp"
#include <asio/error.hpp>
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>

namespace ecdigest {

namespace {

struct SegmentJob {
  uint64_t id{0};
  std::vector<uint8_t> data;
};

// Worker results indexed by segment id. The reader sizes the store before a
// job is queued and each slot is written by exactly one worker.
class SegmentSlots {
public:
  void extend(uint64_t count) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (slots_.size() < count)
      slots_.resize((size_t)count);
  }

  bool store(uint64_t id, SegmentDigest &&d) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (id >= slots_.size())
      return false;
    slots_[id] = std::move(d);
    return true;
  }

  bool take(uint64_t id, SegmentDigest &out) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (id >= slots_.size() || !slots_[id])
      return false;
    out = std::move(*slots_[id]);
    slots_[id].reset();
    return true;
  }

private:
  std::mutex mtx_;
  std::vector<std::optional<SegmentDigest>> slots_;
};

// Single-slot error signal: the first error or exception is kept, later ones
// are dropped.
class FirstError {
public:
  bool set(std::error_code ec) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (ec_ || ex_)
      return false;
    ec_ = ec;
    return true;
  }

  bool set(std::exception_ptr ex) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (ec_ || ex_)
      return false;
    ex_ = std::move(ex);
    return true;
  }

  std::error_code get() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return ec_;
  }

  void rethrow_if_set() const {
    std::lock_guard<std::mutex> lk(mtx_);
    if (ex_)
      std::rethrow_exception(ex_);
  }

private:
  mutable std::mutex mtx_;
  std::error_code ec_;
  std::exception_ptr ex_;
};

struct WorkerShared {
  BoundedQueue<SegmentJob> jobs{kJobQueueCapacity};
  SegmentSlots slots;
  FirstError error;
  std::atomic<size_t> alive{0};
};

void stop_worker(WorkerShared &ws) {
  // The reader would block forever on a full queue with no consumers.
  if (--ws.alive == 0)
    ws.jobs.close();
}

void hash_worker(WorkerShared &ws, const ErasureCoder &coder) {
  SegmentJob job;
  while (ws.jobs.pop(job)) {
    SegmentDigest d;
    std::error_code ec;
    try {
      ec = hash_segment(coder, job.data.data(), job.data.size(), d);
    } catch (...) {
      // Rethrown on the calling thread once the pool has joined.
      if (ws.error.set(std::current_exception()))
        Logger::instance().log(LogLevel::ERROR, "segment %llu hashing threw",
                               (unsigned long long)job.id);
      stop_worker(ws);
      return;
    }
    if (!ec && !ws.slots.store(job.id, std::move(d)))
      ec = errc::missing_segment;
    if (ec) {
      if (ws.error.set(ec))
        Logger::instance().log(LogLevel::ERROR, "segment %llu encode failed: %s",
                               (unsigned long long)job.id, ec.message().c_str());
      else
        Logger::instance().log(LogLevel::WARN,
                               "segment %llu encode failed after an earlier "
                               "error, dropped: %s",
                               (unsigned long long)job.id, ec.message().c_str());
      stop_worker(ws);
      return;
    }
  }
  --ws.alive;
}

} // namespace

size_t worker_count() {
  size_t n = std::thread::hardware_concurrency() / 2;
  return std::max<size_t>(1, std::min(n, kMaxWorkers));
}

std::error_code compute_integrity_hash_parallel(ByteSource &src,
                                                uint64_t segment_size,
                                                const ShardLayout &layout,
                                                IntegrityResult &out) {
  ReedSolomon coder(layout);
  return compute_integrity_hash_parallel(src, segment_size, coder, out);
}

std::error_code compute_integrity_hash_parallel(ByteSource &src,
                                                uint64_t segment_size,
                                                const ErasureCoder &coder,
                                                IntegrityResult &out) {
  if (segment_size == 0)
    return errc::invalid_segment_size;
  if (!digest_init())
    Logger::instance().log(LogLevel::ERROR, "libsodium initialization failed");

  WorkerShared ws;
  size_t threads = worker_count();
  ws.alive = threads;
  std::vector<std::thread> th;
  auto join_all = [&th]() {
    for (auto &t : th)
      if (t.joinable())
        t.join();
  };

  uint64_t jobs = 0;
  uint64_t content_len = 0;
  std::error_code read_ec;
  try {
    th.reserve(threads);
    for (size_t i = 0; i < threads; i++)
      th.emplace_back([&ws, &coder]() { hash_worker(ws, coder); });
    Logger::instance().log(LogLevel::DEBUG, "parallel hash: %zu workers",
                           threads);

    for (;;) {
      std::vector<uint8_t> seg((size_t)segment_size);
      std::error_code ec;
      size_t n = read_full(src, seg.data(), seg.size(), ec);
      if (ec) {
        if (ec != asio::error::eof) {
          Logger::instance().log(LogLevel::ERROR, "failed to read content: %s",
                                 ec.message().c_str());
          read_ec = ec;
        }
        break;
      }
      seg.resize(n);
      ws.slots.extend(jobs + 1);
      if (!ws.jobs.push(SegmentJob{jobs, std::move(seg)}))
        break;
      content_len += n;
      jobs++;
    }
  } catch (...) {
    ws.jobs.close();
    join_all();
    throw;
  }
  ws.jobs.close();
  join_all();

  if (read_ec)
    return errc::source_read;
  ws.error.rethrow_if_set();
  if (auto ec = ws.error.get())
    return ec;

  HashLists lists(coder.layout().total());
  for (uint64_t id = 0; id < jobs; id++) {
    SegmentDigest d;
    if (!ws.slots.take(id, d)) {
      Logger::instance().log(LogLevel::ERROR, "missing hash for segment %llu",
                             (unsigned long long)id);
      return errc::missing_segment;
    }
    if (auto ec = lists.add(d))
      return ec;
  }

  Logger::instance().log(LogLevel::DEBUG,
                         "parallel hash: %llu segments, %llu bytes",
                         (unsigned long long)jobs,
                         (unsigned long long)content_len);

  IntegrityResult res;
  assemble_roots(lists.segments, lists.shards, res.hashes);
  res.content_length = content_len;
  res.redundancy = RedundancyType::ErasureCode;
  out = std::move(res);
  return {};
}

} // namespace ecdigest
