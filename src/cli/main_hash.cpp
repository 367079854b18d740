
#include "integrity.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <limits>

using namespace ecdigest;

static void usage() {
  std::cerr << "usage: ecdigest-hash (--file <path> | --hex <bytes>)\n"
               "         [--segment-size <n>] [--data-shards <n>]\n"
               "         [--parity-shards <n>] [--serial]\n"
               "         [--log-level trace|debug|info|warn|error]\n";
}

int main(int argc, char **argv) {
  HashConfig cfg;
  std::string file;
  std::string hex;
  bool have_hex = false;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    auto next_u64 = [&](int &i, uint64_t max) -> uint64_t {
      std::string v = next(i);
      uint64_t n = 0;
      if (!parse_u64(v, n) || n > max) {
        std::cerr << "bad value for " << a << ": " << v << "\n";
        std::exit(1);
      }
      return n;
    };
    if (a == "--file")
      file = next(i);
    else if (a == "--hex") {
      hex = next(i);
      have_hex = true;
    } else if (a == "--segment-size")
      cfg.segment_size =
          next_u64(i, std::numeric_limits<uint32_t>::max());
    else if (a == "--data-shards")
      cfg.layout.data_shards = (uint16_t)next_u64(i, kMaxTotalShards);
    else if (a == "--parity-shards")
      cfg.layout.parity_shards = (uint16_t)next_u64(i, kMaxTotalShards);
    else if (a == "--serial")
      cfg.strategy = Strategy::Serial;
    else if (a == "--log-level") {
      std::string v = next(i);
      if (!parse_log_level(v, cfg.log_level)) {
        std::cerr << "bad log level " << v << "\n";
        return 1;
      }
    } else if (a == "--help" || a == "-h") {
      usage();
      return 0;
    } else {
      std::cerr << "unknown option " << a << "\n";
      usage();
      return 1;
    }
  }

  if (file.empty() == !have_hex) {
    usage();
    return 1;
  }
  Logger::instance().set_level(cfg.log_level);

  std::vector<uint8_t> content;
  if (have_hex) {
    content = hex_to_bytes(hex);
    if (content.empty() && !hex.empty()) {
      std::cerr << "bad hex input" << std::endl;
      return 1;
    }
  }

  IntegrityResult res;
  std::error_code ec;
  if (have_hex) {
    BufferSource src(content);
    ec = compute_integrity_hash(src, cfg, res);
  } else {
    FileSource src;
    if (auto oec = src.open(file)) {
      Logger::instance().log(LogLevel::ERROR, "failed to open file %s: %s",
                             file.c_str(), oec.message().c_str());
      return 2;
    }
    ec = compute_integrity_hash(src, cfg, res);
  }
  if (ec) {
    Logger::instance().log(LogLevel::ERROR, "integrity hash failed: %s",
                           ec.message().c_str());
    return 2;
  }

  std::printf("content_length=%llu\n", (unsigned long long)res.content_length);
  std::printf("redundancy=%s\n",
              res.redundancy == RedundancyType::ErasureCode ? "ec" : "replica");
  for (size_t i = 0; i < res.hashes.size(); i++)
    std::printf("hash[%zu]=%s\n", i, to_hex(res.hashes[i]).c_str());
  return 0;
}
