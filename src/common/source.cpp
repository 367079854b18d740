
#include "source.hpp"
#include <asio/error.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace ecdigest {

size_t BufferSource::read_some(uint8_t *buf, size_t n, std::error_code &ec) {
  ec.clear();
  if (pos_ >= data_.size()) {
    ec = asio::error::eof;
    return 0;
  }
  size_t m = std::min(n, data_.size() - pos_);
  std::memcpy(buf, data_.data() + pos_, m);
  pos_ += m;
  return m;
}

size_t StreamSource::read_some(uint8_t *buf, size_t n, std::error_code &ec) {
  ec.clear();
  if (in_.bad()) {
    ec = std::make_error_code(std::errc::io_error);
    return 0;
  }
  in_.read(reinterpret_cast<char *>(buf), (std::streamsize)n);
  size_t got = (size_t)in_.gcount();
  if (in_.bad()) {
    ec = std::make_error_code(std::errc::io_error);
    return 0;
  }
  if (got == 0 && in_.eof())
    ec = asio::error::eof;
  else if (got == 0 && in_.fail())
    ec = std::make_error_code(std::errc::io_error);
  return got;
}

FileSource::~FileSource() { close(); }

std::error_code FileSource::open(const std::string &path) {
  close();
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0)
    return std::error_code(errno, std::generic_category());
  fd_ = fd;
  return {};
}

void FileSource::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

size_t FileSource::read_some(uint8_t *buf, size_t n, std::error_code &ec) {
  ec.clear();
  if (fd_ < 0) {
    ec = std::make_error_code(std::errc::bad_file_descriptor);
    return 0;
  }
  for (;;) {
    ssize_t r = ::read(fd_, buf, n);
    if (r > 0)
      return (size_t)r;
    if (r == 0) {
      ec = asio::error::eof;
      return 0;
    }
    if (errno != EINTR) {
      ec = std::error_code(errno, std::generic_category());
      return 0;
    }
  }
}

size_t read_full(ByteSource &src, uint8_t *buf, size_t n, std::error_code &ec) {
  ec.clear();
  size_t total = 0;
  while (total < n) {
    size_t got = src.read_some(buf + total, n - total, ec);
    total += got;
    if (ec) {
      if (ec == asio::error::eof && total > 0)
        ec.clear();
      break;
    }
  }
  return total;
}

} // namespace ecdigest
