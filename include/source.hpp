
#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <system_error>
#include <vector>

namespace ecdigest {

// End of input is reported as asio::error::eof.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual size_t read_some(uint8_t* buf, size_t n, std::error_code& ec) = 0;
};

class BufferSource : public ByteSource {
public:
    // Holds a reference; data must outlive the source.
    explicit BufferSource(const std::vector<uint8_t>& data) : data_(data) {}
    BufferSource(std::vector<uint8_t>&&) = delete;
    size_t read_some(uint8_t* buf, size_t n, std::error_code& ec) override;
private:
    const std::vector<uint8_t>& data_;
    size_t pos_{0};
};

class StreamSource : public ByteSource {
public:
    explicit StreamSource(std::istream& in) : in_(in) {}
    size_t read_some(uint8_t* buf, size_t n, std::error_code& ec) override;
private:
    std::istream& in_;
};

class FileSource : public ByteSource {
public:
    FileSource() = default;
    ~FileSource() override;
    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    std::error_code open(const std::string& path);
    bool is_open() const { return fd_ >= 0; }
    void close();
    size_t read_some(uint8_t* buf, size_t n, std::error_code& ec) override;
private:
    int fd_{-1};
};

size_t read_full(ByteSource& src, uint8_t* buf, size_t n, std::error_code& ec);

} // namespace ecdigest
