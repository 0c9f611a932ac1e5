#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "provider/iprovider.hpp"

namespace provider
{

// Reads a file through a POSIX descriptor; used for outgoing stream payloads.
class FileByteSource final : public ByteSource
{
  public:
    explicit FileByteSource(const std::string &path);
    ~FileByteSource() override;

    FileByteSource(const FileByteSource &)            = delete;
    FileByteSource &operator=(const FileByteSource &) = delete;

    bool is_open() const { return fd_ >= 0; }
    long read(std::uint8_t *buf, std::size_t n) override;
    bool close() override;

  private:
    int fd_{-1};
};

// Bytes appended by a producer thread and read by the consumer. read() never
// blocks; it returns 0 when everything appended so far has been consumed.
class BufferByteSource final : public ByteSource
{
  public:
    void append(const std::uint8_t *data, std::size_t n);
    void finish();  // no more bytes will be appended

    long read(std::uint8_t *buf, std::size_t n) override;
    bool close() override;

    bool closed() const;

  private:
    mutable std::mutex        mu_;
    std::vector<std::uint8_t> data_;
    std::size_t               read_pos_{0};
    bool                      finished_{false};
    bool                      closed_{false};
};

}  // namespace provider
