#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

#include "provider/byte_sources.hpp"
#include "util/log.hpp"

namespace provider
{

// ---------------- FileByteSource ----------------

FileByteSource::FileByteSource(const std::string &path)
{
    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0)
        LOG_ERROR("open(%s) failed: %s", path.c_str(), std::strerror(errno));
}

FileByteSource::~FileByteSource()
{
    if (fd_ >= 0)
        ::close(fd_);
}

long FileByteSource::read(std::uint8_t *buf, std::size_t n)
{
    if (fd_ < 0)
        return -1;
    while (true)
    {
        ssize_t got = ::read(fd_, buf, n);
        if (got >= 0)
            return static_cast<long>(got);
        if (errno == EINTR)
            continue;
        LOG_ERROR("read() failed: %s", std::strerror(errno));
        return -1;
    }
}

bool FileByteSource::close()
{
    if (fd_ < 0)
        return true;
    int r = ::close(fd_);
    fd_   = -1;
    if (r != 0)
    {
        LOG_ERROR("close() failed: %s", std::strerror(errno));
        return false;
    }
    return true;
}

// ---------------- BufferByteSource ----------------

void BufferByteSource::append(const std::uint8_t *data, std::size_t n)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_ || finished_)
        return;
    data_.insert(data_.end(), data, data + n);
}

void BufferByteSource::finish()
{
    std::lock_guard<std::mutex> lk(mu_);
    finished_ = true;
}

long BufferByteSource::read(std::uint8_t *buf, std::size_t n)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_)
        return -1;

    const std::size_t take = std::min(n, data_.size() - read_pos_);
    if (take == 0)
        return 0;
    std::memcpy(buf, data_.data() + read_pos_, take);
    read_pos_ += take;
    return static_cast<long>(take);
}

bool BufferByteSource::close()
{
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
    data_.clear();
    read_pos_ = 0;
    return true;
}

bool BufferByteSource::closed() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
}

}  // namespace provider
