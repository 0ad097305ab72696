#include "chunk_reader.hpp"
#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace s3xfer {

namespace {

std::system_error io_error(int err, const std::string& what) {
    return std::system_error(err, std::generic_category(), what);
}

}  // namespace

ChunkReader::ChunkReader(const std::string& path, uint64_t start_byte, uint64_t size)
    : path_(path)
    , start_byte_(start_byte)
    , size_(0) {

    fd_ = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        throw io_error(errno, "open " + path_);
    }

    struct stat st;
    if (::fstat(fd_, &st) != 0) {
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        throw io_error(err, "stat " + path_);
    }

    // Requests running past EOF only see the bytes that actually exist
    uint64_t file_size = static_cast<uint64_t>(st.st_size);
    if (start_byte_ < file_size) {
        size_ = std::min(size, file_size - start_byte_);
    }
}

ChunkReader::~ChunkReader() {
    close();
}

ChunkReader::ChunkReader(ChunkReader&& other) noexcept
    : path_(std::move(other.path_))
    , start_byte_(other.start_byte_)
    , size_(other.size_)
    , position_(other.position_)
    , fd_(other.fd_)
    , position_dirty_(other.position_dirty_) {
    other.fd_ = -1;
}

ChunkReader& ChunkReader::operator=(ChunkReader&& other) noexcept {
    if (this != &other) {
        close();
        path_ = std::move(other.path_);
        start_byte_ = other.start_byte_;
        size_ = other.size_;
        position_ = other.position_;
        fd_ = other.fd_;
        position_dirty_ = other.position_dirty_;
        other.fd_ = -1;
    }
    return *this;
}

std::vector<char> ChunkReader::read(std::optional<uint64_t> amount) {
    ensure_open("read");

    uint64_t want = remaining();
    if (amount.has_value()) {
        want = std::min(want, *amount);
    }

    std::vector<char> data(static_cast<size_t>(want));
    size_t got = read(data.data(), data.size());
    data.resize(got);
    return data;
}

size_t ChunkReader::read(char* buffer, size_t n) {
    ensure_open("read");

    size_t want = static_cast<size_t>(std::min<uint64_t>(n, remaining()));
    if (want == 0) {
        return 0;
    }

    sync_file_position();

    size_t total = 0;
    while (total < want) {
        ssize_t r = ::read(fd_, buffer + total, want - total);
        if (r < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            // The descriptor may have moved past position_
            position_dirty_ = true;
            throw io_error(err, "read " + path_);
        }
        if (r == 0) {
            break;  // File shrank underneath us
        }
        total += static_cast<size_t>(r);
    }

    position_ += total;
    return total;
}

void ChunkReader::seek(uint64_t offset) {
    ensure_open("seek");
    position_ = std::min(offset, size_);
    position_dirty_ = true;
}

void ChunkReader::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void ChunkReader::ensure_open(const char* operation) const {
    if (fd_ < 0) {
        throw io_error(EBADF, std::string(operation) + " on closed chunk of " + path_);
    }
}

void ChunkReader::sync_file_position() {
    if (!position_dirty_) {
        return;
    }

    off_t target = static_cast<off_t>(start_byte_ + position_);
    if (::lseek(fd_, target, SEEK_SET) != target) {
        throw io_error(errno, "seek " + path_);
    }
    position_dirty_ = false;
}

}  // namespace s3xfer
