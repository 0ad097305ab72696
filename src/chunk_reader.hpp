#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace s3xfer {

// Read-only view over [start_byte, start_byte + size) of a file.
//
// Each reader opens its own descriptor, so any number of readers may cover the
// same file concurrently. Offsets passed to seek() and returned by tell() are
// relative to the chunk, which lets a failed part upload restart from the
// beginning of its chunk with seek(0).
class ChunkReader {
public:
    // Throws std::system_error if the file cannot be opened
    ChunkReader(const std::string& path, uint64_t start_byte, uint64_t size);
    ~ChunkReader();

    ChunkReader(const ChunkReader&) = delete;
    ChunkReader& operator=(const ChunkReader&) = delete;
    ChunkReader(ChunkReader&& other) noexcept;
    ChunkReader& operator=(ChunkReader&& other) noexcept;

    // Read up to amount bytes (all remaining bytes if omitted).
    // Returns an empty vector at the end of the chunk.
    std::vector<char> read(std::optional<uint64_t> amount = std::nullopt);

    // Read up to n bytes into buffer, returns bytes read (0 at end of chunk)
    size_t read(char* buffer, size_t n);

    // Position relative to chunk start, clamped to [0, length()]
    void seek(uint64_t offset);
    uint64_t tell() const { return position_; }

    // Readable span, clamped against the file size at construction
    uint64_t length() const { return size_; }
    uint64_t remaining() const { return size_ - position_; }

    const std::string& path() const { return path_; }
    uint64_t start_byte() const { return start_byte_; }

    void close();
    bool is_open() const { return fd_ >= 0; }

private:
    void ensure_open(const char* operation) const;
    void sync_file_position();

    std::string path_;
    uint64_t start_byte_;
    uint64_t size_;
    uint64_t position_ = 0;
    int fd_ = -1;
    bool position_dirty_ = true;  // descriptor offset must be reset before next read
};

}  // namespace s3xfer
