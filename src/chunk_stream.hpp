#pragma once

#include "chunk_reader.hpp"

#include <cstddef>
#include <istream>
#include <streambuf>

namespace s3xfer {

// Input stream buffer pulling from a ChunkReader through a fixed window.
// Positions are chunk-relative. The reader must outlive the buffer.
class ChunkStreamBuf : public std::streambuf {
public:
    explicit ChunkStreamBuf(ChunkReader& reader);

    ChunkStreamBuf(const ChunkStreamBuf&) = delete;
    ChunkStreamBuf& operator=(const ChunkStreamBuf&) = delete;

protected:
    int_type underflow() override;
    std::streamsize showmanyc() override;
    pos_type seekoff(off_type off, std::ios_base::seekdir dir,
                     std::ios_base::openmode which) override;
    pos_type seekpos(pos_type pos, std::ios_base::openmode which) override;

private:
    uint64_t position() const;

    static constexpr size_t BUFFER_SIZE = 64 * 1024;

    ChunkReader& reader_;
    char buffer_[BUFFER_SIZE];
};

// Request body over one chunk of a file. Never holds more than one buffer
// window of the chunk in memory.
class ChunkStream : public std::iostream {
public:
    explicit ChunkStream(ChunkReader& reader);

private:
    ChunkStreamBuf buf_;
};

}  // namespace s3xfer
