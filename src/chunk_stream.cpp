#include "chunk_stream.hpp"

namespace s3xfer {

ChunkStreamBuf::ChunkStreamBuf(ChunkReader& reader)
    : reader_(reader) {
    setp(nullptr, nullptr);
    setg(buffer_, buffer_, buffer_);
}

ChunkStreamBuf::int_type ChunkStreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }

    size_t n = reader_.read(buffer_, BUFFER_SIZE);
    if (n == 0) {
        return traits_type::eof();
    }

    setg(buffer_, buffer_, buffer_ + n);
    return traits_type::to_int_type(*gptr());
}

std::streamsize ChunkStreamBuf::showmanyc() {
    uint64_t left = reader_.length() - position();
    return left == 0 ? -1 : static_cast<std::streamsize>(left);
}

ChunkStreamBuf::pos_type ChunkStreamBuf::seekoff(off_type off, std::ios_base::seekdir dir,
                                                 std::ios_base::openmode which) {
    if (!(which & std::ios_base::in)) {
        return pos_type(off_type(-1));
    }

    long long base = 0;
    if (dir == std::ios_base::cur) {
        base = static_cast<long long>(position());
    } else if (dir == std::ios_base::end) {
        base = static_cast<long long>(reader_.length());
    }

    long long target = base + off;
    if (target < 0 || static_cast<uint64_t>(target) > reader_.length()) {
        return pos_type(off_type(-1));
    }

    reader_.seek(static_cast<uint64_t>(target));
    setg(buffer_, buffer_, buffer_);
    return pos_type(off_type(target));
}

ChunkStreamBuf::pos_type ChunkStreamBuf::seekpos(pos_type pos, std::ios_base::openmode which) {
    return seekoff(off_type(pos), std::ios_base::beg, which);
}

uint64_t ChunkStreamBuf::position() const {
    // The reader is ahead of the stream by whatever is still buffered
    return reader_.tell() - static_cast<uint64_t>(egptr() - gptr());
}

ChunkStream::ChunkStream(ChunkReader& reader)
    : std::iostream(nullptr)
    , buf_(reader) {
    rdbuf(&buf_);
    clear();
}

}  // namespace s3xfer
