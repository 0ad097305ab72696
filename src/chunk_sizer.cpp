#include "chunk_sizer.hpp"
#include <algorithm>
#include <limits>

namespace s3xfer {

uint64_t part_count(uint64_t total_size, uint64_t chunksize) {
    if (chunksize == 0) return 0;
    return total_size / chunksize + (total_size % chunksize != 0 ? 1 : 0);
}

uint64_t find_chunksize(uint64_t total_size,
                        uint64_t chunksize,
                        uint64_t max_parts,
                        uint64_t max_single_part) {
    if (chunksize == 0) return 0;

    if (part_count(total_size, chunksize) <= max_parts &&
        chunksize <= max_single_part) {
        return chunksize;
    }

    // Doubling past max_single_part is harmless, the cap below wins.
    // Stop before overflowing so absurd inputs still terminate.
    while (part_count(total_size, chunksize) > max_parts &&
           chunksize <= std::numeric_limits<uint64_t>::max() / 2) {
        chunksize *= 2;
    }

    return std::min(chunksize, max_single_part);
}

}  // namespace s3xfer
