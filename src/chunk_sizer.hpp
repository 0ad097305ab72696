#pragma once

#include "types.hpp"
#include <cstdint>

namespace s3xfer {

// Number of parts needed to cover total_size with chunks of chunksize (rounded up)
uint64_t part_count(uint64_t total_size, uint64_t chunksize);

// Pick a part size for a multipart upload of total_size bytes.
//
// The requested chunksize is returned untouched when it already yields at most
// max_parts parts and fits in a single part. Otherwise it is doubled until the
// part count fits, and the result is capped at max_single_part.
uint64_t find_chunksize(uint64_t total_size,
                        uint64_t chunksize,
                        uint64_t max_parts = MAX_PARTS,
                        uint64_t max_single_part = MAX_SINGLE_UPLOAD_SIZE);

}  // namespace s3xfer
