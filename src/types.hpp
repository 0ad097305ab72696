#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace s3xfer {

using Timestamp = std::chrono::system_clock::time_point;

// Multipart limits
constexpr uint64_t MAX_PARTS = 1000;
constexpr uint64_t MAX_SINGLE_UPLOAD_SIZE = 5ULL * 1024 * 1024 * 1024;  // 5GB
constexpr uint64_t MAX_UPLOAD_SIZE = 5ULL * 1024 * 1024 * 1024 * 1024;  // 5TB
constexpr uint64_t DEFAULT_CHUNK_SIZE = 8 * 1024 * 1024;  // 8MB
constexpr uint64_t MULTIPART_THRESHOLD = 8 * 1024 * 1024;

// Task scheduling
constexpr int DEFAULT_MAX_PRIORITY = 20;
constexpr int PART_UPLOAD_PRIORITY = 10;
constexpr size_t DEFAULT_QUEUE_SIZE = 1000;
constexpr int DEFAULT_WORKER_COUNT = 10;
constexpr int DEFAULT_MAX_RETRIES = 5;

// Listing
constexpr int DEFAULT_LIST_PAGE_SIZE = 1000;
constexpr const char* LIST_OBJECTS_EVENT = "after-call.s3.ListObjects";

// Helper to convert string to bytes (parses "16G", "512M", etc.)
inline size_t parse_size(const std::string& size_str) {
    if (size_str.empty()) return 0;

    size_t value = std::stoull(size_str);
    char suffix = size_str.back();

    switch (suffix) {
        case 'K': case 'k': return value * 1024;
        case 'M': case 'm': return value * 1024 * 1024;
        case 'G': case 'g': return value * 1024ULL * 1024 * 1024;
        default: return value;  // Assume bytes if no suffix
    }
}

}  // namespace s3xfer
