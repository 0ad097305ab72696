#pragma once

#include <string>
#include <utility>

namespace s3xfer {

// "bucket/some/key" -> {"bucket", "some/key"}. A leading "s3://" is ignored.
std::pair<std::string, std::string> find_bucket_key(const std::string& s3_path);

// Path of filename relative to start, e.g. ("/tmp/foo/bar", "/tmp/foo") -> "./bar".
// Falls back to the absolute path when no relative form exists.
std::string relative_path(const std::string& filename, const std::string& start = ".");

// Percent-decode text. Malformed escapes are kept as-is, and byte sequences
// that are not valid UTF-8 after decoding are replaced with U+FFFD.
std::string url_unquote(const std::string& text);

// Replace invalid UTF-8 sequences with U+FFFD
std::string sanitize_utf8(const std::string& bytes);

}  // namespace s3xfer
