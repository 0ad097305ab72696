#include "path_utils.hpp"
#include <filesystem>

namespace s3xfer {

namespace fs = std::filesystem;

namespace {

constexpr const char* S3_SCHEME = "s3://";
constexpr const char* REPLACEMENT_CHAR = "\xEF\xBF\xBD";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

}  // namespace

std::pair<std::string, std::string> find_bucket_key(const std::string& s3_path) {
    std::string path = s3_path;
    if (path.compare(0, 5, S3_SCHEME) == 0) {
        path = path.substr(5);
    }

    size_t slash = path.find('/');
    if (slash == std::string::npos) {
        return {path, ""};
    }
    return {path.substr(0, slash), path.substr(slash + 1)};
}

std::string relative_path(const std::string& filename, const std::string& start) {
    try {
        fs::path file(filename);
        fs::path dir = file.parent_path();
        if (dir.empty()) {
            dir = ".";
        }

        fs::path base = fs::absolute(start).lexically_normal();
        fs::path rel = fs::absolute(dir).lexically_normal().lexically_relative(base);
        if (rel.empty()) {
            return fs::absolute(file).lexically_normal().string();
        }
        return (rel / file.filename()).string();
    } catch (const fs::filesystem_error&) {
        return filename;
    }
}

std::string url_unquote(const std::string& text) {
    std::string bytes;
    bytes.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                bytes.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        bytes.push_back(text[i]);
    }

    return sanitize_utf8(bytes);
}

std::string sanitize_utf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());

    size_t i = 0;
    while (i < bytes.size()) {
        unsigned char lead = static_cast<unsigned char>(bytes[i]);

        if (lead < 0x80) {
            out.push_back(static_cast<char>(lead));
            ++i;
            continue;
        }

        // Sequence length and allowed range of the second byte (rejects
        // overlong forms, surrogates and code points above U+10FFFF)
        size_t needed = 0;
        unsigned char lo = 0x80, hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            needed = 1;
        } else if (lead == 0xE0) {
            needed = 2; lo = 0xA0;
        } else if (lead >= 0xE1 && lead <= 0xEC) {
            needed = 2;
        } else if (lead == 0xED) {
            needed = 2; hi = 0x9F;
        } else if (lead >= 0xEE && lead <= 0xEF) {
            needed = 2;
        } else if (lead == 0xF0) {
            needed = 3; lo = 0x90;
        } else if (lead >= 0xF1 && lead <= 0xF3) {
            needed = 3;
        } else if (lead == 0xF4) {
            needed = 3; hi = 0x8F;
        } else {
            out += REPLACEMENT_CHAR;
            ++i;
            continue;
        }

        // Length of the valid prefix, lead byte included
        size_t valid = 1;
        while (valid <= needed && i + valid < bytes.size()) {
            unsigned char c = static_cast<unsigned char>(bytes[i + valid]);
            bool ok = (valid == 1) ? (c >= lo && c <= hi) : is_continuation(c);
            if (!ok) break;
            ++valid;
        }

        if (valid == needed + 1) {
            out.append(bytes, i, valid);
        } else {
            out += REPLACEMENT_CHAR;
        }
        i += valid;
    }

    return out;
}

}  // namespace s3xfer
