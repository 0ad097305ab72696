#pragma once

#include "types.hpp"
#include "s3_client.hpp"
#include "s3_uploader.hpp"
#include <string>
#include <vector>

namespace s3xfer {

enum class Command {
    NONE,
    LIST,    // ls s3://bucket[/prefix]
    UPLOAD   // cp FILE s3://bucket/key
};

struct Config {
    Command command = Command::NONE;
    std::string local_path;   // cp source
    std::string s3_uri;       // ls target or cp destination

    S3Config s3_config;
    TransferSettings transfer;
    bool debug = false;

    // Parse from command line
    bool parse(int argc, char* argv[]);

    // Validate configuration
    bool validate() const;

    // Print usage
    static void print_usage(const char* program_name);

private:
    bool parse_chunk_size(const std::string& size_str);
    bool parse_positionals(const std::vector<std::string>& args);
};

}  // namespace s3xfer
