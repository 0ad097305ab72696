#include "config.hpp"
#include <iostream>
#include <stdexcept>

namespace s3xfer {

namespace {

bool is_s3_uri(const std::string& value) {
    return value.compare(0, 5, "s3://") == 0 && value.size() > 5;
}

}  // namespace

bool Config::parse(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return false;
    }

    std::vector<std::string> positionals;

    // Simple argument parser (no external dependencies)
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--region") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --region requires an argument\n";
                return false;
            }
            s3_config.region = argv[++i];
        }
        else if (arg == "--endpoint-url") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --endpoint-url requires an argument\n";
                return false;
            }
            s3_config.endpoint_url = argv[++i];
        }
        else if (arg == "--chunk-size") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --chunk-size requires an argument\n";
                return false;
            }
            if (!parse_chunk_size(argv[++i])) {
                return false;
            }
        }
        else if (arg == "--workers") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --workers requires an argument\n";
                return false;
            }
            try {
                transfer.num_workers = std::stoi(argv[++i]);
            } catch (const std::exception& e) {
                std::cerr << "Error: Invalid value for --workers\n";
                return false;
            }
        }
        else if (arg == "--queue-size") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --queue-size requires an argument\n";
                return false;
            }
            try {
                transfer.queue_size = std::stoul(argv[++i]);
            } catch (const std::exception& e) {
                std::cerr << "Error: Invalid value for --queue-size\n";
                return false;
            }
        }
        else if (arg == "--max-retries") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --max-retries requires an argument\n";
                return false;
            }
            try {
                transfer.max_retries = std::stoi(argv[++i]);
            } catch (const std::exception& e) {
                std::cerr << "Error: Invalid value for --max-retries\n";
                return false;
            }
        }
        else if (arg == "--debug") {
            debug = true;
        }
        else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return false;
        }
        else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return false;
        }
        else {
            positionals.push_back(arg);
        }
    }

    if (!parse_positionals(positionals)) {
        print_usage(argv[0]);
        return false;
    }

    // Workers share the client's connection pool
    s3_config.max_connections = transfer.num_workers * 2;

    // Validate after parsing
    return validate();
}

bool Config::validate() const {
    switch (command) {
        case Command::LIST:
            if (!is_s3_uri(s3_uri)) {
                std::cerr << "Error: ls requires an s3://bucket[/prefix] argument\n";
                return false;
            }
            break;
        case Command::UPLOAD:
            if (local_path.empty()) {
                std::cerr << "Error: cp requires a local source file\n";
                return false;
            }
            if (!is_s3_uri(s3_uri) || s3_uri.find('/', 5) == std::string::npos ||
                s3_uri.back() == '/') {
                std::cerr << "Error: cp destination must be s3://bucket/key\n";
                return false;
            }
            break;
        case Command::NONE:
            std::cerr << "Error: a command (ls or cp) is required\n";
            return false;
    }

    // Validate numeric ranges
    if (transfer.chunk_size < 5 * 1024 * 1024) {  // S3 minimum part size
        std::cerr << "Error: chunk size must be at least 5MB\n";
        return false;
    }

    if (transfer.chunk_size > MAX_SINGLE_UPLOAD_SIZE) {
        std::cerr << "Error: chunk size must be at most 5GB\n";
        return false;
    }

    if (transfer.num_workers < 1 || transfer.num_workers > 128) {
        std::cerr << "Error: workers must be between 1 and 128\n";
        return false;
    }

    if (transfer.queue_size < 1) {
        std::cerr << "Error: queue size must be at least 1\n";
        return false;
    }

    if (transfer.max_retries < 0 || transfer.max_retries > 20) {
        std::cerr << "Error: max retries must be between 0 and 20\n";
        return false;
    }

    return true;
}

void Config::print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] COMMAND ARGS\n\n"
              << "Commands:\n"
              << "  ls s3://BUCKET[/PREFIX]     List objects under a bucket or prefix\n"
              << "  cp FILE s3://BUCKET/KEY     Upload a local file\n\n"
              << "Options:\n"
              << "  --region REGION         AWS region (default: SDK default chain)\n"
              << "  --endpoint-url URL      Custom S3-compatible endpoint\n"
              << "  --chunk-size SIZE       Multipart chunk size (e.g., 8M, 64M) (default: 8M)\n"
              << "  --workers N             Number of upload threads (1-128) (default: 10)\n"
              << "  --queue-size N          Maximum queued part uploads (default: 1000)\n"
              << "  --max-retries N         Retries per part (0-20) (default: 5)\n"
              << "  --debug                 Enable debug logging\n"
              << "  --help, -h              Show this help message\n\n"
              << "Examples:\n"
              << "  " << program_name << " ls s3://my-bucket/logs/\n"
              << "  " << program_name << " --region eu-west-1 --chunk-size 64M \\\n"
              << "                    cp backup.tar s3://my-bucket/backups/backup.tar\n";
}

bool Config::parse_chunk_size(const std::string& size_str) {
    try {
        transfer.chunk_size = parse_size(size_str);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid chunk size format: " << size_str << "\n";
        std::cerr << "Expected format: number followed by K/M/G (e.g., 8M, 1G)\n";
        return false;
    }
}

bool Config::parse_positionals(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Error: a command (ls or cp) is required\n";
        return false;
    }

    const std::string& name = args[0];
    if (name == "ls") {
        if (args.size() != 2) {
            std::cerr << "Error: ls takes exactly one argument\n";
            return false;
        }
        command = Command::LIST;
        s3_uri = args[1];
    }
    else if (name == "cp") {
        if (args.size() != 3) {
            std::cerr << "Error: cp takes a source and a destination\n";
            return false;
        }
        command = Command::UPLOAD;
        local_path = args[1];
        s3_uri = args[2];
    }
    else {
        std::cerr << "Error: Unknown command: " << name << "\n";
        return false;
    }

    return true;
}

}  // namespace s3xfer
