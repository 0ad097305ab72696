#include "../src/config.hpp"
#include <cassert>
#include <iostream>

using namespace s3xfer;

void test_minimal_list_config() {
    const char* argv[] = {
        "s3xfer",
        "ls", "s3://my-bucket"
    };
    int argc = 3;

    Config config;
    bool success = config.parse(argc, const_cast<char**>(argv));

    assert(success);
    assert(config.command == Command::LIST);
    assert(config.s3_uri == "s3://my-bucket");

    // Defaults
    assert(config.transfer.chunk_size == DEFAULT_CHUNK_SIZE);
    assert(config.transfer.num_workers == DEFAULT_WORKER_COUNT);
    assert(config.transfer.max_retries == DEFAULT_MAX_RETRIES);
    assert(!config.debug);

    std::cout << "test_minimal_list_config: PASS\n";
}

void test_full_upload_config() {
    const char* argv[] = {
        "s3xfer",
        "--region", "eu-west-1",
        "--endpoint-url", "http://localhost:9000",
        "--chunk-size", "64M",
        "--workers", "16",
        "--queue-size", "32",
        "--max-retries", "2",
        "--debug",
        "cp", "backup.tar", "s3://training-data/backups/backup.tar"
    };
    int argc = 17;

    Config config;
    bool success = config.parse(argc, const_cast<char**>(argv));

    assert(success);
    assert(config.command == Command::UPLOAD);
    assert(config.local_path == "backup.tar");
    assert(config.s3_uri == "s3://training-data/backups/backup.tar");
    assert(config.s3_config.region == "eu-west-1");
    assert(config.s3_config.endpoint_url == "http://localhost:9000");
    assert(config.s3_config.max_connections == 32);
    assert(config.transfer.chunk_size == 64ULL * 1024 * 1024);
    assert(config.transfer.num_workers == 16);
    assert(config.transfer.queue_size == 32);
    assert(config.transfer.max_retries == 2);
    assert(config.debug);

    std::cout << "test_full_upload_config: PASS\n";
}

void test_missing_command() {
    const char* argv[] = {
        "s3xfer",
        "--region", "us-west-2"
        // Missing command
    };
    int argc = 3;

    Config config;
    bool success = config.parse(argc, const_cast<char**>(argv));

    assert(!success);  // Should fail

    std::cout << "test_missing_command: PASS\n";
}

void test_upload_needs_key() {
    const char* argv[] = {
        "s3xfer",
        "cp", "file.bin", "s3://bucket-only"
    };
    int argc = 4;

    Config config;
    bool success = config.parse(argc, const_cast<char**>(argv));

    assert(!success);

    std::cout << "test_upload_needs_key: PASS\n";
}

void test_invalid_chunk_size() {
    const char* argv[] = {
        "s3xfer",
        "--chunk-size", "invalid",
        "ls", "s3://bucket"
    };
    int argc = 5;

    Config config;
    bool success = config.parse(argc, const_cast<char**>(argv));

    assert(!success);  // Should fail parsing

    std::cout << "test_invalid_chunk_size: PASS\n";
}

void test_chunk_size_below_part_minimum() {
    const char* argv[] = {
        "s3xfer",
        "--chunk-size", "1M",
        "cp", "file.bin", "s3://bucket/key"
    };
    int argc = 6;

    Config config;
    bool success = config.parse(argc, const_cast<char**>(argv));

    assert(!success);  // Should fail validation

    std::cout << "test_chunk_size_below_part_minimum: PASS\n";
}

void test_unknown_option() {
    const char* argv[] = {
        "s3xfer",
        "--recursive",
        "ls", "s3://bucket"
    };
    int argc = 4;

    Config config;
    assert(!config.parse(argc, const_cast<char**>(argv)));

    std::cout << "test_unknown_option: PASS\n";
}

int main() {
    test_minimal_list_config();
    test_full_upload_config();
    test_missing_command();
    test_upload_needs_key();
    test_invalid_chunk_size();
    test_chunk_size_below_part_minimum();
    test_unknown_option();
    std::cout << "All Config tests passed!\n";
    return 0;
}
