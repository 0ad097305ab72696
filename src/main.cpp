#include "config.hpp"
#include "event_bus.hpp"
#include "logger.hpp"
#include "object_lister.hpp"
#include "path_utils.hpp"
#include "s3_client.hpp"
#include "s3_list_source.hpp"
#include "s3_uploader.hpp"

#include <aws/core/Aws.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>

using namespace s3xfer;

static std::string format_timestamp(const Timestamp& ts) {
    auto time_t_value = std::chrono::system_clock::to_time_t(ts);
    std::tm tm_buf;
    localtime_r(&time_t_value, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

static int run_list(const Config& config) {
    auto [bucket, prefix] = find_bucket_key(config.s3_uri);

    auto client = make_s3_client(config.s3_config);
    S3ListSource source(client);
    HierarchicalEventBus<ListObjectsPage> events;
    ObjectLister lister(source, events, parse_iso8601);

    size_t pages = 0;
    ScopedEventHandler<ListObjectsPage> page_counter(events, LIST_OBJECTS_EVENT,
        [&pages](const ListObjectsPage& page) {
            ++pages;
            Logger::debug("ls", "Page " + std::to_string(pages) + ": " +
                          std::to_string(page.contents.size()) + " objects");
        });

    uint64_t total_objects = 0;
    uint64_t total_bytes = 0;
    std::optional<std::string> list_prefix;
    if (!prefix.empty()) {
        list_prefix = prefix;
    }

    for (const auto& entry : lister.list_objects(bucket, list_prefix)) {
        std::cout << format_timestamp(entry.last_modified) << " "
                  << std::setw(10) << entry.size << " "
                  << entry.path << "\n";
        ++total_objects;
        total_bytes += entry.size;
    }

    Logger::info("ls", "Listed " + std::to_string(total_objects) + " objects (" +
                 std::to_string(total_bytes) + " bytes) in " + std::to_string(pages) + " pages");
    return 0;
}

static int run_upload(const Config& config) {
    auto [bucket, key] = find_bucket_key(config.s3_uri);

    S3Uploader uploader(make_s3_client(config.s3_config), config.transfer);
    uploader.start();

    UploadSummary summary = uploader.upload_file(config.local_path, bucket, key);
    uploader.shutdown();

    std::cout << "upload: " << relative_path(config.local_path) << " to "
              << config.s3_uri << "\n";

    if (summary.multipart) {
        Logger::info("cp", "Uploaded " + std::to_string(summary.bytes) + " bytes in " +
                     std::to_string(summary.parts) + " parts of " +
                     std::to_string(summary.chunk_size) + " bytes (" +
                     std::to_string(uploader.get_stats().part_retries.load()) + " retries)");
    } else {
        Logger::info("cp", "Uploaded " + std::to_string(summary.bytes) + " bytes");
    }
    return 0;
}

int main(int argc, char* argv[]) {
    // Parse configuration
    Config config;
    if (!config.parse(argc, argv)) {
        return 1;
    }

    if (config.debug) {
        Logger::set_level(LogLevel::DEBUG);
    }

    Aws::SDKOptions sdk_options;
    Aws::InitAPI(sdk_options);

    int ret = 1;
    try {
        switch (config.command) {
            case Command::LIST:
                ret = run_list(config);
                break;
            case Command::UPLOAD:
                ret = run_upload(config);
                break;
            case Command::NONE:
                break;
        }
    } catch (const std::exception& e) {
        Logger::error("s3xfer", e.what());
        ret = 1;
    }

    Aws::ShutdownAPI(sdk_options);
    return ret;
}
