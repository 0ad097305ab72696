#pragma once

#include "types.hpp"
#include "s3_client.hpp"
#include "stable_priority_queue.hpp"

#include <aws/s3/S3Client.h>

#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace s3xfer {

struct TransferSettings {
    uint64_t chunk_size = DEFAULT_CHUNK_SIZE;
    uint64_t multipart_threshold = MULTIPART_THRESHOLD;
    int num_workers = DEFAULT_WORKER_COUNT;
    size_t queue_size = DEFAULT_QUEUE_SIZE;
    int max_priority = DEFAULT_MAX_PRIORITY;
    int max_retries = DEFAULT_MAX_RETRIES;
};

struct PartResult {
    bool success = false;
    std::string etag;
    std::string error;
};

// Upload of one byte range of a local file as part of a multipart upload
struct PartUploadTask : public HasPriority {
    std::string bucket;
    std::string key;
    std::string upload_id;
    std::string file_path;
    int part_number;              // 1-based
    uint64_t offset;
    uint64_t size;
    int task_priority;
    std::shared_ptr<std::promise<PartResult>> completion;  // Fulfill when done

    PartUploadTask(const std::string& bkt, const std::string& k, const std::string& id,
                   const std::string& path, int part, uint64_t off, uint64_t sz,
                   int prio = PART_UPLOAD_PRIORITY)
        : bucket(bkt)
        , key(k)
        , upload_id(id)
        , file_path(path)
        , part_number(part)
        , offset(off)
        , size(sz)
        , task_priority(prio)
        , completion(std::make_shared<std::promise<PartResult>>()) {}

    int priority() const override { return task_priority; }
};

struct UploadSummary {
    uint64_t bytes = 0;
    bool multipart = false;
    uint64_t chunk_size = 0;
    uint64_t parts = 0;
    std::string etag;
};

// Uploads local files to S3. Large files are split into parts that a pool of
// worker threads uploads in parallel, each part read through its own ChunkReader.
class S3Uploader {
public:
    S3Uploader(std::shared_ptr<Aws::S3::S3Client> client,
               const TransferSettings& settings = TransferSettings());

    ~S3Uploader();

    // Start worker threads
    void start();

    // Shutdown workers. Parts still queued are failed.
    void shutdown();

    bool is_running() const { return started_ && !shutdown_flag_; }

    // Queue a part upload. Blocks while the queue is full.
    std::shared_future<PartResult> submit(std::shared_ptr<PartUploadTask> task);

    // Upload local_path to s3://bucket/key. Requires start().
    // Throws S3Error on remote failures and std::system_error on local I/O errors.
    UploadSummary upload_file(const std::string& local_path,
                              const std::string& bucket,
                              const std::string& key);

    struct Stats {
        std::atomic<uint64_t> parts_uploaded{0};
        std::atomic<uint64_t> parts_failed{0};
        std::atomic<uint64_t> part_retries{0};
        std::atomic<uint64_t> bytes_uploaded{0};
    };

    const Stats& get_stats() const { return stats_; }
    const TransferSettings& settings() const { return settings_; }

private:
    void worker_loop(int worker_id);
    PartResult upload_part(const PartUploadTask& task);

    UploadSummary put_object(const std::string& local_path, uint64_t size,
                             const std::string& bucket, const std::string& key);
    UploadSummary multipart_upload(const std::string& local_path, uint64_t size,
                                   const std::string& bucket, const std::string& key);
    void abort_upload(const std::string& bucket, const std::string& key,
                      const std::string& upload_id);

    std::shared_ptr<Aws::S3::S3Client> s3_client_;
    TransferSettings settings_;

    StablePriorityQueue<PartUploadTask> task_queue_;
    std::vector<std::thread> workers_;
    std::atomic<bool> started_;
    std::atomic<bool> shutdown_flag_;

    Stats stats_;
};

}  // namespace s3xfer
