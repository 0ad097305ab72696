#include "s3_uploader.hpp"
#include "chunk_reader.hpp"
#include "chunk_sizer.hpp"
#include "chunk_stream.hpp"
#include "logger.hpp"

#include <aws/core/utils/memory/AWSMemory.h>
#include <aws/core/utils/memory/stl/AWSStreamFwd.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/s3/model/UploadPartRequest.h>

#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace s3xfer {

namespace {

constexpr const char* ALLOC_TAG = "s3xfer";

// Request body streaming the chunk from its current position. The body
// borrows the reader, which must outlive the request.
std::shared_ptr<Aws::IOStream> make_body(ChunkReader& reader) {
    auto body = Aws::MakeShared<ChunkStream>(ALLOC_TAG, reader);
    if (!body->good()) {
        throw std::runtime_error("chunk body of " + reader.path() + " not readable");
    }
    return body;
}

}  // namespace

S3Uploader::S3Uploader(std::shared_ptr<Aws::S3::S3Client> client,
                       const TransferSettings& settings)
    : s3_client_(std::move(client))
    , settings_(settings)
    , task_queue_(settings.queue_size, settings.max_priority)
    , started_(false)
    , shutdown_flag_(false) {

    if (!s3_client_) {
        throw std::invalid_argument("S3Uploader requires an S3 client");
    }

    Logger::info("S3Uploader", "Initialized: workers=" + std::to_string(settings_.num_workers) +
                 ", chunk_size=" + std::to_string(settings_.chunk_size) +
                 ", queue_size=" + std::to_string(settings_.queue_size));
}

S3Uploader::~S3Uploader() {
    shutdown();
}

void S3Uploader::start() {
    if (started_.exchange(true)) {
        Logger::warn("S3Uploader", "Already started");
        return;
    }

    for (int i = 0; i < settings_.num_workers; ++i) {
        workers_.emplace_back(&S3Uploader::worker_loop, this, i);
    }
    Logger::info("S3Uploader", "Started " + std::to_string(settings_.num_workers) + " workers");
}

void S3Uploader::shutdown() {
    if (shutdown_flag_.exchange(true)) {
        return;  // Already shutdown
    }

    Logger::debug("S3Uploader", "Shutting down...");

    task_queue_.shutdown();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    // Nobody is left to run these
    while (auto task = task_queue_.try_get()) {
        task->completion->set_value({false, "", "uploader shut down"});
    }

    Logger::debug("S3Uploader", "All workers stopped");
}

std::shared_future<PartResult> S3Uploader::submit(std::shared_ptr<PartUploadTask> task) {
    auto future = task->completion->get_future().share();

    if (!task_queue_.put(task)) {
        task->completion->set_value({false, "", "uploader shut down"});
    }

    return future;
}

void S3Uploader::worker_loop(int worker_id) {
    while (!shutdown_flag_) {
        auto task = task_queue_.get();

        if (!task) {
            break;  // Shutdown signal
        }

        PartResult result;
        try {
            result = upload_part(*task);
        } catch (const std::exception& e) {
            stats_.parts_failed++;
            result = {false, "", e.what()};
        }

        if (!result.success) {
            Logger::error("S3Uploader", "Worker " + std::to_string(worker_id) +
                          ": part " + std::to_string(task->part_number) + " of " +
                          task->file_path + " failed: " + result.error);
        }

        task->completion->set_value(std::move(result));
    }
}

PartResult S3Uploader::upload_part(const PartUploadTask& task) {
    ChunkReader reader(task.file_path, task.offset, task.size);

    Aws::S3::Model::UploadPartRequest request;
    request.SetBucket(task.bucket.c_str());
    request.SetKey(task.key.c_str());
    request.SetUploadId(task.upload_id.c_str());
    request.SetPartNumber(task.part_number);
    request.SetContentLength(static_cast<long long>(reader.length()));

    std::string last_error;
    for (int attempt = 0; attempt <= settings_.max_retries; ++attempt) {
        // A retry re-sends the whole chunk, not the whole file
        reader.seek(0);
        request.SetBody(make_body(reader));

        auto outcome = s3_client_->UploadPart(request);
        if (outcome.IsSuccess()) {
            stats_.parts_uploaded++;
            stats_.bytes_uploaded += reader.length();
            return {true, outcome.GetResult().GetETag().c_str(), ""};
        }

        const auto& error = outcome.GetError();
        last_error = make_s3_error("UploadPart", error).what();
        if (!error.ShouldRetry() || attempt == settings_.max_retries) {
            break;
        }

        stats_.part_retries++;
        Logger::warn("S3Uploader", "Retrying part " + std::to_string(task.part_number) +
                     " of s3://" + task.bucket + "/" + task.key +
                     " (attempt " + std::to_string(attempt + 2) + "): " + last_error);
    }

    stats_.parts_failed++;
    return {false, "", last_error};
}

UploadSummary S3Uploader::upload_file(const std::string& local_path,
                                      const std::string& bucket,
                                      const std::string& key) {
    if (!is_running()) {
        throw std::logic_error("S3Uploader::upload_file called before start()");
    }

    std::error_code ec;
    uint64_t size = std::filesystem::file_size(local_path, ec);
    if (ec) {
        throw std::system_error(ec, "stat " + local_path);
    }

    if (size > MAX_UPLOAD_SIZE) {
        throw std::invalid_argument(local_path + " exceeds the maximum object size");
    }

    if (size < settings_.multipart_threshold) {
        return put_object(local_path, size, bucket, key);
    }
    return multipart_upload(local_path, size, bucket, key);
}

UploadSummary S3Uploader::put_object(const std::string& local_path, uint64_t size,
                                     const std::string& bucket, const std::string& key) {
    ChunkReader reader(local_path, 0, size);

    Aws::S3::Model::PutObjectRequest request;
    request.SetBucket(bucket.c_str());
    request.SetKey(key.c_str());
    request.SetContentLength(static_cast<long long>(reader.length()));
    request.SetBody(make_body(reader));

    auto outcome = s3_client_->PutObject(request);
    if (!outcome.IsSuccess()) {
        throw make_s3_error("PutObject", outcome.GetError());
    }

    stats_.bytes_uploaded += reader.length();

    UploadSummary summary;
    summary.bytes = reader.length();
    summary.etag = outcome.GetResult().GetETag().c_str();
    return summary;
}

UploadSummary S3Uploader::multipart_upload(const std::string& local_path, uint64_t size,
                                           const std::string& bucket, const std::string& key) {
    uint64_t chunk_size = find_chunksize(size, settings_.chunk_size);
    uint64_t num_parts = part_count(size, chunk_size);

    Aws::S3::Model::CreateMultipartUploadRequest create_request;
    create_request.SetBucket(bucket.c_str());
    create_request.SetKey(key.c_str());

    auto create_outcome = s3_client_->CreateMultipartUpload(create_request);
    if (!create_outcome.IsSuccess()) {
        throw make_s3_error("CreateMultipartUpload", create_outcome.GetError());
    }
    std::string upload_id = create_outcome.GetResult().GetUploadId().c_str();

    Logger::debug("S3Uploader", "Multipart upload " + upload_id + " for s3://" + bucket + "/" +
                  key + ": " + std::to_string(num_parts) + " parts of " +
                  std::to_string(chunk_size) + " bytes");

    std::vector<std::shared_future<PartResult>> futures;
    futures.reserve(num_parts);
    for (uint64_t i = 0; i < num_parts; ++i) {
        auto task = std::make_shared<PartUploadTask>(
            bucket, key, upload_id, local_path,
            static_cast<int>(i + 1), i * chunk_size, chunk_size);
        futures.push_back(submit(std::move(task)));
    }

    Aws::S3::Model::CompletedMultipartUpload completed;
    std::string first_error;
    for (size_t i = 0; i < futures.size(); ++i) {
        const PartResult& result = futures[i].get();
        if (!result.success) {
            if (first_error.empty()) {
                first_error = "part " + std::to_string(i + 1) + ": " + result.error;
            }
            continue;
        }

        Aws::S3::Model::CompletedPart part;
        part.SetPartNumber(static_cast<int>(i + 1));
        part.SetETag(result.etag.c_str());
        completed.AddParts(part);
    }

    if (!first_error.empty()) {
        abort_upload(bucket, key, upload_id);
        throw S3Error("UploadPart", "", first_error);
    }

    Aws::S3::Model::CompleteMultipartUploadRequest complete_request;
    complete_request.SetBucket(bucket.c_str());
    complete_request.SetKey(key.c_str());
    complete_request.SetUploadId(upload_id.c_str());
    complete_request.SetMultipartUpload(completed);

    auto complete_outcome = s3_client_->CompleteMultipartUpload(complete_request);
    if (!complete_outcome.IsSuccess()) {
        abort_upload(bucket, key, upload_id);
        throw make_s3_error("CompleteMultipartUpload", complete_outcome.GetError());
    }

    UploadSummary summary;
    summary.bytes = size;
    summary.multipart = true;
    summary.chunk_size = chunk_size;
    summary.parts = num_parts;
    summary.etag = complete_outcome.GetResult().GetETag().c_str();
    return summary;
}

void S3Uploader::abort_upload(const std::string& bucket, const std::string& key,
                              const std::string& upload_id) {
    Aws::S3::Model::AbortMultipartUploadRequest request;
    request.SetBucket(bucket.c_str());
    request.SetKey(key.c_str());
    request.SetUploadId(upload_id.c_str());

    auto outcome = s3_client_->AbortMultipartUpload(request);
    if (!outcome.IsSuccess()) {
        // The original failure is what gets reported to the caller
        Logger::error("S3Uploader", "Abort of multipart upload " + upload_id + " failed: " +
                      std::string(outcome.GetError().GetMessage().c_str()));
    } else {
        Logger::warn("S3Uploader", "Aborted multipart upload " + upload_id +
                     " for s3://" + bucket + "/" + key);
    }
}

}  // namespace s3xfer
