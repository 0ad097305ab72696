#pragma once

#include <aws/core/Aws.h>
#include <aws/core/client/AWSError.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace s3xfer {

struct S3Config {
    std::string region;
    std::string endpoint_url;  // Optional, for S3-compatible stores
    int max_connections = 25;
};

// Failed call against the object store
class S3Error : public std::runtime_error {
public:
    S3Error(const std::string& operation,
            const std::string& error_name,
            const std::string& message)
        : std::runtime_error(operation + " failed: " +
                             (error_name.empty() ? "" : error_name + ": ") + message)
        , operation_(operation)
        , error_name_(error_name) {}

    const std::string& operation() const { return operation_; }
    const std::string& error_name() const { return error_name_; }

private:
    std::string operation_;
    std::string error_name_;
};

S3Error make_s3_error(const std::string& operation,
                      const Aws::Client::AWSError<Aws::S3::S3Errors>& error);

std::shared_ptr<Aws::S3::S3Client> make_s3_client(const S3Config& config);

}  // namespace s3xfer
