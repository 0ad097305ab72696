#include "s3_client.hpp"
#include "logger.hpp"

#include <aws/core/client/ClientConfiguration.h>

namespace s3xfer {

S3Error make_s3_error(const std::string& operation,
                      const Aws::Client::AWSError<Aws::S3::S3Errors>& error) {
    return S3Error(operation,
                   std::string(error.GetExceptionName().c_str()),
                   std::string(error.GetMessage().c_str()));
}

std::shared_ptr<Aws::S3::S3Client> make_s3_client(const S3Config& config) {
    Aws::Client::ClientConfiguration client_config;
    if (!config.region.empty()) {
        client_config.region = config.region.c_str();
    }
    if (!config.endpoint_url.empty()) {
        client_config.endpointOverride = config.endpoint_url.c_str();
    }
    client_config.maxConnections = config.max_connections;

    Logger::debug("S3Client", "Creating client: region=" +
                  (config.region.empty() ? std::string("<default>") : config.region) +
                  (config.endpoint_url.empty() ? "" : ", endpoint=" + config.endpoint_url));

    return std::make_shared<Aws::S3::S3Client>(client_config);
}

}  // namespace s3xfer
