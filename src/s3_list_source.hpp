#pragma once

#include "object_lister.hpp"
#include "s3_client.hpp"
#include "types.hpp"

#include <memory>
#include <string>

namespace s3xfer {

// ListObjectsV2 as a page source for ObjectLister
class S3ListSource : public ListObjectsPageSource {
public:
    explicit S3ListSource(std::shared_ptr<Aws::S3::S3Client> client);

    // Throws S3Error if the call fails
    ListObjectsPage fetch_page(const ListObjectsRequest& request,
                               const std::string& continuation_token) override;

private:
    std::shared_ptr<Aws::S3::S3Client> client_;
};

// ISO-8601 date parser for ObjectLister, e.g. "2014-02-27T04:20:38.000Z".
// Throws std::invalid_argument on malformed input.
Timestamp parse_iso8601(const std::string& text);

}  // namespace s3xfer
