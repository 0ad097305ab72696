#include "s3_list_source.hpp"

#include <aws/core/utils/DateTime.h>
#include <aws/s3/model/EncodingType.h>
#include <aws/s3/model/ListObjectsV2Request.h>

#include <stdexcept>
#include <utility>

namespace s3xfer {

S3ListSource::S3ListSource(std::shared_ptr<Aws::S3::S3Client> client)
    : client_(std::move(client)) {
}

ListObjectsPage S3ListSource::fetch_page(const ListObjectsRequest& request,
                                         const std::string& continuation_token) {
    Aws::S3::Model::ListObjectsV2Request aws_request;
    aws_request.SetBucket(request.bucket.c_str());
    aws_request.SetMaxKeys(request.max_keys);

    if (request.prefix.has_value() && !request.prefix->empty()) {
        aws_request.SetPrefix(request.prefix->c_str());
    }
    if (request.encoding_type == "url") {
        aws_request.SetEncodingType(Aws::S3::Model::EncodingType::url);
    }
    if (!continuation_token.empty()) {
        aws_request.SetContinuationToken(continuation_token.c_str());
    }

    auto outcome = client_->ListObjectsV2(aws_request);
    if (!outcome.IsSuccess()) {
        throw make_s3_error("ListObjectsV2", outcome.GetError());
    }

    const auto& result = outcome.GetResult();

    ListObjectsPage page;
    page.is_truncated = result.GetIsTruncated();
    page.next_continuation_token = result.GetNextContinuationToken().c_str();
    page.contents.reserve(result.GetContents().size());

    for (const auto& obj : result.GetContents()) {
        RawObject raw;
        raw.key = obj.GetKey().c_str();
        raw.size = static_cast<uint64_t>(obj.GetSize());
        raw.last_modified =
            obj.GetLastModified().ToGmtString(Aws::Utils::DateFormat::ISO_8601).c_str();
        page.contents.push_back(std::move(raw));
    }

    return page;
}

Timestamp parse_iso8601(const std::string& text) {
    Aws::Utils::DateTime parsed(text.c_str(), Aws::Utils::DateFormat::ISO_8601);
    if (!parsed.WasParseSuccessful()) {
        throw std::invalid_argument("Invalid ISO-8601 timestamp: " + text);
    }
    return parsed.UnderlyingTimestamp();
}

}  // namespace s3xfer
