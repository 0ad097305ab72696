#include "object_lister.hpp"
#include "logger.hpp"
#include "path_utils.hpp"

#include <utility>

namespace s3xfer {

ObjectLister::ObjectLister(ListObjectsPageSource& source,
                           PageEventBus& events,
                           DateParser date_parser,
                           int page_size)
    : source_(source)
    , events_(events)
    , date_parser_(std::move(date_parser))
    , page_size_(page_size) {
}

ObjectListing ObjectLister::list_objects(const std::string& bucket,
                                         const std::optional<std::string>& prefix) {
    ListObjectsRequest request;
    request.bucket = bucket;
    request.prefix = prefix;
    request.encoding_type = "url";
    request.max_keys = page_size_;
    return ObjectListing(*this, std::move(request));
}

ObjectListing::ObjectListing(ObjectLister& lister, ListObjectsRequest request)
    : lister_(lister)
    , request_(std::move(request)) {
}

std::optional<ObjectEntry> ObjectListing::next() {
    while (page_pos_ >= page_.size()) {
        if (exhausted_ || !fetch_next_page()) {
            return std::nullopt;
        }
    }

    const RawObject& raw = page_[page_pos_++];
    return ObjectEntry{
        request_.bucket + "/" + url_unquote(raw.key),
        raw.size,
        lister_.date_parser_(raw.last_modified)
    };
}

bool ObjectListing::fetch_next_page() {
    ListObjectsPage page = lister_.source_.fetch_page(request_, continuation_token_);
    ++pages_fetched_;

    Logger::debug("ObjectLister", "Fetched page " + std::to_string(pages_fetched_) +
                  " of s3://" + request_.bucket + "/" + request_.prefix.value_or("") +
                  " (" + std::to_string(page.contents.size()) + " objects)");

    lister_.events_.publish(LIST_OBJECTS_EVENT, page);

    if (!page.is_truncated) {
        exhausted_ = true;
    } else if (page.next_continuation_token.empty()) {
        Logger::warn("ObjectLister", "Truncated page without continuation token for s3://" +
                     request_.bucket + ", stopping");
        exhausted_ = true;
    } else {
        continuation_token_ = page.next_continuation_token;
    }

    page_ = std::move(page.contents);
    page_pos_ = 0;
    return true;
}

ObjectListing::iterator::iterator(ObjectListing* listing)
    : listing_(listing) {
    ++*this;
}

ObjectListing::iterator& ObjectListing::iterator::operator++() {
    if (listing_ != nullptr) {
        current_ = listing_->next();
        if (!current_.has_value()) {
            listing_ = nullptr;
        }
    }
    return *this;
}

}  // namespace s3xfer
