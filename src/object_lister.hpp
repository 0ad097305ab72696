#pragma once

#include "types.hpp"
#include "event_bus.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace s3xfer {

// One object as it comes off the wire (key still percent-encoded)
struct RawObject {
    std::string key;
    uint64_t size = 0;
    std::string last_modified;  // ISO-8601
};

struct ListObjectsPage {
    std::vector<RawObject> contents;
    bool is_truncated = false;
    std::string next_continuation_token;
};

struct ListObjectsRequest {
    std::string bucket;
    std::optional<std::string> prefix;
    std::string encoding_type = "url";
    int max_keys = DEFAULT_LIST_PAGE_SIZE;
};

// A paginated "list objects" call. An empty token requests the first page.
class ListObjectsPageSource {
public:
    virtual ~ListObjectsPageSource() = default;

    virtual ListObjectsPage fetch_page(const ListObjectsRequest& request,
                                       const std::string& continuation_token) = 0;
};

struct ObjectEntry {
    std::string path;  // bucket + '/' + decoded key
    uint64_t size;
    Timestamp last_modified;

    bool operator==(const ObjectEntry& other) const {
        return path == other.path && size == other.size &&
               last_modified == other.last_modified;
    }
};

using DateParser = std::function<Timestamp(const std::string&)>;
using PageEventBus = EventBus<ListObjectsPage>;

class ObjectListing;

// Streams the objects under bucket/prefix, one page at a time.
//
// Keys are requested URL-encoded so control characters survive the
// transport, and decoded here. Every fetched page is published on the event
// bus as LIST_OBJECTS_EVENT before its entries are handed out.
class ObjectLister {
public:
    ObjectLister(ListObjectsPageSource& source,
                 PageEventBus& events,
                 DateParser date_parser,
                 int page_size = DEFAULT_LIST_PAGE_SIZE);

    // Each call starts a fresh listing. Nothing is fetched until the
    // returned listing is iterated.
    ObjectListing list_objects(const std::string& bucket,
                               const std::optional<std::string>& prefix = std::nullopt);

private:
    friend class ObjectListing;

    ListObjectsPageSource& source_;
    PageEventBus& events_;
    DateParser date_parser_;
    int page_size_;
};

// Lazy sequence of ObjectEntry produced by ObjectLister::list_objects.
// Single pass; the lister must outlive it.
class ObjectListing {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = ObjectEntry;
        using difference_type = std::ptrdiff_t;
        using pointer = const ObjectEntry*;
        using reference = const ObjectEntry&;

        iterator() = default;
        explicit iterator(ObjectListing* listing);

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        iterator& operator++();
        void operator++(int) { ++*this; }

        bool operator==(const iterator& other) const {
            return listing_ == other.listing_;
        }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        ObjectListing* listing_ = nullptr;  // nullptr once exhausted
        std::optional<ObjectEntry> current_;
    };

    ObjectListing(ObjectLister& lister, ListObjectsRequest request);

    // Next entry, or nullopt when pagination is exhausted
    std::optional<ObjectEntry> next();

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

    size_t pages_fetched() const { return pages_fetched_; }

private:
    bool fetch_next_page();

    ObjectLister& lister_;
    ListObjectsRequest request_;
    std::vector<RawObject> page_;
    size_t page_pos_ = 0;
    std::string continuation_token_;
    bool exhausted_ = false;
    size_t pages_fetched_ = 0;
};

}  // namespace s3xfer
