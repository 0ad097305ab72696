#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace s3xfer {

using HandlerId = uint64_t;

// Topic-based publish/subscribe channel carrying payloads of one type
template <typename Payload>
class EventBus {
public:
    using Handler = std::function<void(const Payload&)>;

    virtual ~EventBus() = default;

    virtual void publish(const std::string& topic, const Payload& payload) = 0;
    virtual HandlerId subscribe(const std::string& topic, Handler handler) = 0;

    // Returns false if no such subscription exists
    virtual bool unsubscribe(const std::string& topic, HandlerId id) = 0;
};

// Dotted topic names form a hierarchy: publishing "after-call.s3.ListObjects"
// reaches subscribers of "after-call.s3.ListObjects", then "after-call.s3",
// then "after-call". Within one topic, handlers run in subscription order.
//
// Handlers run synchronously on the publishing thread, outside the bus lock,
// so they may subscribe or unsubscribe. Calls of one handler from concurrent
// publishers are serialized. Once unsubscribe() returns the handler is not
// running and will not run again. Exceptions thrown by a handler propagate to
// the publisher.
template <typename Payload>
class HierarchicalEventBus : public EventBus<Payload> {
public:
    using Handler = typename EventBus<Payload>::Handler;

    void publish(const std::string& topic, const Payload& payload) override {
        std::vector<std::shared_ptr<Registration>> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::string current = topic;
            while (true) {
                auto it = handlers_.find(current);
                if (it != handlers_.end()) {
                    targets.insert(targets.end(), it->second.begin(), it->second.end());
                }
                size_t dot = current.rfind('.');
                if (dot == std::string::npos) break;
                current.resize(dot);
            }
        }

        for (const auto& registration : targets) {
            std::lock_guard<std::recursive_mutex> call_lock(registration->call_mutex);
            if (registration->active) {
                registration->handler(payload);
            }
        }
    }

    HandlerId subscribe(const std::string& topic, Handler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto registration = std::make_shared<Registration>();
        registration->id = ++last_id_;
        registration->handler = std::move(handler);
        handlers_[topic].push_back(registration);
        return registration->id;
    }

    // Waits for a call of this handler running on another thread to return
    bool unsubscribe(const std::string& topic, HandlerId id) override {
        std::shared_ptr<Registration> registration;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(topic);
            if (it == handlers_.end()) return false;

            auto& entries = it->second;
            auto entry_it = std::find_if(entries.begin(), entries.end(),
                [id](const auto& entry) { return entry->id == id; });
            if (entry_it == entries.end()) return false;

            registration = *entry_it;
            entries.erase(entry_it);
            if (entries.empty()) {
                handlers_.erase(it);
            }
        }

        // Publishers may still hold this registration in their target list
        std::lock_guard<std::recursive_mutex> call_lock(registration->call_mutex);
        registration->active = false;
        return true;
    }

    size_t handler_count(const std::string& topic) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(topic);
        return it == handlers_.end() ? 0 : it->second.size();
    }

private:
    mutable std::mutex mutex_;
    struct Registration {
        HandlerId id = 0;
        Handler handler;
        bool active = true;                // guarded by call_mutex
        std::recursive_mutex call_mutex;   // held for the duration of each call
    };

    std::map<std::string, std::vector<std::shared_ptr<Registration>>> handlers_;
    HandlerId last_id_ = 0;
};

// Subscribes a handler for the lifetime of this object
template <typename Payload>
class ScopedEventHandler {
public:
    using Handler = typename EventBus<Payload>::Handler;

    ScopedEventHandler(EventBus<Payload>& bus, std::string topic, Handler handler)
        : bus_(bus)
        , topic_(std::move(topic))
        , id_(bus_.subscribe(topic_, std::move(handler))) {}

    ~ScopedEventHandler() {
        bus_.unsubscribe(topic_, id_);
    }

    ScopedEventHandler(const ScopedEventHandler&) = delete;
    ScopedEventHandler& operator=(const ScopedEventHandler&) = delete;

    HandlerId id() const { return id_; }
    const std::string& topic() const { return topic_; }

private:
    EventBus<Payload>& bus_;
    std::string topic_;
    HandlerId id_;
};

}  // namespace s3xfer
