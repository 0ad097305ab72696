#include "../src/stable_priority_queue.hpp"
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

using namespace s3xfer;

// Task without a priority
struct Task {
    virtual ~Task() = default;
    int id = 0;
};

struct PrioritizedTask : public Task, public HasPriority {
    explicit PrioritizedTask(int p) : value(p) {}
    int priority() const override { return value; }
    int value;
};

std::shared_ptr<Task> make_task(int priority) {
    return std::make_shared<PrioritizedTask>(priority);
}

void test_fifo_order_of_same_priorities() {
    auto a = make_task(5);
    auto b = make_task(5);
    auto c = make_task(1);

    StablePriorityQueue<Task> q(10, 20);
    q.put(a);
    q.put(b);
    q.put(c);

    // c first because it has the lowest priority value, then a before b
    // because it was inserted first. Compare pointers: same object back.
    assert(q.get() == c);
    assert(q.get() == a);
    assert(q.get() == b);

    std::cout << "test_fifo_order_of_same_priorities: PASS\n";
}

void test_queue_length() {
    StablePriorityQueue<Task> q(10, 20);
    assert(q.qsize() == 0);
    assert(q.empty());

    q.put(make_task(5));
    assert(q.qsize() == 1);

    q.get();
    assert(q.qsize() == 0);

    std::cout << "test_queue_length: PASS\n";
}

void test_insert_max_priority_capped() {
    StablePriorityQueue<Task> q(10, 20);
    auto a = make_task(100);
    auto b = make_task(20);

    q.put(a);
    q.put(b);

    // 100 is clamped to 20, so arrival order decides
    assert(q.get() == a);
    assert(q.get() == b);

    std::cout << "test_insert_max_priority_capped: PASS\n";
}

void test_priority_attr_is_missing() {
    StablePriorityQueue<Task> q(10, 20);
    auto a = std::make_shared<Task>();
    auto b = make_task(5);

    q.put(a);
    q.put(b);

    // Tasks without a priority go to the back
    assert(q.get() == b);
    assert(q.get() == a);

    std::cout << "test_priority_attr_is_missing: PASS\n";
}

void test_no_floor_clamp() {
    StablePriorityQueue<Task> q(10, 20);
    auto one = make_task(1);
    auto zero = make_task(0);

    q.put(one);
    q.put(zero);

    assert(q.get() == zero);
    assert(q.get() == one);

    std::cout << "test_no_floor_clamp: PASS\n";
}

void test_non_polymorphic_items() {
    StablePriorityQueue<int> q;
    auto first = std::make_shared<int>(1);
    auto second = std::make_shared<int>(2);

    q.put(first);
    q.put(second);

    assert(q.get() == first);
    assert(q.get() == second);

    std::cout << "test_non_polymorphic_items: PASS\n";
}

void test_non_blocking_full_and_empty() {
    StablePriorityQueue<Task> q(2, 20);

    assert(q.try_get() == nullptr);
    assert(q.get_for(std::chrono::milliseconds(10)) == nullptr);

    assert(q.try_put(make_task(1)));
    assert(q.try_put(make_task(2)));
    assert(q.full());
    assert(!q.try_put(make_task(3)));
    assert(!q.put_for(make_task(3), std::chrono::milliseconds(10)));
    assert(q.qsize() == 2);

    std::cout << "test_non_blocking_full_and_empty: PASS\n";
}

void test_blocking_get() {
    StablePriorityQueue<Task> q(10, 20);
    auto task = make_task(3);
    std::atomic<bool> popped{false};

    std::thread consumer([&]() {
        auto item = q.get();  // Blocks until item available
        assert(item == task);
        popped = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    assert(!popped);
    q.put(task);

    consumer.join();
    assert(popped);

    std::cout << "test_blocking_get: PASS\n";
}

void test_blocking_put_when_full() {
    StablePriorityQueue<Task> q(1, 20);
    q.put(make_task(1));
    std::atomic<bool> pushed{false};

    std::thread producer([&]() {
        q.put(make_task(2));  // Blocks until a slot frees up
        pushed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    assert(!pushed);
    assert(q.get() != nullptr);

    producer.join();
    assert(pushed);
    assert(q.qsize() == 1);

    std::cout << "test_blocking_put_when_full: PASS\n";
}

void test_shutdown() {
    StablePriorityQueue<Task> q(10, 20);

    std::thread consumer([&]() {
        auto item = q.get();
        assert(item == nullptr);  // Returns empty on shutdown
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    q.shutdown();

    consumer.join();
    assert(!q.put(make_task(1)));

    std::cout << "test_shutdown: PASS\n";
}

void test_concurrent_producers_keep_fifo() {
    StablePriorityQueue<Task> q(8, 20);
    constexpr int PRODUCERS = 4;
    constexpr int PER_PRODUCER = 200;

    std::vector<std::thread> producers;
    for (int p = 0; p < PRODUCERS; ++p) {
        producers.emplace_back([&q, p]() {
            for (int i = 0; i < PER_PRODUCER; ++i) {
                auto task = std::make_shared<PrioritizedTask>(5);
                task->id = p * PER_PRODUCER + i;
                q.put(task);
            }
        });
    }

    // Each producer's tasks share a priority, so they come out in its order
    std::vector<int> last_seen(PRODUCERS, -1);
    for (int n = 0; n < PRODUCERS * PER_PRODUCER; ++n) {
        auto task = q.get();
        assert(task != nullptr);
        int producer = task->id / PER_PRODUCER;
        int index = task->id % PER_PRODUCER;
        assert(index > last_seen[producer]);
        last_seen[producer] = index;
    }

    for (auto& t : producers) {
        t.join();
    }
    assert(q.empty());

    std::cout << "test_concurrent_producers_keep_fifo: PASS\n";
}

int main() {
    test_fifo_order_of_same_priorities();
    test_queue_length();
    test_insert_max_priority_capped();
    test_priority_attr_is_missing();
    test_no_floor_clamp();
    test_non_polymorphic_items();
    test_non_blocking_full_and_empty();
    test_blocking_get();
    test_blocking_put_when_full();
    test_shutdown();
    test_concurrent_producers_keep_fifo();
    std::cout << "All StablePriorityQueue tests passed!\n";
    return 0;
}
