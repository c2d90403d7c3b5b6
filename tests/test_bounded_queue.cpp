#include <catch2/catch.hpp>
#include "bounded_queue.hpp"
#include "stop_signal.hpp"
#include "mock_http_client.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace kindling;
using namespace std::chrono_literals;

// ── BoundedQueue ────────────────────────────────────────────────

TEST_CASE("BoundedQueue: zero capacity rejected", "[queue]") {
    REQUIRE_THROWS_AS(BoundedQueue<int>(0), std::invalid_argument);
}

TEST_CASE("BoundedQueue: FIFO order", "[queue]") {
    BoundedQueue<int> q(4);
    REQUIRE(q.push(1));
    REQUIRE(q.push(2));
    REQUIRE(q.push(3));
    REQUIRE(q.size() == 3);
    REQUIRE(*q.pop() == 1);
    REQUIRE(*q.pop() == 2);
    REQUIRE(*q.pop() == 3);
    REQUIRE(q.size() == 0);
}

TEST_CASE("BoundedQueue: push blocks while full", "[queue]") {
    BoundedQueue<int> q(1);
    REQUIRE(q.push(1));

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        q.push(2);
        pushed = true;
    });

    std::this_thread::sleep_for(30ms);
    REQUIRE_FALSE(pushed.load());
    REQUIRE(*q.pop() == 1);
    REQUIRE(wait_until([&] { return pushed.load(); }));
    REQUIRE(*q.pop() == 2);
    producer.join();
}

TEST_CASE("BoundedQueue: force_push ignores capacity", "[queue]") {
    BoundedQueue<int> q(1);
    REQUIRE(q.push(1));
    REQUIRE(q.force_push(2));
    REQUIRE(q.size() == 2);
    REQUIRE(*q.pop() == 1);
    REQUIRE(*q.pop() == 2);
}

TEST_CASE("BoundedQueue: close drains then ends", "[queue]") {
    BoundedQueue<std::string> q(4);
    q.push("a");
    q.push("b");
    q.close();
    REQUIRE(q.closed());
    REQUIRE_FALSE(q.push("c"));
    REQUIRE_FALSE(q.force_push("d"));
    REQUIRE(*q.pop() == "a");
    REQUIRE(*q.pop() == "b");
    REQUIRE_FALSE(q.pop().has_value());
}

TEST_CASE("BoundedQueue: close wakes blocked consumer and producer", "[queue]") {
    BoundedQueue<int> full(1);
    full.push(1);
    BoundedQueue<int> empty(1);

    std::atomic<int> woke{0};
    std::thread producer([&] {
        if (!full.push(2)) woke++;
    });
    std::thread consumer([&] {
        if (!empty.pop()) woke++;
    });

    std::this_thread::sleep_for(20ms);
    full.close();
    empty.close();
    producer.join();
    consumer.join();
    REQUIRE(woke.load() == 2);
}

TEST_CASE("BoundedQueue: many items across threads keep order", "[queue]") {
    BoundedQueue<int> q(3);
    const int n = 500;
    std::thread producer([&] {
        for (int i = 0; i < n; i++) q.push(i);
        q.close();
    });

    std::vector<int> seen;
    while (auto item = q.pop()) seen.push_back(*item);
    producer.join();

    REQUIRE(seen.size() == static_cast<size_t>(n));
    for (int i = 0; i < n; i++) REQUIRE(seen[i] == i);
}

// ── StopSignal ──────────────────────────────────────────────────

TEST_CASE("StopSignal: wait_for times out without request", "[stop]") {
    StopSignal stop;
    REQUIRE_FALSE(stop.requested());
    REQUIRE_FALSE(stop.wait_for(5ms));
    REQUIRE_FALSE(stop.flag()->load());
}

TEST_CASE("StopSignal: request wakes a sleeping waiter", "[stop]") {
    StopSignal stop;
    std::atomic<bool> result{false};
    auto begin = std::chrono::steady_clock::now();
    std::thread waiter([&] { result = stop.wait_for(10s); });

    std::this_thread::sleep_for(10ms);
    stop.request();
    waiter.join();

    REQUIRE(result.load());
    REQUIRE(std::chrono::steady_clock::now() - begin < 5s);
}

TEST_CASE("StopSignal: request is idempotent", "[stop]") {
    StopSignal stop;
    stop.request();
    stop.request();
    REQUIRE(stop.requested());
    REQUIRE(stop.flag()->load());
    REQUIRE(stop.wait_for(1ms));
}
