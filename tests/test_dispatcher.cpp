#include <catch2/catch.hpp>
#include "dispatcher.hpp"
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace kindling;

static Message text(int64_t id, const std::string& body) {
    Message msg;
    msg.kind = MessageKind::Text;
    msg.type_name = "TextMessage";
    msg.id = id;
    msg.body = body;
    return msg;
}

TEST_CASE("Dispatcher: delivers every message to every listener in order", "[dispatcher]") {
    ListenerList listeners;
    StreamQueue queue(8);
    StopSignal stop;
    std::vector<std::string> calls;

    listeners.attach([&](const Message& m) { calls.push_back("a" + std::to_string(m.id)); });
    listeners.attach([&](const Message& m) { calls.push_back("b" + std::to_string(m.id)); });

    queue.push(text(1, "one"));
    queue.push(text(2, "two"));
    queue.close();

    Dispatcher dispatcher(listeners, queue, stop, {});
    REQUIRE(dispatcher.run() == 2);
    REQUIRE(calls == std::vector<std::string>{"a1", "b1", "a2", "b2"});
}

TEST_CASE("Dispatcher: throwing listener does not skip the others", "[dispatcher]") {
    ListenerList listeners;
    StreamQueue queue(8);
    StopSignal stop;
    std::vector<int64_t> seen;
    std::vector<StreamError> errors;

    listeners.attach([](const Message&) { throw std::runtime_error("boom"); });
    listeners.attach([&](const Message& m) { seen.push_back(m.id); });

    queue.push(text(1, "x"));
    queue.push(text(2, "y"));
    queue.close();

    Dispatcher dispatcher(listeners, queue, stop,
                          [&](const StreamError& e) { errors.push_back(e); });
    REQUIRE(dispatcher.run() == 2);

    REQUIRE(seen == std::vector<int64_t>{1, 2});
    REQUIRE(errors.size() == 2);
    REQUIRE(errors[0].kind == StreamErrorKind::Listener);
    REQUIRE(errors[0].message == "boom");
    REQUIRE(errors[0].message_id == 1);
    REQUIRE(errors[1].message_id == 2);
}

TEST_CASE("Dispatcher: non-standard exceptions are caught too", "[dispatcher]") {
    ListenerList listeners;
    StreamQueue queue(2);
    StopSignal stop;
    int errors = 0;

    listeners.attach([](const Message&) { throw 42; });
    Dispatcher dispatcher(listeners, queue, stop, [&](const StreamError&) { errors++; });
    REQUIRE(dispatcher.dispatch(text(1, "x")) == 1);
    REQUIRE(errors == 1);
}

TEST_CASE("Dispatcher: transport errors are reported in queue order", "[dispatcher]") {
    ListenerList listeners;
    StreamQueue queue(8);
    StopSignal stop;
    std::vector<std::string> events;

    listeners.attach([&](const Message& m) { events.push_back("msg " + m.body); });

    StreamError drop;
    drop.kind = StreamErrorKind::Transport;
    drop.message = "connection reset";
    drop.attempt = 1;

    queue.push(text(1, "before"));
    queue.force_push(drop);
    queue.push(text(2, "after"));
    queue.close();

    Dispatcher dispatcher(listeners, queue, stop, [&](const StreamError& e) {
        events.push_back("err " + e.message);
    });
    REQUIRE(dispatcher.run() == 2);
    REQUIRE(events == std::vector<std::string>{"msg before", "err connection reset", "msg after"});
}

TEST_CASE("Dispatcher: throwing error callback is contained", "[dispatcher]") {
    ListenerList listeners;
    StreamQueue queue(4);
    StopSignal stop;
    int delivered = 0;

    listeners.attach([](const Message&) { throw std::runtime_error("listener"); });
    listeners.attach([&](const Message&) { delivered++; });
    queue.push(text(1, "x"));
    queue.close();

    Dispatcher dispatcher(listeners, queue, stop,
                          [](const StreamError&) { throw std::runtime_error("callback"); });
    REQUIRE(dispatcher.run() == 1);
    REQUIRE(delivered == 1);
}

TEST_CASE("Dispatcher: stop ends run before draining", "[dispatcher]") {
    ListenerList listeners;
    StreamQueue queue(8);
    StopSignal stop;
    int calls = 0;

    listeners.attach([&](const Message&) {
        calls++;
        stop.request();
    });
    queue.push(text(1, "x"));
    queue.push(text(2, "y"));
    queue.push(text(3, "z"));

    Dispatcher dispatcher(listeners, queue, stop, {});
    REQUIRE(dispatcher.run() == 1);
    REQUIRE(calls == 1);
}

TEST_CASE("Dispatcher: waits for messages from another thread", "[dispatcher]") {
    ListenerList listeners;
    StreamQueue queue(1);
    StopSignal stop;
    std::vector<int64_t> seen;
    listeners.attach([&](const Message& m) { seen.push_back(m.id); });

    std::thread producer([&] {
        for (int64_t i = 1; i <= 50; i++) queue.push(text(i, "x"));
        queue.close();
    });

    Dispatcher dispatcher(listeners, queue, stop, {});
    REQUIRE(dispatcher.run() == 50);
    producer.join();

    REQUIRE(seen.size() == 50);
    for (size_t i = 0; i < seen.size(); i++) REQUIRE(seen[i] == static_cast<int64_t>(i + 1));
}
