#include <catch2/catch.hpp>
#include "listeners.hpp"
#include <string>
#include <vector>

using namespace kindling;

static Message text(int64_t id, const std::string& body) {
    Message msg;
    msg.kind = MessageKind::Text;
    msg.id = id;
    msg.body = body;
    return msg;
}

TEST_CASE("ListenerList: snapshot keeps attachment order", "[listeners]") {
    ListenerList list;
    std::vector<std::string> calls;
    list.attach([&](const Message&) { calls.push_back("a"); });
    list.attach([&](const Message&) { calls.push_back("b"); });
    list.attach([&](const Message&) { calls.push_back("c"); });

    for (auto& l : list.snapshot()) l(text(1, "x"));
    REQUIRE(calls == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("ListenerList: attach returns distinct ids", "[listeners]") {
    ListenerList list;
    auto a = list.attach([](const Message&) {});
    auto b = list.attach([](const Message&) {});
    REQUIRE(a != b);
    REQUIRE(list.size() == 2);
}

TEST_CASE("ListenerList: detach removes only that listener", "[listeners]") {
    ListenerList list;
    int a = 0;
    int b = 0;
    auto id_a = list.attach([&](const Message&) { a++; });
    list.attach([&](const Message&) { b++; });

    REQUIRE(list.detach(id_a));
    REQUIRE_FALSE(list.detach(id_a));
    REQUIRE(list.size() == 1);

    for (auto& l : list.snapshot()) l(text(1, "x"));
    REQUIRE(a == 0);
    REQUIRE(b == 1);
}

TEST_CASE("ListenerList: detach unknown id", "[listeners]") {
    ListenerList list;
    REQUIRE_FALSE(list.detach(999));
}

TEST_CASE("ListenerList: snapshot is unaffected by later changes", "[listeners]") {
    ListenerList list;
    int calls = 0;
    list.attach([&](const Message&) { calls++; });
    auto snap = list.snapshot();

    list.attach([&](const Message&) { calls += 10; });
    list.clear();
    REQUIRE(list.size() == 0);

    for (auto& l : snap) l(text(1, "x"));
    REQUIRE(calls == 1);
}

TEST_CASE("ListenerList: listener may attach during its own call", "[listeners]") {
    ListenerList list;
    int late = 0;
    list.attach([&](const Message&) {
        list.attach([&](const Message&) { late++; });
    });

    for (auto& l : list.snapshot()) l(text(1, "x"));
    REQUIRE(late == 0);
    REQUIRE(list.size() == 2);
}
