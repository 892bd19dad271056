#include <doctest/doctest.h>
#include "meshgate/message_store.hpp"

#include <set>
#include <string>

using namespace meshgate;

TEST_CASE("make_message_key yields 10 lowercase hex chars and depends on every input") {
    MessageKey a, b, c, d;
    REQUIRE(make_message_key(1, 42, "hello", a));
    REQUIRE(make_message_key(2, 42, "hello", b));
    REQUIRE(make_message_key(1, 43, "hello", c));
    REQUIRE(make_message_key(1, 42, "hellO", d));

    CHECK(a.size() == MESSAGE_KEY_LEN);
    CHECK(is_message_key(a.c_str()));
    CHECK(a != b);
    CHECK(a != c);
    CHECK(a != d);

    MessageKey again;
    REQUIRE(make_message_key(1, 42, "hello", again));
    CHECK(again == a);
}

TEST_CASE("is_message_key rejects anything but 10 lowercase hex digits") {
    CHECK(is_message_key("0123456789"));
    CHECK(is_message_key("abcdefabcd"));
    CHECK_FALSE(is_message_key(""));
    CHECK_FALSE(is_message_key("012345678"));
    CHECK_FALSE(is_message_key("0123456789a"));
    CHECK_FALSE(is_message_key("ABCDEF0123"));
    CHECK_FALSE(is_message_key("g123456789"));
}

TEST_CASE("insert keeps arrival order under distinct ids") {
    MessageStore store;
    MessageKey hello, world;
    REQUIRE(store.insert(1, "hello", hello));
    REQUIRE(store.insert(1, "world", world));
    CHECK(hello != world);

    auto snap = store.snapshot();
    REQUIRE(snap.size() == 2);
    CHECK(snap[0].id == hello);
    CHECK(snap[0].text == "hello");
    CHECK(snap[0].node_id == 1);
    CHECK(snap[1].id == world);
    CHECK(snap[1].text == "world");
    CHECK(snap[0].arrival < snap[1].arrival);
}

TEST_CASE("101 inserts keep exactly the 100 newest, oldest evicted") {
    MessageStore store;
    MessageKey first;
    REQUIRE(store.insert(7, "msg-0", first));
    for (int i = 1; i <= 100; ++i) {
        MessageKey k;
        REQUIRE(store.insert(7, "msg-" + std::to_string(i), k));
    }

    CHECK(store.size() == MessageStore::capacity());
    auto snap = store.snapshot();
    REQUIRE(snap.size() == 100);
    CHECK(snap.front().text == "msg-1");
    CHECK(snap.back().text == "msg-100");
    for (const auto& e : snap) CHECK(e.id != first);
}

TEST_CASE("size never exceeds capacity over a long run and the window slides") {
    MessageStore store;
    for (int i = 0; i < 350; ++i) {
        MessageKey k;
        REQUIRE(store.insert(static_cast<NodeNum>(i % 5), "m" + std::to_string(i), k));
        CHECK(store.size() <= MessageStore::capacity());
    }
    auto snap = store.snapshot();
    REQUIRE(snap.size() == 100);
    for (size_t i = 0; i < snap.size(); ++i) {
        CHECK(snap[i].text == "m" + std::to_string(250 + i));
    }
}

TEST_CASE("remove deletes exactly one entry and a second remove is NotFound") {
    MessageStore store;
    MessageKey hello, world;
    REQUIRE(store.insert(1, "hello", hello));
    REQUIRE(store.insert(1, "world", world));

    CHECK(store.remove(hello));
    auto snap = store.snapshot();
    REQUIRE(snap.size() == 1);
    CHECK(snap[0].text == "world");

    CHECK_FALSE(store.remove(hello));
    CHECK(store.size() == 1);
}

TEST_CASE("key collision draws a fresh nonce") {
    // Same nonce twice for identical node/text gives the same hash; the store
    // must notice and move on to the next nonce.
    int calls = 0;
    const uint64_t seq[] = {5, 5, 9};
    MessageStore store([&]() { return seq[calls++ % 3]; });

    MessageKey a, b;
    REQUIRE(store.insert(3, "same", a));
    REQUIRE(store.insert(3, "same", b));
    CHECK(a != b);
    CHECK(calls == 3);

    MessageKey expected;
    REQUIRE(make_message_key(9, 3, "same", expected));
    CHECK(b == expected);
}

TEST_CASE("insert gives up when every nonce collides") {
    MessageStore store([]() { return uint64_t{77}; });
    MessageKey a, b;
    REQUIRE(store.insert(3, "same", a));
    CHECK_FALSE(store.insert(3, "same", b));
    CHECK(store.size() == 1);
}

TEST_CASE("ids are unique across a full window") {
    MessageStore store;
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        MessageKey k;
        REQUIRE(store.insert(1, "same text", k));
        ids.insert(k.c_str());
    }
    CHECK(ids.size() == 100);
}
