#include <catch2/catch.hpp>
#include "subscriber_set.hpp"
#include "mock_sink.hpp"
#include <thread>

using namespace fanrelay;

TEST_CASE("SubscriberSet: add and remove report cardinality", "[subscribers]") {
    SubscriberSet set;
    auto a = std::make_shared<MockSink>();
    auto b = std::make_shared<MockSink>();

    REQUIRE(set.empty());
    REQUIRE(set.add(a) == 1);
    REQUIRE(set.add(b) == 2);
    REQUIRE(set.add(a) == 2);  // duplicate ignored
    REQUIRE(set.contains(a));

    REQUIRE(set.remove(a) == 1);
    REQUIRE(set.remove(a) == 1);  // absent: no-op
    REQUIRE_FALSE(set.contains(a));
    REQUIRE(set.remove(b) == 0);
    REQUIRE(set.empty());
}

TEST_CASE("SubscriberSet: broadcast reaches every sink", "[subscribers]") {
    SubscriberSet set;
    auto a = std::make_shared<MockSink>();
    auto b = std::make_shared<MockSink>();
    set.add(a);
    set.add(b);

    REQUIRE(set.broadcast("one") == 2);
    REQUIRE(set.broadcast("two") == 2);

    REQUIRE(a->chunks() == std::vector<std::string>{"one", "two"});
    REQUIRE(b->chunks() == std::vector<std::string>{"one", "two"});
}

TEST_CASE("SubscriberSet: failing sink is dropped, others still served", "[subscribers]") {
    SubscriberSet set;
    auto good = std::make_shared<MockSink>();
    auto bad = std::make_shared<MockSink>();
    set.add(bad);
    set.add(good);
    bad->fail_sends = true;

    REQUIRE(set.broadcast("x") == 1);
    REQUIRE(set.count() == 1);
    REQUIRE_FALSE(set.contains(bad));
    REQUIRE(good->chunks() == std::vector<std::string>{"x"});
}

TEST_CASE("SubscriberSet: closed sink is dropped without a send", "[subscribers]") {
    SubscriberSet set;
    auto sink = std::make_shared<MockSink>();
    set.add(sink);
    sink->close(1000, "gone");

    REQUIRE(set.broadcast("x") == 0);
    REQUIRE(set.empty());
    REQUIRE(sink->chunk_count() == 0);
}

TEST_CASE("SubscriberSet: close_all detaches and closes every sink", "[subscribers]") {
    SubscriberSet set;
    auto a = std::make_shared<MockSink>();
    auto b = std::make_shared<MockSink>();
    set.add(a);
    set.add(b);

    set.close_all(1001, "Server shutting down");

    REQUIRE(set.empty());
    REQUIRE(a->close_code() == 1001);
    REQUIRE(b->close_code() == 1001);
    REQUIRE(a->close_reason() == "Server shutting down");
    REQUIRE_FALSE(a->is_open());
}

TEST_CASE("SubscriberSet: membership changes during broadcast", "[subscribers]") {
    SubscriberSet set;
    auto anchor = std::make_shared<MockSink>();
    set.add(anchor);

    std::atomic<bool> stop{false};
    std::thread churn([&]() {
        while (!stop.load()) {
            auto s = std::make_shared<MockSink>();
            set.add(s);
            set.remove(s);
        }
    });

    for (int i = 0; i < 500; ++i) set.broadcast(std::to_string(i));
    stop = true;
    churn.join();

    auto got = anchor->chunks();
    REQUIRE(got.size() == 500);
    for (int i = 0; i < 500; ++i) REQUIRE(got[static_cast<size_t>(i)] == std::to_string(i));
    REQUIRE(set.count() == 1);
}
