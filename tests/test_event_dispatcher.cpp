// tests/test_event_dispatcher.cpp

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "solo/event_dispatcher.hpp"

TEST(EventDispatcherTest, PlainSignalFiresBeforeMessage)
{
    solo::EventDispatcher events;
    std::vector<std::string> seen;
    // Registered in reverse to show order comes from the kind, not registration.
    events.onNewInstanceWithMessage([&](const std::string &m) { seen.push_back("msg:" + m); });
    events.onNewInstance([&] { seen.push_back("new"); });

    events.dispatch("hello");
    EXPECT_EQ(seen, (std::vector<std::string>{"new", "msg:hello"}));
}

TEST(EventDispatcherTest, EmptyPayloadFiresOnlyPlainSignal)
{
    solo::EventDispatcher events;
    int plain = 0;
    int with_message = 0;
    events.onNewInstance([&] { ++plain; });
    events.onNewInstanceWithMessage([&](const std::string &) { ++with_message; });

    events.dispatch("");
    EXPECT_EQ(plain, 1);
    EXPECT_EQ(with_message, 0);
}

TEST(EventDispatcherTest, EveryHandlerRuns)
{
    solo::EventDispatcher events;
    int plain = 0;
    events.onNewInstance([&] { ++plain; });
    events.onNewInstance([&] { ++plain; });
    events.onNewInstance([&] { ++plain; });

    events.dispatch("x");
    EXPECT_EQ(plain, 3);
}

TEST(EventDispatcherTest, UnsubscribeRemovesHandler)
{
    solo::EventDispatcher events;
    int plain = 0;
    std::string last;
    auto a = events.onNewInstance([&] { ++plain; });
    auto b = events.onNewInstanceWithMessage([&](const std::string &m) { last = m; });
    EXPECT_NE(a, b);

    EXPECT_TRUE(events.unsubscribe(a));
    EXPECT_FALSE(events.unsubscribe(a));
    events.dispatch("one");
    EXPECT_EQ(plain, 0);
    EXPECT_EQ(last, "one");

    EXPECT_TRUE(events.unsubscribe(b));
    events.dispatch("two");
    EXPECT_EQ(last, "one");
}

TEST(EventDispatcherTest, ThrowingHandlerDoesNotStopOthers)
{
    solo::EventDispatcher events;
    int plain = 0;
    std::string last;
    events.onNewInstance([] { throw std::runtime_error("boom"); });
    events.onNewInstance([&] { ++plain; });
    events.onNewInstanceWithMessage([](const std::string &) { throw std::runtime_error("boom"); });
    events.onNewInstanceWithMessage([&](const std::string &m) { last = m; });

    EXPECT_NO_THROW(events.dispatch("still delivered"));
    EXPECT_EQ(plain, 1);
    EXPECT_EQ(last, "still delivered");
}

TEST(EventDispatcherTest, HandlerMaySubscribeDuringDispatch)
{
    solo::EventDispatcher events;
    int late = 0;
    events.onNewInstance([&] { events.onNewInstance([&] { ++late; }); });

    events.dispatch("");
    EXPECT_EQ(late, 0);
    events.dispatch("");
    EXPECT_EQ(late, 1);
}

TEST(EventDispatcherTest, NonStandardThrowDoesNotEscapeDispatch)
{
    solo::EventDispatcher events;
    int plain = 0;
    std::string last;
    events.onNewInstance([] { throw 42; });
    events.onNewInstance([&] { ++plain; });
    events.onNewInstanceWithMessage([](const std::string &) { throw "not an exception"; });
    events.onNewInstanceWithMessage([&](const std::string &m) { last = m; });

    EXPECT_NO_THROW(events.dispatch("after odd throws"));
    EXPECT_EQ(plain, 1);
    EXPECT_EQ(last, "after odd throws");
}
