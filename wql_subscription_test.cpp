#include <doctest/doctest.h>
#include <future>
#include <thread>
#include "wql_subscription.hpp"
#include "wql_test_support.hpp"

using namespace wql;
using namespace wql::testing;
using namespace std::chrono_literals;

namespace subscription_test
{

struct ProcessStarted {
    std::string ProcessName;
    Field<std::uint32_t, "ProcessID"> pid;
};

} // namespace subscription_test

using namespace subscription_test;

namespace
{
constexpr char const* kQuery = "SELECT * FROM Win32_ProcessStartTrace";

ObjectPtr started(std::string name, std::uint32_t pid)
{
    return makeObject("Win32_ProcessStartTrace", { { "ProcessName", std::move(name) }, { "ProcessID", pid } });
}

template <typename Predicate>
bool eventually(Predicate&& predicate)
{
    auto const deadline = std::chrono::steady_clock::now() + 5s;

    while (! predicate())
    {
        if (std::chrono::steady_clock::now() > deadline)
            return false;

        std::this_thread::sleep_for(1ms);
    }

    return true;
}

template <typename Event>
std::unique_ptr<Subscription<Event>> subscribe(std::shared_ptr<MemoryLocator> const& locator, std::shared_ptr<Channel<Event>> const& events)
{
    auto created = Subscription<Event>::create(locator, events, kQuery);
    REQUIRE(created.has_value());

    auto subscription = std::move(*created);
    subscription->setTimeout(20ms);
    return subscription;
}

template <typename Event>
std::future<Status> startInBackground(Subscription<Event>& subscription)
{
    return std::async(std::launch::async, [&subscription] { return subscription.start(); });
}
} // namespace

//=============================================================================
// Lifecycle tests
//=============================================================================

TEST_SUITE("Subscription lifecycle") {

TEST_CASE("create needs a locator and a channel") {
    auto events = std::make_shared<Channel<ProcessStarted>>();
    auto locator = std::make_shared<MemoryLocator>();

    auto noLocator = Subscription<ProcessStarted>::create(nullptr, events, kQuery);
    REQUIRE_FALSE(noLocator.has_value());
    CHECK(noLocator.error().is(Error::Code::invalidArgument));

    auto noChannel = Subscription<ProcessStarted>::create(locator, nullptr, kQuery);
    REQUIRE_FALSE(noChannel.has_value());
    CHECK(noChannel.error().is(Error::Code::invalidArgument));
}

TEST_CASE("defaults") {
    auto locator = std::make_shared<MemoryLocator>();
    auto created = Subscription<ProcessStarted>::create(locator, std::make_shared<Channel<ProcessStarted>>(), kQuery);
    REQUIRE(created.has_value());

    CHECK((*created)->timeout() == SubscriptionBase::kDefaultTimeout);
    CHECK((*created)->query() == kQuery);
}

TEST_CASE("stopping before start") {
    auto locator = std::make_shared<MemoryLocator>();
    auto subscription = subscribe(locator, std::make_shared<Channel<ProcessStarted>>());

    subscription->stop();

    CHECK(subscription->start().has_value());
    CHECK(locator->backend->connects.load() == 0);
}

TEST_CASE("stop is observed within one timeout") {
    auto locator = std::make_shared<MemoryLocator>();
    auto subscription = subscribe(locator, std::make_shared<Channel<ProcessStarted>>());
    subscription->setTimeout(200ms);

    auto running = startInBackground(*subscription);
    REQUIRE(eventually([&] { return locator->backend->events->waits() > 0; }));

    auto const before = std::chrono::steady_clock::now();
    subscription->stop();
    auto const elapsed = std::chrono::steady_clock::now() - before;

    // the loop only notices the stop once the wait in progress expires
    CHECK(elapsed >= 100ms);
    CHECK(elapsed < 700ms);

    CHECK(running.get().has_value());
    CHECK(locator->backend->closes.load() == 1);

    auto const timeouts = locator->backend->events->requestedTimeouts();
    REQUIRE_FALSE(timeouts.empty());
    CHECK(timeouts.front() == 200ms);
}

TEST_CASE("a negative timeout waits for the next event") {
    auto locator = std::make_shared<MemoryLocator>();
    auto events = std::make_shared<Channel<ProcessStarted>>();
    auto subscription = subscribe(locator, events);
    subscription->setTimeout(kWaitForever);

    auto running = startInBackground(*subscription);
    REQUIRE(eventually([&] { return locator->backend->events->waits() > 0; }));

    auto const timeouts = locator->backend->events->requestedTimeouts();
    REQUIRE(timeouts.size() == 1);
    CHECK(timeouts.front() == kWaitForever);

    auto stopping = std::async(std::launch::async, [&subscription] { subscription->stop(); });
    CHECK(stopping.wait_for(150ms) == std::future_status::timeout);

    // the next event ends the wait, its delivery gives way to the stop
    locator->backend->events->push(started("a.exe", 1));
    REQUIRE(stopping.wait_for(5s) == std::future_status::ready);

    CHECK(running.get().has_value());
    CHECK(locator->backend->events->waits() == 1);
    CHECK_FALSE(events->tryReceive().has_value());
}

TEST_CASE("a subscription starts only once") {
    auto locator = std::make_shared<MemoryLocator>();
    auto subscription = subscribe(locator, std::make_shared<Channel<ProcessStarted>>());

    auto running = startInBackground(*subscription);
    REQUIRE(eventually([&] { return locator->backend->events->waits() > 0; }));

    auto second = subscription->start();
    REQUIRE_FALSE(second.has_value());
    CHECK(second.error().is(Error::Code::alreadyRunning));

    subscription->stop();
    CHECK(running.get().has_value());

    // stopped subscriptions stay stopped
    CHECK(subscription->start().has_value());
    CHECK(locator->backend->connects.load() == 1);
}

TEST_CASE("stop after the loop has ended returns at once") {
    auto locator = std::make_shared<MemoryLocator>();
    auto subscription = subscribe(locator, std::make_shared<Channel<ProcessStarted>>());

    locator->backend->events->push(fail(Error::Code::remote, "event sink lost"));
    CHECK_FALSE(subscription->start().has_value());

    subscription->stop();
    subscription->stop();
}

} // TEST_SUITE("Subscription lifecycle")

//=============================================================================
// Delivery tests
//=============================================================================

TEST_SUITE("Subscription delivery") {

TEST_CASE("events arrive in order") {
    auto locator = std::make_shared<MemoryLocator>();
    auto events = std::make_shared<Channel<ProcessStarted>>();
    auto subscription = subscribe(locator, events);

    locator->backend->events->push(started("a.exe", 1));
    locator->backend->events->push(started("b.exe", 2));
    locator->backend->events->push(started("c.exe", 3));

    auto running = startInBackground(*subscription);

    auto first = events->receive();
    auto second = events->receive();
    auto third = events->receive();

    subscription->stop();
    CHECK(running.get().has_value());

    CHECK(first.ProcessName == "a.exe");
    CHECK(second.pid() == 2);
    CHECK(third.ProcessName == "c.exe");

    std::lock_guard guard(locator->backend->lock);
    REQUIRE(locator->backend->subscribedQueries.size() == 1);
    CHECK(locator->backend->subscribedQueries[0] == kQuery);
}

TEST_CASE("events can be allocated separately") {
    auto locator = std::make_shared<MemoryLocator>();
    auto events = std::make_shared<Channel<std::unique_ptr<ProcessStarted>>>();
    auto subscription = subscribe(locator, events);

    locator->backend->events->push(started("a.exe", 7));
    auto running = startInBackground(*subscription);

    auto event = events->receive();
    subscription->stop();
    CHECK(running.get().has_value());

    REQUIRE(event != nullptr);
    CHECK(event->pid() == 7);
}

TEST_CASE("the decoder configuration applies to events") {
    auto locator = std::make_shared<MemoryLocator>();
    auto events = std::make_shared<Channel<ProcessStarted>>();
    auto subscription = subscribe(locator, events);
    subscription->decoder.allowMissingFields = true;

    locator->backend->events->push(makeObject("Win32_ProcessStartTrace", { { "ProcessName", "a.exe" } }));
    auto running = startInBackground(*subscription);

    auto event = events->receive();
    subscription->stop();
    CHECK(running.get().has_value());

    CHECK(event.ProcessName == "a.exe");
    CHECK(event.pid() == 0);
}

TEST_CASE("stop does not wait for a reader") {
    auto locator = std::make_shared<MemoryLocator>();
    auto events = std::make_shared<Channel<ProcessStarted>>();
    auto subscription = subscribe(locator, events);

    locator->backend->events->push(started("a.exe", 1));
    auto running = startInBackground(*subscription);
    REQUIRE(eventually([&] { return locator->backend->events->pending() == 0; }));

    subscription->stop();
    CHECK(running.get().has_value());
    CHECK_FALSE(events->tryReceive().has_value());
}

TEST_CASE("event handles are released after decoding") {
    auto const before = TrackedObject::live();

    auto locator = std::make_shared<MemoryLocator>();
    auto events = std::make_shared<Channel<ProcessStarted>>();
    auto subscription = subscribe(locator, events);

    locator->backend->events->push(ObjectPtr(std::make_shared<TrackedObject>("Win32_ProcessStartTrace",
        std::initializer_list<std::pair<std::string, Variant>> { { "ProcessName", "a.exe" }, { "ProcessID", std::uint32_t(1) } })));
    CHECK(TrackedObject::live() == before + 1);

    auto running = startInBackground(*subscription);
    auto event = events->receive();
    subscription->stop();
    CHECK(running.get().has_value());

    CHECK(event.ProcessName == "a.exe");
    CHECK(TrackedObject::live() == before);
}

} // TEST_SUITE("Subscription delivery")

//=============================================================================
// Failure tests
//=============================================================================

TEST_SUITE("Subscription failures") {

TEST_CASE("connect errors are returned") {
    auto locator = std::make_shared<MemoryLocator>();
    locator->backend->connectError = Error(Error::Code::session, "access denied");

    auto subscription = subscribe(locator, std::make_shared<Channel<ProcessStarted>>());
    auto status = subscription->start();

    REQUIRE_FALSE(status.has_value());
    CHECK(status.error().is(Error::Code::session));
    CHECK(status.error().message() == "access denied");
    CHECK(locator->backend->subscriptions.load() == 0);
    CHECK(locator->backend->closes.load() == 0);
}

TEST_CASE("a missing session is an error") {
    auto locator = std::make_shared<MemoryLocator>();
    locator->backend->nullSession = true;

    auto subscription = subscribe(locator, std::make_shared<Channel<ProcessStarted>>());
    auto status = subscription->start();

    REQUIRE_FALSE(status.has_value());
    CHECK(status.error().is(Error::Code::session));
    CHECK(locator->backend->subscriptions.load() == 0);
    CHECK(locator->backend->closes.load() == 0);
}

TEST_CASE("a missing event source is an error") {
    auto locator = std::make_shared<MemoryLocator>();
    locator->backend->nullEventSource = true;

    auto subscription = subscribe(locator, std::make_shared<Channel<ProcessStarted>>());
    auto status = subscription->start();

    REQUIRE_FALSE(status.has_value());
    CHECK(status.error().is(Error::Code::remote));
    CHECK(locator->backend->events->waits() == 0);
    CHECK(locator->backend->closes.load() == 1);
}

TEST_CASE("faults of any type end the subscription as internal errors") {
    auto locator = std::make_shared<MemoryLocator>();
    locator->backend->throwOnConnect = true;

    auto subscription = subscribe(locator, std::make_shared<Channel<ProcessStarted>>());
    auto status = subscription->start();

    REQUIRE_FALSE(status.has_value());
    CHECK(status.error().is(Error::Code::internal));

    // the loop has exited, so stop must not block
    subscription->stop();
}

TEST_CASE("subscribe errors close the session") {
    auto locator = std::make_shared<MemoryLocator>();
    locator->backend->subscribeError = Error(Error::Code::remote, "invalid query");

    auto subscription = subscribe(locator, std::make_shared<Channel<ProcessStarted>>());
    auto status = subscription->start();

    REQUIRE_FALSE(status.has_value());
    CHECK(status.error().message() == "invalid query");
    CHECK(locator->backend->closes.load() == 1);
}

TEST_CASE("wait errors end the loop") {
    auto locator = std::make_shared<MemoryLocator>();
    auto subscription = subscribe(locator, std::make_shared<Channel<ProcessStarted>>());

    locator->backend->events->push(fail(Error::Code::remote, "event sink lost"));
    auto status = subscription->start();

    REQUIRE_FALSE(status.has_value());
    CHECK(status.error().is(Error::Code::remote));
    CHECK(status.error().message() == "event sink lost");
    CHECK(locator->backend->closes.load() == 1);
}

TEST_CASE("empty events end the loop") {
    auto locator = std::make_shared<MemoryLocator>();
    auto subscription = subscribe(locator, std::make_shared<Channel<ProcessStarted>>());

    locator->backend->events->push(ObjectPtr());
    auto status = subscription->start();

    REQUIRE_FALSE(status.has_value());
    CHECK(status.error().is(Error::Code::remote));
}

TEST_CASE("decode errors end the loop") {
    auto locator = std::make_shared<MemoryLocator>();
    auto events = std::make_shared<Channel<ProcessStarted>>();
    auto subscription = subscribe(locator, events);

    locator->backend->events->push(makeObject("Win32_ProcessStartTrace", { { "ProcessName", std::uint32_t(5) } }));
    auto status = subscription->start();

    REQUIRE_FALSE(status.has_value());
    CHECK(status.error().is(Error::Code::fieldMismatch));
    CHECK(status.error().mismatch()->fieldName == "ProcessName");
    CHECK_FALSE(events->tryReceive().has_value());
    CHECK(locator->backend->closes.load() == 1);
}

TEST_CASE("close failures do not change the outcome") {
    auto locator = std::make_shared<MemoryLocator>();
    locator->backend->closeError = Error(Error::Code::remote, "close failed");

    auto subscription = subscribe(locator, std::make_shared<Channel<ProcessStarted>>());
    auto running = startInBackground(*subscription);
    REQUIRE(eventually([&] { return locator->backend->events->waits() > 0; }));

    subscription->stop();
    CHECK(running.get().has_value());
    CHECK(locator->backend->closes.load() == 1);
}

TEST_CASE("connect options are passed to the locator") {
    auto locator = std::make_shared<MemoryLocator>();
    auto subscription = subscribe(locator, std::make_shared<Channel<ProcessStarted>>());
    subscription->setConnectOptions({ .server = "fileserver", .nameSpace = "root\\wmi", .user = "svc" });

    locator->backend->events->push(fail(Error::Code::remote, "event sink lost"));
    CHECK_FALSE(subscription->start().has_value());

    std::lock_guard guard(locator->backend->lock);
    REQUIRE(locator->backend->lastOptions.has_value());
    CHECK(locator->backend->lastOptions->server == "fileserver");
    CHECK(locator->backend->lastOptions->nameSpace == "root\\wmi");
    CHECK(locator->backend->lastOptions->user == "svc");
}

} // TEST_SUITE("Subscription failures")
