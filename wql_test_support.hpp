#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "wql_services.hpp"
#include "wql_variant.hpp"

namespace wql::testing
{

//=============================================================================
// Objects
//=============================================================================

/// PropertyBag that counts its live instances
class TrackedObject : public PropertyBag
{
public:
    TrackedObject(std::string className_, std::initializer_list<std::pair<std::string, Variant>> props)
        : PropertyBag(std::move(className_), props)
    {
        ++liveCount;
    }

    ~TrackedObject() override { --liveCount; }

    static int live() { return liveCount.load(); }

private:
    static inline std::atomic<int> liveCount { 0 };
};

/// PropertyBag that records every property requested and can fail on demand
class RecordingObject : public PropertyBag
{
public:
    using PropertyBag::PropertyBag;

    Result<Variant> property(std::string_view propertyName) const override
    {
        requested.emplace_back(propertyName);

        if (failing.contains(std::string(propertyName)))
            return fail(Error::Code::remote, "property fetch failed");

        return PropertyBag::property(propertyName);
    }

    bool wasRequested(std::string_view propertyName) const
    {
        for (auto const& name : requested)
            if (name == propertyName)
                return true;

        return false;
    }

    std::set<std::string> failing;
    mutable std::vector<std::string> requested;
};

inline ObjectPtr makeObject(std::string className_, std::initializer_list<std::pair<std::string, Variant>> props)
{
    return std::make_shared<PropertyBag>(std::move(className_), props);
}

//=============================================================================
// Result sets and event sources
//=============================================================================

class MemoryResultSet : public ResultSet
{
public:
    explicit MemoryResultSet(std::vector<Result<ObjectPtr>> elements_) : elements(std::move(elements_)), reported(elements.size()) {}

    /// Reports reported_ as the element count whatever the actual size
    MemoryResultSet(std::vector<Result<ObjectPtr>> elements_, std::size_t reported_) : elements(std::move(elements_)), reported(reported_) {}

    std::size_t count() const override { return reported; }

    Result<ObjectPtr> next() override
    {
        if (position == elements.size())
            return ObjectPtr();

        return elements[position++];
    }

    std::size_t fetched() const noexcept { return position; }

private:
    std::vector<Result<ObjectPtr>> elements;
    std::size_t reported;
    std::size_t position = 0;
};

/// Events a test pushes and a subscription waits for
class EventFeed
{
public:
    void push(Result<ObjectPtr> event)
    {
        {
            std::lock_guard guard(lock);
            queue.push_back(std::move(event));
        }

        changed.notify_all();
    }

    Result<ObjectPtr> next(std::chrono::milliseconds timeout)
    {
        std::unique_lock guard(lock);
        ++waitCount;
        timeouts.push_back(timeout);

        auto const ready = [this] { return ! queue.empty(); };

        if (timeout.count() < 0)
            changed.wait(guard, ready);
        else if (! changed.wait_for(guard, timeout, ready))
            return fail(Error::Code::timedOut, "no event within the timeout");

        auto event = std::move(queue.front());
        queue.pop_front();
        return event;
    }

    int waits() const
    {
        std::lock_guard guard(lock);
        return waitCount;
    }

    std::size_t pending() const
    {
        std::lock_guard guard(lock);
        return queue.size();
    }

    /// Timeouts passed to next(), oldest first
    std::vector<std::chrono::milliseconds> requestedTimeouts() const
    {
        std::lock_guard guard(lock);
        return timeouts;
    }

private:
    mutable std::mutex lock;
    std::condition_variable changed;
    std::deque<Result<ObjectPtr>> queue;
    std::vector<std::chrono::milliseconds> timeouts;
    int waitCount = 0;
};

class FeedEventSource : public EventSource
{
public:
    explicit FeedEventSource(std::shared_ptr<EventFeed> feed_) : feed(std::move(feed_)) {}

    Result<ObjectPtr> nextEvent(std::chrono::milliseconds timeout) override { return feed->next(timeout); }

private:
    std::shared_ptr<EventFeed> feed;
};

//=============================================================================
// Sessions
//=============================================================================

/// Everything the in-memory sessions serve, shared by all of them
struct Backend
{
    std::map<std::string, std::vector<Result<ObjectPtr>>, std::less<>> queries;
    std::map<std::string, ObjectPtr, std::less<>> objects;
    std::shared_ptr<EventFeed> events = std::make_shared<EventFeed>();

    std::optional<Error> connectError;
    std::optional<Error> subscribeError;
    std::optional<Error> closeError;

    // misbehaving backends
    bool nullSession = false;
    bool nullEventSource = false;
    bool throwOnConnect = false;

    std::atomic<int> connects { 0 };
    std::atomic<int> closes { 0 };
    std::atomic<int> subscriptions { 0 };

    std::mutex lock;
    std::optional<ConnectOptions> lastOptions;
    std::vector<std::string> subscribedQueries;
};

class MemoryServices : public Services
{
public:
    explicit MemoryServices(std::shared_ptr<Backend> backend_) : backend(std::move(backend_)) {}

    Result<std::unique_ptr<ResultSet>> execQuery(std::string_view query) override
    {
        auto it = backend->queries.find(query);

        if (it == backend->queries.end())
            return fail(Error::Code::remote, "invalid query");

        return std::make_unique<MemoryResultSet>(it->second);
    }

    Result<ObjectPtr> get(std::string_view path) override
    {
        auto it = backend->objects.find(path);

        if (it == backend->objects.end())
            return fail(Error::Code::notFound, std::string("no object ") + std::string(path));

        return it->second;
    }

    Result<std::unique_ptr<EventSource>> execNotificationQuery(std::string_view query) override
    {
        {
            std::lock_guard guard(backend->lock);
            backend->subscribedQueries.emplace_back(query);
        }

        if (backend->subscribeError)
            return std::unexpected(*backend->subscribeError);

        ++backend->subscriptions;

        if (backend->nullEventSource)
            return std::unique_ptr<EventSource>();

        return std::make_unique<FeedEventSource>(backend->events);
    }

    Status close() override
    {
        ++backend->closes;

        if (backend->closeError)
            return std::unexpected(*backend->closeError);

        return {};
    }

private:
    std::shared_ptr<Backend> backend;
};

class MemoryLocator : public Locator
{
public:
    MemoryLocator() : backend(std::make_shared<Backend>()) {}

    Result<std::unique_ptr<Services>> connectServer(ConnectOptions const& options) override
    {
        ++backend->connects;

        {
            std::lock_guard guard(backend->lock);
            backend->lastOptions = options;
        }

        if (backend->connectError)
            return std::unexpected(*backend->connectError);

        if (backend->throwOnConnect)
            throw 7;

        if (backend->nullSession)
            return std::unique_ptr<Services>();

        return std::make_unique<MemoryServices>(backend);
    }

    std::shared_ptr<Backend> backend;
};

} // namespace wql::testing
