/**
 * @file wql_subscription.hpp
 * @brief Continuous delivery of remote events into a channel
 *
 * A Subscription runs an event query and decodes every event it receives into
 * the caller's event record, which is then sent to the caller's Channel.
 * start() runs the poll loop on the calling thread; stop() may be called from
 * any other thread and returns once the loop has let go.
 *
 * @code
 * struct ProcessStarted
 * {
 *     std::string ProcessName;
 *     Field<std::uint32_t, "ProcessID"> pid;
 * };
 *
 * auto events = std::make_shared<Channel<ProcessStarted>>();
 * auto subscription = Subscription<ProcessStarted>::create(locator, events, "SELECT * FROM Win32_ProcessStartTrace");
 *
 * std::thread loop([&] { auto status = (*subscription)->start(); });
 * auto first = events->receive();
 * (*subscription)->stop();
 * loop.join();
 * @endcode
 *
 * A subscription is good for exactly one start. Once stopped it stays stopped.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include "wql_channel.hpp"
#include "wql_decoder.hpp"
#include "wql_error.hpp"
#include "wql_services.hpp"

namespace wql
{

/**
 * @brief State machine and poll loop shared by all event types
 */
class SubscriptionBase
{
public:
    /// Default bound of a single wait for the next event
    static constexpr std::chrono::milliseconds kDefaultTimeout { 1000 };

    virtual ~SubscriptionBase() = default;

    SubscriptionBase(SubscriptionBase const&) = delete;
    SubscriptionBase& operator=(SubscriptionBase const&) = delete;

    /**
     * @brief Connects, subscribes and delivers events until stopped
     *
     * Fails with Error::Code::alreadyRunning if another start() is running and
     * returns success at once if the subscription was already stopped. Ends
     * with success when stopped, or with the first connect, wait or decode
     * error.
     */
    Status start();

    /**
     * @brief Stops the subscription
     *
     * If the poll loop is running this blocks until it acknowledges, which
     * takes at most about one timeout interval.
     */
    void stop();

    /// Bound of each wait for an event, negative waits forever. Takes effect at the next wait.
    void setTimeout(std::chrono::milliseconds timeout) noexcept;
    std::chrono::milliseconds timeout() const noexcept;

    /// Session arguments used by start()
    void setConnectOptions(ConnectOptions options);

    std::string const& query() const noexcept { return queryText; }

protected:
    SubscriptionBase(std::shared_ptr<Locator> locator_, std::string query_);

    /**
     * @brief Decodes event and hands it to the caller
     *
     * Returns success if the event was received, and also if delivery was
     * abandoned because a stop is pending.
     */
    virtual Status deliver(ObjectPtr event) = 0;

    /// Interrupts a delivery blocked in deliver() so it notices a stop
    virtual void wakeDelivery() = 0;

    /// Acknowledges a pending stop without blocking. Returns true if there was one.
    bool tryAcknowledgeStop();

private:
    enum class State
    {
        notStarted,
        started,
        stopped
    };

    Status run(ConnectOptions const& connectOptions);
    void markLoopExited();

    std::shared_ptr<Locator> locator;
    std::string queryText;
    ConnectOptions options;
    std::atomic<std::chrono::milliseconds::rep> timeoutMs { kDefaultTimeout.count() };

    std::mutex stateLock;
    State state = State::notStarted;

    // stop handshake between stop() and the poll loop
    std::mutex signalLock;
    std::condition_variable signalChanged;
    bool stopWaiting = false;
    bool stopAcknowledged = false;
    bool loopExited = false;
};

namespace detail
{
/// Event types a subscription delivers: a record, or a std::unique_ptr to one
template <typename T>
concept EventRecord = CollectionRecord<T> || (is_unique_ptr<T>::value && CollectionRecord<typename T::element_type>);
} // namespace detail

/**
 * @brief A subscription delivering events of type Event
 *
 * @tparam Event A record, or std::unique_ptr to a record
 */
template <detail::EventRecord Event>
class Subscription : public SubscriptionBase
{
public:
    /**
     * @brief Creates a subscription that is not started yet
     *
     * Fails with Error::Code::invalidArgument if locator or events is null.
     */
    static Result<std::unique_ptr<Subscription>> create(std::shared_ptr<Locator> locator,
                                                        std::shared_ptr<Channel<Event>> events,
                                                        std::string query);

    /// Decoder used for events. Configure it before start().
    Decoder decoder;

protected:
    Status deliver(ObjectPtr event) override;
    void wakeDelivery() override;

private:
    Subscription(std::shared_ptr<Locator> locator_, std::shared_ptr<Channel<Event>> events_, std::string query_);

    std::shared_ptr<Channel<Event>> events;
};

} // namespace wql

// Include template implementations
#include "wql_subscription.tpp"
