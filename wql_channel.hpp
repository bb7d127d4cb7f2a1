/**
 * @file wql_channel.hpp
 * @brief Unbuffered rendezvous channel that delivers subscription events
 *
 * A send completes only once a receiver has taken the value. A sender can race
 * its delivery against a cancellation predicate with sendUnless(): whichever
 * becomes ready first wins, and a cancelled send withdraws its value so it is
 * never received.
 *
 * @code
 * auto events = std::make_shared<Channel<ProcessStarted>>();
 *
 * std::thread consumer([events]
 * {
 *     while (auto ev = events->receiveFor(std::chrono::seconds(5)))
 *         std::cout << ev->ProcessName << std::endl;
 * });
 * @endcode
 */

#pragma once

#include <chrono>
#include <concepts>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>

namespace wql
{

template <typename T>
class Channel
{
public:
    Channel() = default;
    Channel(Channel const&) = delete;
    Channel& operator=(Channel const&) = delete;

    /// Blocks until a value is sent
    T receive();

    /// Waits at most timeout for a value
    template <typename Rep, typename Period>
    std::optional<T> receiveFor(std::chrono::duration<Rep, Period> timeout);

    /// Takes a value only if a sender is waiting right now
    std::optional<T> tryReceive();

    /// Blocks until a receiver has taken value
    void send(T value);

    /**
     * @brief Delivers value unless abandon() becomes true first
     *
     * abandon is evaluated with the channel locked, initially and every time
     * the channel changes or wake() is called.
     *
     * @return true if a receiver took the value, false if the send was abandoned
     */
    template <std::predicate Abandon>
    bool sendUnless(T value, Abandon && abandon);

    /// Makes pending senders re-evaluate their abandon predicates
    void wake();

private:
    std::mutex lock;
    std::condition_variable changed;
    std::optional<T> slot;
    std::uint64_t offered = 0;

    T take();
};

} // namespace wql

// Include template implementations
#include "wql_channel.tpp"
