#pragma once

#include <utility>

namespace wql
{

//=============================================================================
// Channel implementations
//=============================================================================
template <typename T>
T Channel<T>::receive()
{
    std::unique_lock guard(lock);
    changed.wait(guard, [this] { return slot.has_value(); });
    return take();
}

template <typename T>
template <typename Rep, typename Period>
std::optional<T> Channel<T>::receiveFor(std::chrono::duration<Rep, Period> timeout)
{
    std::unique_lock guard(lock);

    if (! changed.wait_for(guard, timeout, [this] { return slot.has_value(); }))
        return std::nullopt;

    return take();
}

template <typename T>
std::optional<T> Channel<T>::tryReceive()
{
    std::lock_guard guard(lock);

    if (! slot.has_value())
        return std::nullopt;

    return take();
}

template <typename T>
void Channel<T>::send(T value)
{
    sendUnless(std::move(value), [] { return false; });
}

template <typename T>
template <std::predicate Abandon>
bool Channel<T>::sendUnless(T value, Abandon && abandon)
{
    std::unique_lock guard(lock);

    // another sender may occupy the slot
    changed.wait(guard, [this, &abandon] { return (! slot.has_value()) || abandon(); });

    if (slot.has_value())
        return false;

    slot.emplace(std::move(value));
    auto const ticket = ++offered;
    changed.notify_all();

    // the value is gone once the slot is empty or holds a later offer
    auto const received = [this, ticket] { return (! slot.has_value()) || offered != ticket; };

    changed.wait(guard, [&received, &abandon] { return received() || abandon(); });

    if (received())
        return true;

    // abandoned before anybody received it
    slot.reset();
    changed.notify_all();
    return false;
}

template <typename T>
void Channel<T>::wake()
{
    std::lock_guard guard(lock);
    changed.notify_all();
}

template <typename T>
T Channel<T>::take()
{
    T value = std::move(*slot);
    slot.reset();
    changed.notify_all();
    return value;
}

} // namespace wql
