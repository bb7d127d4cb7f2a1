#pragma once

#include <utility>
#include <spdlog/spdlog.h>

namespace wql
{

//=============================================================================
// Subscription implementations
//=============================================================================
template <detail::EventRecord Event>
Result<std::unique_ptr<Subscription<Event>>> Subscription<Event>::create(std::shared_ptr<Locator> locator,
                                                                         std::shared_ptr<Channel<Event>> events,
                                                                         std::string query)
{
    if (locator == nullptr)
        return fail(Error::Code::invalidArgument, "subscription needs a locator");

    if (events == nullptr)
        return fail(Error::Code::invalidArgument, "subscription needs an event channel");

    return std::unique_ptr<Subscription>(new Subscription(std::move(locator), std::move(events), std::move(query)));
}

template <detail::EventRecord Event>
Subscription<Event>::Subscription(std::shared_ptr<Locator> locator_, std::shared_ptr<Channel<Event>> events_, std::string query_)
    : SubscriptionBase(std::move(locator_), std::move(query_)), events(std::move(events_))
{}

template <detail::EventRecord Event>
Status Subscription<Event>::deliver(ObjectPtr event)
{
    Event decoded {};
    Status status;

    if constexpr (detail::is_unique_ptr<Event>::value)
    {
        decoded = std::make_unique<typename Event::element_type>();
        status = decoder.decode(*event, *decoded);
    }
    else
    {
        status = decoder.decode(*event, decoded);
    }

    // the event is not needed any more, whatever happens to the delivery
    event.reset();

    if (! status)
        return status;

    if (! events->sendUnless(std::move(decoded), [this] { return tryAcknowledgeStop(); }))
        spdlog::debug("subscription \"{}\" dropped an undelivered event while stopping", query());

    return {};
}

template <detail::EventRecord Event>
void Subscription<Event>::wakeDelivery()
{
    events->wake();
}

} // namespace wql
