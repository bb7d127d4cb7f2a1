#include "wql_subscription.hpp"

#include <exception>
#include <format>
#include <CxxUtilities.hpp>
#include <spdlog/spdlog.h>

namespace wql
{
//=============================================================================
// SubscriptionBase implementations
//=============================================================================

SubscriptionBase::SubscriptionBase(std::shared_ptr<Locator> locator_, std::string query_)
    : locator(std::move(locator_)), queryText(std::move(query_))
{}

Status SubscriptionBase::start()
{
    ConnectOptions connectOptions;
    {
        std::lock_guard guard(stateLock);

        if (state == State::started)
            return fail(Error::Code::alreadyRunning, std::format("subscription \"{}\" is already running", queryText));

        if (state == State::stopped)
            return {};

        state = State::started;
        connectOptions = options;
    }

    spdlog::debug("starting subscription \"{}\"", queryText);

    auto loopExit = cxxutils::callAtEndOfScope(this, [] (SubscriptionBase* self) { self->markLoopExited(); });

    Status status;

    try
    {
        status = run(connectOptions);
    }
    catch (std::exception const& e)
    {
        status = fail(Error::Code::internal, std::format("subscription \"{}\" failed: {}", queryText, e.what()));
    }
    catch (...)
    {
        status = fail(Error::Code::internal, std::format("subscription \"{}\" failed with an unexpected fault", queryText));
    }

    if (! status)
        spdlog::error("subscription \"{}\" ended: {}", queryText, status.error().message());
    else
        spdlog::debug("subscription \"{}\" stopped", queryText);

    return status;
}

void SubscriptionBase::stop()
{
    std::lock_guard guard(stateLock);

    if (state == State::started)
    {
        std::unique_lock signal(signalLock);

        if (! loopExited)
        {
            stopWaiting = true;

            // the loop may be blocked delivering, which needs the channel lock before ours
            signal.unlock();
            wakeDelivery();
            signal.lock();

            signalChanged.wait(signal, [this] { return stopAcknowledged || loopExited; });
        }
    }

    state = State::stopped;
}

void SubscriptionBase::setTimeout(std::chrono::milliseconds timeout) noexcept
{
    timeoutMs.store(timeout.count());
}

std::chrono::milliseconds SubscriptionBase::timeout() const noexcept
{
    return std::chrono::milliseconds(timeoutMs.load());
}

void SubscriptionBase::setConnectOptions(ConnectOptions options_)
{
    std::lock_guard guard(stateLock);
    options = std::move(options_);
}

bool SubscriptionBase::tryAcknowledgeStop()
{
    std::lock_guard guard(signalLock);

    if (! stopWaiting)
        return false;

    stopAcknowledged = true;
    signalChanged.notify_all();
    return true;
}

void SubscriptionBase::markLoopExited()
{
    std::lock_guard guard(signalLock);
    loopExited = true;
    signalChanged.notify_all();
}

Status SubscriptionBase::run(ConnectOptions const& connectOptions)
{
    auto services = locator->connectServer(connectOptions);

    if (! services)
        return std::unexpected(std::move(services.error()));

    if (*services == nullptr)
        return fail(Error::Code::session, std::format("connecting to {} returned no session", connectOptions.server));

    auto session = std::move(*services);
    auto closeSession = cxxutils::callAtEndOfScope(session.get(), [this] (Services* s)
    {
        if (auto status = s->close(); ! status)
            spdlog::warn("closing the session of subscription \"{}\" failed: {}", queryText, status.error().message());
    });

    auto subscribed = session->execNotificationQuery(queryText);

    if (! subscribed)
        return std::unexpected(std::move(subscribed.error()));

    if (*subscribed == nullptr)
        return fail(Error::Code::remote, std::format("subscription \"{}\" returned no event source", queryText));

    auto source = std::move(*subscribed);

    for (;;)
    {
        if (tryAcknowledgeStop())
            return {};

        auto event = source->nextEvent(timeout());

        if (! event)
        {
            if (event.error().is(Error::Code::timedOut))
            {
                spdlog::trace("subscription \"{}\" polled without an event", queryText);
                continue;
            }

            return std::unexpected(std::move(event.error()));
        }

        if (*event == nullptr)
            return fail(Error::Code::remote, std::format("subscription \"{}\" received an empty event", queryText));

        if (auto status = deliver(std::move(*event)); ! status)
            return status;
    }
}

} // namespace wql
