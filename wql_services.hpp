/**
 * @file wql_services.hpp
 * @brief Interfaces of the remote management service wql talks to
 *
 * wql does not speak to the remote system itself. A backend implements these
 * interfaces on top of its native session handles; wql only requires queries,
 * single object fetches, event subscriptions and an explicit close.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include "wql_collection.hpp"
#include "wql_error.hpp"
#include "wql_variant.hpp"

namespace wql
{

/**
 * @brief Arguments of a session
 *
 * Empty strings leave the choice to the backend (current user, default
 * locale and so on).
 */
struct ConnectOptions
{
    std::string server    = ".";
    std::string nameSpace = "root\\cimv2";
    std::string user;
    std::string password;
    std::string locale;
    std::string authority;
    std::int32_t securityFlags = 0;
};

/// Waits infinitely when passed to EventSource::nextEvent
inline constexpr std::chrono::milliseconds kWaitForever { -1 };

/**
 * @brief A running event subscription
 */
class EventSource
{
public:
    virtual ~EventSource() = default;

    /**
     * @brief Waits for the next event
     *
     * A negative timeout waits indefinitely. An expired wait fails with
     * Error::Code::timedOut, which is not fatal: the caller may wait again.
     */
    virtual Result<ObjectPtr> nextEvent(std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief An open session to one namespace of one server
 */
class Services
{
public:
    virtual ~Services() = default;

    virtual Result<std::unique_ptr<ResultSet>> execQuery(std::string_view query) = 0;

    /// Fetches a single object by its object path
    virtual Result<ObjectPtr> get(std::string_view path) = 0;

    virtual Result<std::unique_ptr<EventSource>> execNotificationQuery(std::string_view query) = 0;

    /// Releases the session. Nothing may be called after it.
    virtual Status close() = 0;
};

/**
 * @brief Opens sessions
 */
class Locator
{
public:
    virtual ~Locator() = default;

    virtual Result<std::unique_ptr<Services>> connectServer(ConnectOptions const& options) = 0;
};

} // namespace wql
