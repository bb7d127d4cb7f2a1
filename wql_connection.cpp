#include "wql_connection.hpp"

#include <format>
#include <spdlog/spdlog.h>

namespace wql
{
//=============================================================================
// Connection implementations
//=============================================================================

Connection::Connection(std::unique_ptr<Services> services_, Decoder decoder_)
    : services(std::move(services_)), recordDecoder(std::move(decoder_))
{
    if (! recordDecoder.resolveReference)
    {
        recordDecoder.resolveReference = [this] (std::string_view path) { return getObject(path); };
        resolvesThroughConnection = true;
    }
}

Connection::~Connection()
{
    if (auto status = close(); ! status)
        spdlog::warn("closing connection failed: {}", status.error().message());
}

Result<ObjectPtr> Connection::getObject(std::string_view path)
{
    std::lock_guard guard(lock);

    if (auto status = checkOpen(); ! status)
        return std::unexpected(std::move(status.error()));

    auto object = services->get(path);

    if (! object)
        return std::unexpected(std::move(object.error()));

    if (*object == nullptr)
        return fail(Error::Code::notFound, std::format("no object at \"{}\"", path));

    return object;
}

Status Connection::close()
{
    std::lock_guard guard(lock);

    if (services == nullptr)
        return {};

    auto status = services->close();

    // a failed close still gives up the session, it cannot be used any more
    services.reset();
    spdlog::debug("connection closed");

    return status;
}

bool Connection::isOpen() const
{
    std::lock_guard guard(lock);
    return services != nullptr;
}

Decoder Connection::decoder() const
{
    auto copy = recordDecoder;

    if (resolvesThroughConnection)
        copy.resolveReference = nullptr;

    return copy;
}

Status Connection::checkOpen() const
{
    if (services == nullptr)
        return fail(Error::Code::session, "connection has been closed");

    return {};
}

//=============================================================================
// Client implementations
//=============================================================================

Client::Client(std::shared_ptr<Locator> locator_, Decoder decoder_)
    : decoder(std::move(decoder_)), locator(std::move(locator_))
{}

Result<std::unique_ptr<Connection>> Client::connect(ConnectOptions const& options)
{
    if (locator == nullptr)
        return fail(Error::Code::invalidArgument, "client has no locator");

    auto services = locator->connectServer(options);

    if (! services)
        return std::unexpected(std::move(services.error()));

    if (*services == nullptr)
        return fail(Error::Code::session, std::format("connecting to {} returned no session", options.server));

    spdlog::debug("connected to {} namespace {}", options.server, options.nameSpace);
    return std::make_unique<Connection>(std::move(*services), decoder);
}

} // namespace wql
