#pragma once

#include <format>
#include <optional>
#include <utility>
#include <spdlog/spdlog.h>

namespace wql
{

//=============================================================================
// Connection implementations
//=============================================================================
template <typename Element>
Status Connection::query(std::string_view text, std::vector<Element>& dst)
{
    std::lock_guard guard(lock);

    if (auto status = checkOpen(); ! status)
        return status;

    auto results = services->execQuery(text);

    if (! results)
        return std::unexpected(std::move(results.error()));

    if (*results == nullptr)
        return fail(Error::Code::remote, std::format("query \"{}\" returned no result set", text));

    auto status = decodeAll(recordDecoder, **results, dst);
    spdlog::debug("query \"{}\" returned {} of {} reported element(s)", text, dst.size(), (*results)->count());

    return status;
}

template <typename T>
Status Connection::get(std::string_view path, T& dst)
{
    std::lock_guard guard(lock);

    auto object = getObject(path);

    if (! object)
        return std::unexpected(std::move(object.error()));

    return recordDecoder.decode(**object, dst);
}

//=============================================================================
// Client implementations
//=============================================================================
template <typename Element>
Status Client::query(std::string_view text, std::vector<Element>& dst, ConnectOptions const& options)
{
    auto connection = connect(options);

    if (! connection)
        return std::unexpected(std::move(connection.error()));

    auto status = (*connection)->query(text, dst);
    auto closed = (*connection)->close();

    if (closed)
        return status;

    std::optional<Error> merged;

    if (! status)
        merged.emplace(std::move(status.error()));

    Error::append(merged, std::move(closed.error()));
    return std::unexpected(std::move(*merged));
}

} // namespace wql
