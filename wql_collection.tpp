#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <utility>
#include <spdlog/spdlog.h>

namespace wql
{

namespace detail
{
/// Upper bound of the elements reserved up front from a result set's count hint
inline constexpr std::size_t kMaxReserve = 4096;

template <typename Element, typename DecodeElement>
Status materialise(ResultSet& results, std::vector<Element>& dst, DecodeElement && decodeElement)
{
    std::vector<Element> decoded;
    decoded.reserve(std::min(results.count(), kMaxReserve));

    std::optional<Error> mismatches;

    for (;;)
    {
        auto next = results.next();

        if (! next)
        {
            dst.clear();
            return std::unexpected(std::move(next.error()));
        }

        auto object = std::move(*next);

        if (object == nullptr)
            break;

        Element element {};
        auto status = decodeElement(*object, element);

        // release the element before fetching the next one
        object.reset();

        if (! status)
        {
            if (! status.error().is(Error::Code::fieldMismatch))
            {
                dst.clear();
                return status;
            }

            spdlog::warn("element {} decoded partially: {}", decoded.size(), status.error().message());
            Error::append(mismatches, std::move(status.error()));
        }

        decoded.push_back(std::move(element));
    }

    dst = std::move(decoded);

    if (mismatches)
        return std::unexpected(std::move(*mismatches));

    return {};
}
} // namespace detail

//=============================================================================
// decodeAll implementations
//=============================================================================
template <detail::CollectionRecord R>
Status decodeAll(Decoder const& decoder, ResultSet& results, std::vector<R>& dst)
{
    return detail::materialise(results, dst, [&decoder] (Object const& object, R& element)
    {
        return decoder.decode(object, element);
    });
}

template <detail::CollectionRecord R>
Status decodeAll(Decoder const& decoder, ResultSet& results, std::vector<std::unique_ptr<R>>& dst)
{
    return detail::materialise(results, dst, [&decoder] (Object const& object, std::unique_ptr<R>& element)
    {
        element = std::make_unique<R>();
        return decoder.decode(object, *element);
    });
}

} // namespace wql
