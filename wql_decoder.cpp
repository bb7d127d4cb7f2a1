#include "wql_decoder.hpp"

#include <charconv>
#include <format>

namespace wql
{
//=============================================================================
// Decoder implementations
//=============================================================================

Decoder::FieldStatus Decoder::parseSigned(std::string_view text, std::int64_t& out)
{
    auto digits = text;

    if (digits.size() > 1 && digits.front() == '+')
        digits.remove_prefix(1);

    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), out);

    if (digits.empty() || ec != std::errc() || ptr != digits.data() + digits.size())
        return detail::reject(std::format("cannot parse \"{}\" as a signed integer", text));

    return {};
}

Decoder::FieldStatus Decoder::parseUnsigned(std::string_view text, std::uint64_t& out)
{
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);

    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size())
        return detail::reject(std::format("cannot parse \"{}\" as an unsigned integer", text));

    return {};
}

std::string Decoder::unsupported(std::string_view what, Variant const& value)
{
    return std::format("{} ({})", what, kindName(value.kind()));
}

} // namespace wql
