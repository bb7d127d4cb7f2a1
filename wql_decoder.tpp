#pragma once

#include <exception>
#include <format>
#include <CxxUtilities.hpp>

namespace wql
{

namespace detail
{
inline std::unexpected<std::string> reject(std::string reason) { return std::unexpected(std::move(reason)); }
} // namespace detail

//=============================================================================
// Decoder implementations
//=============================================================================
template <typename T>
Status Decoder::decode(Object const& src, T& dst) const
{
    static_assert(detail::Record<T> || detail::SelfDecoding<T>,
                  "Destination must be an aggregate record or provide Status decodeFrom(Decoder const&, Object const&)");

    try
    {
        if constexpr (detail::SelfDecoding<T>)
            return dst.decodeFrom(*this, src);
        else
            return decodeFields(src, dst);
    }
    catch (std::exception const& e)
    {
        return fail(Error::Code::internal, std::format("unexpected fault while decoding {}: {}", detail::typeName<T>(), e.what()));
    }
    catch (...)
    {
        return fail(Error::Code::internal, std::format("unexpected fault while decoding {}", detail::typeName<T>()));
    }
}

template <typename T>
Status Decoder::decodeFields(Object const& src, T& dst) const
{
    return [this, &src, &dst] <std::size_t... I> (std::index_sequence<I...>) -> Status
    {
        Status status;

        // stops at the first member that fails
        static_cast<void>(((status = decodeMember<T, I>(src, dst)) && ...));
        return status;
    }(std::make_index_sequence<boost::pfr::tuple_size_v<T>>());
}

template <typename T, std::size_t I>
Status Decoder::decodeMember(Object const& src, T& dst) const
{
    using Target = detail::member_value_t<detail::member_t<T, I>>;
    static constexpr std::string_view kName = detail::kPropertyNames<T>[I];

    if constexpr (kName == kSkipName || detail::isShadowed<T, I>())
    {
        return {};
    }
    else
    {
        auto const mismatch = [] (std::string reason) -> Status
        {
            return std::unexpected(Error::fieldMismatch(detail::typeName<Target>(), std::string(kName), std::move(reason)));
        };

        // the fetched value owns any nested object handle until it goes out of scope
        auto value = src.property(kName);

        if (! value)
        {
            if (! value.error().is(Error::Code::notFound))
                return mismatch(value.error().message());

            if (allowMissingFields)
                return {};

            return mismatch("no such result field");
        }

        if (value->isNull())
            return {};

        if (auto status = decodeValue(detail::unwrap(boost::pfr::get<I>(dst)), *value, detail::fieldFlags<T, I>()); ! status)
            return mismatch(std::move(status.error()));

        return {};
    }
}

template <typename Target>
Decoder::FieldStatus Decoder::decodeValue(Target& dst, Variant const& value, FieldFlags flags) const
{
    if constexpr (detail::Nullable<Target>)
    {
        using Traits  = detail::nullable_traits<Target>;
        using Element = typename Traits::element_type;

        if (value.isEmpty())
        {
            if (ptrNil)
                Traits::reset(dst);
            else
                Traits::assign(dst, Element {});

            return {};
        }

        Element element {};

        if (auto status = decodeValue(element, value, flags); ! status)
            return status;

        Traits::assign(dst, std::move(element));
        return {};
    }
    else
    {
        if (value.isEmpty())
        {
            if (! nonePtrZero)
                return detail::reject(unsupported("unsupported type", value));

            dst = Target {};
            return {};
        }

        if constexpr (detail::is_vector<Target>::value)
        {
            if (auto const* elements = value.get<Array>())
                return decodeArray(dst, *elements);

            return detail::reject(unsupported("unsupported type", value));
        }
        else if constexpr (detail::Record<Target> || detail::SelfDecoding<Target>)
        {
            if (hasFlag(flags, FieldFlags::reference))
                return decodeReference(dst, value);

            if (auto const* nested = value.get<ObjectPtr>(); nested != nullptr && *nested != nullptr)
                return decodeObject(dst, **nested);

            if (value.get<std::string>() != nullptr)
                return detail::reject("can't deserialize string into struct");

            return detail::reject(unsupported("unsupported type", value));
        }
        else if constexpr (detail::Primitive<Target>)
        {
            return decodePrimitive(dst, value);
        }
        else
        {
            static_assert(detail::kAlwaysFalse<Target>, "Unsupported record member type");
        }
    }
}

template <typename Target>
Decoder::FieldStatus Decoder::decodePrimitive(Target& dst, Variant const& value) const
{
    auto const unsupportedSource = [&value] { return detail::reject(unsupported("unsupported type", value)); };

    return value.visit(cxxutils::multilambda(
        [&dst] <detail::Integer Source> (Source source) -> FieldStatus
        {
            if constexpr (detail::Integer<Target>)
            {
                dst = static_cast<Target>(source);
                return {};
            }
            else
                return detail::reject("not an integer class");
        },
        [&dst] (bool source) -> FieldStatus
        {
            if constexpr (std::same_as<Target, bool>)
            {
                dst = source;
                return {};
            }
            else
                return detail::reject("not a bool");
        },
        [&dst] (float source) -> FieldStatus
        {
            if constexpr (std::same_as<Target, float>)
            {
                dst = source;
                return {};
            }
            else
                return detail::reject("not a float32");
        },
        [&dst] (std::string const& source) -> FieldStatus
        {
            if constexpr (std::same_as<Target, std::string>)
            {
                dst = source;
                return {};
            }
            else if constexpr (detail::Integer<Target> && std::is_signed_v<Target>)
            {
                std::int64_t parsed = 0;

                if (auto status = parseSigned(source, parsed); ! status)
                    return status;

                dst = static_cast<Target>(parsed);
                return {};
            }
            else if constexpr (detail::Integer<Target>)
            {
                std::uint64_t parsed = 0;

                if (auto status = parseUnsigned(source, parsed); ! status)
                    return status;

                dst = static_cast<Target>(parsed);
                return {};
            }
            else if constexpr (detail::is_timestamp<Target>::value)
            {
                auto parsed = parseTimestamp(source);

                if (! parsed)
                    return detail::reject(parsed.error().message());

                dst = std::chrono::time_point_cast<typename Target::duration>(*parsed);
                return {};
            }
            else
                return detail::reject(std::format("can't deserialize string into {}", detail::typeName<Target>()));
        },
        [&unsupportedSource] (std::monostate)     -> FieldStatus { return unsupportedSource(); },
        [&unsupportedSource] (Null)               -> FieldStatus { return unsupportedSource(); },
        [&unsupportedSource] (ObjectPtr const&)   -> FieldStatus { return unsupportedSource(); },
        [&unsupportedSource] (Array const&)       -> FieldStatus { return unsupportedSource(); }
    ));
}

template <typename Target>
Decoder::FieldStatus Decoder::decodeArray(Target& dst, Array const& elements) const
{
    using Element = typename Target::value_type;

    if constexpr (! detail::Primitive<Element>)
    {
        return detail::reject(std::format("unsupported slice type ({})", detail::typeName<Element>()));
    }
    else
    {
        Target decoded;
        decoded.reserve(elements.size());

        for (auto const& element : elements)
        {
            Element item {};

            if (! decodePrimitive(item, element))
                return detail::reject(unsupported("unsupported slice type", element));

            decoded.push_back(std::move(item));
        }

        dst = std::move(decoded);
        return {};
    }
}

template <typename Target>
Decoder::FieldStatus Decoder::decodeObject(Target& dst, Object const& nested) const
{
    if (auto status = decode(nested, dst); ! status)
        return detail::reject(status.error().message());

    return {};
}

template <typename Target>
Decoder::FieldStatus Decoder::decodeReference(Target& dst, Variant const& value) const
{
    auto const* path = value.get<std::string>();

    if (path == nullptr)
        return detail::reject(unsupported("not an object path", value));

    if (! resolveReference)
        return detail::reject(std::format("no reference resolver for \"{}\"", *path));

    auto referenced = resolveReference(*path);

    if (! referenced)
        return detail::reject(referenced.error().message());

    if (*referenced == nullptr)
        return detail::reject(std::format("\"{}\" does not name an object", *path));

    return decodeObject(dst, **referenced);
}

} // namespace wql
