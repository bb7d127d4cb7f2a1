#include "wql_variant.hpp"

#include <algorithm>
#include <format>
#include <CxxUtilities.hpp>

namespace wql
{
//=============================================================================
// Variant implementations
//=============================================================================

std::string_view kindName(Variant::Kind kind) noexcept
{
    switch (kind)
    {
    case Variant::Kind::empty:   return "empty";
    case Variant::Kind::null:    return "null";
    case Variant::Kind::int8:    return "int8";
    case Variant::Kind::int16:   return "int16";
    case Variant::Kind::int32:   return "int32";
    case Variant::Kind::int64:   return "int64";
    case Variant::Kind::uint8:   return "uint8";
    case Variant::Kind::uint16:  return "uint16";
    case Variant::Kind::uint32:  return "uint32";
    case Variant::Kind::uint64:  return "uint64";
    case Variant::Kind::boolean: return "bool";
    case Variant::Kind::real32:  return "float32";
    case Variant::Kind::string:  return "string";
    case Variant::Kind::object:  return "object";
    case Variant::Kind::array:   return "array";
    }

    return "unknown";
}

std::ostream& operator<<(std::ostream& o, Variant const& v)
{
    v.visit(cxxutils::multilambda(
        [&o] (std::monostate)          { o << "<empty>"; },
        [&o] (Null)                    { o << "<null>"; },
        [&o] (std::int8_t x)           { o << static_cast<int>(x); },
        [&o] (std::uint8_t x)          { o << static_cast<unsigned>(x); },
        [&o] (bool x)                  { o << (x ? "true" : "false"); },
        [&o] (std::string const& x)    { o << '"' << x << '"'; },
        [&o] (ObjectPtr const& x)      { o << "<object " << (x != nullptr ? x->className() : "nil") << ">"; },
        [&o] (Array const& x)
        {
            o << "[";
            auto first = true;

            for (auto const& element : x)
            {
                if (! std::exchange(first, false))
                    o << ", ";

                o << element;
            }

            o << "]";
        },
        [&o] (auto x)                  { o << x; }
    ));

    return o;
}

//=============================================================================
// PropertyBag implementations
//=============================================================================

PropertyBag::PropertyBag(std::string className_) : name(std::move(className_)) {}

PropertyBag::PropertyBag(std::string className_, std::initializer_list<std::pair<std::string, Variant>> props)
    : name(std::move(className_)), properties(props)
{}

Result<Variant> PropertyBag::property(std::string_view propertyName) const
{
    auto it = std::find_if(properties.begin(), properties.end(),
                           [propertyName] (auto const& p) { return p.first == propertyName; });

    if (it == properties.end())
        return fail(Error::Code::notFound, std::format("{} has no property \"{}\"", name, propertyName));

    return it->second;
}

PropertyBag& PropertyBag::set(std::string_view propertyName, Variant value)
{
    auto it = std::find_if(properties.begin(), properties.end(),
                           [propertyName] (auto const& p) { return p.first == propertyName; });

    if (it != properties.end())
        it->second = std::move(value);
    else
        properties.emplace_back(std::string(propertyName), std::move(value));

    return *this;
}

bool PropertyBag::remove(std::string_view propertyName)
{
    auto it = std::find_if(properties.begin(), properties.end(),
                           [propertyName] (auto const& p) { return p.first == propertyName; });

    if (it == properties.end())
        return false;

    properties.erase(it);
    return true;
}

bool PropertyBag::contains(std::string_view propertyName) const
{
    return std::any_of(properties.begin(), properties.end(),
                       [propertyName] (auto const& p) { return p.first == propertyName; });
}
} // namespace wql
