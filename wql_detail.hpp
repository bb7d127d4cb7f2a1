#pragma once

#include <array>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>
#include <boost/pfr.hpp>
#include "wql_field.hpp"
#include "wql_variant.hpp"

namespace wql
{

class Decoder;

//=============================================================================
// Implementation details - not part of the public API
//=============================================================================
namespace detail
{

//-----------------------------------------------------------------------------
// Field tag detection
//-----------------------------------------------------------------------------

template <typename T> struct is_field_helper : std::false_type {};
template <typename T, fixstr::fixed_string Name, FieldFlags Flags>
struct is_field_helper<Field<T, Name, Flags>> : std::true_type {};

/// Predicate that is true if T is a Field<> specialization
template <typename T> struct is_field { static constexpr auto value = is_field_helper<std::decay_t<T>>::value; };

/// The value type a member stores: T for Field<T, ...>, the member type otherwise
template <typename T, bool = is_field<T>::value> struct member_value { using type = T; };
template <typename T> struct member_value<T, true> { using type = typename T::value_type; };

template <typename T> using member_value_t = typename member_value<std::remove_cvref_t<T>>::type;

/// Returns a reference to the value a member stores
template <typename M>
constexpr auto& unwrap(M& member) noexcept
{
    if constexpr (is_field<M>::value)
        return member();
    else
        return member;
}

//-----------------------------------------------------------------------------
// Member kind classification
//-----------------------------------------------------------------------------

/// Dependent false for static_assert in discarded if constexpr branches
template <typename> inline constexpr bool kAlwaysFalse = false;

/// Integers of any width and signedness, bool excluded
template <typename T>
concept Integer = std::integral<T> && (! std::same_as<T, bool>);

template <typename T> struct is_timestamp : std::false_type {};
template <typename Duration>
struct is_timestamp<std::chrono::time_point<std::chrono::system_clock, Duration>> : std::true_type {};

template <typename T> struct is_vector : std::false_type {};
template <typename T, typename A> struct is_vector<std::vector<T, A>> : std::true_type {};

/**
 * @brief Describes "pointer" members: std::optional<T> and std::unique_ptr<T>
 *
 * A nullable member is populated by emplacing a zero value and decoding into
 * it; it can be reset to the empty state.
 */
template <typename T> struct nullable_traits { static constexpr bool value = false; };

template <typename T>
struct nullable_traits<std::optional<T>>
{
    static constexpr bool value = true;
    using element_type = T;

    static void assign(std::optional<T>& dst, T&& v) { dst = std::move(v); }
    static void reset(std::optional<T>& dst) noexcept { dst.reset(); }
};

template <typename T>
struct nullable_traits<std::unique_ptr<T>>
{
    static constexpr bool value = true;
    using element_type = T;

    static void assign(std::unique_ptr<T>& dst, T&& v) { dst = std::make_unique<T>(std::move(v)); }
    static void reset(std::unique_ptr<T>& dst) noexcept { dst.reset(); }
};

template <typename T>
concept Nullable = nullable_traits<T>::value;

template <typename T> struct is_unique_ptr : std::false_type {};
template <typename T> struct is_unique_ptr<std::unique_ptr<T>> : std::true_type { using element_type = T; };

/// Leaf kinds a single property value or array element can be decoded into
template <typename T>
concept Primitive = Integer<T> || std::same_as<T, bool> || std::same_as<T, float>
                 || std::same_as<T, std::string> || is_timestamp<T>::value;

/**
 * @brief A destination record: an aggregate struct walked member by member
 *
 * Timestamps, vectors and nullable wrappers are handled as their own kinds.
 */
template <typename T>
concept Record = std::is_class_v<T> && std::is_aggregate_v<T>
              && (! is_timestamp<T>::value) && (! is_vector<T>::value) && (! Nullable<T>)
              && (! is_field<T>::value);

//-----------------------------------------------------------------------------
// Property name resolution
//-----------------------------------------------------------------------------

/// Type of the I-th member of record T (possibly a Field<>)
template <typename T, std::size_t I>
using member_t = std::remove_cvref_t<decltype(boost::pfr::get<I>(std::declval<T&>()))>;

/**
 * @brief Resolves the property name of the I-th member of T
 *
 * An explicit Field<> name wins (including the "-" skip marker), otherwise the
 * member's declared name is used.
 */
template <typename T, std::size_t I>
constexpr std::string_view propertyName()
{
    using M = member_t<T, I>;

    if constexpr (is_field<M>::value)
        return M::kPropertyName;
    else
        return boost::pfr::get_name<I, T>();
}

template <typename T, std::size_t I>
constexpr FieldFlags fieldFlags()
{
    using M = member_t<T, I>;

    if constexpr (is_field<M>::value)
        return M::kFlags;
    else
        return FieldFlags::none;
}

/// Property names of all members of T in declaration order, computed once per type
template <typename T>
inline constexpr auto kPropertyNames = std::invoke([] <std::size_t... I> (std::index_sequence<I...>)
{
    return std::array<std::string_view, sizeof...(I)> {{ propertyName<T, I>()... }};
}, std::make_index_sequence<boost::pfr::tuple_size_v<T>>());

/**
 * @brief True if an earlier member of T is bound to the same property as member I
 *
 * The first member bound to a property takes it, later ones stay untouched.
 */
template <typename T, std::size_t I>
constexpr bool isShadowed()
{
    for (std::size_t j = 0; j < I; ++j)
        if (kPropertyNames<T>[j] == kPropertyNames<T>[I])
            return true;

    return false;
}

//-----------------------------------------------------------------------------
// Diagnostics
//-----------------------------------------------------------------------------

/// Printable name of T for error messages, extracted from the compiler's signature
template <typename T>
std::string typeName()
{
    std::string_view signature = std::source_location::current().function_name();

    auto const start = signature.find("T = ");
    if (start == std::string_view::npos)
        return std::string(signature);

    auto const end = signature.find_first_of(";]", start);
    return std::string(signature.substr(start + 4, end - start - 4));
}

//-----------------------------------------------------------------------------
// Self-decoding capability
//-----------------------------------------------------------------------------

/**
 * @brief Types that decode themselves from a dynamic object
 *
 * The member function receives the decoder (with its configuration) so it can
 * decode helper records from the same object before synthesising its fields.
 */
template <typename T>
concept SelfDecoding = requires (T& t, Decoder const& d, Object const& o)
{
    { t.decodeFrom(d, o) } -> std::same_as<Status>;
};

} // namespace detail
} // namespace wql
