/**
 * @file wql_field.hpp
 * @brief Tags that control how a record member is bound to a property
 *
 * Plain members of a destination record are bound to the property with the
 * member's own name. Wrapping a member in Field<> overrides that:
 *
 * @code
 * struct Process
 * {
 *     std::string                         Name;         // property "Name"
 *     Field<std::uint32_t, "ProcessId">   pid;          // property "ProcessId"
 *     Skip<std::string>                   displayName;  // never bound
 * };
 *
 * struct LoggedOnUser
 * {
 *     // "Dependent" holds an object path which is fetched and decoded
 *     Field<Session, "Dependent", FieldFlags::reference> session;
 * };
 * @endcode
 */

#pragma once

#include <string_view>
#include <utility>
#include <fixed_string.hpp>

namespace wql
{

/// Property name that marks a member as never bound
inline constexpr std::string_view kSkipName = "-";

/**
 * @brief Per-field binding options
 */
enum class FieldFlags : unsigned
{
    none      = 0,
    reference = 1 << 0   ///< property holds an object path to dereference
};

constexpr FieldFlags operator|(FieldFlags a, FieldFlags b) noexcept
{
    return static_cast<FieldFlags>(static_cast<unsigned>(a) | static_cast<unsigned>(b));
}

constexpr bool hasFlag(FieldFlags flags, FieldFlags flag) noexcept
{
    return (static_cast<unsigned>(flags) & static_cast<unsigned>(flag)) != 0;
}

/**
 * @brief Record member bound to an explicitly named property
 *
 * Field behaves like the T it wraps: it converts to T, can be assigned a T and
 * forwards member access with operator->.
 *
 * @tparam T The member's value type
 * @tparam Name The property name, or "-" to never bind the member
 * @tparam Flags Binding options, see FieldFlags
 */
template <typename T, fixstr::fixed_string Name, FieldFlags Flags = FieldFlags::none>
class Field
{
public:
    using value_type = T;

    /// The property this field is bound to
    static constexpr std::string_view kPropertyName = Name;

    static constexpr FieldFlags kFlags = Flags;

    /// True if this member is never bound
    static constexpr bool kIsSkipped = kPropertyName == kSkipName;

    Field() = default;
    Field(T const& v) : value(v) {}
    Field(T && v) : value(std::move(v)) {}

    Field& operator=(T const& v) { value = v; return *this; }
    Field& operator=(T && v) { value = std::move(v); return *this; }

    /// Returns the wrapped value
    T&       operator()()       noexcept { return value; }
    T const& operator()() const noexcept { return value; }

    T&       operator*()       noexcept { return value; }
    T const& operator*() const noexcept { return value; }

    T*       operator->()       noexcept { return &value; }
    T const* operator->() const noexcept { return &value; }

    operator T const&() const noexcept { return value; }

    friend bool operator==(Field const&, Field const&) = default;

    T value {};
};

/// Member that is never bound to a property
template <typename T>
using Skip = Field<T, "-">;

} // namespace wql
