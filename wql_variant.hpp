/**
 * @file wql_variant.hpp
 * @brief The dynamic object model wql decodes from
 *
 * A remote object is a bag of named properties, each typed only when it is
 * read. wql models a property value as a closed set of alternatives (Variant)
 * and a remote object as the abstract Object interface. Backends implement
 * Object on top of their native handles. PropertyBag is the in-memory
 * implementation.
 *
 * Handles to nested objects are reference counted (ObjectPtr). Dropping the
 * last Variant or ObjectPtr that refers to an object releases it, so scoping a
 * fetched Variant is enough to guarantee its release on every exit path.
 */

#pragma once

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include "wql_error.hpp"

namespace wql
{

class Object;
class Variant;

/// Shared handle to a dynamic object
using ObjectPtr = std::shared_ptr<Object const>;

/// Array-valued property
using Array = std::vector<Variant>;

/// The "null" property value (VT_NULL). Distinct from an empty Variant.
struct Null
{
    friend constexpr bool operator==(Null, Null) noexcept { return true; }
};

/**
 * @brief A single, dynamically typed property value
 *
 * The alternatives are fixed: empty (no value at all), null, signed and
 * unsigned integers of every width, bool, 32-bit float, string, a nested
 * object and an array of Variants. Visiting a Variant is therefore a total
 * match over a known set.
 *
 * @code
 * Variant v(std::uint32_t(4));
 * v.visit([] (auto const& x) { std::cout << x; });
 * @endcode
 */
class Variant
{
public:
    /// Alternatives in declaration order, mirrors Storage
    enum class Kind
    {
        empty, null,
        int8, int16, int32, int64,
        uint8, uint16, uint32, uint64,
        boolean, real32, string,
        object, array
    };

    using Storage = std::variant<
        std::monostate, Null,
        std::int8_t, std::int16_t, std::int32_t, std::int64_t,
        std::uint8_t, std::uint16_t, std::uint32_t, std::uint64_t,
        bool, float, std::string,
        ObjectPtr, Array
    >;

    /// Default constructor - an empty Variant
    Variant() = default;

    Variant(Null)                    : storage(Null{}) {}
    Variant(std::int8_t v)           : storage(v) {}
    Variant(std::int16_t v)          : storage(v) {}
    Variant(std::int32_t v)          : storage(v) {}
    Variant(std::int64_t v)          : storage(v) {}
    Variant(std::uint8_t v)          : storage(v) {}
    Variant(std::uint16_t v)         : storage(v) {}
    Variant(std::uint32_t v)         : storage(v) {}
    Variant(std::uint64_t v)         : storage(v) {}
    Variant(bool v)                  : storage(v) {}
    Variant(float v)                 : storage(v) {}
    Variant(std::string v)           : storage(std::move(v)) {}
    Variant(char const* v)           : storage(std::string(v)) {}
    Variant(ObjectPtr v)             : storage(std::move(v)) {}
    Variant(Array v)                 : storage(std::move(v)) {}

    Kind kind() const noexcept { return static_cast<Kind>(storage.index()); }

    bool isEmpty() const noexcept  { return kind() == Kind::empty; }
    bool isNull() const noexcept   { return kind() == Kind::null; }
    bool isObject() const noexcept { return kind() == Kind::object; }
    bool isArray() const noexcept  { return kind() == Kind::array; }

    /// Releases whatever the Variant holds and makes it empty
    void clear() noexcept { storage.emplace<std::monostate>(); }

    /// Returns a pointer to the alternative T, or nullptr
    template <typename T>
    T const* get() const noexcept { return std::get_if<T>(&storage); }

    /// Visits the held alternative (std::monostate for empty)
    template <typename Lambda>
    decltype(auto) visit(Lambda && lambda) const { return std::visit(std::forward<Lambda>(lambda), storage); }

    Storage const& underlying() const noexcept { return storage; }

    friend bool operator==(Variant const& a, Variant const& b) { return a.storage == b.storage; }

private:
    Storage storage;
};

/// Printable name of a Variant alternative, e.g. "uint32" or "array"
std::string_view kindName(Variant::Kind kind) noexcept;

/**
 * @brief Abstract dynamic object
 *
 * Properties are fetched by name. A property the object does not have is
 * reported with Error::Code::notFound. Any other error is a failure of the
 * remote system and is propagated by the caller.
 */
class Object
{
public:
    virtual ~Object() = default;

    /// Name of the object's class, e.g. "Win32_Process"
    virtual std::string_view className() const = 0;

    /// Fetches a property value
    virtual Result<Variant> property(std::string_view name) const = 0;
};

/**
 * @brief In-memory dynamic object
 *
 * Properties keep their insertion order. Setting an existing name replaces its
 * value.
 *
 * @code
 * auto process = std::make_shared<PropertyBag>("Win32_Process");
 * process->set("Name", "System").set("ProcessId", std::uint32_t(4));
 * @endcode
 */
class PropertyBag : public Object
{
public:
    PropertyBag() = default;
    explicit PropertyBag(std::string className_);
    PropertyBag(std::string className_, std::initializer_list<std::pair<std::string, Variant>> props);

    std::string_view className() const override { return name; }
    Result<Variant> property(std::string_view propertyName) const override;

    /// Adds or replaces a property
    PropertyBag& set(std::string_view propertyName, Variant value);

    /// Removes a property, returns false if it did not exist
    bool remove(std::string_view propertyName);

    bool contains(std::string_view propertyName) const;
    std::size_t size() const noexcept { return properties.size(); }

private:
    std::string name;
    std::vector<std::pair<std::string, Variant>> properties;
};

std::ostream& operator<<(std::ostream& o, Variant const& v);

} // namespace wql
