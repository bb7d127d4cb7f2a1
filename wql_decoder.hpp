/**
 * @file wql_decoder.hpp
 * @brief Type-directed decoding of dynamic objects into records
 *
 * The Decoder walks the members of a destination record in declaration order,
 * fetches the property each member is bound to (see wql_field.hpp) and
 * converts the dynamically typed value into the member's static type.
 *
 * Usage example:
 *   struct Process
 *   {
 *       std::string                         Name;
 *       Field<std::uint32_t, "ProcessId">   pid;
 *       std::optional<Timestamp>            CreationDate;
 *       std::vector<std::string>            Tags;
 *   };
 *
 *   Decoder decoder;
 *   Process process;
 *   if (auto status = decoder.decode(*object, process); ! status)
 *       std::cerr << status.error() << std::endl;
 */

#pragma once

#include <functional>
#include <string>
#include <string_view>
#include "wql_detail.hpp"
#include "wql_error.hpp"
#include "wql_timestamp.hpp"
#include "wql_variant.hpp"

namespace wql
{

/**
 * @brief Decodes dynamic objects into statically typed records
 *
 * A Decoder holds configuration only, so a single instance may be used from
 * several threads at once. Destinations are written in place; nothing of the
 * source object is retained after a call returns.
 *
 * Conversion rules, by destination member kind:
 *   - integers of any width accept integer values of any width and
 *     signedness, and decimal strings
 *   - bool, float and std::string require a value of exactly that kind
 *   - Timestamp accepts strings in the remote timestamp format
 *   - records accept nested objects (or object paths for reference fields)
 *   - std::vector<primitive> accepts arrays whose elements fit the element type
 *   - std::optional<T> and std::unique_ptr<T> decode into a fresh T and keep it
 *     only if that succeeded
 *
 * A destination type with a member function
 * `Status decodeFrom(Decoder const&, Object const&)` decodes itself.
 */
class Decoder
{
public:
    /// Resolves an object path of a reference field into the object it names
    using ReferenceResolver = std::function<Result<ObjectPtr>(std::string_view path)>;

    /**
     * Set non-pointer members to their zero value when the source property
     * has no value at all, instead of failing. Allows records without
     * nullable members to be used with sparse results.
     */
    bool nonePtrZero = false;

    /**
     * Reset nullable members when the source property has no value at all.
     * Otherwise they hold a zero value.
     */
    bool ptrNil = false;

    /**
     * Leave members untouched when the object does not have their property.
     * Allows one full record definition to be used with narrower queries.
     */
    bool allowMissingFields = false;

    /// Used for FieldFlags::reference members, see Connection
    ReferenceResolver resolveReference;

    /**
     * @brief Decodes src into dst
     *
     * Fails with Error::Code::fieldMismatch naming the first member that could
     * not be decoded; members before it keep their decoded values, members
     * after it are untouched. An unexpected fault during the walk is returned
     * as Error::Code::internal.
     */
    template <typename T>
    Status decode(Object const& src, T& dst) const;

private:
    /// Outcome of decoding a single value: the reason text on failure
    using FieldStatus = std::expected<void, std::string>;

    template <typename T>
    Status decodeFields(Object const& src, T& dst) const;

    template <typename T, std::size_t I>
    Status decodeMember(Object const& src, T& dst) const;

    template <typename Target>
    FieldStatus decodeValue(Target& dst, Variant const& value, FieldFlags flags) const;

    template <typename Target>
    FieldStatus decodePrimitive(Target& dst, Variant const& value) const;

    template <typename Target>
    FieldStatus decodeArray(Target& dst, Array const& elements) const;

    template <typename Target>
    FieldStatus decodeObject(Target& dst, Object const& nested) const;

    template <typename Target>
    FieldStatus decodeReference(Target& dst, Variant const& value) const;

    static FieldStatus parseSigned(std::string_view text, std::int64_t& out);
    static FieldStatus parseUnsigned(std::string_view text, std::uint64_t& out);
    static std::string unsupported(std::string_view what, Variant const& value);
};

} // namespace wql

// Include template implementations
#include "wql_decoder.tpp"
