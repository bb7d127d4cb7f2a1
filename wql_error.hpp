/**
 * @file wql_error.hpp
 * @brief Error values returned by every fallible wql operation
 *
 * wql never throws across its public API. Fallible calls return either a
 * Status (success or Error) or a Result<T> (value or Error). An Error always
 * carries a Code so callers can tell the failure classes apart:
 *
 *   - fieldMismatch: a destination field could not accept the source value,
 *     or a required property was absent. Details name the field.
 *   - multiple: several errors accumulated while materialising a result set.
 *   - timedOut: a bounded wait expired. Subscriptions treat it as "poll again".
 *   - everything else is propagated verbatim by the layer that sees it.
 */

#pragma once

#include <expected>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace wql
{

/**
 * @brief Details of a single field that failed to decode
 */
struct FieldMismatch
{
    /// Printable name of the destination member type
    std::string fieldType;

    /// Property name the field was resolved to
    std::string fieldName;

    /// Why the value was rejected, e.g. "no such result field"
    std::string reason;
};

/**
 * @brief A failure reported by wql or by one of its collaborators
 *
 * Errors are plain values: copyable, comparable by code and cheap to move.
 *
 * @code
 * if (auto status = decoder.decode(object, process); ! status)
 * {
 *     if (auto const* mismatch = status.error().mismatch())
 *         std::cerr << mismatch->fieldName << ": " << mismatch->reason << std::endl;
 * }
 * @endcode
 */
class Error
{
public:
    enum class Code
    {
        fieldMismatch,    ///< destination field cannot hold the source value
        invalidArgument,  ///< caller passed an unusable argument
        notFound,         ///< requested property or object does not exist
        session,          ///< session closed or could not be established
        timedOut,         ///< bounded wait expired without a result
        alreadyRunning,   ///< subscription is already started
        remote,           ///< the remote system reported a failure
        internal,         ///< unexpected fault caught at an API boundary
        multiple          ///< several accumulated errors, see errors()
    };

    Error(Code code_, std::string message_);

    /// Creates a fieldMismatch error with the canonical message
    static Error fieldMismatch(std::string fieldType, std::string fieldName, std::string reason);

    /**
     * @brief Accumulates next into accumulated
     *
     * The first call turns an empty accumulator into a Code::multiple error
     * holding next. Later calls append to it. A single error already in the
     * accumulator becomes the first of the list, and the errors of a
     * Code::multiple next are appended one by one.
     */
    static void append(std::optional<Error>& accumulated, Error next);

    Code code() const noexcept { return errorCode; }
    std::string const& message() const noexcept { return text; }

    /// Field details, or nullptr if this is not a fieldMismatch
    FieldMismatch const* mismatch() const noexcept { return details ? &*details : nullptr; }

    /// Accumulated errors of a Code::multiple error (empty otherwise)
    std::vector<Error> const& errors() const noexcept { return nested; }

    bool is(Code c) const noexcept { return errorCode == c; }

private:
    void rebuildMessage();

    Code errorCode;
    std::string text;
    std::optional<FieldMismatch> details;
    std::vector<Error> nested;
};

/// Success, or the Error that prevented it
using Status = std::expected<void, Error>;

/// A value of type T, or the Error that prevented producing it
template <typename T>
using Result = std::expected<T, Error>;

/// Shorthand for returning an Error from a function returning Status or Result
inline std::unexpected<Error> fail(Error::Code code, std::string message)
{
    return std::unexpected<Error>(Error(code, std::move(message)));
}

char const* toString(Error::Code code) noexcept;
std::ostream& operator<<(std::ostream& o, Error const& e);

} // namespace wql
