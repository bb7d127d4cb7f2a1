/**
 * @file wql_collection.hpp
 * @brief Materialising whole result sets into vectors of records
 */

#pragma once

#include <cstddef>
#include <memory>
#include <vector>
#include "wql_decoder.hpp"
#include "wql_error.hpp"
#include "wql_variant.hpp"

namespace wql
{

/**
 * @brief Abstract enumerable result of a query
 *
 * Elements are handed out one at a time so at most one element handle is held
 * while the set is being materialised.
 */
class ResultSet
{
public:
    virtual ~ResultSet() = default;

    /// Number of elements the remote system reported. A hint, not a bound.
    virtual std::size_t count() const = 0;

    /// Fetches the next element. A null pointer marks the end of the set.
    virtual Result<ObjectPtr> next() = 0;
};

namespace detail
{
/// Element types decodeAll accepts: records, or records that decode themselves
template <typename T>
concept CollectionRecord = Record<T> || SelfDecoding<T>;
} // namespace detail

/**
 * @brief Decodes every element of results into dst
 *
 * dst is replaced with one element per result. Elements whose decode fails
 * with a field mismatch are kept with the fields decoded up to the failure,
 * and their errors are returned together as an Error::Code::multiple after
 * the whole set has been read. Any other error stops immediately, leaves dst
 * empty and is returned unchanged.
 *
 * @code
 * std::vector<Process> processes;
 * auto status = decodeAll(decoder, *results, processes);
 * @endcode
 */
template <detail::CollectionRecord R>
Status decodeAll(Decoder const& decoder, ResultSet& results, std::vector<R>& dst);

/// Same as above, but every element is allocated separately
template <detail::CollectionRecord R>
Status decodeAll(Decoder const& decoder, ResultSet& results, std::vector<std::unique_ptr<R>>& dst);

} // namespace wql

// Include template implementations
#include "wql_collection.tpp"
