// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "../SqlError.hpp"

#include <concepts>
#include <cstdint>
#include <format>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

/// @defgroup QueryBuilder Query Builder
///
/// The query builder assembles SQL statements from raw text fragments using a fluent C++ API.

/// @brief The kind of SQL statement being built.
///
/// Set once by the factory function and never changed afterwards.
///
/// @ingroup QueryBuilder
enum class SqlStatementKind : uint8_t
{
    Select,
    Insert,
    Update,
    Delete,
};

/// @ingroup QueryBuilder
enum class SqlResultOrdering : uint8_t
{
    ASCENDING,
    DESCENDING
};

/// @brief Join type modifier, consumed by the next SqlQueryBuilder::Join() call.
/// @ingroup QueryBuilder
enum class SqlJoinType : uint8_t
{
    Plain,
    Left,
    LeftOuter,
    Right,
    RightOuter,
    Inner,
    Cross,
};

/// @brief Any value that can be embedded as raw text into an SQL fragment.
///
/// Strings are taken as is, everything else is displayed via std::format.
/// Ranges (other than strings) are lists of fragments, not fragments.
///
/// @ingroup QueryBuilder
template <typename T>
concept SqlFragment = std::convertible_to<T const&, std::string_view>
                      || (std::formattable<T, char> && !std::ranges::range<T>);

/// @brief A list of SQL fragments, such as a field list or a value tuple.
/// @ingroup QueryBuilder
template <typename T>
concept SqlFragmentList = std::ranges::input_range<T> && !SqlFragment<T>
                          && SqlFragment<std::ranges::range_value_t<T>>;

/// @brief The accumulated clause state of a single SQL statement under construction.
///
/// All members are owned exclusively. The ordered lists preserve the call order of the
/// accumulators, no deduplication takes place.
///
/// @ingroup QueryBuilder
struct SqlStatementState
{
    SqlStatementKind kind = SqlStatementKind::Select;
    std::string table;
    bool distinct = false;

    std::vector<std::string> fields;
    std::vector<std::string> joins;
    std::vector<std::string> sets;
    std::vector<std::string> values;
    std::optional<std::string> selectSource;

    std::vector<std::string> groupBy;
    std::optional<std::string> having;

    // Each entry is one OR-chain. Entries are AND-ed when rendered.
    std::vector<std::string> wheres;

    std::vector<std::string> orderBy;
    std::optional<std::size_t> limit;
    std::optional<std::size_t> offset;

    std::vector<std::string> unions;
};

namespace detail
{

template <SqlFragment T>
std::string ToSqlFragment(T const& value)
{
    if constexpr (std::convertible_to<T const&, std::string_view>)
        return std::string(std::string_view(value));
    else
        return std::format("{}", value);
}

template <std::ranges::input_range Range>
    requires SqlFragment<std::ranges::range_value_t<Range>>
std::string JoinSqlFragments(Range const& fragments, std::string_view delimiter)
{
    std::string result;
    bool first = true;
    for (auto const& fragment: fragments)
    {
        if (!first)
            result += delimiter;
        first = false;
        result += ToSqlFragment(fragment);
    }
    return result;
}

} // namespace detail
