// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlError.hpp"
#include "SqlQuery/Core.hpp"

#include <string>
#include <vector>

/// API to format the accumulated clause state of a statement into SQL text (SQLite dialect).
///
/// All functions are pure: they read the given state and never modify it.
/// The returned text is never terminated with a semicolon.
///
/// @ingroup QueryBuilder
class [[nodiscard]] SQLITE3BUILDER_API SqlQueryFormatter final
{
  public:
    /// Retrieves the SQL query formatter for SQLite.
    static SqlQueryFormatter const& Sqlite() noexcept;

    /// Dispatches on the statement kind and formats the statement.
    [[nodiscard]] SqlResult<std::string> Format(SqlStatementState const& state) const;

    /// Constructs an SQL SELECT query, including its trailing UNION parts.
    [[nodiscard]] SqlResult<std::string> Select(SqlStatementState const& state) const;

    /// Constructs a value-only SELECT, without FROM and without any clause other than DISTINCT.
    [[nodiscard]] SqlResult<std::string> SelectValues(SqlStatementState const& state) const;

    /// Constructs an SQL INSERT query, either from value tuples or from a select source.
    [[nodiscard]] SqlResult<std::string> Insert(SqlStatementState const& state) const;

    /// Constructs an SQL UPDATE query.
    [[nodiscard]] SqlResult<std::string> Update(SqlStatementState const& state) const;

    /// Constructs an SQL DELETE query.
    [[nodiscard]] SqlResult<std::string> Delete(SqlStatementState const& state) const;

    /// Constructs the WHERE clause, including its leading space, or an empty string if there is no condition.
    ///
    /// A single condition is emitted as is, multiple conditions are parenthesized and AND-ed.
    [[nodiscard]] std::string WhereClause(std::vector<std::string> const& conditions) const;
};
