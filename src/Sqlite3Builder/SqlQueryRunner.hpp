// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlConnection.hpp"
#include "SqlError.hpp"
#include "SqlQuery.hpp"
#include "SqlStatement.hpp"

#include <cstdint>
#include <string>

/// Executes built statements on a connection and converts their results into JSON values.
///
/// Every operation renders the statement via SqlQueryBuilder::ToSql() first and
/// propagates render errors unchanged, without touching the database.
///
/// @code
/// auto runner = SqlQueryRunner { connection };
/// auto const price = runner.GetInt(SqlQueryBuilder::SelectFrom("books")
///                                       .Field("price")
///                                       .AndWhereEq("title", SqlQuote("Don Quixote")));
/// @endcode
///
/// @ingroup QueryBuilder
class SQLITE3BUILDER_API SqlQueryRunner final
{
  public:
    /// Binds the runner to the given connection, which must outlive the runner.
    explicit SqlQueryRunner(SqlConnection& connection) noexcept:
        m_connection { &connection }
    {
    }

    /// Executes the statement, discarding any result.
    SqlResult<void> Execute(SqlQueryBuilder const& query);

    /// Executes the statement and retrieves all result rows.
    [[nodiscard]] SqlResult<SqlJsonRows> GetRows(SqlQueryBuilder const& query);

    /// Executes the statement and retrieves the first result row, or an empty row if there is none.
    [[nodiscard]] SqlResult<SqlJsonRow> GetRow(SqlQueryBuilder const& query);

    /// Executes the statement and retrieves the first column of the first result row.
    ///
    /// Yields SqlError::NODATA if there is no result row.
    [[nodiscard]] SqlResult<SqlJsonValue> GetValue(SqlQueryBuilder const& query);

    /// Like GetValue(), but requires the value to be an integer (SqlError::UNSUPPORTED_TYPE otherwise).
    [[nodiscard]] SqlResult<int64_t> GetInt(SqlQueryBuilder const& query);

    /// Like GetValue(), but requires the value to be a string (SqlError::UNSUPPORTED_TYPE otherwise).
    [[nodiscard]] SqlResult<std::string> GetString(SqlQueryBuilder const& query);

    /// Executes the statement and retrieves a cursor for iterating the result rows one by one.
    [[nodiscard]] SqlResult<SqlResultCursor> GetCursor(SqlQueryBuilder const& query);

  private:
    SqlResult<SqlStatement> ExecuteStatement(SqlQueryBuilder const& query);

    SqlConnection* m_connection;
};
