// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include "Api.hpp"
#include "SqlConnection.hpp"
#include "SqlError.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <concepts>
#include <cstddef>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <sql.h>
#include <sqlext.h>
#include <sqltypes.h>

// clang-format off
template <typename QueryObject>
concept SqlQueryObject = requires(QueryObject const& queryObject)
{
    { queryObject.ToSql() } -> std::convertible_to<SqlResult<std::string>>;
};
// clang-format on

/// A single column value of a result row: null, a 64-bit integer or a string.
using SqlJsonValue = nlohmann::json;

/// The column values of a single result row, in column order.
using SqlJsonRow = std::vector<SqlJsonValue>;

using SqlJsonRows = std::vector<SqlJsonRow>;

class SqlResultCursor;

// High level API for raw SQL statements
//
// SQL statement lifecycle:
// 1. Prepare the statement, or execute it directly
// 2. Execute the prepared statement
// 3. Fetch rows (if any) and read their column values
// 4. Repeat as needed
class SQLITE3BUILDER_API SqlStatement final
{
  public:
    // Construct a new SqlStatement object, using the given connection.
    //
    // The connection must outlive the statement.
    explicit SqlStatement(SqlConnection& relatedConnection);

    SqlStatement(SqlStatement&& other) noexcept;
    SqlStatement& operator=(SqlStatement&& other) noexcept;

    SqlStatement(SqlStatement const&) noexcept = delete;
    SqlStatement& operator=(SqlStatement const&) noexcept = delete;

    ~SqlStatement() noexcept;

    [[nodiscard]] bool IsAlive() const noexcept
    {
        return m_connection && m_connection->IsAlive() && m_hStmt != SQL_NULL_HSTMT;
    }

    // Retrieves the connection associated with this statement.
    [[nodiscard]] SqlConnection& Connection() noexcept
    {
        return *m_connection;
    }

    // Retrieves the native handle of the statement.
    [[nodiscard]] SQLHSTMT NativeHandle() const noexcept
    {
        return m_hStmt;
    }

    // Retrieves the last error information with respect to this SQL statement handle.
    [[nodiscard]] SqlErrorInfo LastError() const;

    // Retrieves the code of the last operation on this statement.
    [[nodiscard]] SqlError LastErrorCode() const noexcept
    {
        return m_lastError;
    }

    // Prepares the statement for execution.
    SqlResult<void> Prepare(std::string_view query);

    // Renders the given query object and prepares it for execution.
    SqlResult<void> Prepare(SqlQueryObject auto const& queryObject)
    {
        return queryObject.ToSql().and_then([&](std::string const& sql) { return Prepare(sql); });
    }

    [[nodiscard]] std::string const& PreparedQuery() const noexcept
    {
        return m_preparedQuery;
    }

    // Executes the prepared statement.
    SqlResult<void> Execute(std::source_location location = std::source_location::current());

    // Executes the given query directly.
    SqlResult<void> ExecuteDirect(std::string_view query,
                                  std::source_location location = std::source_location::current());

    // Renders the given query object and executes it directly.
    SqlResult<void> ExecuteDirect(SqlQueryObject auto const& queryObject,
                                  std::source_location location = std::source_location::current())
    {
        return queryObject.ToSql().and_then([&](std::string const& sql) { return ExecuteDirect(sql, location); });
    }

    // Retrieves the number of rows affected by the last query.
    [[nodiscard]] SqlResult<size_t> NumRowsAffected() const;

    // Retrieves the number of columns affected by the last query.
    [[nodiscard]] SqlResult<size_t> NumColumnsAffected() const;

    // Fetches the next row of the result set.
    //
    // @note Automatically closes the cursor at the end of the result set.
    //
    // @retval true The next result row was successfully fetched
    // @retval false No result row was fetched, because the end of the result set was reached.
    [[nodiscard]] SqlResult<bool> FetchRow();

    // Closes the result cursor on queries that yield a result set, e.g. SELECT statements.
    //
    // Call this function when done with fetching the results before the end of the result set is reached.
    void CloseCursor() noexcept;

    // Retrieves the value of the column at the given index (1-based) for the currently fetched row.
    //
    // The conversion follows the value stored in the cell, which in SQLite may differ from the
    // declared column type: NULL yields a null value, an integer an integer, text a string.
    // Any other value, such as a floating point number, yields SqlError::UNSUPPORTED_TYPE.
    [[nodiscard]] SqlResult<SqlJsonValue> GetColumnValue(SQLUSMALLINT column) const;

    // Retrieves all column values of the currently fetched row.
    [[nodiscard]] SqlResult<SqlJsonRow> GetRowValues() const;

  private:
    SqlResult<void> UpdateLastError(SQLRETURN error,
                                    std::source_location sourceLocation = std::source_location::current()) const;

    // Reads the cell as text, std::nullopt for NULL.
    SqlResult<std::optional<std::string>> GetColumnText(SQLUSMALLINT column) const;
    SqlResult<SqlJsonValue> GetNonTextualColumn(SQLUSMALLINT column) const;
    [[nodiscard]] bool IsTableColumn(SQLUSMALLINT column) const noexcept;
    SqlResult<SqlJsonValue> UnsupportedValue() const;

    void StartQuery(std::string_view query);
    void FinishQuery() noexcept;

    SqlConnection* m_connection {};
    SQLHSTMT m_hStmt {};
    std::string m_preparedQuery;
    mutable SqlError m_lastError = SqlError::SUCCESS;

    // The query of the current result, traced until its rows are consumed or the cursor is closed.
    std::string m_runningQuery;
    bool m_queryRunning = false;
    std::chrono::steady_clock::time_point m_queryStartedAt {};
    size_t m_fetchedRows = 0;
};

// API for reading an SQL query result set.
//
// The cursor owns the statement that produced the result set.
class [[nodiscard]] SqlResultCursor
{
  public:
    explicit SqlResultCursor(SqlStatement&& stmt) noexcept:
        m_stmt { std::move(stmt) }
    {
    }

    SqlResultCursor() = delete;
    SqlResultCursor(SqlResultCursor const&) = delete;
    SqlResultCursor& operator=(SqlResultCursor const&) = delete;
    SqlResultCursor(SqlResultCursor&&) noexcept = default;
    SqlResultCursor& operator=(SqlResultCursor&&) noexcept = default;

    ~SqlResultCursor()
    {
        m_stmt.CloseCursor();
    }

    // Retrieves the number of columns of the result set.
    [[nodiscard]] SQLITE3BUILDER_FORCE_INLINE SqlResult<size_t> NumColumnsAffected() const
    {
        return m_stmt.NumColumnsAffected();
    }

    // Fetches the next row of the result set.
    [[nodiscard]] SQLITE3BUILDER_FORCE_INLINE SqlResult<bool> FetchRow()
    {
        return m_stmt.FetchRow();
    }

    // Retrieves the value of the column at the given index (1-based) for the currently fetched row.
    [[nodiscard]] SQLITE3BUILDER_FORCE_INLINE SqlResult<SqlJsonValue> GetColumnValue(SQLUSMALLINT column) const
    {
        return m_stmt.GetColumnValue(column);
    }

    // Retrieves all column values of the currently fetched row.
    [[nodiscard]] SQLITE3BUILDER_FORCE_INLINE SqlResult<SqlJsonRow> Row() const
    {
        return m_stmt.GetRowValues();
    }

  private:
    SqlStatement m_stmt;
};
