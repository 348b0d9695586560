// SPDX-License-Identifier: Apache-2.0

#include "SqlLogger.hpp"
#include "SqlStatement.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <system_error>

namespace
{

bool IsIntegerType(SQLLEN conciseType) noexcept
{
    switch (conciseType)
    {
        case SQL_TINYINT:
        case SQL_SMALLINT:
        case SQL_INTEGER:
        case SQL_BIGINT:
            return true;
        default:
            return false;
    }
}

bool IsCharacterType(SQLLEN conciseType) noexcept
{
    switch (conciseType)
    {
        case SQL_CHAR:
        case SQL_VARCHAR:
        case SQL_LONGVARCHAR:
        case SQL_WCHAR:
        case SQL_WVARCHAR:
        case SQL_WLONGVARCHAR:
            return true;
        default:
            return false;
    }
}

enum class NumericText : uint8_t
{
    None,
    Integer,
    Real,
};

// Classifies the textual form of a cell value as SQLite prints its INTEGER and REAL values.
NumericText ClassifyNumericText(std::string_view text, int64_t& integer) noexcept
{
    if (text.empty())
        return NumericText::None;

    auto const lead = static_cast<unsigned char>(text.front());
    if (!std::isdigit(lead) && lead != '-' && lead != '.')
        return NumericText::None;

    auto const* const end = text.data() + text.size();
    if (auto const [ptr, ec] = std::from_chars(text.data(), end, integer); ec == std::errc {} && ptr == end)
        return NumericText::Integer;

    double real {};
    if (auto const [ptr, ec] = std::from_chars(text.data(), end, real); ec == std::errc {} && ptr == end)
        return NumericText::Real;

    return NumericText::None;
}

} // namespace

SqlStatement::SqlStatement(SqlConnection& relatedConnection):
    m_connection { &relatedConnection }
{
    // The outcome is kept in LastErrorCode().
    (void) UpdateLastError(SQLAllocHandle(SQL_HANDLE_STMT, m_connection->NativeHandle(), &m_hStmt));
}

SqlStatement::SqlStatement(SqlStatement&& other) noexcept:
    m_connection { std::exchange(other.m_connection, nullptr) },
    m_hStmt { std::exchange(other.m_hStmt, SQL_NULL_HSTMT) },
    m_preparedQuery { std::move(other.m_preparedQuery) },
    m_lastError { other.m_lastError },
    m_runningQuery { std::move(other.m_runningQuery) },
    m_queryRunning { std::exchange(other.m_queryRunning, false) },
    m_queryStartedAt { other.m_queryStartedAt },
    m_fetchedRows { other.m_fetchedRows }
{
}

SqlStatement& SqlStatement::operator=(SqlStatement&& other) noexcept
{
    if (this == &other)
        return *this;

    FinishQuery();
    if (m_hStmt)
        SQLFreeHandle(SQL_HANDLE_STMT, m_hStmt);

    m_connection = std::exchange(other.m_connection, nullptr);
    m_hStmt = std::exchange(other.m_hStmt, SQL_NULL_HSTMT);
    m_preparedQuery = std::move(other.m_preparedQuery);
    m_lastError = other.m_lastError;
    m_runningQuery = std::move(other.m_runningQuery);
    m_queryRunning = std::exchange(other.m_queryRunning, false);
    m_queryStartedAt = other.m_queryStartedAt;
    m_fetchedRows = other.m_fetchedRows;

    return *this;
}

SqlStatement::~SqlStatement() noexcept
{
    FinishQuery();
    if (m_hStmt)
        SQLFreeHandle(SQL_HANDLE_STMT, m_hStmt);
}

SqlErrorInfo SqlStatement::LastError() const
{
    return SqlErrorInfo::fromStatementHandle(m_hStmt);
}

void SqlStatement::StartQuery(std::string_view query)
{
    FinishQuery();

    m_runningQuery = std::string(query);
    m_queryRunning = true;
    m_queryStartedAt = std::chrono::steady_clock::now();
    m_fetchedRows = 0;

    SqlLogger::GetLogger().OnQueryStarted(m_runningQuery);
}

void SqlStatement::FinishQuery() noexcept
{
    if (!m_queryRunning)
        return;

    m_queryRunning = false;
    auto const duration = std::chrono::steady_clock::now() - m_queryStartedAt;
    SqlLogger::GetLogger().OnQueryFinished(SqlQueryTrace {
        .query = m_runningQuery,
        .duration = std::chrono::duration_cast<std::chrono::microseconds>(duration),
        .rowCount = m_fetchedRows,
    });
}

SqlResult<void> SqlStatement::Prepare(std::string_view query)
{
    FinishQuery();
    m_preparedQuery = std::string(query);

    // Closes the cursor if it is open
    return UpdateLastError(SQLFreeStmt(m_hStmt, SQL_CLOSE)).and_then([&] {
        return UpdateLastError(
            SQLPrepareA(m_hStmt, (SQLCHAR*) m_preparedQuery.data(), (SQLINTEGER) m_preparedQuery.size()));
    });
}

SqlResult<void> SqlStatement::Execute(std::source_location location)
{
    StartQuery(m_preparedQuery);

    auto const sqlResult = SQLExecute(m_hStmt);

    // A statement without any affected row (e.g. DELETE matching nothing) reports SQL_NO_DATA.
    if (sqlResult == SQL_NO_DATA)
        return {};

    return UpdateLastError(sqlResult, location);
}

SqlResult<void> SqlStatement::ExecuteDirect(std::string_view query, std::source_location location)
{
    if (query.empty())
        return {};

    m_preparedQuery.clear();

    return UpdateLastError(SQLFreeStmt(m_hStmt, SQL_CLOSE), location).and_then([&]() -> SqlResult<void> {
        StartQuery(query);
        auto const sqlResult = SQLExecDirectA(m_hStmt, (SQLCHAR*) query.data(), (SQLINTEGER) query.size());
        if (sqlResult == SQL_NO_DATA)
            return {};
        return UpdateLastError(sqlResult, location);
    });
}

SqlResult<size_t> SqlStatement::NumRowsAffected() const
{
    SQLLEN numRowsAffected {};
    return UpdateLastError(SQLRowCount(m_hStmt, &numRowsAffected)).transform([&] {
        return static_cast<size_t>(numRowsAffected);
    });
}

SqlResult<size_t> SqlStatement::NumColumnsAffected() const
{
    SQLSMALLINT numColumns {};
    return UpdateLastError(SQLNumResultCols(m_hStmt, &numColumns)).transform([&] {
        return static_cast<size_t>(numColumns);
    });
}

SqlResult<bool> SqlStatement::FetchRow()
{
    auto const sqlResult = SQLFetch(m_hStmt);
    if (sqlResult == SQL_NO_DATA)
    {
        m_lastError = SqlError::NODATA;
        SQLCloseCursor(m_hStmt);
        FinishQuery();
        return false;
    }

    return UpdateLastError(sqlResult).transform([&] {
        ++m_fetchedRows;
        return true;
    });
}

void SqlStatement::CloseCursor() noexcept
{
    if (!m_hStmt)
        return;

    SQLFreeStmt(m_hStmt, SQL_CLOSE);
    FinishQuery();
}

SqlResult<SqlJsonValue> SqlStatement::GetColumnValue(SQLUSMALLINT column) const
{
    SQLLEN conciseType {};
    return UpdateLastError(SQLColAttributeA(m_hStmt, column, SQL_DESC_CONCISE_TYPE, nullptr, 0, nullptr, &conciseType))
        .and_then([&]() -> SqlResult<SqlJsonValue> {
            if (!IsIntegerType(conciseType) && !IsCharacterType(conciseType))
                return GetNonTextualColumn(column);

            // Character columns of a table have TEXT affinity: SQLite stores any value in them as text.
            // Other cells may hold an integer, a real or text regardless of the reported column type.
            bool const textAffinity = IsCharacterType(conciseType) && IsTableColumn(column);

            return GetColumnText(column).and_then(
                [&](std::optional<std::string> text) -> SqlResult<SqlJsonValue> {
                    if (!text)
                        return SqlJsonValue(nullptr);

                    if (textAffinity)
                        return SqlJsonValue(std::move(*text));

                    int64_t integer {};
                    switch (ClassifyNumericText(*text, integer))
                    {
                        case NumericText::Integer:
                            return SqlJsonValue(integer);
                        case NumericText::Real:
                            return UnsupportedValue();
                        case NumericText::None:
                            break;
                    }
                    return SqlJsonValue(std::move(*text));
                });
        });
}

SqlResult<SqlJsonRow> SqlStatement::GetRowValues() const
{
    return NumColumnsAffected().and_then([&](size_t numColumns) -> SqlResult<SqlJsonRow> {
        SqlJsonRow row;
        row.reserve(numColumns);
        for (size_t column = 1; column <= numColumns; ++column)
        {
            auto value = GetColumnValue(static_cast<SQLUSMALLINT>(column));
            if (!value)
                return std::unexpected { value.error() };
            row.emplace_back(std::move(*value));
        }
        return row;
    });
}

SqlResult<std::optional<std::string>> SqlStatement::GetColumnText(SQLUSMALLINT column) const
{
    // Long values are read in chunks. Each chunk is NUL-terminated by the driver.
    std::array<char, 256> buffer {};
    std::string result;

    while (true)
    {
        SQLLEN indicator {};
        auto const sqlResult =
            SQLGetData(m_hStmt, column, SQL_C_CHAR, buffer.data(), (SQLLEN) buffer.size(), &indicator);

        if (sqlResult == SQL_NO_DATA)
            break;

        if (auto const status = UpdateLastError(sqlResult); !status)
            return std::unexpected { status.error() };

        if (indicator == SQL_NULL_DATA)
            return std::nullopt;

        if (indicator == SQL_NO_TOTAL || indicator >= static_cast<SQLLEN>(buffer.size()))
        {
            result.append(buffer.data(), buffer.size() - 1);
            continue;
        }

        result.append(buffer.data(), static_cast<size_t>(indicator));
        break;
    }

    return result;
}

SqlResult<SqlJsonValue> SqlStatement::GetNonTextualColumn(SQLUSMALLINT column) const
{
    // Only NULL is representable for any other column type.
    std::array<char, 1> buffer {};
    SQLLEN indicator {};
    auto const sqlResult = SQLGetData(m_hStmt, column, SQL_C_BINARY, buffer.data(), 0, &indicator);
    if (SQL_SUCCEEDED(sqlResult) && indicator == SQL_NULL_DATA)
        return SqlJsonValue(nullptr);

    return UnsupportedValue();
}

bool SqlStatement::IsTableColumn(SQLUSMALLINT column) const noexcept
{
    std::array<char, 128> tableName {};
    SQLSMALLINT length {};
    auto const sqlResult = SQLColAttributeA(m_hStmt,
                                            column,
                                            SQL_DESC_BASE_TABLE_NAME,
                                            tableName.data(),
                                            (SQLSMALLINT) tableName.size(),
                                            &length,
                                            nullptr);
    return SQL_SUCCEEDED(sqlResult) && length > 0;
}

SqlResult<SqlJsonValue> SqlStatement::UnsupportedValue() const
{
    m_lastError = SqlError::UNSUPPORTED_TYPE;
    SqlLogger::GetLogger().OnError(SqlError::UNSUPPORTED_TYPE);
    return std::unexpected { SqlError::UNSUPPORTED_TYPE };
}

SqlResult<void> SqlStatement::UpdateLastError(SQLRETURN error, std::source_location location) const
{
    return detail::UpdateSqlError(&m_lastError, error).or_else([&](auto&&) -> SqlResult<void> {
        if (m_lastError != SqlError::NODATA)
            SqlLogger::GetLogger().OnError(SqlErrorInfo::fromStatementHandle(m_hStmt), location);
        return std::unexpected { m_lastError };
    });
}
