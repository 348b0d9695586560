// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include "Api.hpp"

#include <cstdint>
#include <expected>
#include <format>
#include <string>
#include <system_error>

#include <sql.h>
#include <sqlext.h>
#include <sqltypes.h>

/// Error codes reported by the query builder and by the ODBC execution layer.
///
/// The lower range mirrors the ODBC return codes, the upper range (>= 1000)
/// is specific to this library.
enum class SqlError : std::int16_t
{
    SUCCESS = SQL_SUCCESS,
    SUCCESS_WITH_INFO = SQL_SUCCESS_WITH_INFO,
    NODATA = SQL_NO_DATA,
    FAILURE = SQL_ERROR,
    INVALID_HANDLE = SQL_INVALID_HANDLE,
    STILL_EXECUTING = SQL_STILL_EXECUTING,
    NEED_DATA = SQL_NEED_DATA,
    UNSUPPORTED_TYPE = 1'000,
    INVALID_ARGUMENT = 1'001,
    NO_TABLE_NAME = 1'002,
    NO_VALUES = 1'003,
    NO_SET_FIELDS = 1'004,
};

/// Result type of every fallible operation: either the value or an SqlError.
template <typename T>
using SqlResult = std::expected<T, SqlError>;

/// Extended diagnostics of a failed ODBC call.
struct SqlErrorInfo
{
    SQLINTEGER nativeErrorCode {};
    std::string sqlState = "     "; // 5 characters + null terminator
    std::string message;

    static SqlErrorInfo fromConnectionHandle(SQLHDBC hDbc)
    {
        return fromHandle(SQL_HANDLE_DBC, hDbc);
    }

    static SqlErrorInfo fromStatementHandle(SQLHSTMT hStmt)
    {
        return fromHandle(SQL_HANDLE_STMT, hStmt);
    }

    SQLITE3BUILDER_API static SqlErrorInfo fromHandle(SQLSMALLINT handleType, SQLHANDLE handle);
};

struct SqlErrorCategory: std::error_category
{
    static SqlErrorCategory const& get() noexcept
    {
        static SqlErrorCategory const category;
        return category;
    }

    [[nodiscard]] char const* name() const noexcept override
    {
        return "Sqlite3Builder";
    }

    [[nodiscard]] std::string message(int code) const override
    {
        using namespace std::string_literals;
        switch (static_cast<SqlError>(code))
        {
            case SqlError::SUCCESS:
                return "SQL_SUCCESS"s;
            case SqlError::SUCCESS_WITH_INFO:
                return "SQL_SUCCESS_WITH_INFO"s;
            case SqlError::NODATA:
                return "SQL_NO_DATA"s;
            case SqlError::FAILURE:
                return "SQL_ERROR"s;
            case SqlError::INVALID_HANDLE:
                return "SQL_INVALID_HANDLE"s;
            case SqlError::STILL_EXECUTING:
                return "SQL_STILL_EXECUTING"s;
            case SqlError::NEED_DATA:
                return "SQL_NEED_DATA"s;
            case SqlError::UNSUPPORTED_TYPE:
                return "unsupported type"s;
            case SqlError::INVALID_ARGUMENT:
                return "invalid argument"s;
            case SqlError::NO_TABLE_NAME:
                return "no table name"s;
            case SqlError::NO_VALUES:
                return "no values"s;
            case SqlError::NO_SET_FIELDS:
                return "no set fields"s;
        }
        return std::format("SQL error code {}", code);
    }
};

// Register our enum as an error code so we can construct error_code from it
template <>
struct std::is_error_code_enum<SqlError>: public std::true_type
{
};

inline std::error_code make_error_code(SqlError e)
{
    return { static_cast<int>(e), SqlErrorCategory::get() };
}

namespace detail
{

/// Maps an ODBC return code to an SqlResult, treating SQL_SUCCESS_WITH_INFO as success.
inline SqlResult<void> UpdateSqlError(SqlError* errorCode, SQLRETURN error) noexcept
{
    *errorCode = static_cast<SqlError>(error);
    if (SQL_SUCCEEDED(error))
        return {};
    return std::unexpected { *errorCode };
}

} // namespace detail

template <>
struct std::formatter<SqlError>: formatter<std::string>
{
    auto format(SqlError value, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(SqlErrorCategory::get().message(static_cast<int>(value)), ctx);
    }
};

template <>
struct std::formatter<SqlErrorInfo>: formatter<std::string>
{
    auto format(SqlErrorInfo const& info, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(
            std::format("{} ({}) - {}", info.sqlState, info.nativeErrorCode, info.message), ctx);
    }
};
