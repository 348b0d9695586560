// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"

#include <format>
#include <map>
#include <optional>
#include <string>
#include <string_view>

/// Represents an ODBC connection string.
struct SqlConnectionString
{
    std::string value;

    SQLITE3BUILDER_API auto operator<=>(SqlConnectionString const&) const noexcept = default;

    /// Retrieves the connection string with any password masked out, suitable for logging.
    [[nodiscard]] SQLITE3BUILDER_API std::string Sanitized() const;

    SQLITE3BUILDER_API static std::string SanitizePwd(std::string_view input);

    /// Constructs a connection string for the SQLite3 ODBC driver and the given database file.
    ///
    /// Use `file::memory:` for a private in-memory database.
    [[nodiscard]] SQLITE3BUILDER_API static SqlConnectionString Sqlite3(std::string_view databasePath);

    /// Reads a connection string from the given environment variable, if set and not empty.
    [[nodiscard]] SQLITE3BUILDER_API static std::optional<SqlConnectionString> FromEnvironment(
        char const* variableName = "SQLITE3BUILDER_CONNECTION_STRING");
};

using SqlConnectionStringMap = std::map<std::string, std::string>;

/// Parses an ODBC connection string into a map.
///
/// Keys are upper-cased, surrounding whitespace and `{...}` quotation of values are dropped.
SQLITE3BUILDER_API SqlConnectionStringMap ParseConnectionString(SqlConnectionString const& connectionString);

/// Builds an ODBC connection string from a map.
SQLITE3BUILDER_API SqlConnectionString BuildConnectionString(SqlConnectionStringMap const& map);

/// Formats a connection string with its password masked out.
template <>
struct std::formatter<SqlConnectionString>: std::formatter<std::string>
{
    auto format(SqlConnectionString const& connectionString, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(connectionString.Sanitized(), ctx);
    }
};
