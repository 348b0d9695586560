// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include "Api.hpp"
#include "SqlConnectInfo.hpp"
#include "SqlError.hpp"
#include "SqlLogger.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <source_location>
#include <string>

#include <sql.h>
#include <sqlext.h>
#include <sqltypes.h>

/// @brief An ODBC connection to a database, in autocommit mode.
///
/// Owns its ODBC environment and connection handles. Connection failures are kept in
/// LastErrorCode() and reported, with the driver diagnostics, to the current SqlLogger.
class SQLITE3BUILDER_API SqlConnection final
{
  public:
    /// Connects to DefaultConnectionString().
    SqlConnection();

    /// Connects to the given connection string, or stays disconnected if none is given.
    explicit SqlConnection(std::optional<SqlConnectionString> connectionString);

    SqlConnection(SqlConnection&& other) noexcept;
    SqlConnection& operator=(SqlConnection&& other) noexcept;
    SqlConnection(SqlConnection const&) = delete;
    SqlConnection& operator=(SqlConnection const&) = delete;

    ~SqlConnection() noexcept;

    /// The connection string used by the default constructor.
    static SqlConnectionString const& DefaultConnectionString() noexcept;

    static void SetDefaultConnectionString(SqlConnectionString const& connectionString) noexcept;

    /// Installs a callback invoked after every successful connect, e.g. to set session PRAGMAs.
    ///
    /// An empty function removes the callback.
    static void SetPostConnectedHook(std::function<void(SqlConnection&)> hook);

    /// Process-wide unique identifier, kept across moves and pool reuse.
    [[nodiscard]] uint64_t ConnectionId() const noexcept
    {
        return m_connectionId;
    }

    /// Connects to the given connection string, disconnecting first if connected.
    SqlResult<void> Connect(SqlConnectionString connectionString) noexcept;

    /// Disconnects and releases the ODBC handles. The connection cannot be reconnected afterwards.
    void Close() noexcept;

    [[nodiscard]] bool IsConnected() const noexcept
    {
        return m_connected;
    }

    /// Tests if the connection is connected and the driver does not consider it dead.
    [[nodiscard]] bool IsAlive() const noexcept;

    /// Retrieves the driver diagnostics of the last failed operation.
    [[nodiscard]] SqlErrorInfo LastError() const;

    [[nodiscard]] SqlError LastErrorCode() const noexcept
    {
        return m_lastError;
    }

    /// Retrieves the DBMS name as reported by the driver, e.g. "SQLite".
    [[nodiscard]] SqlResult<std::string> ServerName() const;

    [[nodiscard]] SqlResult<std::string> ServerVersion() const;

    [[nodiscard]] SqlConnectionString const& ConnectionString() const noexcept
    {
        return m_connectionString;
    }

    [[nodiscard]] SQLHDBC NativeHandle() const noexcept
    {
        return m_hDbc;
    }

    /// The time the connection was connected or last handed back to a pool.
    [[nodiscard]] std::chrono::steady_clock::time_point LastUsed() const noexcept
    {
        return m_lastUsed;
    }

    /// Sets LastUsed() to now.
    void MarkUsed() noexcept
    {
        m_lastUsed = std::chrono::steady_clock::now();
    }

  private:
    SqlResult<std::string> GetInfoString(SQLUSMALLINT infoType) const;

    SqlResult<void> UpdateLastError(SQLRETURN sqlResult,
                                    std::source_location sourceLocation = std::source_location::current()) const;

    SQLHENV m_hEnv {};
    SQLHDBC m_hDbc {};
    uint64_t m_connectionId;
    bool m_connected = false;
    mutable SqlError m_lastError = SqlError::SUCCESS;
    SqlConnectionString m_connectionString;
    std::chrono::steady_clock::time_point m_lastUsed {};
};
