// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlConnectInfo.hpp"
#include "SqlConnection.hpp"
#include "SqlError.hpp"

#include <chrono>
#include <cstddef>
#include <list>
#include <mutex>

class SqlConnectionPool;

/// A connection borrowed from a SqlConnectionPool.
///
/// The connection is handed back to its pool on destruction.
class [[nodiscard]] SQLITE3BUILDER_API SqlPooledConnection final
{
  public:
    SqlPooledConnection(SqlConnectionPool& pool, SqlConnection&& connection) noexcept;

    SqlPooledConnection(SqlPooledConnection&& other) noexcept;
    SqlPooledConnection& operator=(SqlPooledConnection&& other) noexcept;
    SqlPooledConnection(SqlPooledConnection const&) = delete;
    SqlPooledConnection& operator=(SqlPooledConnection const&) = delete;

    ~SqlPooledConnection() noexcept;

    [[nodiscard]] SqlConnection& Get() noexcept
    {
        return m_connection;
    }

    SqlConnection& operator*() noexcept
    {
        return m_connection;
    }

    SqlConnection* operator->() noexcept
    {
        return &m_connection;
    }

  private:
    void Release() noexcept;

    SqlConnectionPool* m_pool;
    SqlConnection m_connection;
};

/// A thread-safe pool of idle connections to a single connection string.
///
/// Idle connections are reused unless they have been idle longer than the connection timeout
/// or the database reports them dead.
class SQLITE3BUILDER_API SqlConnectionPool final
{
  public:
    /// Counters of the pool decisions, see SqlPoolEvent.
    struct Stats
    {
        size_t created {};  // successfully opened connections only
        size_t reused {};
        size_t closed {};   // evicted on release, dead or killed while idle
        size_t timedout {};
        size_t released {};
    };

    explicit SqlConnectionPool(SqlConnectionString connectionString,
                               size_t maxIdleConnections = 10,
                               std::chrono::seconds connectionTimeout = std::chrono::seconds { 120 });

    SqlConnectionPool(SqlConnectionPool const&) = delete;
    SqlConnectionPool& operator=(SqlConnectionPool const&) = delete;
    SqlConnectionPool(SqlConnectionPool&&) = delete;
    SqlConnectionPool& operator=(SqlConnectionPool&&) = delete;

    /// Closes all idle connections. Borrowed connections must have been returned before.
    ~SqlConnectionPool();

    /// Borrows a connection, reusing an idle one if possible, otherwise connecting a new one.
    [[nodiscard]] SqlResult<SqlPooledConnection> Acquire();

    /// Hands a connection back to the pool. Called by SqlPooledConnection.
    void Release(SqlConnection&& connection);

    /// Closes all idle connections.
    void KillAllIdleConnections();

    void SetMaxIdleConnections(size_t maxIdleConnections);

    [[nodiscard]] size_t IdleConnectionCount() const;

    [[nodiscard]] Stats GetStats() const;

    [[nodiscard]] SqlConnectionString const& ConnectionString() const noexcept
    {
        return m_connectionString;
    }

  private:
    SqlConnectionString m_connectionString;
    std::list<SqlConnection> m_unusedConnections;
    mutable std::mutex m_unusedConnectionsMutex;
    size_t m_maxIdleConnections;
    std::chrono::seconds m_connectionTimeout;
    Stats m_stats;
};
