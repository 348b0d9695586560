// SPDX-License-Identifier: Apache-2.0

#include "SqlConnectionPool.hpp"
#include "SqlLogger.hpp"

#include <utility>

SqlPooledConnection::SqlPooledConnection(SqlConnectionPool& pool, SqlConnection&& connection) noexcept:
    m_pool { &pool },
    m_connection { std::move(connection) }
{
}

SqlPooledConnection::SqlPooledConnection(SqlPooledConnection&& other) noexcept:
    m_pool { other.m_pool },
    m_connection { std::move(other.m_connection) }
{
    other.m_pool = nullptr;
}

SqlPooledConnection& SqlPooledConnection::operator=(SqlPooledConnection&& other) noexcept
{
    if (this == &other)
        return *this;

    Release();

    m_pool = other.m_pool;
    m_connection = std::move(other.m_connection);
    other.m_pool = nullptr;

    return *this;
}

SqlPooledConnection::~SqlPooledConnection() noexcept
{
    Release();
}

void SqlPooledConnection::Release() noexcept
{
    if (!m_pool)
        return;

    m_pool->Release(std::move(m_connection));
    m_pool = nullptr;
}

// =====================================================================================================================

SqlConnectionPool::SqlConnectionPool(SqlConnectionString connectionString,
                                     size_t maxIdleConnections,
                                     std::chrono::seconds connectionTimeout):
    m_connectionString { std::move(connectionString) },
    m_maxIdleConnections { maxIdleConnections },
    m_connectionTimeout { connectionTimeout }
{
}

SqlConnectionPool::~SqlConnectionPool()
{
    KillAllIdleConnections();
}

SqlResult<SqlPooledConnection> SqlConnectionPool::Acquire()
{
    {
        auto const _ = std::lock_guard { m_unusedConnectionsMutex };
        auto& logger = SqlLogger::GetLogger();

        // The front has been idle the longest.
        auto const now = std::chrono::steady_clock::now();
        while (!m_unusedConnections.empty() && now - m_unusedConnections.front().LastUsed() > m_connectionTimeout)
        {
            ++m_stats.timedout;
            logger.OnPoolEvent(m_unusedConnections.front(), SqlPoolEvent::TimedOut);
            m_unusedConnections.pop_front();
        }

        while (!m_unusedConnections.empty())
        {
            auto connection = std::move(m_unusedConnections.front());
            m_unusedConnections.pop_front();

            if (!connection.IsAlive())
            {
                ++m_stats.closed;
                logger.OnPoolEvent(connection, SqlPoolEvent::Dead);
                continue;
            }

            ++m_stats.reused;
            logger.OnPoolEvent(connection, SqlPoolEvent::Reused);
            return SqlPooledConnection { *this, std::move(connection) };
        }
    }

    // Connecting happens outside the lock, other threads may reuse idle connections meanwhile.
    auto connection = SqlConnection { std::nullopt };
    if (auto const result = connection.Connect(m_connectionString); !result)
        return std::unexpected { result.error() };

    {
        auto const _ = std::lock_guard { m_unusedConnectionsMutex };
        ++m_stats.created;
    }
    SqlLogger::GetLogger().OnPoolEvent(connection, SqlPoolEvent::Created);

    return SqlPooledConnection { *this, std::move(connection) };
}

void SqlConnectionPool::Release(SqlConnection&& connection)
{
    auto const _ = std::lock_guard { m_unusedConnectionsMutex };
    ++m_stats.released;

    if (!connection.IsConnected())
        return;

    if (m_unusedConnections.size() < m_maxIdleConnections)
    {
        connection.MarkUsed();
        SqlLogger::GetLogger().OnPoolEvent(connection, SqlPoolEvent::Released);
        m_unusedConnections.emplace_back(std::move(connection));
    }
    else
    {
        ++m_stats.closed;
        SqlLogger::GetLogger().OnPoolEvent(connection, SqlPoolEvent::Evicted);
        connection.Close();
    }
}

void SqlConnectionPool::KillAllIdleConnections()
{
    auto const _ = std::lock_guard { m_unusedConnectionsMutex };
    m_stats.closed += m_unusedConnections.size();
    m_unusedConnections.clear();
}

void SqlConnectionPool::SetMaxIdleConnections(size_t maxIdleConnections)
{
    auto const _ = std::lock_guard { m_unusedConnectionsMutex };
    m_maxIdleConnections = maxIdleConnections;
}

size_t SqlConnectionPool::IdleConnectionCount() const
{
    auto const _ = std::lock_guard { m_unusedConnectionsMutex };
    return m_unusedConnections.size();
}

SqlConnectionPool::Stats SqlConnectionPool::GetStats() const
{
    auto const _ = std::lock_guard { m_unusedConnectionsMutex };
    return m_stats;
}
