// SPDX-License-Identifier: Apache-2.0

#include "SqlConnection.hpp"

#include <algorithm>
#include <atomic>
#include <utility>

namespace
{

SqlConnectionString gDefaultConnectionString {};
std::atomic<uint64_t> gNextConnectionId { 1 };
std::function<void(SqlConnection&)> gPostConnectedHook {};

} // namespace

SqlConnection::SqlConnection():
    SqlConnection { std::optional { DefaultConnectionString() } }
{
}

SqlConnection::SqlConnection(std::optional<SqlConnectionString> connectionString):
    m_connectionId { gNextConnectionId++ }
{
    SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &m_hEnv);
    SQLSetEnvAttr(m_hEnv, SQL_ATTR_ODBC_VERSION, (SQLPOINTER) SQL_OV_ODBC3, 0);
    SQLAllocHandle(SQL_HANDLE_DBC, m_hEnv, &m_hDbc);

    // A failure is kept in LastErrorCode().
    if (connectionString)
        (void) Connect(std::move(*connectionString));
}

SqlConnection::SqlConnection(SqlConnection&& other) noexcept:
    m_hEnv { std::exchange(other.m_hEnv, SQLHENV {}) },
    m_hDbc { std::exchange(other.m_hDbc, SQLHDBC {}) },
    m_connectionId { other.m_connectionId },
    m_connected { std::exchange(other.m_connected, false) },
    m_lastError { other.m_lastError },
    m_connectionString { std::move(other.m_connectionString) },
    m_lastUsed { other.m_lastUsed }
{
}

SqlConnection& SqlConnection::operator=(SqlConnection&& other) noexcept
{
    if (this != &other)
    {
        Close();
        m_hEnv = std::exchange(other.m_hEnv, SQLHENV {});
        m_hDbc = std::exchange(other.m_hDbc, SQLHDBC {});
        m_connectionId = other.m_connectionId;
        m_connected = std::exchange(other.m_connected, false);
        m_lastError = other.m_lastError;
        m_connectionString = std::move(other.m_connectionString);
        m_lastUsed = other.m_lastUsed;
    }
    return *this;
}

SqlConnection::~SqlConnection() noexcept
{
    Close();
}

SqlConnectionString const& SqlConnection::DefaultConnectionString() noexcept
{
    return gDefaultConnectionString;
}

void SqlConnection::SetDefaultConnectionString(SqlConnectionString const& connectionString) noexcept
{
    gDefaultConnectionString = connectionString;
}

void SqlConnection::SetPostConnectedHook(std::function<void(SqlConnection&)> hook)
{
    gPostConnectedHook = std::move(hook);
}

SqlResult<void> SqlConnection::Connect(SqlConnectionString connectionString) noexcept
{
    if (m_connected)
    {
        SqlLogger::GetLogger().OnConnectionClosed(*this);
        SQLDisconnect(m_hDbc);
        m_connected = false;
    }

    m_connectionString = std::move(connectionString);
    auto& text = m_connectionString.value;

    return UpdateLastError(SQLDriverConnectA(m_hDbc,
                                             (SQLHWND) nullptr,
                                             (SQLCHAR*) text.data(),
                                             (SQLSMALLINT) text.size(),
                                             nullptr,
                                             0,
                                             nullptr,
                                             SQL_DRIVER_NOPROMPT))
        .and_then([&] {
            return UpdateLastError(
                SQLSetConnectAttrA(m_hDbc, SQL_ATTR_AUTOCOMMIT, (SQLPOINTER) SQL_AUTOCOMMIT_ON, SQL_IS_UINTEGER));
        })
        .transform([&] {
            m_connected = true;
            MarkUsed();
            SqlLogger::GetLogger().OnConnectionOpened(*this);
            if (gPostConnectedHook)
                gPostConnectedHook(*this);
        });
}

void SqlConnection::Close() noexcept
{
    if (!m_hDbc)
        return;

    if (m_connected)
    {
        SqlLogger::GetLogger().OnConnectionClosed(*this);
        SQLDisconnect(m_hDbc);
        m_connected = false;
    }

    SQLFreeHandle(SQL_HANDLE_DBC, std::exchange(m_hDbc, SQLHDBC {}));
    SQLFreeHandle(SQL_HANDLE_ENV, std::exchange(m_hEnv, SQLHENV {}));
}

bool SqlConnection::IsAlive() const noexcept
{
    if (!m_connected)
        return false;

    SQLUINTEGER dead {};
    return SQL_SUCCEEDED(SQLGetConnectAttrA(m_hDbc, SQL_ATTR_CONNECTION_DEAD, &dead, 0, nullptr))
           && dead == SQL_CD_FALSE;
}

SqlErrorInfo SqlConnection::LastError() const
{
    return SqlErrorInfo::fromConnectionHandle(m_hDbc);
}

SqlResult<std::string> SqlConnection::ServerName() const
{
    return GetInfoString(SQL_DBMS_NAME);
}

SqlResult<std::string> SqlConnection::ServerVersion() const
{
    return GetInfoString(SQL_DBMS_VER);
}

SqlResult<std::string> SqlConnection::GetInfoString(SQLUSMALLINT infoType) const
{
    std::string text(128, '\0');
    SQLSMALLINT length {};
    return UpdateLastError(SQLGetInfoA(m_hDbc, infoType, (SQLPOINTER) text.data(), (SQLSMALLINT) text.size(), &length))
        .transform([&] {
            text.resize(std::min(static_cast<size_t>(length), text.size()));
            return std::move(text);
        });
}

SqlResult<void> SqlConnection::UpdateLastError(SQLRETURN sqlResult, std::source_location sourceLocation) const
{
    return detail::UpdateSqlError(&m_lastError, sqlResult).or_else([&](auto&&) -> SqlResult<void> {
        SqlLogger::GetLogger().OnError(SqlErrorInfo::fromConnectionHandle(m_hDbc), sourceLocation);
        return std::unexpected { m_lastError };
    });
}
