// SPDX-License-Identifier: Apache-2.0

#include "SqlConnectInfo.hpp"
#include "SqlConnection.hpp"
#include "SqlLogger.hpp"
#include "SqlQuery/Core.hpp"

#include <chrono>
#include <format>
#include <mutex>
#include <print>
#include <string>

namespace
{

std::string_view StatementKeyword(SqlStatementKind kind) noexcept
{
    switch (kind)
    {
        case SqlStatementKind::Select:
            return "SELECT";
        case SqlStatementKind::Insert:
            return "INSERT";
        case SqlStatementKind::Update:
            return "UPDATE";
        case SqlStatementKind::Delete:
            return "DELETE";
    }
    return "?";
}

// Writes one line per event. Lines of concurrently used connections never interleave.
class SqlTraceLogger final: public SqlLogger
{
  public:
    void OnWarning(std::string_view const& message) override
    {
        Write("Warning: {}", message);
    }

    void OnError(SqlError errorCode, std::source_location sourceLocation) override
    {
        Write("Error: {} [{}:{}]", errorCode, sourceLocation.file_name(), sourceLocation.line());
    }

    void OnError(SqlErrorInfo const& errorInfo, std::source_location sourceLocation) override
    {
        auto const _ = std::lock_guard { m_mutex };
        WriteLine("Error: {} [{}:{}]", errorInfo, sourceLocation.file_name(), sourceLocation.line());
        if (!m_currentQuery.empty())
            WriteLine("  while executing: {}", m_currentQuery);
    }

    void OnRenderFailure(SqlStatementState const& state, SqlError errorCode) override
    {
        Write("Not executed, the {} statement on '{}' cannot be rendered: {}",
              StatementKeyword(state.kind),
              state.table,
              errorCode);
    }

    void OnConnectionOpened(SqlConnection const& connection) override
    {
        Write("Connection {} opened: {}", connection.ConnectionId(), connection.ConnectionString().Sanitized());
    }

    void OnConnectionClosed(SqlConnection const& connection) override
    {
        Write("Connection {} closed", connection.ConnectionId());
    }

    void OnPoolEvent(SqlConnection const& connection, SqlPoolEvent event) override
    {
        Write("Connection {} {} by pool", connection.ConnectionId(), event);
    }

    void OnQueryStarted(std::string_view const& query) override
    {
        auto const _ = std::lock_guard { m_mutex };
        m_currentQuery = query;
    }

    void OnQueryFinished(SqlQueryTrace const& trace) override
    {
        auto const seconds = std::chrono::duration<double>(trace.duration).count();

        auto const _ = std::lock_guard { m_mutex };
        if (trace.rowCount == 1)
            WriteLine("[{:.6f}s] [1 row] {}", seconds, trace.query);
        else
            WriteLine("[{:.6f}s] [{} rows] {}", seconds, trace.rowCount, trace.query);
        m_currentQuery.clear();
    }

  private:
    template <typename... Args>
    void Write(std::format_string<Args...> const& fmt, Args&&... args)
    {
        auto const _ = std::lock_guard { m_mutex };
        WriteLine(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void WriteLine(std::format_string<Args...> const& fmt, Args&&... args)
    {
        auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
        std::println("[{:%F %T}] {}", now, std::format(fmt, std::forward<Args>(args)...));
    }

    std::mutex m_mutex;
    std::string m_currentQuery;
};

} // namespace

SqlLogger::Null& SqlLogger::NullLogger() noexcept
{
    static SqlLogger::Null theNullLogger {};
    return theNullLogger;
}

SqlLogger& SqlLogger::TraceLogger()
{
    static SqlTraceLogger theTraceLogger {};
    return theTraceLogger;
}

static SqlLogger* theCurrentLogger = &SqlLogger::NullLogger();

SqlLogger& SqlLogger::GetLogger()
{
    return *theCurrentLogger;
}

void SqlLogger::SetLogger(SqlLogger& logger)
{
    theCurrentLogger = &logger;
}
