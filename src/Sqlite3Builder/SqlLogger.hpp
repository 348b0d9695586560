// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlError.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <format>
#include <source_location>
#include <string_view>

class SqlConnection;
struct SqlStatementState;

/// A decision of a SqlConnectionPool about one of its connections.
enum class SqlPoolEvent : uint8_t
{
    Created,  ///< A new connection was opened, as no idle one was available.
    Reused,   ///< An idle connection was handed out again.
    Released, ///< A connection was handed back and is kept idle.
    Evicted,  ///< A connection was handed back and closed, as enough connections are idle already.
    TimedOut, ///< An idle connection was closed, as it was idle for longer than the connection timeout.
    Dead,     ///< An idle connection was discarded, as the database no longer considers it alive.
};

/// Summary of a single executed query, reported once its result set has been consumed or closed.
struct SqlQueryTrace
{
    std::string_view query;
    std::chrono::microseconds duration {};
    std::size_t rowCount {};
};

/// Receives the events of the execution layer.
///
/// The query builder itself never logs, its render failures are reported by the
/// SqlQueryRunner that tried to execute the statement.
class SQLITE3BUILDER_API SqlLogger
{
  public:
    SqlLogger() = default;
    SqlLogger(SqlLogger const& /*other*/) = default;
    SqlLogger(SqlLogger&& /*other*/) = default;
    SqlLogger& operator=(SqlLogger const& /*other*/) = default;
    SqlLogger& operator=(SqlLogger&& /*other*/) = default;
    virtual ~SqlLogger() = default;

    virtual void OnWarning(std::string_view const& message) = 0;

    /// Invoked on a failure without extended diagnostics, e.g. a value that has no JSON counterpart.
    virtual void OnError(SqlError errorCode, std::source_location sourceLocation = std::source_location::current()) = 0;

    /// Invoked on a failure reported by the ODBC driver.
    virtual void OnError(SqlErrorInfo const& errorInfo,
                         std::source_location sourceLocation = std::source_location::current()) = 0;

    /// Invoked when a statement could not be rendered into SQL and was therefore not executed.
    virtual void OnRenderFailure(SqlStatementState const& state, SqlError errorCode) = 0;

    virtual void OnConnectionOpened(SqlConnection const& connection) = 0;
    virtual void OnConnectionClosed(SqlConnection const& connection) = 0;

    /// Invoked for every decision a connection pool makes about the given connection.
    virtual void OnPoolEvent(SqlConnection const& connection, SqlPoolEvent event) = 0;

    /// Invoked right before a query is sent to the database.
    virtual void OnQueryStarted(std::string_view const& query) = 0;

    /// Invoked once the result of a query is done with.
    virtual void OnQueryFinished(SqlQueryTrace const& trace) = 0;

    class Null;

    /// Retrieves a logger that discards everything. This is the initial logger.
    static Null& NullLogger() noexcept;

    /// Retrieves a logger writing every event, with timestamps, to standard output.
    static SqlLogger& TraceLogger();

    static SqlLogger& GetLogger();

    /// Sets the current logger.
    ///
    /// The ownership of the logger is not transferred and remains with the caller.
    static void SetLogger(SqlLogger& logger);
};

class SqlLogger::Null: public SqlLogger
{
  public:
    void OnWarning(std::string_view const& /*message*/) override {}
    void OnError(SqlError /*errorCode*/, std::source_location /*sourceLocation*/) override {}
    void OnError(SqlErrorInfo const& /*errorInfo*/, std::source_location /*sourceLocation*/) override {}
    void OnRenderFailure(SqlStatementState const& /*state*/, SqlError /*errorCode*/) override {}
    void OnConnectionOpened(SqlConnection const& /*connection*/) override {}
    void OnConnectionClosed(SqlConnection const& /*connection*/) override {}
    void OnPoolEvent(SqlConnection const& /*connection*/, SqlPoolEvent /*event*/) override {}
    void OnQueryStarted(std::string_view const& /*query*/) override {}
    void OnQueryFinished(SqlQueryTrace const& /*trace*/) override {}
};

template <>
struct std::formatter<SqlPoolEvent>: formatter<std::string_view>
{
    auto format(SqlPoolEvent event, format_context& ctx) const -> format_context::iterator
    {
        std::string_view name;
        switch (event)
        {
            case SqlPoolEvent::Created:
                name = "created";
                break;
            case SqlPoolEvent::Reused:
                name = "reused";
                break;
            case SqlPoolEvent::Released:
                name = "released";
                break;
            case SqlPoolEvent::Evicted:
                name = "evicted";
                break;
            case SqlPoolEvent::TimedOut:
                name = "timed out";
                break;
            case SqlPoolEvent::Dead:
                name = "dead";
                break;
        }
        return formatter<std::string_view>::format(name, ctx);
    }
};
