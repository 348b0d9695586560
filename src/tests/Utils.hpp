// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include "../Sqlite3Builder/SqlConnectInfo.hpp"
#include "../Sqlite3Builder/SqlConnection.hpp"
#include "../Sqlite3Builder/SqlError.hpp"
#include "../Sqlite3Builder/SqlLogger.hpp"
#include "../Sqlite3Builder/SqlQuery.hpp"
#include "../Sqlite3Builder/SqlStatement.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <format>
#include <ostream>
#include <print>
#include <source_location>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>

#include <sql.h>
#include <sqlext.h>
#include <sqltypes.h>

// {{{ pretty printers for REQUIRE() and CHECK()

inline std::ostream& operator<<(std::ostream& os, SqlError value)
{
    return os << std::format("SqlError({}: {})", static_cast<int>(value), value);
}

template <typename T>
std::ostream& operator<<(std::ostream& os, SqlResult<T> const& result)
{
    if (!result)
        return os << result.error();
    if constexpr (std::is_void_v<T>)
        return os << "success";
    else
        return os << *result;
}

// }}}

// A private in-memory database per connection, served by the SQLite3 ODBC driver
// (http://www.ch-werner.de/sqliteodbc/).
auto const inline DefaultTestConnectionString = SqlConnectionString::Sqlite3("file::memory:");

// Attaches the execution layer events to the report of the running test case.
//
// Failures show up as warnings. Everything else is only shown for failing test cases.
class TestSuiteSqlLogger final: public SqlLogger
{
  public:
    static TestSuiteSqlLogger& GetLogger() noexcept
    {
        static TestSuiteSqlLogger theLogger;
        return theLogger;
    }

    void OnWarning(std::string_view const& message) override
    {
        WARN(std::string(message));
    }

    void OnError(SqlError errorCode, std::source_location sourceLocation) override
    {
        WARN(std::format("{} [{}:{}]", errorCode, sourceLocation.file_name(), sourceLocation.line()));
    }

    void OnError(SqlErrorInfo const& errorInfo, std::source_location sourceLocation) override
    {
        WARN(std::format("{} [{}:{}] while executing: {}",
                         errorInfo,
                         sourceLocation.file_name(),
                         sourceLocation.line(),
                         m_currentQuery));
    }

    void OnRenderFailure(SqlStatementState const& state, SqlError errorCode) override
    {
        Note(std::format("not rendered ({}): statement on '{}'", errorCode, state.table));
    }

    void OnConnectionOpened(SqlConnection const& connection) override
    {
        Note(std::format("connection {} opened", connection.ConnectionId()));
    }

    void OnConnectionClosed(SqlConnection const& connection) override
    {
        Note(std::format("connection {} closed", connection.ConnectionId()));
    }

    void OnPoolEvent(SqlConnection const& connection, SqlPoolEvent event) override
    {
        Note(std::format("connection {} {} by pool", connection.ConnectionId(), event));
    }

    void OnQueryStarted(std::string_view const& query) override
    {
        m_currentQuery = query;
    }

    void OnQueryFinished(SqlQueryTrace const& trace) override
    {
        Note(std::format("[{} rows] {}", trace.rowCount, trace.query));
        m_currentQuery.clear();
    }

  private:
    static void Note(std::string const& message)
    {
        try
        {
            UNSCOPED_INFO(message);
        }
        catch (std::exception const&)
        {
            // Outside of a running test case, e.g. while setting up in main().
            std::println("{}", message);
        }
    }

    std::string m_currentQuery;
};

// Silences the execution layer events for the lifetime of this object.
//
// Used around expected failures and wherever Catch2 must not be called, e.g. from worker threads.
// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
class ScopedSqlNullLogger: public SqlLogger::Null
{
  public:
    ScopedSqlNullLogger():
        m_restore { SqlLogger::GetLogger() }
    {
        SqlLogger::SetLogger(*this);
    }

    ~ScopedSqlNullLogger() override
    {
        SqlLogger::SetLogger(m_restore);
    }

  private:
    SqlLogger& m_restore;
};

// Connects to the test database for the duration of a test case.
//
// Database test cases are skipped when the database could not be reached in Initialize().
// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
class SqlTestFixture
{
  public:
    static inline bool odbcTrace = false;
    static inline bool databaseAvailable = false;

    using MainProgramArgs = std::tuple<int, char**>;

    // Consumes the leading test suite options and configures the database connection.
    //
    // Yields the remaining arguments for Catch2, or an exit code if the program should stop.
    static std::variant<MainProgramArgs, int> Initialize(int argc, char** argv)
    {
        using namespace std::string_view_literals;

        SqlLogger::SetLogger(TestSuiteSqlLogger::GetLogger());

        int consumed = 0;
        while (consumed + 1 < argc)
        {
            auto const arg = std::string_view { argv[consumed + 1] };
            if (arg == "--trace-sql"sv)
                SqlLogger::SetLogger(SqlLogger::TraceLogger());
            else if (arg == "--trace-odbc"sv)
                odbcTrace = true;
            else if (arg == "--help"sv || arg == "-h"sv)
            {
                std::println("Usage: {} [--trace-sql] [--trace-odbc] [--] [Catch2 options...]", argv[0]);
                return EXIT_SUCCESS;
            }
            else if (arg != "--"sv)
                break;

            ++consumed;
            if (arg == "--"sv)
                break;
        }

        // Catch2 sees the program name followed by the remaining arguments.
        argv[consumed] = argv[0];

        auto const connectionString = SqlConnectionString::FromEnvironment().value_or(DefaultTestConnectionString);
        std::println("Test database: {}", connectionString);
        SqlConnection::SetDefaultConnectionString(connectionString);
        SqlConnection::SetPostConnectedHook(&SqlTestFixture::PostConnectedHook);

        auto const _ = ScopedSqlNullLogger {};
        auto connection = SqlConnection {};
        databaseAvailable = connection.IsAlive();
        if (databaseAvailable)
            std::println("Connected to {} {}",
                         connection.ServerName().value_or("(unknown)"),
                         connection.ServerVersion().value_or("(unknown)"));
        else
            std::println("No database, skipping database test cases: {}", connection.LastError());

        return MainProgramArgs { argc - consumed, argv + consumed };
    }

    static void PostConnectedHook(SqlConnection& connection)
    {
#if !defined(_WIN32) && !defined(_WIN64)
        if (odbcTrace)
        {
            SQLSetConnectAttrA(connection.NativeHandle(), SQL_ATTR_TRACEFILE, (SQLPOINTER) "/dev/stdout", SQL_NTS);
            SQLSetConnectAttrA(
                connection.NativeHandle(), SQL_ATTR_TRACE, (SQLPOINTER) SQL_OPT_TRACE_ON, SQL_IS_UINTEGER);
        }
#endif

        auto stmt = SqlStatement { connection };
        if (auto const result = stmt.ExecuteDirect("PRAGMA foreign_keys = ON"); !result)
            SqlLogger::GetLogger().OnWarning(std::format("PRAGMA foreign_keys failed: {}", result.error()));
    }

    SqlTestFixture()
    {
        if (!databaseAvailable)
            SKIP("No database available");

        REQUIRE(m_connection.Connect(SqlConnection::DefaultConnectionString()));
        REQUIRE(DropTestTables());
    }

    ~SqlTestFixture()
    {
        if (!m_connection.IsConnected())
            return;
        if (auto const result = DropTestTables(); !result)
            SqlLogger::GetLogger().OnWarning(std::format("Dropping the test tables failed: {}", result.error()));
    }

    [[nodiscard]] SqlConnection& Connection() noexcept
    {
        return m_connection;
    }

    // Executes a setup statement, which must succeed.
    void ExecuteDirect(std::string_view query, std::source_location location = std::source_location::current())
    {
        INFO(std::format("{}:{}: {}", location.file_name(), location.line(), query));
        auto stmt = SqlStatement { m_connection };
        REQUIRE(stmt.ExecuteDirect(query, location));
    }

    // books(id, title, price, comment, rating) with four books, two of them "Harry Potter" ones.
    void CreateBooksTable()
    {
        ExecuteDirect("CREATE TABLE books (id INTEGER PRIMARY KEY, title VARCHAR(100) NOT NULL, price INTEGER, "
                      "comment VARCHAR(100), rating REAL)");

        ExecuteDirect(SqlQueryBuilder::InsertInto("books")
                          .Fields("id", "title", "price", "comment", "rating")
                          .Values(1, SqlQuote("Harry Potter and the Philosopher's Stone"), 80, "NULL", 4.5)
                          .Values(2, SqlQuote("Harry Potter and the Chamber of Secrets"), 120, SqlQuote("second"), 4.1)
                          .Values(3, SqlQuote("Don Quixote"), 200, "NULL", "NULL")
                          .Values(4, SqlQuote("In Search of Lost Time"), 150, "NULL", "NULL")
                          .ToSql()
                          .value());
    }

  private:
    SqlResult<void> DropTestTables()
    {
        auto stmt = SqlStatement { m_connection };
        return stmt.ExecuteDirect("DROP TABLE IF EXISTS books").and_then([&] {
            return stmt.ExecuteDirect("DROP TABLE IF EXISTS warehouse");
        });
    }

    SqlConnection m_connection { std::nullopt };
};
