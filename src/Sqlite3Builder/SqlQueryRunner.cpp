// SPDX-License-Identifier: Apache-2.0

#include "SqlLogger.hpp"
#include "SqlQueryRunner.hpp"

SqlResult<SqlStatement> SqlQueryRunner::ExecuteStatement(SqlQueryBuilder const& query)
{
    return query.ToSql()
        .or_else([&](SqlError error) -> SqlResult<std::string> {
            SqlLogger::GetLogger().OnRenderFailure(query.State(), error);
            return std::unexpected { error };
        })
        .and_then([&](std::string const& sql) -> SqlResult<SqlStatement> {
            auto stmt = SqlStatement { *m_connection };
            if (stmt.LastErrorCode() != SqlError::SUCCESS)
                return std::unexpected { stmt.LastErrorCode() };

            return stmt.Prepare(sql)
                .and_then([&] { return stmt.Execute(); })
                .transform([&] { return std::move(stmt); });
        });
}

SqlResult<void> SqlQueryRunner::Execute(SqlQueryBuilder const& query)
{
    return ExecuteStatement(query).transform([](SqlStatement const& /*stmt*/) {});
}

SqlResult<SqlJsonRows> SqlQueryRunner::GetRows(SqlQueryBuilder const& query)
{
    return ExecuteStatement(query).and_then([](SqlStatement stmt) -> SqlResult<SqlJsonRows> {
        SqlJsonRows rows;
        while (true)
        {
            auto const fetched = stmt.FetchRow();
            if (!fetched)
                return std::unexpected { fetched.error() };
            if (!*fetched)
                break;

            auto row = stmt.GetRowValues();
            if (!row)
                return std::unexpected { row.error() };
            rows.emplace_back(std::move(*row));
        }
        return rows;
    });
}

SqlResult<SqlJsonRow> SqlQueryRunner::GetRow(SqlQueryBuilder const& query)
{
    return ExecuteStatement(query).and_then([](SqlStatement stmt) -> SqlResult<SqlJsonRow> {
        return stmt.FetchRow().and_then([&](bool fetched) -> SqlResult<SqlJsonRow> {
            if (!fetched)
                return SqlJsonRow {};
            auto row = stmt.GetRowValues();
            stmt.CloseCursor();
            return row;
        });
    });
}

SqlResult<SqlJsonValue> SqlQueryRunner::GetValue(SqlQueryBuilder const& query)
{
    return ExecuteStatement(query).and_then([](SqlStatement stmt) -> SqlResult<SqlJsonValue> {
        return stmt.FetchRow().and_then([&](bool fetched) -> SqlResult<SqlJsonValue> {
            if (!fetched)
                return std::unexpected { SqlError::NODATA };
            auto value = stmt.GetColumnValue(1);
            stmt.CloseCursor();
            return value;
        });
    });
}

SqlResult<int64_t> SqlQueryRunner::GetInt(SqlQueryBuilder const& query)
{
    return GetValue(query).and_then([](SqlJsonValue const& value) -> SqlResult<int64_t> {
        if (!value.is_number_integer())
            return std::unexpected { SqlError::UNSUPPORTED_TYPE };
        return value.get<int64_t>();
    });
}

SqlResult<std::string> SqlQueryRunner::GetString(SqlQueryBuilder const& query)
{
    return GetValue(query).and_then([](SqlJsonValue const& value) -> SqlResult<std::string> {
        if (!value.is_string())
            return std::unexpected { SqlError::UNSUPPORTED_TYPE };
        return value.get<std::string>();
    });
}

SqlResult<SqlResultCursor> SqlQueryRunner::GetCursor(SqlQueryBuilder const& query)
{
    return ExecuteStatement(query).transform([](SqlStatement stmt) { return SqlResultCursor { std::move(stmt) }; });
}
