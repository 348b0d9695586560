// SPDX-License-Identifier: Apache-2.0

#include "SqlQueryFormatter.hpp"

#include <sstream>

using detail::JoinSqlFragments;

SqlQueryFormatter const& SqlQueryFormatter::Sqlite() noexcept
{
    static SqlQueryFormatter const formatter {};
    return formatter;
}

SqlResult<std::string> SqlQueryFormatter::Format(SqlStatementState const& state) const
{
    switch (state.kind)
    {
        case SqlStatementKind::Select:
            return Select(state);
        case SqlStatementKind::Insert:
            return Insert(state);
        case SqlStatementKind::Update:
            return Update(state);
        case SqlStatementKind::Delete:
            return Delete(state);
    }
    return std::unexpected { SqlError::INVALID_ARGUMENT };
}

SqlResult<std::string> SqlQueryFormatter::Select(SqlStatementState const& state) const
{
    if (state.table.empty())
        return std::unexpected { SqlError::NO_TABLE_NAME };

    std::stringstream sqlQueryString;
    sqlQueryString << "SELECT ";
    if (state.distinct)
        sqlQueryString << "DISTINCT ";
    if (state.fields.empty())
        sqlQueryString << '*';
    else
        sqlQueryString << JoinSqlFragments(state.fields, ", ");
    sqlQueryString << " FROM " << state.table;

    if (!state.joins.empty())
        sqlQueryString << ' ' << JoinSqlFragments(state.joins, " ");

    if (!state.groupBy.empty())
        sqlQueryString << " GROUP BY " << JoinSqlFragments(state.groupBy, ", ");

    // HAVING follows GROUP BY, but is also emitted without any grouping.
    if (state.having)
        sqlQueryString << " HAVING " << *state.having;

    sqlQueryString << WhereClause(state.wheres);

    if (!state.orderBy.empty())
        sqlQueryString << " ORDER BY " << JoinSqlFragments(state.orderBy, ", ");

    if (state.limit)
        sqlQueryString << " LIMIT " << *state.limit;

    if (state.offset)
        sqlQueryString << " OFFSET " << *state.offset;

    for (auto const& unionPart: state.unions)
        sqlQueryString << unionPart;

    return sqlQueryString.str();
}

SqlResult<std::string> SqlQueryFormatter::SelectValues(SqlStatementState const& state) const
{
    // There is no FROM clause that `*` could expand to.
    if (state.fields.empty())
        return std::unexpected { SqlError::NO_VALUES };

    if (state.distinct)
        return "SELECT DISTINCT " + JoinSqlFragments(state.fields, ", ");
    return "SELECT " + JoinSqlFragments(state.fields, ", ");
}

SqlResult<std::string> SqlQueryFormatter::Insert(SqlStatementState const& state) const
{
    if (state.table.empty())
        return std::unexpected { SqlError::NO_TABLE_NAME };

    std::stringstream sqlQueryString;
    sqlQueryString << "INSERT INTO " << state.table;
    if (!state.fields.empty())
        sqlQueryString << " (" << JoinSqlFragments(state.fields, ", ") << ')';

    if (state.selectSource)
        sqlQueryString << ' ' << *state.selectSource;
    else if (!state.values.empty())
        sqlQueryString << " VALUES " << JoinSqlFragments(state.values, ", ");
    else
        return std::unexpected { SqlError::NO_VALUES };

    return sqlQueryString.str();
}

SqlResult<std::string> SqlQueryFormatter::Update(SqlStatementState const& state) const
{
    if (state.table.empty())
        return std::unexpected { SqlError::NO_TABLE_NAME };

    if (state.sets.empty())
        return std::unexpected { SqlError::NO_SET_FIELDS };

    std::stringstream sqlQueryString;
    sqlQueryString << "UPDATE " << state.table << " SET " << JoinSqlFragments(state.sets, ", ");
    sqlQueryString << WhereClause(state.wheres);
    return sqlQueryString.str();
}

SqlResult<std::string> SqlQueryFormatter::Delete(SqlStatementState const& state) const
{
    if (state.table.empty())
        return std::unexpected { SqlError::NO_TABLE_NAME };

    return "DELETE FROM " + state.table + WhereClause(state.wheres);
}

std::string SqlQueryFormatter::WhereClause(std::vector<std::string> const& conditions) const
{
    if (conditions.empty())
        return {};

    if (conditions.size() == 1)
        return " WHERE " + conditions.front();

    std::string result = " WHERE ";
    bool first = true;
    for (auto const& condition: conditions)
    {
        if (!first)
            result += " AND ";
        first = false;
        result += '(';
        result += condition;
        result += ')';
    }
    return result;
}
