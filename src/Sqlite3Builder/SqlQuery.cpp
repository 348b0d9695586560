// SPDX-License-Identifier: Apache-2.0

#include "SqlQuery.hpp"
#include "SqlQueryFormatter.hpp"

using namespace std::string_view_literals;

namespace
{

std::string_view JoinTypeKeyword(SqlJoinType type) noexcept
{
    switch (type)
    {
        case SqlJoinType::Plain:
            return ""sv;
        case SqlJoinType::Left:
            return "LEFT "sv;
        case SqlJoinType::LeftOuter:
            return "LEFT OUTER "sv;
        case SqlJoinType::Right:
            return "RIGHT "sv;
        case SqlJoinType::RightOuter:
            return "RIGHT OUTER "sv;
        case SqlJoinType::Inner:
            return "INNER "sv;
        case SqlJoinType::Cross:
            return "CROSS "sv;
    }
    return ""sv;
}

} // namespace

SqlQueryBuilder::SqlQueryBuilder(SqlStatementKind kind, std::string_view table)
{
    m_state.kind = kind;
    m_state.table = std::string(table);
}

SqlQueryBuilder SqlQueryBuilder::SelectFrom(std::string_view table)
{
    return SqlQueryBuilder { SqlStatementKind::Select, table };
}

SqlQueryBuilder SqlQueryBuilder::InsertInto(std::string_view table)
{
    return SqlQueryBuilder { SqlStatementKind::Insert, table };
}

SqlQueryBuilder SqlQueryBuilder::UpdateTable(std::string_view table)
{
    return SqlQueryBuilder { SqlStatementKind::Update, table };
}

SqlQueryBuilder SqlQueryBuilder::DeleteFrom(std::string_view table)
{
    return SqlQueryBuilder { SqlStatementKind::Delete, table };
}

SqlQueryBuilder& SqlQueryBuilder::Limit(std::size_t limit) noexcept
{
    m_state.limit = limit;
    return *this;
}

SqlQueryBuilder& SqlQueryBuilder::Offset(std::size_t offset) noexcept
{
    m_state.offset = offset;
    return *this;
}

SqlQueryBuilder& SqlQueryBuilder::Natural() noexcept
{
    m_nextJoinNatural = true;
    return *this;
}

SqlQueryBuilder& SqlQueryBuilder::Left() noexcept
{
    m_nextJoinType = SqlJoinType::Left;
    return *this;
}

SqlQueryBuilder& SqlQueryBuilder::LeftOuter() noexcept
{
    m_nextJoinType = SqlJoinType::LeftOuter;
    return *this;
}

SqlQueryBuilder& SqlQueryBuilder::Right() noexcept
{
    m_nextJoinType = SqlJoinType::Right;
    return *this;
}

SqlQueryBuilder& SqlQueryBuilder::RightOuter() noexcept
{
    m_nextJoinType = SqlJoinType::RightOuter;
    return *this;
}

SqlQueryBuilder& SqlQueryBuilder::Inner() noexcept
{
    m_nextJoinType = SqlJoinType::Inner;
    return *this;
}

SqlQueryBuilder& SqlQueryBuilder::Cross() noexcept
{
    m_nextJoinType = SqlJoinType::Cross;
    return *this;
}

SqlQueryBuilder& SqlQueryBuilder::Join(std::string_view table, std::string_view op, std::string_view constraint)
{
    std::string join;
    if (!op.empty())
    {
        join += op;
        join += ' ';
    }
    join += "JOIN ";
    join += table;
    if (!constraint.empty())
    {
        join += ' ';
        join += constraint;
    }
    m_state.joins.emplace_back(std::move(join));
    return *this;
}

SqlQueryBuilder& SqlQueryBuilder::Distinct() noexcept
{
    m_state.distinct = true;
    return *this;
}

SqlQueryBuilder& SqlQueryBuilder::AddValues(std::string tuple)
{
    m_state.selectSource.reset();
    m_state.values.emplace_back('(' + tuple + ')');
    return *this;
}

SqlQueryBuilder& SqlQueryBuilder::AddJoin(std::string table)
{
    std::string join;
    if (m_nextJoinNatural)
        join += "NATURAL ";
    join += JoinTypeKeyword(m_nextJoinType);
    join += "JOIN ";
    join += table;
    m_state.joins.emplace_back(std::move(join));

    m_nextJoinNatural = false;
    m_nextJoinType = SqlJoinType::Plain;
    return *this;
}

SqlQueryBuilder& SqlQueryBuilder::AddJoinConstraint(std::string constraint)
{
    // Without any join, there is nothing to constrain.
    if (!m_state.joins.empty())
    {
        m_state.joins.back() += " ON ";
        m_state.joins.back() += constraint;
    }
    return *this;
}

SqlResult<std::string> SqlQueryBuilder::ToSql() const
{
    return Query().transform([](std::string sql) {
        sql += ';';
        return sql;
    });
}

SqlResult<std::string> SqlQueryBuilder::Query() const
{
    return SqlQueryFormatter::Sqlite().Format(m_state);
}

SqlResult<std::string> SqlQueryBuilder::SubQuery() const
{
    return Query().transform([](std::string const& sql) { return '(' + sql + ')'; });
}

SqlResult<std::string> SqlQueryBuilder::SubQueryAs(std::string_view name) const
{
    return Query().transform([name](std::string const& sql) { return std::format("({}) AS {}", sql, name); });
}

SqlResult<std::string> SqlQueryBuilder::QueryValues() const
{
    return SqlQueryFormatter::Sqlite().SelectValues(m_state);
}
