// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlError.hpp"
#include "SqlQuery/Core.hpp"
#include "SqlQuery/WhereClause.hpp"
#include "SqlQuoting.hpp"

#include <reflection-cpp/reflection.hpp>

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

/// @brief API entry point for building SQL statements.
///
/// A builder is created by one of the factories SelectFrom(), InsertInto(), UpdateTable()
/// or DeleteFrom(), filled by chained clause accumulators, and rendered via ToSql() or one
/// of the fragment renderers.
///
/// Fragments are raw SQL text and are embedded verbatim. Use SqlQuote() to embed literal
/// string values.
///
/// @code
/// auto const sql = SqlQueryBuilder::SelectFrom("books")
///                      .Field("title")
///                      .Field("price")
///                      .AndWhere("price > 100")
///                      .AndWhereLikeLeft("title", "Harry Potter")
///                      .ToSql();
/// // sql.value() == "SELECT title, price FROM books WHERE (price > 100) AND (title LIKE 'Harry Potter%');"
/// @endcode
///
/// @ingroup QueryBuilder
class [[nodiscard]] SqlQueryBuilder final: public detail::SqlWhereClauseBuilder<SqlQueryBuilder>
{
  public:
    /// Creates a SELECT statement builder.
    /// The table may also be a comma separated list of tables or a subquery.
    static SQLITE3BUILDER_API SqlQueryBuilder SelectFrom(std::string_view table);

    /// Creates an INSERT statement builder.
    static SQLITE3BUILDER_API SqlQueryBuilder InsertInto(std::string_view table);

    /// Creates an UPDATE statement builder.
    static SQLITE3BUILDER_API SqlQueryBuilder UpdateTable(std::string_view table);

    /// Creates a DELETE statement builder.
    static SQLITE3BUILDER_API SqlQueryBuilder DeleteFrom(std::string_view table);

    // {{{ field list

    /// Adds a single field to the SELECT or INSERT field list.
    SqlQueryBuilder& Field(SqlFragment auto const& field)
    {
        m_state.fields.emplace_back(detail::ToSqlFragment(field));
        return *this;
    }

    /// Adds a sequence of fields to the SELECT or INSERT field list.
    template <SqlFragment FirstField, SqlFragment... MoreFields>
    SqlQueryBuilder& Fields(FirstField const& firstField, MoreFields const&... moreFields)
    {
        Field(firstField);
        (Field(moreFields), ...);
        return *this;
    }

    /// Adds a list of fields to the SELECT or INSERT field list.
    template <SqlFragmentList FieldList>
    SqlQueryBuilder& Fields(FieldList const& fields)
    {
        for (auto const& field: fields)
            Field(field);
        return *this;
    }

    template <SqlFragment T>
    SqlQueryBuilder& Fields(std::initializer_list<T> const& fields)
    {
        for (auto const& field: fields)
            Field(field);
        return *this;
    }

    /// Adds the member names of the given aggregate record type to the field list.
    template <typename Record>
    SqlQueryBuilder& Fields();

    /// Replaces the field list with the single given field.
    SqlQueryBuilder& SetField(SqlFragment auto const& field)
    {
        m_state.fields.clear();
        return Field(field);
    }

    /// Replaces the field list with the given fields.
    template <SqlFragmentList FieldList>
    SqlQueryBuilder& SetFields(FieldList const& fields)
    {
        m_state.fields.clear();
        return Fields(fields);
    }

    template <SqlFragment T>
    SqlQueryBuilder& SetFields(std::initializer_list<T> const& fields)
    {
        m_state.fields.clear();
        return Fields(fields);
    }
    // }}}

    // {{{ UPDATE ... SET

    /// Adds `field = value` to the SET list. The value is raw SQL.
    SqlQueryBuilder& Set(SqlFragment auto const& field, SqlFragment auto const& value)
    {
        std::string assignment = detail::ToSqlFragment(field);
        assignment += " = ";
        assignment += detail::ToSqlFragment(value);
        m_state.sets.emplace_back(std::move(assignment));
        return *this;
    }

    /// Adds `field = 'value'` to the SET list, quoting the value as a string literal.
    SqlQueryBuilder& SetString(SqlFragment auto const& field, std::string_view value)
    {
        return Set(field, SqlQuote(value));
    }
    // }}}

    // {{{ INSERT sources

    /// Adds a value tuple to the INSERT statement.
    ///
    /// Discards a previously set select source.
    ///
    /// @code
    /// .Values(SqlQuote("Don Quixote"), 200)
    /// // VALUES ('Don Quixote', 200)
    /// @endcode
    template <SqlFragment FirstValue, SqlFragment... MoreValues>
    SqlQueryBuilder& Values(FirstValue const& firstValue, MoreValues const&... moreValues)
    {
        std::string tuple = detail::ToSqlFragment(firstValue);
        ((tuple += ", ", tuple += detail::ToSqlFragment(moreValues)), ...);
        return AddValues(std::move(tuple));
    }

    /// Adds a value tuple, given as a list of values, to the INSERT statement.
    template <SqlFragmentList ValueList>
    SqlQueryBuilder& Values(ValueList const& values)
    {
        return AddValues(detail::JoinSqlFragments(values, ", "));
    }

    template <SqlFragment T>
    SqlQueryBuilder& Values(std::initializer_list<T> const& values)
    {
        return AddValues(detail::JoinSqlFragments(values, ", "));
    }

    /// Uses the given query (see Query()) as the row source of the INSERT statement.
    ///
    /// Discards previously added value tuples.
    SqlQueryBuilder& Select(SqlFragment auto const& query)
    {
        m_state.values.clear();
        m_state.selectSource = detail::ToSqlFragment(query);
        return *this;
    }
    // }}}

    // {{{ grouping and ordering

    /// Constructs or extends a GROUP BY clause.
    SqlQueryBuilder& GroupBy(SqlFragment auto const& field)
    {
        m_state.groupBy.emplace_back(detail::ToSqlFragment(field));
        return *this;
    }

    /// Sets the HAVING condition, replacing a previous one.
    SqlQueryBuilder& Having(SqlFragment auto const& condition)
    {
        m_state.having = detail::ToSqlFragment(condition);
        return *this;
    }

    /// Constructs or extends a ORDER BY clause.
    SqlQueryBuilder& OrderBy(SqlFragment auto const& field, SqlResultOrdering ordering = SqlResultOrdering::ASCENDING)
    {
        std::string term = detail::ToSqlFragment(field);
        if (ordering == SqlResultOrdering::DESCENDING)
            term += " DESC";
        m_state.orderBy.emplace_back(std::move(term));
        return *this;
    }

    SqlQueryBuilder& OrderAsc(SqlFragment auto const& field)
    {
        return OrderBy(field, SqlResultOrdering::ASCENDING);
    }

    SqlQueryBuilder& OrderDesc(SqlFragment auto const& field)
    {
        return OrderBy(field, SqlResultOrdering::DESCENDING);
    }

    /// Sets the LIMIT, replacing a previous one.
    SQLITE3BUILDER_API SqlQueryBuilder& Limit(std::size_t limit) noexcept;

    /// Sets the OFFSET, replacing a previous one.
    SQLITE3BUILDER_API SqlQueryBuilder& Offset(std::size_t offset) noexcept;
    // }}}

    // {{{ joins

    /// Marks the next join as NATURAL.
    SQLITE3BUILDER_API SqlQueryBuilder& Natural() noexcept;

    /// Marks the next join as LEFT JOIN.
    SQLITE3BUILDER_API SqlQueryBuilder& Left() noexcept;

    /// Marks the next join as LEFT OUTER JOIN.
    SQLITE3BUILDER_API SqlQueryBuilder& LeftOuter() noexcept;

    /// Marks the next join as RIGHT JOIN.
    SQLITE3BUILDER_API SqlQueryBuilder& Right() noexcept;

    /// Marks the next join as RIGHT OUTER JOIN.
    SQLITE3BUILDER_API SqlQueryBuilder& RightOuter() noexcept;

    /// Marks the next join as INNER JOIN.
    SQLITE3BUILDER_API SqlQueryBuilder& Inner() noexcept;

    /// Marks the next join as CROSS JOIN.
    SQLITE3BUILDER_API SqlQueryBuilder& Cross() noexcept;

    /// Adds a join with the given table, consuming the pending join modifiers.
    SqlQueryBuilder& Join(SqlFragment auto const& table)
    {
        return AddJoin(detail::ToSqlFragment(table));
    }

    /// Adds a fully specified join: `[op ]JOIN table[ constraint]`.
    ///
    /// Empty @p op or @p constraint are omitted. Pending join modifiers are left untouched.
    ///
    /// @code
    /// .Join("shops AS s", "LEFT OUTER", "ON b.id = s.book")
    /// // LEFT OUTER JOIN shops AS s ON b.id = s.book
    /// @endcode
    SQLITE3BUILDER_API SqlQueryBuilder& Join(std::string_view table, std::string_view op, std::string_view constraint);

    /// Appends an ON constraint to the most recently added join.
    SqlQueryBuilder& On(SqlFragment auto const& constraint)
    {
        return AddJoinConstraint(detail::ToSqlFragment(constraint));
    }

    /// Appends `ON left = right` to the most recently added join.
    SqlQueryBuilder& OnEq(SqlFragment auto const& left, SqlFragment auto const& right)
    {
        return AddJoinConstraint(detail::ToSqlFragment(left) + " = " + detail::ToSqlFragment(right));
    }
    // }}}

    /// Adds a DISTINCT clause to the SELECT statement.
    SQLITE3BUILDER_API SqlQueryBuilder& Distinct() noexcept;

    /// Appends `UNION query` to the statement.
    SqlQueryBuilder& Union(SqlFragment auto const& query)
    {
        m_state.unions.emplace_back(" UNION " + detail::ToSqlFragment(query));
        return *this;
    }

    /// Appends `UNION ALL query` to the statement.
    SqlQueryBuilder& UnionAll(SqlFragment auto const& query)
    {
        m_state.unions.emplace_back(" UNION ALL " + detail::ToSqlFragment(query));
        return *this;
    }

    /// Renders the complete statement, terminated with a semicolon.
    [[nodiscard]] SQLITE3BUILDER_API SqlResult<std::string> ToSql() const;

    /// Renders the statement as a fragment, for use as a subquery, INSERT source or UNION part.
    [[nodiscard]] SQLITE3BUILDER_API SqlResult<std::string> Query() const;

    /// Renders the statement wrapped in parentheses.
    [[nodiscard]] SQLITE3BUILDER_API SqlResult<std::string> SubQuery() const;

    /// Renders the statement wrapped in parentheses, followed by `AS name`.
    [[nodiscard]] SQLITE3BUILDER_API SqlResult<std::string> SubQueryAs(std::string_view name) const;

    /// Renders `SELECT[ DISTINCT] fields` without a FROM clause, for selecting plain values.
    ///
    /// Fails with SqlError::NO_VALUES if no field was given.
    [[nodiscard]] SQLITE3BUILDER_API SqlResult<std::string> QueryValues() const;

    /// Retrieves the accumulated clause state.
    [[nodiscard]] SqlStatementState const& State() const noexcept
    {
        return m_state;
    }

    SQLITE3BUILDER_FORCE_INLINE std::vector<std::string>& WhereConditions() noexcept
    {
        return m_state.wheres;
    }

  private:
    SqlQueryBuilder(SqlStatementKind kind, std::string_view table);

    SQLITE3BUILDER_API SqlQueryBuilder& AddValues(std::string tuple);
    SQLITE3BUILDER_API SqlQueryBuilder& AddJoin(std::string table);
    SQLITE3BUILDER_API SqlQueryBuilder& AddJoinConstraint(std::string constraint);

    SqlStatementState m_state;

    // Join modifiers, consumed by the next Join() call.
    bool m_nextJoinNatural = false;
    SqlJoinType m_nextJoinType = SqlJoinType::Plain;
};

template <typename Record>
inline SqlQueryBuilder& SqlQueryBuilder::Fields()
{
    Reflection::EnumerateMembers<Record>(
        [&]<size_t FieldIndex, typename FieldType>() { Field(Reflection::MemberNameOf<FieldIndex, Record>); });
    return *this;
}
