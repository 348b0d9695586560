// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../SqlQuoting.hpp"
#include "Core.hpp"

#include <initializer_list>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>

namespace detail
{

/// Helper CRTP-based class for building WHERE clauses.
///
/// Every AndWhere* call pushes a new, independent condition.
/// Every OrWhere* call extends the most recently pushed condition with " OR ...",
/// so that each pushed condition forms one OR-chain. The OR-chains are AND-ed
/// when the statement is rendered.
///
/// The derived class must provide `std::vector<std::string>& WhereConditions() noexcept`.
///
/// @see SqlQueryBuilder
template <typename Derived>
class SqlWhereClauseBuilder
{
  public:
    /// Where the `%` wildcard goes in a LIKE mask.
    enum class LikeAnchor : uint8_t
    {
        None,   //!< mask as given
        Prefix, //!< mask followed by `%`
        Suffix, //!< `%` followed by mask
        Any,    //!< `%` on both sides
    };

    /// Pushes a raw condition as a new AND-ed entry.
    Derived& AndWhere(SqlFragment auto const& condition)
    {
        return Append(WhereJunctor::And, ToSqlFragment(condition));
    }

    /// Extends the last condition with a raw OR-ed condition.
    Derived& OrWhere(SqlFragment auto const& condition)
    {
        return Append(WhereJunctor::Or, ToSqlFragment(condition));
    }

    // {{{ comparisons
    Derived& AndWhereEq(SqlFragment auto const& field, SqlFragment auto const& value)
    {
        return AppendBinary(WhereJunctor::And, field, "=", value);
    }

    Derived& AndWhereNe(SqlFragment auto const& field, SqlFragment auto const& value)
    {
        return AppendBinary(WhereJunctor::And, field, "<>", value);
    }

    Derived& AndWhereGt(SqlFragment auto const& field, SqlFragment auto const& value)
    {
        return AppendBinary(WhereJunctor::And, field, ">", value);
    }

    Derived& AndWhereGe(SqlFragment auto const& field, SqlFragment auto const& value)
    {
        return AppendBinary(WhereJunctor::And, field, ">=", value);
    }

    Derived& AndWhereLt(SqlFragment auto const& field, SqlFragment auto const& value)
    {
        return AppendBinary(WhereJunctor::And, field, "<", value);
    }

    Derived& AndWhereLe(SqlFragment auto const& field, SqlFragment auto const& value)
    {
        return AppendBinary(WhereJunctor::And, field, "<=", value);
    }

    Derived& OrWhereEq(SqlFragment auto const& field, SqlFragment auto const& value)
    {
        return AppendBinary(WhereJunctor::Or, field, "=", value);
    }

    Derived& OrWhereNe(SqlFragment auto const& field, SqlFragment auto const& value)
    {
        return AppendBinary(WhereJunctor::Or, field, "<>", value);
    }

    Derived& OrWhereGt(SqlFragment auto const& field, SqlFragment auto const& value)
    {
        return AppendBinary(WhereJunctor::Or, field, ">", value);
    }

    Derived& OrWhereGe(SqlFragment auto const& field, SqlFragment auto const& value)
    {
        return AppendBinary(WhereJunctor::Or, field, ">=", value);
    }

    Derived& OrWhereLt(SqlFragment auto const& field, SqlFragment auto const& value)
    {
        return AppendBinary(WhereJunctor::Or, field, "<", value);
    }

    Derived& OrWhereLe(SqlFragment auto const& field, SqlFragment auto const& value)
    {
        return AppendBinary(WhereJunctor::Or, field, "<=", value);
    }
    // }}}

    // {{{ LIKE masks
    //
    // The mask is escaped and rendered as a string literal.

    Derived& AndWhereLike(SqlFragment auto const& field, std::string_view mask)
    {
        return AppendLike(WhereJunctor::And, field, "LIKE", mask, LikeAnchor::None);
    }

    /// Prefix match: `field LIKE 'mask%'`.
    Derived& AndWhereLikeLeft(SqlFragment auto const& field, std::string_view mask)
    {
        return AppendLike(WhereJunctor::And, field, "LIKE", mask, LikeAnchor::Prefix);
    }

    /// Suffix match: `field LIKE '%mask'`.
    Derived& AndWhereLikeRight(SqlFragment auto const& field, std::string_view mask)
    {
        return AppendLike(WhereJunctor::And, field, "LIKE", mask, LikeAnchor::Suffix);
    }

    /// Substring match: `field LIKE '%mask%'`.
    Derived& AndWhereLikeAny(SqlFragment auto const& field, std::string_view mask)
    {
        return AppendLike(WhereJunctor::And, field, "LIKE", mask, LikeAnchor::Any);
    }

    Derived& AndWhereNotLike(SqlFragment auto const& field, std::string_view mask)
    {
        return AppendLike(WhereJunctor::And, field, "NOT LIKE", mask, LikeAnchor::None);
    }

    Derived& AndWhereNotLikeLeft(SqlFragment auto const& field, std::string_view mask)
    {
        return AppendLike(WhereJunctor::And, field, "NOT LIKE", mask, LikeAnchor::Prefix);
    }

    Derived& AndWhereNotLikeRight(SqlFragment auto const& field, std::string_view mask)
    {
        return AppendLike(WhereJunctor::And, field, "NOT LIKE", mask, LikeAnchor::Suffix);
    }

    Derived& AndWhereNotLikeAny(SqlFragment auto const& field, std::string_view mask)
    {
        return AppendLike(WhereJunctor::And, field, "NOT LIKE", mask, LikeAnchor::Any);
    }

    Derived& OrWhereLike(SqlFragment auto const& field, std::string_view mask)
    {
        return AppendLike(WhereJunctor::Or, field, "LIKE", mask, LikeAnchor::None);
    }

    Derived& OrWhereLikeLeft(SqlFragment auto const& field, std::string_view mask)
    {
        return AppendLike(WhereJunctor::Or, field, "LIKE", mask, LikeAnchor::Prefix);
    }

    Derived& OrWhereLikeRight(SqlFragment auto const& field, std::string_view mask)
    {
        return AppendLike(WhereJunctor::Or, field, "LIKE", mask, LikeAnchor::Suffix);
    }

    Derived& OrWhereLikeAny(SqlFragment auto const& field, std::string_view mask)
    {
        return AppendLike(WhereJunctor::Or, field, "LIKE", mask, LikeAnchor::Any);
    }

    Derived& OrWhereNotLike(SqlFragment auto const& field, std::string_view mask)
    {
        return AppendLike(WhereJunctor::Or, field, "NOT LIKE", mask, LikeAnchor::None);
    }

    Derived& OrWhereNotLikeLeft(SqlFragment auto const& field, std::string_view mask)
    {
        return AppendLike(WhereJunctor::Or, field, "NOT LIKE", mask, LikeAnchor::Prefix);
    }

    Derived& OrWhereNotLikeRight(SqlFragment auto const& field, std::string_view mask)
    {
        return AppendLike(WhereJunctor::Or, field, "NOT LIKE", mask, LikeAnchor::Suffix);
    }

    Derived& OrWhereNotLikeAny(SqlFragment auto const& field, std::string_view mask)
    {
        return AppendLike(WhereJunctor::Or, field, "NOT LIKE", mask, LikeAnchor::Any);
    }
    // }}}

    // {{{ NULL tests
    Derived& AndWhereIsNull(SqlFragment auto const& field)
    {
        return Append(WhereJunctor::And, ToSqlFragment(field) + " IS NULL");
    }

    Derived& AndWhereIsNotNull(SqlFragment auto const& field)
    {
        return Append(WhereJunctor::And, ToSqlFragment(field) + " IS NOT NULL");
    }

    Derived& OrWhereIsNull(SqlFragment auto const& field)
    {
        return Append(WhereJunctor::Or, ToSqlFragment(field) + " IS NULL");
    }

    Derived& OrWhereIsNotNull(SqlFragment auto const& field)
    {
        return Append(WhereJunctor::Or, ToSqlFragment(field) + " IS NOT NULL");
    }
    // }}}

    // {{{ IN lists and sub-selects
    template <SqlFragmentList InputRange>
    Derived& AndWhereIn(SqlFragment auto const& field, InputRange const& list)
    {
        return AppendIn(WhereJunctor::And, field, "IN", JoinSqlFragments(list, ", "));
    }

    template <SqlFragment T>
    Derived& AndWhereIn(SqlFragment auto const& field, std::initializer_list<T> const& list)
    {
        return AppendIn(WhereJunctor::And, field, "IN", JoinSqlFragments(list, ", "));
    }

    template <SqlFragmentList InputRange>
    Derived& AndWhereNotIn(SqlFragment auto const& field, InputRange const& list)
    {
        return AppendIn(WhereJunctor::And, field, "NOT IN", JoinSqlFragments(list, ", "));
    }

    template <SqlFragment T>
    Derived& AndWhereNotIn(SqlFragment auto const& field, std::initializer_list<T> const& list)
    {
        return AppendIn(WhereJunctor::And, field, "NOT IN", JoinSqlFragments(list, ", "));
    }

    /// Tests against the result of a sub-select, given as a query fragment (see SqlQueryBuilder::Query()).
    Derived& AndWhereInQuery(SqlFragment auto const& field, SqlFragment auto const& query)
    {
        return AppendIn(WhereJunctor::And, field, "IN", ToSqlFragment(query));
    }

    Derived& AndWhereNotInQuery(SqlFragment auto const& field, SqlFragment auto const& query)
    {
        return AppendIn(WhereJunctor::And, field, "NOT IN", ToSqlFragment(query));
    }

    template <SqlFragmentList InputRange>
    Derived& OrWhereIn(SqlFragment auto const& field, InputRange const& list)
    {
        return AppendIn(WhereJunctor::Or, field, "IN", JoinSqlFragments(list, ", "));
    }

    template <SqlFragment T>
    Derived& OrWhereIn(SqlFragment auto const& field, std::initializer_list<T> const& list)
    {
        return AppendIn(WhereJunctor::Or, field, "IN", JoinSqlFragments(list, ", "));
    }

    template <SqlFragmentList InputRange>
    Derived& OrWhereNotIn(SqlFragment auto const& field, InputRange const& list)
    {
        return AppendIn(WhereJunctor::Or, field, "NOT IN", JoinSqlFragments(list, ", "));
    }

    template <SqlFragment T>
    Derived& OrWhereNotIn(SqlFragment auto const& field, std::initializer_list<T> const& list)
    {
        return AppendIn(WhereJunctor::Or, field, "NOT IN", JoinSqlFragments(list, ", "));
    }

    Derived& OrWhereInQuery(SqlFragment auto const& field, SqlFragment auto const& query)
    {
        return AppendIn(WhereJunctor::Or, field, "IN", ToSqlFragment(query));
    }

    Derived& OrWhereNotInQuery(SqlFragment auto const& field, SqlFragment auto const& query)
    {
        return AppendIn(WhereJunctor::Or, field, "NOT IN", ToSqlFragment(query));
    }
    // }}}

    // {{{ ranges
    Derived& AndWhereBetween(SqlFragment auto const& field, SqlFragment auto const& min, SqlFragment auto const& max)
    {
        return AppendBetween(WhereJunctor::And, field, "BETWEEN", min, max);
    }

    Derived& AndWhereNotBetween(SqlFragment auto const& field,
                                SqlFragment auto const& min,
                                SqlFragment auto const& max)
    {
        return AppendBetween(WhereJunctor::And, field, "NOT BETWEEN", min, max);
    }

    Derived& OrWhereBetween(SqlFragment auto const& field, SqlFragment auto const& min, SqlFragment auto const& max)
    {
        return AppendBetween(WhereJunctor::Or, field, "BETWEEN", min, max);
    }

    Derived& OrWhereNotBetween(SqlFragment auto const& field,
                               SqlFragment auto const& min,
                               SqlFragment auto const& max)
    {
        return AppendBetween(WhereJunctor::Or, field, "NOT BETWEEN", min, max);
    }
    // }}}

  private:
    enum class WhereJunctor : uint8_t
    {
        And,
        Or,
    };

    Derived& Append(WhereJunctor junctor, std::string condition);

    template <SqlFragment Field, SqlFragment Value>
    Derived& AppendBinary(WhereJunctor junctor, Field const& field, std::string_view op, Value const& value);

    template <SqlFragment Field>
    Derived& AppendLike(
        WhereJunctor junctor, Field const& field, std::string_view op, std::string_view mask, LikeAnchor anchor);

    template <SqlFragment Field>
    Derived& AppendIn(WhereJunctor junctor, Field const& field, std::string_view op, std::string_view list);

    template <SqlFragment Field, SqlFragment Min, SqlFragment Max>
    Derived& AppendBetween(
        WhereJunctor junctor, Field const& field, std::string_view op, Min const& min, Max const& max);

    std::vector<std::string>& Conditions() noexcept
    {
        return static_cast<Derived&>(*this).WhereConditions();
    }
};

template <typename Derived>
Derived& SqlWhereClauseBuilder<Derived>::Append(WhereJunctor junctor, std::string condition)
{
    auto& conditions = Conditions();

    if (junctor == WhereJunctor::Or && !conditions.empty())
    {
        conditions.back() += " OR ";
        conditions.back() += condition;
    }
    else
        conditions.emplace_back(std::move(condition));

    return static_cast<Derived&>(*this);
}

template <typename Derived>
template <SqlFragment Field, SqlFragment Value>
inline Derived& SqlWhereClauseBuilder<Derived>::AppendBinary(WhereJunctor junctor,
                                                             Field const& field,
                                                             std::string_view op,
                                                             Value const& value)
{
    std::string condition = ToSqlFragment(field);
    condition += ' ';
    condition += op;
    condition += ' ';
    condition += ToSqlFragment(value);
    return Append(junctor, std::move(condition));
}

template <typename Derived>
template <SqlFragment Field>
inline Derived& SqlWhereClauseBuilder<Derived>::AppendLike(
    WhereJunctor junctor, Field const& field, std::string_view op, std::string_view mask, LikeAnchor anchor)
{
    std::string condition = ToSqlFragment(field);
    condition += ' ';
    condition += op;
    condition += " '";
    if (anchor == LikeAnchor::Suffix || anchor == LikeAnchor::Any)
        condition += '%';
    condition += SqlEscape(mask);
    if (anchor == LikeAnchor::Prefix || anchor == LikeAnchor::Any)
        condition += '%';
    condition += '\'';
    return Append(junctor, std::move(condition));
}

template <typename Derived>
template <SqlFragment Field>
inline Derived& SqlWhereClauseBuilder<Derived>::AppendIn(WhereJunctor junctor,
                                                         Field const& field,
                                                         std::string_view op,
                                                         std::string_view list)
{
    return Append(junctor, std::format("{} {} ({})", ToSqlFragment(field), op, list));
}

template <typename Derived>
template <SqlFragment Field, SqlFragment Min, SqlFragment Max>
inline Derived& SqlWhereClauseBuilder<Derived>::AppendBetween(
    WhereJunctor junctor, Field const& field, std::string_view op, Min const& min, Max const& max)
{
    return Append(junctor,
                  std::format("{} {} {} AND {}", ToSqlFragment(field), op, ToSqlFragment(min), ToSqlFragment(max)));
}

} // namespace detail
