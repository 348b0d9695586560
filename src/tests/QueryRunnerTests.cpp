// SPDX-License-Identifier: Apache-2.0

#include "Utils.hpp"

#include "../Sqlite3Builder/SqlQuery.hpp"
#include "../Sqlite3Builder/SqlQueryRunner.hpp"
#include "../Sqlite3Builder/SqlQuoting.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <vector>

TEST_CASE_METHOD(SqlTestFixture, "SqlQueryRunner.GetRows", "[SqlQueryRunner]")
{
    CreateBooksTable();
    auto runner = SqlQueryRunner { Connection() };

    auto const rows = runner.GetRows(
        SqlQueryBuilder::SelectFrom("books").Fields("id", "title").AndWhereLikeLeft("title", "Harry Potter").OrderBy("id"));
    REQUIRE(rows);
    REQUIRE(rows->size() == 2);
    CHECK(rows->at(0) == SqlJsonRow { 1, "Harry Potter and the Philosopher's Stone" });
    CHECK(rows->at(1) == SqlJsonRow { 2, "Harry Potter and the Chamber of Secrets" });

    auto const none = runner.GetRows(SqlQueryBuilder::SelectFrom("books").AndWhereGt("price", 1000));
    REQUIRE(none);
    CHECK(none->empty());
}

TEST_CASE_METHOD(SqlTestFixture, "SqlQueryRunner.GetRow", "[SqlQueryRunner]")
{
    CreateBooksTable();
    auto runner = SqlQueryRunner { Connection() };

    auto const row =
        runner.GetRow(SqlQueryBuilder::SelectFrom("books").Fields("title", "price").OrderDesc("price").Limit(1));
    REQUIRE(row);
    CHECK(*row == SqlJsonRow { "Don Quixote", 200 });

    // No result row yields an empty row.
    auto const empty = runner.GetRow(SqlQueryBuilder::SelectFrom("books").AndWhereEq("id", 99));
    REQUIRE(empty);
    CHECK(empty->empty());
}

TEST_CASE_METHOD(SqlTestFixture, "SqlQueryRunner.GetValue", "[SqlQueryRunner]")
{
    CreateBooksTable();
    auto runner = SqlQueryRunner { Connection() };

    auto const value = runner.GetValue(SqlQueryBuilder::SelectFrom("books").Field("comment").AndWhereEq("id", 2));
    REQUIRE(value);
    CHECK(*value == "second");

    auto const null = runner.GetValue(SqlQueryBuilder::SelectFrom("books").Field("comment").AndWhereEq("id", 1));
    REQUIRE(null);
    CHECK(null->is_null());

    auto const missing = runner.GetValue(SqlQueryBuilder::SelectFrom("books").Field("comment").AndWhereEq("id", 99));
    REQUIRE(!missing);
    CHECK(missing.error() == SqlError::NODATA);
}

TEST_CASE_METHOD(SqlTestFixture, "SqlQueryRunner.GetInt", "[SqlQueryRunner]")
{
    CreateBooksTable();
    auto runner = SqlQueryRunner { Connection() };

    CHECK(runner.GetInt(SqlQueryBuilder::SelectFrom("books").Field("price").AndWhereEq("title", SqlQuote("Don Quixote")))
          == int64_t { 200 });

    auto const mismatch = runner.GetInt(SqlQueryBuilder::SelectFrom("books").Field("title").AndWhereEq("id", 3));
    REQUIRE(!mismatch);
    CHECK(mismatch.error() == SqlError::UNSUPPORTED_TYPE);

    auto const null = runner.GetInt(SqlQueryBuilder::SelectFrom("books").Field("comment").AndWhereEq("id", 3));
    REQUIRE(!null);
    CHECK(null.error() == SqlError::UNSUPPORTED_TYPE);
}

TEST_CASE_METHOD(SqlTestFixture, "SqlQueryRunner.GetString", "[SqlQueryRunner]")
{
    CreateBooksTable();
    auto runner = SqlQueryRunner { Connection() };

    CHECK(runner.GetString(SqlQueryBuilder::SelectFrom("books").Field("title").AndWhereEq("id", 4))
          == std::string("In Search of Lost Time"));

    auto const mismatch = runner.GetString(SqlQueryBuilder::SelectFrom("books").Field("price").AndWhereEq("id", 4));
    REQUIRE(!mismatch);
    CHECK(mismatch.error() == SqlError::UNSUPPORTED_TYPE);
}

TEST_CASE_METHOD(SqlTestFixture, "SqlQueryRunner.ValuesFollowTheCell", "[SqlQueryRunner]")
{
    CreateBooksTable();
    auto runner = SqlQueryRunner { Connection() };

    // An INTEGER column keeps values that are no integers with their own type.
    REQUIRE(runner.Execute(SqlQueryBuilder::UpdateTable("books").Set("price", "12.5").AndWhereEq("id", 1)));
    REQUIRE(runner.Execute(SqlQueryBuilder::UpdateTable("books").SetString("price", "free").AndWhereEq("id", 2)));

    CHECK(runner.GetString(SqlQueryBuilder::SelectFrom("books").Field("price").AndWhereEq("id", 2))
          == std::string("free"));
    CHECK(runner.GetInt(SqlQueryBuilder::SelectFrom("books").Field("price").AndWhereEq("id", 3)) == int64_t { 200 });

    auto const _ = ScopedSqlNullLogger {};
    auto const real = runner.GetValue(SqlQueryBuilder::SelectFrom("books").Field("price").AndWhereEq("id", 1));
    REQUIRE(!real);
    CHECK(real.error() == SqlError::UNSUPPORTED_TYPE);

    auto const rows = runner.GetRows(SqlQueryBuilder::SelectFrom("books").Field("price").OrderBy("id"));
    REQUIRE(!rows);
    CHECK(rows.error() == SqlError::UNSUPPORTED_TYPE);
}

TEST_CASE_METHOD(SqlTestFixture, "SqlQueryRunner.Expressions", "[SqlQueryRunner]")
{
    CreateBooksTable();
    auto runner = SqlQueryRunner { Connection() };

    CHECK(runner.GetInt(SqlQueryBuilder::SelectFrom("books").Field("price + 1").AndWhereEq("id", 3))
          == int64_t { 201 });
    CHECK(runner.GetString(SqlQueryBuilder::SelectFrom("books").Field("title || '!'").AndWhereEq("id", 3))
          == std::string("Don Quixote!"));
    CHECK(runner.GetInt(SqlQueryBuilder::SelectFrom("books").Field("MAX(price)")) == int64_t { 200 });
}

TEST_CASE_METHOD(SqlTestFixture, "SqlQueryRunner.CountThenFetch", "[SqlQueryRunner]")
{
    CreateBooksTable();
    auto runner = SqlQueryRunner { Connection() };

    // The same filter first counts the matches, then retrieves them.
    auto query = SqlQueryBuilder::SelectFrom("books").AndWhereLikeLeft("title", "Harry Potter");
    CHECK(runner.GetInt(query.SetField("COUNT(*)")) == int64_t { 2 });

    auto const rows = runner.GetRows(query.SetFields({ "id", "price" }).OrderBy("id"));
    REQUIRE(rows);
    CHECK(*rows == SqlJsonRows { { 1, 80 }, { 2, 120 } });

    CHECK(runner.GetInt(query.SetField("COUNT(*)")) == int64_t { 2 });
}

TEST_CASE_METHOD(SqlTestFixture, "SqlQueryRunner.GetCursor", "[SqlQueryRunner]")
{
    CreateBooksTable();
    auto runner = SqlQueryRunner { Connection() };

    auto cursor = runner.GetCursor(SqlQueryBuilder::SelectFrom("books").Field("id").OrderDesc("id"));
    REQUIRE(cursor);
    CHECK(cursor->NumColumnsAffected() == 1);

    std::vector<int64_t> ids;
    while (true)
    {
        auto const fetched = cursor->FetchRow();
        REQUIRE(fetched);
        if (!*fetched)
            break;
        auto const id = cursor->GetColumnValue(1);
        REQUIRE(id);
        ids.emplace_back(id->get<int64_t>());
    }
    CHECK(ids == std::vector<int64_t> { 4, 3, 2, 1 });
}

TEST_CASE_METHOD(SqlTestFixture, "SqlQueryRunner.RenderErrors", "[SqlQueryRunner]")
{
    auto runner = SqlQueryRunner { Connection() };

    // Render errors are reported before the database is involved.
    auto const noTable = runner.GetRows(SqlQueryBuilder::SelectFrom(""));
    REQUIRE(!noTable);
    CHECK(noTable.error() == SqlError::NO_TABLE_NAME);

    auto const noValues = runner.Execute(SqlQueryBuilder::InsertInto("books"));
    REQUIRE(!noValues);
    CHECK(noValues.error() == SqlError::NO_VALUES);

    auto const noSetFields = runner.Execute(SqlQueryBuilder::UpdateTable("books"));
    REQUIRE(!noSetFields);
    CHECK(noSetFields.error() == SqlError::NO_SET_FIELDS);
}

TEST_CASE_METHOD(SqlTestFixture, "SqlQueryRunner.DatabaseErrors", "[SqlQueryRunner]")
{
    auto const _ = ScopedSqlNullLogger {};
    auto runner = SqlQueryRunner { Connection() };

    auto const result = runner.GetRows(SqlQueryBuilder::SelectFrom("no_such_table"));
    REQUIRE(!result);
    CHECK(result.error() == SqlError::FAILURE);
}

TEST_CASE_METHOD(SqlTestFixture, "SqlQueryRunner.Insert", "[SqlQueryRunner]")
{
    CreateBooksTable();
    auto runner = SqlQueryRunner { Connection() };

    REQUIRE(runner.Execute(SqlQueryBuilder::InsertInto("books")
                               .Fields("id", "title", "price")
                               .Values({ "5", "'War and Peace'", "90" })
                               .Values(6, SqlQuote("Moby Dick"), 60)));

    auto const rows =
        runner.GetRows(SqlQueryBuilder::SelectFrom("books").Fields("title", "price").AndWhereGe("id", 5).OrderBy("id"));
    REQUIRE(rows);
    CHECK(*rows == SqlJsonRows { { "War and Peace", 90 }, { "Moby Dick", 60 } });
}

TEST_CASE_METHOD(SqlTestFixture, "SqlQueryRunner.InsertSelect", "[SqlQueryRunner]")
{
    CreateBooksTable();
    ExecuteDirect("CREATE TABLE warehouse (title VARCHAR(100) NOT NULL, preliminary_price INTEGER)");
    ExecuteDirect("INSERT INTO warehouse (title, preliminary_price) VALUES ('Ulysses', 50), ('Hamlet', 20)");

    auto runner = SqlQueryRunner { Connection() };
    auto const source =
        SqlQueryBuilder::SelectFrom("warehouse").Fields("title", "preliminary_price * 2").OrderBy("title").Query();
    REQUIRE(source);
    REQUIRE(runner.Execute(SqlQueryBuilder::InsertInto("books").Fields("title", "price").Select(*source)));

    auto const rows = runner.GetRows(
        SqlQueryBuilder::SelectFrom("books").Fields("title", "price").AndWhereIn("title", { "'Ulysses'", "'Hamlet'" }).OrderBy("price"));
    REQUIRE(rows);
    CHECK(*rows == SqlJsonRows { { "Hamlet", 40 }, { "Ulysses", 100 } });
}

TEST_CASE_METHOD(SqlTestFixture, "SqlQueryRunner.Update", "[SqlQueryRunner]")
{
    CreateBooksTable();
    auto runner = SqlQueryRunner { Connection() };

    REQUIRE(runner.Execute(SqlQueryBuilder::UpdateTable("books")
                               .Set("price", 0)
                               .Set("title", "'[SOLD!]' || title")
                               .AndWhereLikeLeft("title", "Harry Potter")));

    auto const rows =
        runner.GetRows(SqlQueryBuilder::SelectFrom("books").Fields("title", "price").AndWhereEq("price", 0).OrderBy("id"));
    REQUIRE(rows);
    CHECK(*rows
          == SqlJsonRows { { "[SOLD!]Harry Potter and the Philosopher's Stone", 0 },
                           { "[SOLD!]Harry Potter and the Chamber of Secrets", 0 } });
}

TEST_CASE_METHOD(SqlTestFixture, "SqlQueryRunner.Delete", "[SqlQueryRunner]")
{
    CreateBooksTable();
    auto runner = SqlQueryRunner { Connection() };

    REQUIRE(runner.Execute(SqlQueryBuilder::DeleteFrom("books").AndWhere("price > 100")));

    auto const rows = runner.GetRows(SqlQueryBuilder::SelectFrom("books").Field("id"));
    REQUIRE(rows);
    CHECK(*rows == SqlJsonRows { { 1 } });
}

TEST_CASE_METHOD(SqlTestFixture, "SqlQueryRunner.Join", "[SqlQueryRunner]")
{
    CreateBooksTable();
    ExecuteDirect("CREATE TABLE warehouse (book_id INTEGER NOT NULL, stock INTEGER NOT NULL)");
    ExecuteDirect("INSERT INTO warehouse (book_id, stock) VALUES (1, 7), (3, 2)");

    auto runner = SqlQueryRunner { Connection() };

    auto const inner = runner.GetRows(SqlQueryBuilder::SelectFrom("books AS b")
                                          .Fields("b.id", "w.stock")
                                          .Join("warehouse AS w", "INNER", "ON b.id = w.book_id")
                                          .OrderBy("b.id"));
    REQUIRE(inner);
    CHECK(*inner == SqlJsonRows { { 1, 7 }, { 3, 2 } });

    auto const left = runner.GetRows(SqlQueryBuilder::SelectFrom("books AS b")
                                         .Fields("b.id", "w.stock")
                                         .Left()
                                         .Join("warehouse AS w")
                                         .OnEq("b.id", "w.book_id")
                                         .OrderBy("b.id"));
    REQUIRE(left);
    CHECK(*left == SqlJsonRows { { 1, 7 }, { 2, nullptr }, { 3, 2 }, { 4, nullptr } });
}

TEST_CASE_METHOD(SqlTestFixture, "SqlQueryRunner.SubSelects", "[SqlQueryRunner]")
{
    CreateBooksTable();
    ExecuteDirect("CREATE TABLE warehouse (book_id INTEGER NOT NULL, stock INTEGER NOT NULL)");
    ExecuteDirect("INSERT INTO warehouse (book_id, stock) VALUES (2, 1), (4, 5)");

    auto runner = SqlQueryRunner { Connection() };
    auto const stocked = SqlQueryBuilder::SelectFrom("warehouse").Field("book_id").Query();
    REQUIRE(stocked);

    auto const inStock =
        runner.GetRows(SqlQueryBuilder::SelectFrom("books").Field("id").AndWhereInQuery("id", *stocked).OrderBy("id"));
    REQUIRE(inStock);
    CHECK(*inStock == SqlJsonRows { { 2 }, { 4 } });

    auto const both = runner.GetRows(SqlQueryBuilder::SelectFrom("books")
                                         .Field("id")
                                         .AndWhereEq("id", 1)
                                         .UnionAll(SqlQueryBuilder::SelectFrom("books")
                                                       .Field("id")
                                                       .AndWhereBetween("id", 3, 4)
                                                       .Query()
                                                       .value()));
    REQUIRE(both);
    CHECK(both->size() == 3);
}
