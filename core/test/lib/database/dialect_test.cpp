#include <gtest/gtest.h>

#include <array>

#include "database_iface.hpp"
#include "dialect.hpp"

using namespace sqlflow;

TEST(DialectTest, RewriteNamedParameters) {
  std::vector<std::string> names{"id", "name"};
  {
    SCOPED_TRACE("Declaration order");
    auto positional = database::rewriteNamedParameters(
        "select * from t where id = @id and name = @name", names);
    EXPECT_EQ(positional.text, "select * from t where id = $1 and name = $2");
    EXPECT_EQ(positional.names, names);
  }
  {
    SCOPED_TRACE("Numbered by first use, repeated name keeps its number");
    auto positional =
        database::rewriteNamedParameters("select @name, @id, @name", names);
    EXPECT_EQ(positional.text, "select $1, $2, $1");
    EXPECT_EQ(positional.names, (std::vector<std::string>{"name", "id"}));
  }
  {
    SCOPED_TRACE("Literals, comments and @@ are untouched");
    auto positional = database::rewriteNamedParameters(
        "select '@id', \"@name\", @@x -- @id\n, @id /* @name */", names);
    EXPECT_EQ(positional.text,
              "select '@id', \"@name\", @@x -- @id\n, $1 /* @name */");
    EXPECT_EQ(positional.names, (std::vector<std::string>{"id"}));
  }
}

TEST(DialectTest, RewriteBindsOnlyReferencedParameters) {
  std::vector<std::string> names{"a", "b"};
  {
    SCOPED_TRACE("None referenced");
    auto positional =
        database::rewriteNamedParameters("select count(*) from t", names);
    EXPECT_EQ(positional.text, "select count(*) from t");
    EXPECT_TRUE(positional.names.empty());
  }
  {
    SCOPED_TRACE("Only the second one referenced");
    auto positional =
        database::rewriteNamedParameters("select * from t where b = @b", names);
    EXPECT_EQ(positional.text, "select * from t where b = $1");
    EXPECT_EQ(positional.names, (std::vector<std::string>{"b"}));
  }
}

TEST(DialectTest, RewriteUnknownParameterThrows) {
  try {
    database::rewriteNamedParameters("select @missing", {"id"});
    FAIL() << "Expected DatabaseError";
  } catch (const database::DatabaseError &e) {
    EXPECT_EQ(e.sqlState(), "42P02");
  }
}

TEST(DialectTest, ProcedureCall) {
  EXPECT_EQ(database::procedureCall("add_user", {"login", "age"}),
            "select * from add_user(login => $1, age => $2)");
  EXPECT_EQ(database::procedureCall("now_utc", {}), "select * from now_utc()");
  EXPECT_EQ(database::tableDirect("users"), "select * from users");
}

TEST(DialectTest, ConnectionString) {
  database::ConnectionSettings settings;
  settings.databaseName = "shop";
  settings.userName = "o'neil";
  auto conn = database::connectionString(settings);
  EXPECT_EQ(conn, "host='localhost' port=5432 dbname='shop' "
                  "user='o\\'neil' connect_timeout=30 "
                  "application_name='sqlflow'");
}

TEST(DialectTest, DecodeHexSlice) {
  std::string_view hex = "\\x0102030405";
  EXPECT_EQ(database::hexSliceLength(hex), 5);
  std::array<std::byte, 2> buffer{};
  {
    SCOPED_TRACE("Head");
    ASSERT_EQ(database::decodeHexSlice(hex, 0, buffer), 2);
    EXPECT_EQ(buffer[0], std::byte{0x01});
    EXPECT_EQ(buffer[1], std::byte{0x02});
  }
  {
    SCOPED_TRACE("Tail shorter than buffer");
    ASSERT_EQ(database::decodeHexSlice(hex, 4, buffer), 1);
    EXPECT_EQ(buffer[0], std::byte{0x05});
  }
  {
    SCOPED_TRACE("Past the end");
    EXPECT_EQ(database::decodeHexSlice(hex, 5, buffer), 0);
  }
}

TEST(DialectTest, DecodeRejectsNonHexFormat) {
  std::array<std::byte, 4> buffer{};
  EXPECT_THROW(database::decodeHexSlice("\\001", 0, buffer),
               database::DatabaseError);
  EXPECT_THROW(database::decodeHexSlice("\\x0g", 0, buffer),
               database::DatabaseError);
}

TEST(DialectTest, QuoteIdentifier) {
  EXPECT_EQ(database::quoteIdentifier("payload"), "\"payload\"");
  EXPECT_EQ(database::quoteIdentifier("odd\"name"), "\"odd\"\"name\"");
}

TEST(DialectTest, StreamQueries) {
  EXPECT_EQ(database::streamMaterialize("select * from files where id = $1"),
            "create temporary table sqlflow_stream on commit drop as "
            "select row_number() over () as sqlflow_row, src.* from "
            "(select * from files where id = $1) as src");
  EXPECT_EQ(database::streamDescribe(), "select * from sqlflow_stream limit 0");

  std::vector<database::StreamColumn> columns{{"id", false},
                                              {"payload", true}};
  EXPECT_EQ(database::streamRow(columns),
            "select \"id\", null::bytea as \"payload\" from sqlflow_stream "
            "where sqlflow_row = $1");
  EXPECT_EQ(database::streamSlice(columns[1]),
            "select substring(\"payload\" from $1::integer + 1 "
            "for $2::integer) from sqlflow_stream where sqlflow_row = $3");
  EXPECT_EQ(database::streamSlice(columns[0]),
            "select substring(convert_to(\"id\"::text, 'UTF8') from "
            "$1::integer + 1 for $2::integer) from sqlflow_stream "
            "where sqlflow_row = $3");
  EXPECT_EQ(database::streamValue(columns[1]),
            "select \"payload\" from sqlflow_stream where sqlflow_row = $1");
}
