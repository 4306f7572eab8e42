#include <gtest/gtest.h>

using namespace std::string_literals;

#include "command_assembler.hpp"
#include "errors.hpp"
#include "naming.hpp"

using namespace sqlflow;
using database::CommandKind;
using database::ParameterDirection;

namespace {
struct CommandAssemblerTest : ::testing::Test {
  CommandAssembler assembler{naming::snakeCase};
};
} // namespace

TEST_F(CommandAssemblerTest, TextCommandNormalizesNames) {
  assembler.createTextCommand("select * from users where user_id = @user_id",
                              {{"userId", int64_t(4)}});
  EXPECT_EQ(assembler.command().kind, CommandKind::Text);
  EXPECT_EQ(assembler.parameters().names(),
            (std::vector<std::string>{"user_id"}));
  EXPECT_EQ(assembler.describe(),
            "select * from users where user_id = @user_id");
}

TEST_F(CommandAssemblerTest, DuplicateParameterIsRejected) {
  assembler.createTextCommand("select @a", {{"a", int64_t(1)}});
  EXPECT_THROW(assembler.addParameter("a", int64_t(2)),
               DuplicateParameterError);
  ASSERT_EQ(assembler.parameters().size(), 1);
  EXPECT_EQ(std::get<int64_t>(*assembler.parameters().find("a")), 1);
}

TEST_F(CommandAssemblerTest, InsertRegeneratesWithoutAccumulating) {
  assembler.createInsertCommand("users", {{"login", "bob"s}});
  EXPECT_EQ(assembler.command().text,
            "insert into users (login) values (@login)");
  assembler.addParameter("age", int64_t(30));
  assembler.addParameter("city", "Paris"s);
  EXPECT_EQ(assembler.command().text,
            "insert into users (login, age, city) values "
            "(@login, @age, @city)");
  assembler.removeParameter("city");
  EXPECT_EQ(assembler.command().text,
            "insert into users (login, age) values (@login, @age)");
}

TEST_F(CommandAssemblerTest, UpdateKeepsSingleWhereClause) {
  assembler.createUpdateCommand("users", {{"login", "bob"s}}, "id = 5");
  assembler.addParameter("age", int64_t(31));
  assembler.addParameter("flag", true);
  EXPECT_EQ(assembler.command().text,
            "update users set login = @login, age = @age, flag = @flag "
            "where id = 5");
}

TEST_F(CommandAssemblerTest, InsertThenUpdateMergesFields) {
  assembler.createInsertCommand("t", {{"a", int64_t(1)}, {"b", int64_t(2)}});
  assembler.createUpdateCommand("t", {{"a", int64_t(3)}}, "id = 5");
  EXPECT_EQ(assembler.command().text,
            "update t set a = @a, b = @b where id = 5");
  EXPECT_EQ(std::get<int64_t>(*assembler.parameters().find("a")), 3);
  EXPECT_EQ(assembler.crudState().mode, CrudMode::Update);
}

TEST_F(CommandAssemblerTest, TextCommandLeavesCrudMode) {
  assembler.createInsertCommand("t", {{"a", int64_t(1)}});
  assembler.createTextCommand("select 1");
  assembler.addParameter("b", int64_t(2));
  EXPECT_EQ(assembler.command().text, "select 1");
  EXPECT_EQ(assembler.crudState().mode, CrudMode::None);
}

TEST_F(CommandAssemblerTest, RemoveNullAndBlank) {
  assembler.createInsertCommand("t", {{"a", std::monostate()},
                                      {"b", ""s},
                                      {"c", " "s},
                                      {"d", int64_t(0)}});
  {
    SCOPED_TRACE("Blank only");
    assembler.removeBlankParameters();
    EXPECT_EQ(assembler.parameters().names(),
              (std::vector<std::string>{"a", "c", "d"}));
  }
  {
    SCOPED_TRACE("Null only");
    assembler.removeNullParameters();
    EXPECT_EQ(assembler.parameters().names(),
              (std::vector<std::string>{"c", "d"}));
  }
  EXPECT_EQ(assembler.command().text, "insert into t (c, d) values (@c, @d)");
}

TEST_F(CommandAssemblerTest, RemoveNullAndBlankTogether) {
  assembler.createTextCommand("select 1", {{"a", std::monostate()},
                                           {"b", ""s},
                                           {"c", "x"s}});
  assembler.removeNullAndBlankParameters();
  EXPECT_EQ(assembler.parameters().names(), (std::vector<std::string>{"c"}));
}

TEST_F(CommandAssemblerTest, ProcedureCommand) {
  assembler.createProcedureCommand("add_user",
                                   {{"login", "bob"s}, {"age", int64_t(30)}});
  assembler.addOutputParameter("user_id", database::DbType::BigInt);
  EXPECT_EQ(assembler.command().kind, CommandKind::StoredProcedure);
  ASSERT_NE(assembler.returnValue(), nullptr);
  EXPECT_FALSE(assembler.returnValue()->populated);
  EXPECT_EQ(assembler.describe(),
            "exec add_user @login = 'bob', @age = 30, @user_id = NULL");

  assembler.bind();
  const auto &params = assembler.command().parameters;
  ASSERT_EQ(params.size(), 4);
  EXPECT_EQ(params[0].name, "login");
  EXPECT_EQ(params[1].name, "age");
  EXPECT_EQ(params[2].name, "user_id");
  EXPECT_EQ(params[2].direction, ParameterDirection::Output);
  EXPECT_EQ(params[2].type, database::DbType::BigInt);
  EXPECT_EQ(params[3].direction, ParameterDirection::ReturnValue);
}

TEST_F(CommandAssemblerTest, BindResetsReturnValue) {
  assembler.createProcedureCommand("f");
  assembler.bind();
  auto bound = assembler.command().find(CommandAssembler::kReturnValueName);
  ASSERT_NE(bound, nullptr);
  bound->value = int64_t(9);
  bound->populated = true;
  assembler.bind();
  ASSERT_NE(assembler.returnValue(), nullptr);
  EXPECT_FALSE(assembler.returnValue()->populated);
  EXPECT_TRUE(database::isNull(assembler.returnValue()->value));
}

TEST_F(CommandAssemblerTest, TextCommandHasNoReturnValue) {
  assembler.createTextCommand("select 1");
  assembler.bind();
  EXPECT_EQ(assembler.returnValue(), nullptr);
}

TEST_F(CommandAssemblerTest, OutputParameterLookup) {
  assembler.createProcedureCommand("f");
  EXPECT_THROW(assembler.outputParameter("nope"), MissingOutputParameterError);
  assembler.addOutputParameter("total", database::DbType::Integer);
  assembler.bind();
  auto bound = assembler.command().find("total");
  ASSERT_NE(bound, nullptr);
  bound->value = int32_t(12);
  bound->populated = true;
  EXPECT_EQ(std::get<int32_t>(assembler.outputParameter("total").value), 12);
}

TEST_F(CommandAssemblerTest, ConstCommandLookup) {
  assembler.createTextCommand("select @a, @b", {{"a", int64_t(1)}, {"b", "x"s}});
  assembler.bind();
  const CommandAssembler &view = assembler;
  const database::Parameter *found = view.command().find("b");
  ASSERT_NE(found, nullptr);
  EXPECT_EQ(std::get<std::string>(found->value), "x");
  EXPECT_EQ(view.command().find("c"), nullptr);
}

TEST_F(CommandAssemblerTest, AppendText) {
  assembler.createTextCommand("insert into t (a) values (1)");
  assembler.appendText(" returning lastval()");
  EXPECT_EQ(assembler.command().text,
            "insert into t (a) values (1) returning lastval()");
}

TEST_F(CommandAssemblerTest, NormalizerCanBeReplaced) {
  assembler.setNormalizer({});
  assembler.createTextCommand("select @userId", {{"userId", int64_t(1)}});
  EXPECT_EQ(assembler.parameters().names(),
            (std::vector<std::string>{"userId"}));
}
