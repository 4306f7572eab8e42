#include <gtest/gtest.h>

#include "query_builder.hpp"

using namespace sqlflow;

TEST(QueryBuilderTest, Insert) {
  QueryBuilder builder;
  EXPECT_EQ(builder.insert("users", {"login", "age"}),
            "insert into users (login, age) values (@login, @age)");
  EXPECT_EQ(builder.insert("users", {"login"}),
            "insert into users (login) values (@login)");
}

TEST(QueryBuilderTest, Update) {
  QueryBuilder builder;
  EXPECT_EQ(builder.update("users", {"login", "age"}, "id = @id"),
            "update users set login = @login, age = @age where id = @id");
}

TEST(QueryBuilderTest, RegenerateFollowsMode) {
  QueryBuilder builder;
  ParameterStore store;
  store.add("a", int64_t(1));
  store.add("b", int64_t(2));
  {
    SCOPED_TRACE("None");
    EXPECT_FALSE(builder.regenerate(CrudState{}, store).has_value());
  }
  {
    SCOPED_TRACE("Insert");
    auto text = builder.regenerate(CrudState{CrudMode::Insert, "t", ""}, store);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "insert into t (a, b) values (@a, @b)");
  }
  {
    SCOPED_TRACE("Update");
    auto text =
        builder.regenerate(CrudState{CrudMode::Update, "t", "id = 5"}, store);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "update t set a = @a, b = @b where id = 5");
  }
}
