#include <gtest/gtest.h>

#include "naming.hpp"

using namespace sqlflow;

TEST(NamingTest, SplitWords) {
  using Words = std::vector<std::string>;
  EXPECT_EQ(naming::splitWords("personName"), (Words{"person", "name"}));
  EXPECT_EQ(naming::splitWords("person_name"), (Words{"person", "name"}));
  EXPECT_EQ(naming::splitWords("Person-Name id"),
            (Words{"person", "name", "id"}));
  EXPECT_EQ(naming::splitWords("HTTPServerName"),
            (Words{"http", "server", "name"}));
  EXPECT_EQ(naming::splitWords("order2Id"), (Words{"order2", "id"}));
  EXPECT_TRUE(naming::splitWords("__").empty());
}

TEST(NamingTest, SnakeCase) {
  EXPECT_EQ(naming::snakeCase("personName"), "person_name");
  EXPECT_EQ(naming::snakeCase("PersonID"), "person_id");
  EXPECT_EQ(naming::snakeCase("already_snake"), "already_snake");
  EXPECT_EQ(naming::snakeCase(""), "");
}

TEST(NamingTest, CamelAndTitleCase) {
  EXPECT_EQ(naming::camelCase("person_name"), "personName");
  EXPECT_EQ(naming::camelCase("Person Name"), "personName");
  EXPECT_EQ(naming::titleCase("person_name"), "PersonName");
  EXPECT_EQ(naming::titleCase("x"), "X");
}
