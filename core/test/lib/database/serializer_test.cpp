#include <boost/hana.hpp>
#include <gtest/gtest.h>
#include <optional>
#include <stdexcept>

using namespace std::string_literals;

#include "naming.hpp"
#include "serializer.hpp"

using namespace sqlflow;

namespace {
struct Person {
  BOOST_HANA_DEFINE_STRUCT(Person, (int64_t, personId),
                           (std::string, personName));
};

struct Nickname {
  BOOST_HANA_DEFINE_STRUCT(Nickname, (int32_t, personId),
                           (std::optional<std::string>, nickName));
};

struct Empty {
  BOOST_HANA_DEFINE_STRUCT(Empty);
};
} // namespace

TEST(SerializerTest, BasicStructureUnpack) {
  {
    database::RowFields types{{"personId", int64_t(42)},
                              {"personName", "Bob"s}};
    SCOPED_TRACE("Success");
    auto res = database::unpack<Person>(types);
    ASSERT_EQ(res.personName, "Bob");
    ASSERT_EQ(res.personId, 42);
  }
  {
    database::RowFields types{{"personId", "junk"s},
                              {"personName", "junk"s}};
    SCOPED_TRACE("Unparsable number");
    EXPECT_THROW(database::unpack<Person>(types), boost::bad_lexical_cast);
  }
  {
    database::RowFields types{{"personId", boost::uuids::uuid{}},
                              {"personName", "junk"s}};
    SCOPED_TRACE("Type mismatch");
    EXPECT_THROW(database::unpack<Person>(types), std::bad_variant_access);
  }
  {
    SCOPED_TRACE("Empty field records");
    database::RowFields types{};
    EXPECT_THROW(database::unpack<Person>(types), std::out_of_range);
  }
  {
    SCOPED_TRACE("Not enough field records");
    database::RowFields types{{"personId", int64_t(42)}};
    EXPECT_THROW(database::unpack<Person>(types), std::out_of_range);
  }
  {
    SCOPED_TRACE("Too many field records");
    database::RowFields types{
        {"personId", int64_t(42)}, {"personName", "Bob"s}, {"pi", float(3.14)}};
    EXPECT_THROW(database::unpack<Person>(types), std::out_of_range);
  }
  {
    SCOPED_TRACE("Right count, wrong names");
    database::RowFields types{{"personId", int64_t(42)}, {"name", "Bob"s}};
    EXPECT_THROW(database::unpack<Person>(types), std::out_of_range);
  }
}

TEST(SerializerTest, UnpackConvertsCompatibleValues) {
  database::RowFields types{{"personId", int32_t(7)},
                            {"personName", std::monostate()}};
  auto res = database::unpack<Person>(types);
  EXPECT_EQ(res.personId, 7);
  EXPECT_EQ(res.personName, "");
}

TEST(SerializerTest, UnpackOptionalMembers) {
  {
    SCOPED_TRACE("NULL");
    database::RowFields types{{"personId", int32_t(1)},
                              {"nickName", std::monostate()}};
    auto res = database::unpack<Nickname>(types);
    EXPECT_FALSE(res.nickName.has_value());
  }
  {
    SCOPED_TRACE("Value");
    database::RowFields types{{"personId", int32_t(1)},
                              {"nickName", "bobby"s}};
    auto res = database::unpack<Nickname>(types);
    ASSERT_TRUE(res.nickName.has_value());
    EXPECT_EQ(*res.nickName, "bobby");
  }
}

TEST(SerializerTest, UnpackWithNameConverter) {
  database::RowFields types{{"person_id", int64_t(5)},
                            {"person_name", "Alice"s}};
  auto res = database::unpack<Person>(types, naming::snakeCase);
  EXPECT_EQ(res.personId, 5);
  EXPECT_EQ(res.personName, "Alice");
}

TEST(SerializerTest, BasicStructurePack) {
  {
    SCOPED_TRACE("Normal case");
    Person person{.personId = 101, .personName = "Jimmy"};
    auto fields = database::pack(person);
    ASSERT_EQ(fields.size(), 2);
    EXPECT_EQ(fields[0].first, "personId");
    EXPECT_EQ(std::get<int64_t>(fields[0].second), int64_t(101));
    EXPECT_EQ(fields[1].first, "personName");
    EXPECT_EQ(std::get<std::string>(fields[1].second), "Jimmy"s);
  }
  {
    SCOPED_TRACE("Empty structure");
    Empty empty{};
    auto fields = database::pack(empty);
    EXPECT_TRUE(fields.empty());
  }
  {
    SCOPED_TRACE("Optional member");
    Nickname nick{.personId = 3, .nickName = std::nullopt};
    auto fields = database::pack(nick);
    ASSERT_EQ(fields.size(), 2);
    EXPECT_TRUE(database::isNull(fields[1].second));
  }
}

TEST(SerializerTest, PackWithNameConverter) {
  Person person{.personId = 1, .personName = "Ann"};
  auto fields = database::pack(person, naming::snakeCase);
  ASSERT_EQ(fields.size(), 2);
  EXPECT_EQ(fields[0].first, "person_id");
  EXPECT_EQ(fields[1].first, "person_name");
}
