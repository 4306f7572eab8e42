#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

#include <boost/hana.hpp>

#include "field.hpp"

namespace sqlflow::database {
namespace hana = boost::hana;

// Преобразование имён полей (например, personName -> person_name)
using NameConverter = std::function<std::string(std::string_view)>;

// Структура, описанная через BOOST_HANA_DEFINE_STRUCT
template <typename T>
concept Record = hana::Struct<std::remove_cvref_t<T>>::value;

inline std::string convertName(const NameConverter &converter,
                               std::string_view name) {
  return converter ? converter(name) : std::string(name);
}

template <Record T>
T unpack(const RowFields &fields, const NameConverter &nameConverter = {}) {
  T object{};
  constexpr auto accessors = hana::accessors<T>();
  if (hana::length(accessors) != fields.size()) {
    throw std::out_of_range("Field count does not match member count");
  }
  hana::for_each(accessors, [&](auto &&member) {
    auto memberName = hana::first(member).c_str();
    auto memberAccessor = hana::second(member);
    auto columnName = convertName(nameConverter, memberName);
    auto found = fields.find(columnName);
    if (found == fields.end()) {
      throw std::out_of_range("No column for member: " + columnName);
    }
    using MemberType = std::remove_cvref_t<decltype(memberAccessor(object))>;
    memberAccessor(object) = convertTo<MemberType>(found->second);
  });
  return object;
}

template <Record T>
FieldList pack(const T &object, const NameConverter &nameConverter = {}) {
  FieldList fields;
  constexpr auto accessors = hana::accessors<T>();
  hana::for_each(accessors, [&](auto &&member) {
    auto memberName = hana::first(member).c_str();
    auto memberAccessor = hana::second(member);
    fields.emplace_back(convertName(nameConverter, memberName),
                        toField(memberAccessor(object)));
  });
  return fields;
}

} // namespace sqlflow::database
