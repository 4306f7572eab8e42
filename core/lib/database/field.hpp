#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/numeric/conversion/cast.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace sqlflow::database {
template <typename... Ts> struct Overload : Ts... {
  using Ts::operator()...;
};
template <class... Ts> Overload(Ts...) -> Overload<Ts...>;

using Blob = std::vector<std::byte>;

using Field =
    std::variant<std::monostate, bool, int16_t, int32_t, int64_t, float,
                 double, std::string, boost::uuids::uuid, Blob>;

// Строка результата: имя колонки -> значение
using RowFields = std::unordered_map<std::string, Field>;

// Упорядоченный набор пар имя -> значение
using FieldList = std::vector<std::pair<std::string, Field>>;

std::ostream &operator<<(std::ostream &os, const Field &field);

std::string stringify(const Field &field);

inline bool isNull(const Field &field) {
  return std::holds_alternative<std::monostate>(field);
}

namespace detail {
template <typename T> struct IsOptional : std::false_type {};
template <typename T> struct IsOptional<std::optional<T>> : std::true_type {};
} // namespace detail

/**
 * @brief Приводит значение колонки к типу вызывающей стороны.
 *
 * NULL превращается в значение по умолчанию (или std::nullopt),
 * числа приводятся друг к другу с проверкой диапазона, строки разбираются.
 */
template <typename T> T convertTo(const Field &field) {
  if constexpr (std::is_same_v<T, Field>) {
    return field;
  } else if constexpr (detail::IsOptional<T>::value) {
    if (isNull(field)) {
      return std::nullopt;
    }
    return convertTo<typename T::value_type>(field);
  } else {
    return std::visit(
        [](const auto &value) -> T {
          using Held = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<Held, T>) {
            return value;
          } else if constexpr (std::is_same_v<Held, std::monostate>) {
            return T{};
          } else if constexpr (std::is_same_v<T, bool> &&
                               std::is_arithmetic_v<Held>) {
            return value != 0;
          } else if constexpr (std::is_same_v<Held, bool> &&
                               std::is_arithmetic_v<T>) {
            return static_cast<T>(value);
          } else if constexpr (std::is_arithmetic_v<Held> &&
                               std::is_arithmetic_v<T>) {
            // Выход за диапазон T - bad_numeric_cast
            return boost::numeric_cast<T>(value);
          } else if constexpr (std::is_same_v<Held, std::string> &&
                               std::is_arithmetic_v<T>) {
            return boost::lexical_cast<T>(value);
          } else if constexpr (std::is_same_v<Held, std::string> &&
                               std::is_same_v<T, boost::uuids::uuid>) {
            return boost::uuids::string_generator()(value);
          } else if constexpr (std::is_same_v<Held, boost::uuids::uuid> &&
                               std::is_same_v<T, std::string>) {
            return boost::uuids::to_string(value);
          } else if constexpr (std::is_arithmetic_v<Held> &&
                               std::is_same_v<T, std::string>) {
            return boost::lexical_cast<std::string>(value);
          } else {
            throw std::bad_variant_access();
          }
        },
        field);
  }
}

template <typename V> Field toField(const V &value) {
  if constexpr (detail::IsOptional<V>::value) {
    return value ? Field(*value) : Field(std::monostate());
  } else {
    return Field(value);
  }
}

} // namespace sqlflow::database
