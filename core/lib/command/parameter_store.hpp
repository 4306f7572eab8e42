#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "field.hpp"

namespace sqlflow {
/**
 * @brief Параметры команды в порядке добавления. Имена уникальны.
 */
struct ParameterStore {
  using Entry = std::pair<std::string, database::Field>;
  using Predicate = std::function<bool(const database::Field &)>;

  // Бросает DuplicateParameterError, если имя уже занято
  void add(std::string name, database::Field value);

  // Заменяет значение существующего параметра или добавляет новый в конец
  void assign(std::string name, database::Field value);

  bool remove(std::string_view name);

  // Возвращает число удалённых параметров
  size_t removeIf(const Predicate &predicate);

  bool contains(std::string_view name) const;
  const database::Field *find(std::string_view name) const;
  std::vector<std::string> names() const;

  const std::vector<Entry> &entries() const { return entries_; }
  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  auto begin() const { return entries_.begin(); }
  auto end() const { return entries_.end(); }

private:
  std::vector<Entry> entries_;
};
} // namespace sqlflow
