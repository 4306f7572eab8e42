#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "parameter_store.hpp"

namespace sqlflow {
enum class CrudMode { None, Insert, Update };

// Всё, от чего зависит сгенерированный текст insert/update
struct CrudState {
  CrudMode mode = CrudMode::None;
  std::string tableName;
  std::string whereClause;
};

struct QueryBuilder {
  // insert into t (a, b) values (@a, @b)
  std::string insert(std::string_view tableName,
                     const std::vector<std::string> &columns) const;

  // update t set a = @a, b = @b where <whereClause>
  std::string update(std::string_view tableName,
                     const std::vector<std::string> &columns,
                     std::string_view whereClause) const;

  /**
   * @brief Текст команды для текущего CRUD-режима.
   *
   * Чистая функция от режима, таблицы, условия и имён параметров.
   * std::nullopt для CrudMode::None.
   */
  std::optional<std::string> regenerate(const CrudState &state,
                                        const ParameterStore &store) const;
};
} // namespace sqlflow
