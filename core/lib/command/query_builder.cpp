#include "query_builder.hpp"

#include <format>
#include <sstream>

namespace sqlflow {
std::string QueryBuilder::insert(std::string_view tableName,
                                 const std::vector<std::string> &columns) const {
  std::stringstream keys;
  std::stringstream values;
  int idx = 1;
  for (auto &&key : columns) {
    if (idx != 1) {
      keys << ", ";
      values << ", ";
    }
    keys << key;
    values << "@" << key;
    idx++;
  }
  return std::format("insert into {} ({}) values ({})", tableName, keys.str(),
                     values.str());
}

std::string QueryBuilder::update(std::string_view tableName,
                                 const std::vector<std::string> &columns,
                                 std::string_view whereClause) const {
  std::stringstream assignments;
  int idx = 1;
  for (auto &&key : columns) {
    if (idx != 1) {
      assignments << ", ";
    }
    assignments << key << " = @" << key;
    idx++;
  }
  return std::format("update {} set {} where {}", tableName, assignments.str(),
                     whereClause);
}

std::optional<std::string>
QueryBuilder::regenerate(const CrudState &state,
                         const ParameterStore &store) const {
  switch (state.mode) {
  case CrudMode::Insert:
    return insert(state.tableName, store.names());
  case CrudMode::Update:
    return update(state.tableName, store.names(), state.whereClause);
  case CrudMode::None:
    break;
  }
  return std::nullopt;
}
} // namespace sqlflow
