#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "database_iface.hpp"
#include "parameter_store.hpp"
#include "query_builder.hpp"
#include "serializer.hpp"

namespace sqlflow {
/**
 * @brief Собирает команду из текста (или имени процедуры), её вида и
 * параметров.
 *
 * В режимах Insert и Update текст команды пересобирается после каждого
 * изменения параметров.
 */
struct CommandAssembler {
  static constexpr std::string_view kReturnValueName = "return_value";

  explicit CommandAssembler(database::NameConverter normalizer);

  void setNormalizer(database::NameConverter normalizer);
  const database::NameConverter &normalizer() const { return normalizer_; }

  void addParameter(std::string_view name, database::Field value);
  void addParameters(const database::FieldList &fields);

  void removeParameter(std::string_view name);
  void removeNullParameters();
  void removeBlankParameters();
  void removeNullAndBlankParameters();

  void createTextCommand(std::string text,
                         const database::FieldList &parameters = {});
  void createProcedureCommand(std::string name,
                              const database::FieldList &parameters = {});
  void createInsertCommand(std::string tableName,
                           const database::FieldList &fields);
  void createUpdateCommand(std::string tableName,
                           const database::FieldList &fields,
                           std::string whereClause);

  void addOutputParameter(std::string name, database::DbType type);

  // Дописывает фрагмент к текущему тексту команды
  void appendText(std::string_view fragment);

  // Переносит параметры и объявления выходных параметров в команду
  void bind();

  const database::Parameter *returnValue() const;
  const database::Parameter &outputParameter(std::string_view name) const;

  std::string describe() const;

  database::Command &command() { return command_; }
  const database::Command &command() const { return command_; }
  const ParameterStore &parameters() const { return store_; }
  const CrudState &crudState() const { return crud_; }

private:
  void mergeParameters(const database::FieldList &fields);
  void regenerate();

  database::NameConverter normalizer_;
  ParameterStore store_;
  CrudState crud_;
  database::Command command_;
  std::vector<database::Parameter> outputs_;
};
} // namespace sqlflow
