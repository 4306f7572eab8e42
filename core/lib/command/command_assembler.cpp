#include "command_assembler.hpp"
#include "errors.hpp"

#include <boost/log/trivial.hpp>

#include <algorithm>
#include <sstream>

namespace sqlflow {
using database::CommandKind;
using database::Parameter;
using database::ParameterDirection;

CommandAssembler::CommandAssembler(database::NameConverter normalizer)
    : normalizer_(std::move(normalizer)) {}

void CommandAssembler::setNormalizer(database::NameConverter normalizer) {
  normalizer_ = std::move(normalizer);
}

void CommandAssembler::addParameter(std::string_view name,
                                    database::Field value) {
  store_.add(database::convertName(normalizer_, name), std::move(value));
  regenerate();
}

void CommandAssembler::addParameters(const database::FieldList &fields) {
  for (auto &&[name, value] : fields) {
    addParameter(name, value);
  }
}

void CommandAssembler::mergeParameters(const database::FieldList &fields) {
  for (auto &&[name, value] : fields) {
    store_.assign(database::convertName(normalizer_, name), value);
  }
}

void CommandAssembler::removeParameter(std::string_view name) {
  store_.remove(database::convertName(normalizer_, name));
  regenerate();
}

void CommandAssembler::removeNullParameters() {
  store_.removeIf(database::isNull);
  regenerate();
}

void CommandAssembler::removeBlankParameters() {
  store_.removeIf([](const database::Field &field) {
    auto text = std::get_if<std::string>(&field);
    return text != nullptr && text->empty();
  });
  regenerate();
}

void CommandAssembler::removeNullAndBlankParameters() {
  removeNullParameters();
  removeBlankParameters();
}

void CommandAssembler::createTextCommand(std::string text,
                                         const database::FieldList &parameters) {
  crud_.mode = CrudMode::None;
  command_ = database::Command{std::move(text), CommandKind::Text, {}};
  addParameters(parameters);
}

void CommandAssembler::createProcedureCommand(
    std::string name, const database::FieldList &parameters) {
  crud_.mode = CrudMode::None;
  command_ =
      database::Command{std::move(name), CommandKind::StoredProcedure, {}};
  addParameters(parameters);
  command_.parameters.push_back(Parameter{std::string(kReturnValueName),
                                          std::monostate(),
                                          ParameterDirection::ReturnValue,
                                          database::DbType::Variant});
}

void CommandAssembler::createInsertCommand(std::string tableName,
                                           const database::FieldList &fields) {
  mergeParameters(fields);
  crud_ = CrudState{CrudMode::Insert, std::move(tableName), ""};
  regenerate();
}

void CommandAssembler::createUpdateCommand(std::string tableName,
                                           const database::FieldList &fields,
                                           std::string whereClause) {
  mergeParameters(fields);
  crud_ = CrudState{CrudMode::Update, std::move(tableName),
                    std::move(whereClause)};
  regenerate();
}

void CommandAssembler::addOutputParameter(std::string name,
                                          database::DbType type) {
  outputs_.push_back(Parameter{std::move(name), std::monostate(),
                               ParameterDirection::Output, type});
}

void CommandAssembler::appendText(std::string_view fragment) {
  command_.text += fragment;
}

void CommandAssembler::regenerate() {
  auto text = QueryBuilder().regenerate(crud_, store_);
  if (!text) {
    return;
  }
  BOOST_LOG_TRIVIAL(debug) << "[Команда] Сгенерирован текст: " << *text;
  command_ = database::Command{std::move(*text), CommandKind::Text, {}};
}

void CommandAssembler::bind() {
  std::vector<Parameter> bound;
  for (auto &&[name, value] : store_) {
    bound.push_back(Parameter{name, value, ParameterDirection::Input,
                              database::DbType::Variant});
  }
  for (auto &&output : outputs_) {
    bound.push_back(output);
  }
  if (auto current = returnValue()) {
    Parameter fresh = *current;
    fresh.value = std::monostate();
    fresh.populated = false;
    bound.push_back(std::move(fresh));
  }
  command_.parameters = std::move(bound);
}

const Parameter *CommandAssembler::returnValue() const {
  for (auto &&param : command_.parameters) {
    if (param.direction == ParameterDirection::ReturnValue) {
      return &param;
    }
  }
  return nullptr;
}

const Parameter &
CommandAssembler::outputParameter(std::string_view name) const {
  auto declared = std::find_if(
      outputs_.begin(), outputs_.end(),
      [name](const Parameter &param) { return param.name == name; });
  if (declared == outputs_.end()) {
    throw MissingOutputParameterError(std::string(name));
  }
  auto bound = command_.find(name);
  if (bound != nullptr && bound->direction == ParameterDirection::Output) {
    return *bound;
  }
  return *declared;
}

std::string CommandAssembler::describe() const {
  if (command_.kind != CommandKind::StoredProcedure) {
    return command_.text;
  }
  std::stringstream description;
  description << "exec " << command_.text;
  int idx = 1;
  auto describeParameter = [&](std::string_view name,
                               const database::Field &value) {
    description << (idx++ == 1 ? " " : ", ") << "@" << name << " = "
                << database::stringify(value);
  };
  for (auto &&[name, value] : store_) {
    describeParameter(name, value);
  }
  for (auto &&output : outputs_) {
    describeParameter(output.name, outputParameter(output.name).value);
  }
  return description.str();
}
} // namespace sqlflow
