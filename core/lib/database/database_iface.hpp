#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "field.hpp"

namespace sqlflow::database {

/**
 * @brief Ошибка, пришедшая от сервера или драйвера базы данных.
 */
struct DatabaseError : std::runtime_error {
  explicit DatabaseError(const std::string &message, std::string sqlState = "")
      : std::runtime_error(message), sqlState_(std::move(sqlState)) {}

  const std::string &sqlState() const noexcept { return sqlState_; }

private:
  std::string sqlState_;
};

enum class ConnectionState { Closed, Open };

enum class CommandKind { Text, StoredProcedure, TableDirect };

enum class ParameterDirection { Input, Output, ReturnValue };

enum class DbType {
  Variant,
  Boolean,
  SmallInt,
  Integer,
  BigInt,
  Real,
  Double,
  Text,
  Uuid,
  Binary
};

enum class ReaderBehavior { Default, SequentialAccess };

constexpr const char *toString(ConnectionState state) {
  return state == ConnectionState::Open ? "Open" : "Closed";
}

struct StateChange {
  ConnectionState previous;
  ConnectionState current;
};

struct InfoMessage {
  std::string severity;
  std::string message;
};

struct Parameter {
  std::string name;
  Field value;
  ParameterDirection direction = ParameterDirection::Input;
  DbType type = DbType::Variant;
  // Выставляется соединением после записи выходного значения
  bool populated = false;
};

/**
 * @brief Описание команды: текст (или имя процедуры), вид и привязанные
 * параметры. Выходные параметры заполняются соединением при выполнении.
 */
struct Command {
  std::string text;
  CommandKind kind = CommandKind::Text;
  std::vector<Parameter> parameters;

  Parameter *find(std::string_view name) {
    auto found = std::find_if(
        parameters.begin(), parameters.end(),
        [name](const Parameter &param) { return param.name == name; });
    return found == parameters.end() ? nullptr : &*found;
  }

  const Parameter *find(std::string_view name) const {
    auto found = std::find_if(
        parameters.begin(), parameters.end(),
        [name](const Parameter &param) { return param.name == name; });
    return found == parameters.end() ? nullptr : &*found;
  }
};

struct AbstractReader {
  virtual ~AbstractReader() = default;
  // Переход к следующей строке, false когда строки закончились
  virtual bool read() = 0;
  virtual size_t fieldCount() const = 0;
  virtual std::string fieldName(size_t ordinal) const = 0;
  virtual size_t ordinal(std::string_view name) const = 0;
  virtual Field value(size_t ordinal) const = 0;
  // Копирует в buffer байты колонки начиная с offset, возвращает их число
  virtual size_t getBytes(size_t ordinal, size_t offset,
                          std::span<std::byte> buffer) = 0;
  virtual void close() noexcept = 0;
};

struct AbstractConnection {
  using StateChangeListener = std::function<void(const StateChange &)>;
  using InfoMessageListener = std::function<void(const InfoMessage &)>;

  virtual ~AbstractConnection() = default;

  virtual void open() = 0;
  virtual void close() = 0;
  virtual void changeDatabase(std::string_view name) = 0;
  virtual ConnectionState state() const = 0;

  virtual void onStateChange(StateChangeListener listener) = 0;
  virtual void onInfoMessage(InfoMessageListener listener) = 0;

  // Хвост запроса, возвращающий последний сгенерированный идентификатор
  virtual std::string identityClause() const = 0;

  virtual size_t executeNonQuery(Command &command) = 0;
  virtual Field executeScalar(Command &command) = 0;
  virtual std::unique_ptr<AbstractReader>
  executeReader(Command &command, ReaderBehavior behavior) = 0;
};
} // namespace sqlflow::database
