#pragma once

#include <stdexcept>
#include <string>

#include "database_iface.hpp"

namespace sqlflow {
struct DuplicateParameterError : std::invalid_argument {
  explicit DuplicateParameterError(const std::string &name)
      : std::invalid_argument("Parameter '" + name + "' is already defined"),
        name_(name) {}

  const std::string &name() const noexcept { return name_; }

private:
  std::string name_;
};

/**
 * @brief Ошибка выполнения, не перехваченная ни одним обработчиком.
 *
 * Хранит исходную ошибку базы и описание команды.
 */
struct DatabaseExecutionError : std::runtime_error {
  DatabaseExecutionError(database::DatabaseError fault,
                         std::string commandDescription)
      : std::runtime_error(std::string(fault.what()) +
                           " [command: " + commandDescription + "]"),
        fault_(std::move(fault)),
        commandDescription_(std::move(commandDescription)) {}

  const database::DatabaseError &fault() const noexcept { return fault_; }
  const std::string &commandDescription() const noexcept {
    return commandDescription_;
  }

private:
  database::DatabaseError fault_;
  std::string commandDescription_;
};

struct NoReturnValueError : std::logic_error {
  using std::logic_error::logic_error;
};

struct MissingOutputParameterError : std::out_of_range {
  explicit MissingOutputParameterError(const std::string &name)
      : std::out_of_range("Output parameter '" + name + "' is not declared"),
        name_(name) {}

  const std::string &name() const noexcept { return name_; }

private:
  std::string name_;
};

struct DuplicateKeyError : std::invalid_argument {
  explicit DuplicateKeyError(const std::string &key)
      : std::invalid_argument("Duplicate key in vertical dictionary: " + key),
        key_(key) {}

  const std::string &key() const noexcept { return key_; }

private:
  std::string key_;
};
} // namespace sqlflow
