#include "command_executor.hpp"
#include "database.hpp"
#include "naming.hpp"

#include <boost/log/trivial.hpp>

#include <stdexcept>

namespace sqlflow {
using database::ConnectionState;

CommandExecutor::CommandExecutor(
    std::unique_ptr<database::AbstractConnection> connection, bool autoClose)
    : connection_(std::move(connection)), assembler_(naming::snakeCase),
      autoClose_(autoClose) {
  if (!connection_) {
    throw std::invalid_argument("Connection must not be null");
  }
}

CommandExecutor::CommandExecutor(database::ConnectionSettings settings,
                                 bool autoClose)
    : CommandExecutor(
          std::make_unique<database::PqConnection>(std::move(settings)),
          autoClose) {}

CommandExecutor &CommandExecutor::onError(ErrorHandler handler) {
  handlers_.errors.add(std::move(handler));
  return *this;
}

CommandExecutor &CommandExecutor::onInfo(InfoHandler handler) {
  handlers_.infoMessages.add(std::move(handler));
  return *this;
}

CommandExecutor &
CommandExecutor::onConnectionStateChange(StateChangeHandler handler) {
  handlers_.stateChanges.add(std::move(handler));
  return *this;
}

CommandExecutor &CommandExecutor::onExecuted(ExecutedHandler handler) {
  handlers_.executed.add(std::move(handler));
  return *this;
}

CommandExecutor &CommandExecutor::changeDatabase(std::string_view name) {
  if (!ensureOpen()) {
    return *this;
  }
  try {
    connection_->changeDatabase(name);
  } catch (const database::DatabaseError &fault) {
    if (!suppressFault(fault)) {
      throw DatabaseExecutionError(fault, "change database " +
                                              std::string(name));
    }
  }
  return *this;
}

CommandExecutor &
CommandExecutor::setNameConverter(database::NameConverter converter) {
  assembler_.setNormalizer(std::move(converter));
  return *this;
}

CommandExecutor &CommandExecutor::addParameter(std::string_view name,
                                               database::Field value) {
  assembler_.addParameter(name, std::move(value));
  return *this;
}

CommandExecutor &
CommandExecutor::addParameters(const database::FieldList &fields) {
  assembler_.addParameters(fields);
  return *this;
}

CommandExecutor &CommandExecutor::removeParameter(std::string_view name) {
  assembler_.removeParameter(name);
  return *this;
}

CommandExecutor &CommandExecutor::removeNullParameters() {
  assembler_.removeNullParameters();
  return *this;
}

CommandExecutor &CommandExecutor::removeBlankParameters() {
  assembler_.removeBlankParameters();
  return *this;
}

CommandExecutor &CommandExecutor::removeNullAndBlankParameters() {
  assembler_.removeNullAndBlankParameters();
  return *this;
}

CommandExecutor &CommandExecutor::addOutputParameter(std::string name,
                                                     database::DbType type) {
  assembler_.addOutputParameter(std::move(name), type);
  return *this;
}

CommandExecutor &
CommandExecutor::createTextCommand(std::string text,
                                   const database::FieldList &parameters) {
  assembler_.createTextCommand(std::move(text), parameters);
  return *this;
}

CommandExecutor &
CommandExecutor::createProcedureCommand(std::string name,
                                        const database::FieldList &parameters) {
  assembler_.createProcedureCommand(std::move(name), parameters);
  return *this;
}

CommandExecutor &
CommandExecutor::createInsertCommand(std::string tableName,
                                     const database::FieldList &fields) {
  assembler_.createInsertCommand(std::move(tableName), fields);
  return *this;
}

CommandExecutor &
CommandExecutor::createUpdateCommand(std::string tableName,
                                     const database::FieldList &fields,
                                     std::string whereClause) {
  assembler_.createUpdateCommand(std::move(tableName), fields,
                                 std::move(whereClause));
  return *this;
}

CommandExecutor &CommandExecutor::executeNonQuery() {
  executeRecordsAffected();
  return *this;
}

size_t CommandExecutor::executeRecordsAffected() {
  auto affected = execute(
      [this] { return connection_->executeNonQuery(assembler_.command()); },
      true);
  recordsAffected_ = affected.value_or(0);
  return recordsAffected_;
}

size_t CommandExecutor::executeBinaryStream(std::string_view columnName,
                                            std::ostream &output,
                                            size_t bufferSize) {
  if (bufferSize == 0) {
    throw std::invalid_argument("Buffer size must be positive");
  }
  ReaderScope reader(openReader(database::ReaderBehavior::SequentialAccess));
  if (!reader || !reader->read()) {
    BOOST_LOG_TRIVIAL(debug) << "[Исполнитель] Нет строки для чтения колонки "
                             << columnName;
    return 0;
  }
  auto ordinal = reader->ordinal(columnName);
  std::vector<std::byte> buffer(bufferSize);
  size_t position = 0;
  size_t bytesRead = 0;
  while ((bytesRead = reader->getBytes(ordinal, position, buffer)) > 0) {
    output.write(reinterpret_cast<const char *>(buffer.data()),
                 static_cast<std::streamsize>(bytesRead));
    position += bytesRead;
  }
  BOOST_LOG_TRIVIAL(debug) << "[Исполнитель] Передано байт из колонки "
                           << columnName << ": " << position;
  return position;
}

std::unique_ptr<database::AbstractReader>
CommandExecutor::openReader(database::ReaderBehavior behavior) {
  auto reader = execute(
      [this, behavior] {
        return connection_->executeReader(assembler_.command(), behavior);
      },
      false);
  if (!reader) {
    return nullptr;
  }
  return std::move(*reader);
}

bool CommandExecutor::beforeExecution() {
  wireConnectionHandlers();
  if (!ensureOpen()) {
    return false;
  }
  assembler_.bind();
  BOOST_LOG_TRIVIAL(debug) << "[Исполнитель] Выполняю команду: "
                           << describeCommand();
  return true;
}

bool CommandExecutor::ensureOpen() {
  if (connection_->state() == ConnectionState::Open) {
    return true;
  }
  try {
    connection_->open();
    return true;
  } catch (const database::DatabaseError &fault) {
    if (!suppressFault(fault)) {
      throw DatabaseExecutionError(fault, describeCommand());
    }
    return false;
  }
}

void CommandExecutor::afterExecution(bool dataReadComplete) {
  ++executionCount_;
  BOOST_LOG_TRIVIAL(info) << "[Исполнитель] Команда выполнена за "
                          << lastElapsed_.count() / 1000 << " мкс";
  handlers_.executed.dispatch(
      *this, CommandExecutedEvent{lastElapsed_, assembler_.command()});
  if (dataReadComplete) {
    onDataRead();
  }
}

void CommandExecutor::onDataRead() {
  if (autoClose_ && connection_->state() != ConnectionState::Closed) {
    connection_->close();
  }
}

bool CommandExecutor::suppressFault(const database::DatabaseError &fault) {
  if (handlers_.errors.empty()) {
    BOOST_LOG_TRIVIAL(error) << "[Исполнитель] Ошибка базы данных: "
                             << fault.what();
    return false;
  }
  BOOST_LOG_TRIVIAL(warning)
      << "[Исполнитель] Ошибка передана обработчикам (" << handlers_.errors.size()
      << "): " << fault.what();
  lastCallFaulted_ = true;
  handlers_.errors.dispatch(*this, fault);
  return true;
}

void CommandExecutor::wireConnectionHandlers() {
  for (; wiredStateHandlers_ < handlers_.stateChanges.size();
       ++wiredStateHandlers_) {
    connection_->onStateChange(
        [this, handler = handlers_.stateChanges.at(wiredStateHandlers_)](
            const database::StateChange &change) { handler(*this, change); });
  }
  for (; wiredInfoHandlers_ < handlers_.infoMessages.size();
       ++wiredInfoHandlers_) {
    connection_->onInfoMessage(
        [this, handler = handlers_.infoMessages.at(wiredInfoHandlers_)](
            const database::InfoMessage &info) { handler(*this, info); });
  }
}

database::RowFields CommandExecutor::currentRow(database::AbstractReader &reader) {
  database::RowFields fields;
  for (size_t i = 0; i < reader.fieldCount(); ++i) {
    fields[reader.fieldName(i)] = reader.value(i);
  }
  return fields;
}
} // namespace sqlflow
