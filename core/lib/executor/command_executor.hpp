#pragma once

#include <boost/log/trivial.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "command_assembler.hpp"
#include "database_iface.hpp"
#include "dialect.hpp"
#include "errors.hpp"
#include "handlers.hpp"
#include "reader_scope.hpp"
#include "serializer.hpp"

namespace sqlflow {
// Один ключ -> все значения в порядке строк
template <typename K, typename V> using Lookup = std::map<K, std::vector<V>>;

/**
 * @brief Fluent-обёртка над соединением: собирает команду, выполняет её и
 * превращает результат в нужную форму.
 *
 * Экземпляр владеет соединением и одной командой. Не потокобезопасен:
 * для параллельной работы нужен отдельный экземпляр на поток.
 *
 * Ошибки базы при выполнении:
 *  - нет обработчиков onError -> DatabaseExecutionError;
 *  - есть хотя бы один -> все обработчики вызываются по порядку, ошибка
 *    поглощается, вызов возвращает значение по умолчанию, а
 *    lastCallFaulted() становится true.
 */
class CommandExecutor {
public:
  using ErrorHandler = HandlerList<database::DatabaseError>::Handler;
  using InfoHandler = HandlerList<database::InfoMessage>::Handler;
  using StateChangeHandler = HandlerList<database::StateChange>::Handler;
  using ExecutedHandler = HandlerList<CommandExecutedEvent>::Handler;

  template <typename T>
  using RowConverter = std::function<T(database::AbstractReader &)>;

  static constexpr size_t kDefaultStreamBuffer = 1 << 18;

  explicit CommandExecutor(
      std::unique_ptr<database::AbstractConnection> connection,
      bool autoClose = true);
  explicit CommandExecutor(database::ConnectionSettings settings,
                           bool autoClose = true);

  CommandExecutor(const CommandExecutor &) = delete;
  CommandExecutor &operator=(const CommandExecutor &) = delete;

  CommandExecutor &onError(ErrorHandler handler);
  CommandExecutor &onInfo(InfoHandler handler);
  CommandExecutor &onConnectionStateChange(StateChangeHandler handler);
  CommandExecutor &onExecuted(ExecutedHandler handler);

  CommandExecutor &changeDatabase(std::string_view name);

  // Нормализация имён параметров и сопоставление колонок с полями
  CommandExecutor &setNameConverter(database::NameConverter converter);

  CommandExecutor &addParameter(std::string_view name, database::Field value);
  CommandExecutor &addParameters(const database::FieldList &fields);

  template <database::Record R>
  CommandExecutor &addParameters(const R &record) {
    return addParameters(database::pack(record));
  }

  // nullptr игнорируется
  template <database::Record R>
  CommandExecutor &addParameters(const R *record) {
    if (record == nullptr) {
      return *this;
    }
    return addParameters(*record);
  }

  CommandExecutor &removeParameter(std::string_view name);
  CommandExecutor &removeNullParameters();
  CommandExecutor &removeBlankParameters();
  CommandExecutor &removeNullAndBlankParameters();

  CommandExecutor &addOutputParameter(std::string name, database::DbType type);

  template <typename T> T getOutputParameter(std::string_view name) const {
    return database::convertTo<T>(assembler_.outputParameter(name).value);
  }

  template <typename T> T getReturnValue() const {
    auto param = assembler_.returnValue();
    if (param == nullptr) {
      throw NoReturnValueError(
          "No return value parameter has been initialized");
    }
    if (!param->populated) {
      throw NoReturnValueError(
          "Return value is not available before execution completes");
    }
    return database::convertTo<T>(param->value);
  }

  std::string describeCommand() const { return assembler_.describe(); }

  CommandExecutor &createTextCommand(std::string text,
                                     const database::FieldList &parameters = {});
  CommandExecutor &
  createProcedureCommand(std::string name,
                         const database::FieldList &parameters = {});
  CommandExecutor &createInsertCommand(std::string tableName,
                                       const database::FieldList &fields);
  CommandExecutor &createUpdateCommand(std::string tableName,
                                       const database::FieldList &fields,
                                       std::string whereClause);

  template <database::Record R>
  CommandExecutor &createTextCommand(std::string text, const R &parameters) {
    return createTextCommand(std::move(text), database::pack(parameters));
  }

  template <database::Record R>
  CommandExecutor &createProcedureCommand(std::string name,
                                          const R &parameters) {
    return createProcedureCommand(std::move(name), database::pack(parameters));
  }

  template <database::Record R>
  CommandExecutor &createInsertCommand(std::string tableName,
                                       const R &fields) {
    return createInsertCommand(std::move(tableName), database::pack(fields));
  }

  template <database::Record R>
  CommandExecutor &createUpdateCommand(std::string tableName, const R &fields,
                                       std::string whereClause) {
    return createUpdateCommand(std::move(tableName), database::pack(fields),
                               std::move(whereClause));
  }

  CommandExecutor &executeNonQuery();

  size_t executeRecordsAffected();

  template <typename T> T executeReturnValue() {
    executeRecordsAffected();
    if (lastCallFaulted_) {
      return T{};
    }
    return getReturnValue<T>();
  }

  template <typename T> T executeScalar() {
    auto value = execute(
        [this] { return connection_->executeScalar(assembler_.command()); },
        true);
    return value ? database::convertTo<T>(*value) : T{};
  }

  template <typename T>
  T executeScalar(std::string text,
                  const database::FieldList &parameters = {}) {
    createTextCommand(std::move(text), parameters);
    return executeScalar<T>();
  }

  template <typename T, database::Record R>
  T executeScalar(std::string text, const R &parameters) {
    return executeScalar<T>(std::move(text), database::pack(parameters));
  }

  template <typename T = database::Field>
  std::vector<std::unordered_map<std::string, T>>
  executeDictionaries(const database::NameConverter &fieldNameConverter = {}) {
    return executeAndTransform<std::unordered_map<std::string, T>>(
        [&fieldNameConverter](database::AbstractReader &reader) {
          std::unordered_map<std::string, T> row;
          for (size_t i = 0; i < reader.fieldCount(); ++i) {
            auto name =
                database::convertName(fieldNameConverter, reader.fieldName(i));
            row[name] = database::convertTo<T>(reader.value(i));
          }
          return row;
        });
  }

  template <typename K, typename V>
  std::map<K, V> executeVerticalDictionary(size_t keyCol = 0,
                                           size_t valCol = 1) {
    return toDictionary(executeAndTransform<std::pair<K, V>>(
        [keyCol, valCol](database::AbstractReader &reader) {
          return rowPair<K, V>(reader, keyCol, valCol);
        }));
  }

  template <typename K, typename V>
  std::map<K, V> executeVerticalDictionary(std::string_view keyCol,
                                           std::string_view valCol) {
    return toDictionary(executeAndTransform<std::pair<K, V>>(
        [keyCol, valCol](database::AbstractReader &reader) {
          return rowPair<K, V>(reader, reader.ordinal(keyCol),
                               reader.ordinal(valCol));
        }));
  }

  template <typename K, typename V>
  Lookup<K, V> executeVerticalLookup(size_t keyCol = 0, size_t valCol = 1) {
    return toLookup(executeAndTransform<std::pair<K, V>>(
        [keyCol, valCol](database::AbstractReader &reader) {
          return rowPair<K, V>(reader, keyCol, valCol);
        }));
  }

  template <typename K, typename V>
  Lookup<K, V> executeVerticalLookup(std::string_view keyCol,
                                     std::string_view valCol) {
    return toLookup(executeAndTransform<std::pair<K, V>>(
        [keyCol, valCol](database::AbstractReader &reader) {
          return rowPair<K, V>(reader, reader.ordinal(keyCol),
                               reader.ordinal(valCol));
        }));
  }

  template <typename T> std::vector<T> executeArray(size_t col = 0) {
    return executeAndTransform<T>([col](database::AbstractReader &reader) {
      return database::convertTo<T>(reader.value(col));
    });
  }

  template <typename T> std::vector<T> executeArray(std::string_view col) {
    return executeAndTransform<T>([col](database::AbstractReader &reader) {
      return database::convertTo<T>(reader.value(reader.ordinal(col)));
    });
  }

  /**
   * @brief Выполняет команду и применяет converter к каждой строке.
   *
   * Курсор закрывается до возврата при любом исходе. Соединение закрывается
   * после чтения всех строк, если включено автозакрытие.
   */
  template <typename T>
  std::vector<T> executeAndTransform(const RowConverter<T> &converter) {
    std::vector<T> rows;
    {
      ReaderScope reader(openReader(database::ReaderBehavior::Default));
      while (reader && reader->read()) {
        rows.push_back(converter(*reader));
      }
    }
    onDataRead();
    return rows;
  }

  template <database::Record T> std::vector<T> executeAndAutoMap() {
    return executeAndTransform<T>([this](database::AbstractReader &reader) {
      return database::unpack<T>(currentRow(reader), assembler_.normalizer());
    });
  }

  // Дописывает к тексту команды запрос последнего идентификатора
  template <typename T> T executeScopeIdentity() {
    assembler_.appendText(connection_->identityClause());
    return executeScalar<T>();
  }

  /**
   * @brief Копирует значение колонки первой строки в output порциями не
   * больше bufferSize байт.
   *
   * Соединение после чтения не закрывается.
   *
   * @return Число записанных байт
   */
  size_t executeBinaryStream(std::string_view columnName, std::ostream &output,
                             size_t bufferSize = kDefaultStreamBuffer);

  size_t executionCount() const { return executionCount_; }
  size_t recordsAffected() const { return recordsAffected_; }
  std::chrono::nanoseconds lastElapsed() const { return lastElapsed_; }
  bool autoClose() const { return autoClose_; }
  bool lastCallFaulted() const { return lastCallFaulted_; }

  database::AbstractConnection &connection() { return *connection_; }
  const database::Command &command() const { return assembler_.command(); }
  const ParameterStore &parameters() const { return assembler_.parameters(); }
  const CrudState &crudState() const { return assembler_.crudState(); }

private:
  template <typename Primitive>
  auto execute(Primitive &&primitive, bool dataReadComplete)
      -> std::optional<std::invoke_result_t<Primitive &>>;

  std::unique_ptr<database::AbstractReader>
  openReader(database::ReaderBehavior behavior);

  bool beforeExecution();
  bool ensureOpen();
  void afterExecution(bool dataReadComplete);
  void onDataRead();
  bool suppressFault(const database::DatabaseError &fault);
  void wireConnectionHandlers();

  static database::RowFields currentRow(database::AbstractReader &reader);

  template <typename K, typename V>
  static std::pair<K, V> rowPair(database::AbstractReader &reader,
                                 size_t keyCol, size_t valCol) {
    return {database::convertTo<K>(reader.value(keyCol)),
            database::convertTo<V>(reader.value(valCol))};
  }

  template <typename K> static std::string describeKey(const K &key) {
    if constexpr (std::is_same_v<K, database::Field>) {
      return database::stringify(key);
    } else if constexpr (requires(std::ostream &os, const K &k) { os << k; }) {
      std::ostringstream out;
      out << key;
      return out.str();
    } else {
      return "<unprintable>";
    }
  }

  template <typename K, typename V>
  static std::map<K, V> toDictionary(std::vector<std::pair<K, V>> pairs) {
    std::map<K, V> result;
    for (auto &&[key, value] : pairs) {
      auto [_, inserted] = result.try_emplace(key, std::move(value));
      if (!inserted) {
        throw DuplicateKeyError(describeKey(key));
      }
    }
    return result;
  }

  template <typename K, typename V>
  static Lookup<K, V> toLookup(std::vector<std::pair<K, V>> pairs) {
    Lookup<K, V> result;
    for (auto &&[key, value] : pairs) {
      result[key].push_back(std::move(value));
    }
    return result;
  }

  std::unique_ptr<database::AbstractConnection> connection_;
  CommandAssembler assembler_;
  HandlerRegistry handlers_;
  bool autoClose_;
  size_t executionCount_ = 0;
  size_t recordsAffected_ = 0;
  std::chrono::nanoseconds lastElapsed_{};
  bool lastCallFaulted_ = false;
  size_t wiredInfoHandlers_ = 0;
  size_t wiredStateHandlers_ = 0;
};

template <typename Primitive>
auto CommandExecutor::execute(Primitive &&primitive, bool dataReadComplete)
    -> std::optional<std::invoke_result_t<Primitive &>> {
  using Result = std::invoke_result_t<Primitive &>;
  lastCallFaulted_ = false;
  if (!beforeExecution()) {
    lastElapsed_ = std::chrono::nanoseconds::zero();
    afterExecution(dataReadComplete);
    return std::nullopt;
  }
  std::optional<Result> result;
  auto started = std::chrono::steady_clock::now();
  try {
    result.emplace(primitive());
    lastElapsed_ = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - started);
  } catch (const database::DatabaseError &fault) {
    lastElapsed_ = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - started);
    if (!suppressFault(fault)) {
      // Читать нечего, соединение закрывается как после чтения
      afterExecution(true);
      throw DatabaseExecutionError(fault, describeCommand());
    }
  } catch (const std::exception &e) {
    lastElapsed_ = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - started);
    BOOST_LOG_TRIVIAL(error) << "[Исполнитель] Сбой при выполнении команды: "
                             << e.what();
    afterExecution(true);
    throw;
  }
  afterExecution(dataReadComplete);
  return result;
}
} // namespace sqlflow
