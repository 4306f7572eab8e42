#include "database.hpp"
#include "dialect.hpp"

#include <boost/log/trivial.hpp>
#include <boost/uuid/string_generator.hpp>

#include <algorithm>
#include <cstring>
#include <format>
#include <limits>
#include <optional>
#include <stdexcept>
#include <variant>

namespace sqlflow::database {

struct PqConnection::NoticeForwarder final : pqxx::errorhandler {
  NoticeForwarder(pqxx::connection &connection,
                  const std::vector<InfoMessageListener> &listeners)
      : pqxx::errorhandler(connection), listeners_(listeners) {}

  bool operator()(char const msg[]) noexcept override {
    std::string_view text(msg);
    InfoMessage info;
    auto colon = text.find(':');
    if (colon != std::string_view::npos) {
      info.severity = text.substr(0, colon);
      text.remove_prefix(colon + 1);
    }
    while (!text.empty() && (text.front() == ' ')) {
      text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == '\n' || text.back() == ' ')) {
      text.remove_suffix(1);
    }
    info.message = text;
    BOOST_LOG_TRIVIAL(debug) << "[БД] Сообщение сервера (" << info.severity
                             << "): " << info.message;
    for (auto &&listener : listeners_) {
      listener(info);
    }
    return true;
  }

private:
  const std::vector<InfoMessageListener> &listeners_;
};

namespace {
constexpr unsigned kBoolType = 16;
constexpr unsigned kByteaType = 17;
constexpr unsigned kInt8Type = 20;
constexpr unsigned kInt2Type = 21;
constexpr unsigned kInt4Type = 23;
constexpr unsigned kTextType = 25;
constexpr unsigned kFloat4Type = 700;
constexpr unsigned kFloat8Type = 701;
constexpr unsigned kVarCharType = 1043;
constexpr unsigned kUuid = 2950;

Field fromOid(const pqxx::field &field) {
  if (field.is_null()) {
    return std::monostate();
  }
  switch (field.type()) {
  case kBoolType:
    return field.as<bool>();
  case kByteaType: {
    auto hexText = field.view();
    Blob blob(hexSliceLength(hexText));
    decodeHexSlice(hexText, 0, blob);
    return blob;
  }
  case kInt8Type:
    return field.as<int64_t>();
  case kInt2Type:
    return field.as<int16_t>();
  case kInt4Type:
    return field.as<int32_t>();
  case kFloat4Type:
    return field.as<float>();
  case kFloat8Type:
    return field.as<double>();
  case kUuid: {
    boost::uuids::string_generator gen;
    return gen(field.as<std::string>());
  }
  case kTextType:
  case kVarCharType:
  default:
    return field.as<std::string>();
  }
}

void append(pqxx::params &params, const Field &field) {
  auto visitor = Overload{
      [&params](std::monostate) { params.append(); },
      [&params](bool b) { params.append(b); },
      [&params](int16_t x) { params.append(x); },
      [&params](int32_t x) { params.append(x); },
      [&params](int64_t x) { params.append(x); },
      [&params](float x) { params.append(x); },
      [&params](double x) { params.append(x); },
      [&params](const std::string &s) { params.append(s); },
      [&params](const boost::uuids::uuid &u) {
        params.append(boost::uuids::to_string(u));
      },
      [&params](const Blob &blob) {
        params.append(std::basic_string_view<std::byte>(blob.data(),
                                                        blob.size()));
      },
  };
  std::visit(visitor, field);
}

template <typename Action> auto translateErrors(Action &&action) {
  try {
    return action();
  } catch (const pqxx::sql_error &e) {
    throw DatabaseError(e.what(), e.sqlstate());
  } catch (const pqxx::failure &e) {
    throw DatabaseError(e.what());
  }
}

// Текст для сервера и значения для $1, $2, ...
struct Statement {
  std::string sql;
  pqxx::params params;
};

const Field &inputValue(const Command &command, std::string_view name) {
  auto found = std::find_if(
      command.parameters.begin(), command.parameters.end(),
      [name](const Parameter &param) {
        return param.direction == ParameterDirection::Input &&
               param.name == name;
      });
  if (found == command.parameters.end()) {
    throw DatabaseError(std::format("Parameter @{} is not bound", name),
                        "42P02");
  }
  return found->value;
}

// Привязываются только параметры, которые упоминаются в тексте команды
Statement prepare(const Command &command) {
  std::vector<std::string> inputs;
  for (auto &&param : command.parameters) {
    if (param.direction == ParameterDirection::Input) {
      inputs.push_back(param.name);
    }
  }

  Statement statement;
  std::vector<std::string> bound;
  switch (command.kind) {
  case CommandKind::StoredProcedure:
    statement.sql = procedureCall(command.text, inputs);
    bound = std::move(inputs);
    break;
  case CommandKind::TableDirect:
    statement.sql = tableDirect(command.text);
    break;
  case CommandKind::Text: {
    auto positional = rewriteNamedParameters(command.text, inputs);
    statement.sql = std::move(positional.text);
    bound = std::move(positional.names);
    break;
  }
  }
  for (auto &&name : bound) {
    append(statement.params, inputValue(command, name));
  }
  return statement;
}

std::optional<size_t> findColumn(const pqxx::result &result,
                                 std::string_view name) {
  for (pqxx::row_size_type col = 0; col < result.columns(); ++col) {
    if (name == result.column_name(col)) {
      return static_cast<size_t>(col);
    }
  }
  return std::nullopt;
}

// Значения выходных параметров и кода возврата берутся из первой строки
void populateOutputs(Command &command, const pqxx::result &result) {
  std::vector<size_t> consumed;
  for (auto &param : command.parameters) {
    if (param.direction != ParameterDirection::Output) {
      continue;
    }
    param.populated = true;
    param.value = std::monostate();
    auto col = findColumn(result, param.name);
    if (col && !result.empty()) {
      param.value = fromOid(result[0][static_cast<pqxx::row_size_type>(*col)]);
      consumed.push_back(*col);
    }
  }
  for (auto &param : command.parameters) {
    if (param.direction != ParameterDirection::ReturnValue) {
      continue;
    }
    param.populated = true;
    param.value = std::monostate();
    for (size_t col = 0; col < static_cast<size_t>(result.columns()); ++col) {
      if (std::find(consumed.begin(), consumed.end(), col) != consumed.end()) {
        continue;
      }
      if (!result.empty()) {
        param.value =
            fromOid(result[0][static_cast<pqxx::row_size_type>(col)]);
      }
      break;
    }
  }
}

struct PqReader final : AbstractReader {
  explicit PqReader(pqxx::result result) : result_(std::move(result)) {}

  bool read() override {
    if (closed_ || next_ >= static_cast<size_t>(result_.size())) {
      return false;
    }
    current_ = next_++;
    return true;
  }

  size_t fieldCount() const override {
    return static_cast<size_t>(result_.columns());
  }

  std::string fieldName(size_t ordinal) const override {
    return result_.column_name(static_cast<pqxx::row_size_type>(ordinal));
  }

  size_t ordinal(std::string_view name) const override {
    auto col = findColumn(result_, name);
    if (!col) {
      throw std::out_of_range("No such column: " + std::string(name));
    }
    return *col;
  }

  Field value(size_t ordinal) const override { return fromOid(at(ordinal)); }

  size_t getBytes(size_t ordinal, size_t offset,
                  std::span<std::byte> buffer) override {
    auto field = at(ordinal);
    if (field.is_null()) {
      return 0;
    }
    auto text = field.view();
    if (field.type() == kByteaType) {
      return decodeHexSlice(text, offset, buffer);
    }
    if (offset >= text.size()) {
      return 0;
    }
    size_t count = std::min(buffer.size(), text.size() - offset);
    std::memcpy(buffer.data(), text.data() + offset, count);
    return count;
  }

  void close() noexcept override {
    closed_ = true;
    result_ = pqxx::result();
  }

private:
  pqxx::field at(size_t ordinal) const {
    if (closed_) {
      throw std::logic_error("Reader is closed");
    }
    auto row = result_[static_cast<pqxx::result_size_type>(current_)];
    return row[static_cast<pqxx::row_size_type>(ordinal)];
  }

  pqxx::result result_;
  size_t next_ = 0;
  size_t current_ = 0;
  bool closed_ = false;
};

/**
 * @brief Последовательный курсор: результат лежит во временной таблице
 * на сервере, клиент получает строки по одной и колонки кусками.
 *
 * Держит открытую транзакцию до close().
 */
struct SequentialPqReader final : AbstractReader {
  SequentialPqReader(pqxx::connection &connection, const Statement &statement)
      : worker_(std::make_unique<pqxx::work>(connection)) {
    worker_->exec(streamMaterialize(statement.sql), statement.params);
    auto shape = worker_->exec(streamDescribe());
    // Колонка 0 - номер строки
    for (pqxx::row_size_type col = 1; col < shape.columns(); ++col) {
      columns_.push_back(StreamColumn{shape.column_name(col),
                                      shape.column_type(col) == kByteaType});
    }
  }

  bool read() override {
    requireOpen();
    pqxx::params params;
    params.append(static_cast<int64_t>(row_ + 1));
    auto result = translateErrors(
        [&] { return worker_->exec(streamRow(columns_), params); });
    if (result.empty()) {
      return false;
    }
    current_ = std::move(result);
    ++row_;
    return true;
  }

  size_t fieldCount() const override { return columns_.size(); }

  std::string fieldName(size_t ordinal) const override {
    return columns_.at(ordinal).name;
  }

  size_t ordinal(std::string_view name) const override {
    auto found = std::find_if(
        columns_.begin(), columns_.end(),
        [name](const StreamColumn &column) { return column.name == name; });
    if (found == columns_.end()) {
      throw std::out_of_range("No such column: " + std::string(name));
    }
    return static_cast<size_t>(found - columns_.begin());
  }

  Field value(size_t ordinal) const override {
    requireRow();
    const auto &column = columns_.at(ordinal);
    if (!column.binary) {
      return fromOid(current_[0][static_cast<pqxx::row_size_type>(ordinal)]);
    }
    pqxx::params params;
    params.append(static_cast<int64_t>(row_));
    auto result = translateErrors(
        [&] { return worker_->exec(streamValue(column), params); });
    return fromOid(result[0][0]);
  }

  size_t getBytes(size_t ordinal, size_t offset,
                  std::span<std::byte> buffer) override {
    requireRow();
    const auto &column = columns_.at(ordinal);
    auto length = std::min<size_t>(buffer.size(),
                                   std::numeric_limits<int32_t>::max());
    pqxx::params params;
    params.append(static_cast<int64_t>(offset));
    params.append(static_cast<int64_t>(length));
    params.append(static_cast<int64_t>(row_));
    auto result = translateErrors(
        [&] { return worker_->exec(streamSlice(column), params); });
    if (result.empty() || result[0][0].is_null()) {
      return 0;
    }
    return decodeHexSlice(result[0][0].view(), 0, buffer.first(length));
  }

  // Откат транзакции удаляет временную таблицу
  void close() noexcept override {
    worker_.reset();
    current_ = pqxx::result();
  }

private:
  void requireOpen() const {
    if (!worker_) {
      throw std::logic_error("Reader is closed");
    }
  }

  void requireRow() const {
    requireOpen();
    if (row_ == 0) {
      throw std::logic_error("Reader is not positioned on a row");
    }
  }

  std::unique_ptr<pqxx::work> worker_;
  std::vector<StreamColumn> columns_;
  pqxx::result current_;
  size_t row_ = 0;
};
} // namespace

PqConnection::PqConnection(ConnectionSettings settings)
    : settings_(std::move(settings)) {}

PqConnection::~PqConnection() {
  noticeForwarder_.reset();
  dbConnection_.reset();
}

void PqConnection::open() {
  if (dbConnection_) {
    return;
  }
  BOOST_LOG_TRIVIAL(info) << "[БД] Подключаюсь к " << settings_.host << ":"
                          << settings_.port << "/" << settings_.databaseName;
  try {
    dbConnection_ =
        std::make_unique<pqxx::connection>(connectionString(settings_));
  } catch (const pqxx::broken_connection &e) {
    throw DatabaseError(e.what(), "08001");
  }
  noticeForwarder_ =
      std::make_unique<NoticeForwarder>(*dbConnection_, infoListeners_);
  transition(ConnectionState::Open);
}

void PqConnection::close() {
  if (!dbConnection_) {
    return;
  }
  BOOST_LOG_TRIVIAL(info) << "[БД] Закрываю соединение";
  noticeForwarder_.reset();
  dbConnection_->close();
  dbConnection_.reset();
  transition(ConnectionState::Closed);
}

void PqConnection::changeDatabase(std::string_view name) {
  // PostgreSQL не переключает базу в открытой сессии, переподключаемся
  settings_.databaseName = name;
  if (dbConnection_) {
    close();
    open();
  }
}

ConnectionState PqConnection::state() const {
  return dbConnection_ ? ConnectionState::Open : ConnectionState::Closed;
}

void PqConnection::onStateChange(StateChangeListener listener) {
  stateListeners_.push_back(std::move(listener));
}

void PqConnection::onInfoMessage(InfoMessageListener listener) {
  infoListeners_.push_back(std::move(listener));
}

std::string PqConnection::identityClause() const {
  return " returning lastval()";
}

void PqConnection::transition(ConnectionState next) {
  StateChange change{next == ConnectionState::Open ? ConnectionState::Closed
                                                   : ConnectionState::Open,
                     next};
  for (auto &&listener : stateListeners_) {
    listener(change);
  }
}

void PqConnection::requireOpen() const {
  if (!dbConnection_) {
    throw DatabaseError("Connection is not open", "08003");
  }
}

pqxx::result PqConnection::run(Command &command) {
  requireOpen();
  auto statement = prepare(command);
  return translateErrors([&] {
    pqxx::work worker(*dbConnection_);
    BOOST_LOG_TRIVIAL(debug) << "[БД] Выполняю: " << statement.sql;
    auto result = worker.exec(statement.sql, statement.params);
    worker.commit();
    if (command.kind == CommandKind::StoredProcedure) {
      populateOutputs(command, result);
    }
    return result;
  });
}

size_t PqConnection::executeNonQuery(Command &command) {
  auto result = run(command);
  auto affected = static_cast<size_t>(result.affected_rows());
  BOOST_LOG_TRIVIAL(debug) << "[БД] Затронуто строк: " << affected;
  return affected;
}

Field PqConnection::executeScalar(Command &command) {
  auto result = run(command);
  if (result.empty() || result.columns() == 0) {
    return std::monostate();
  }
  return fromOid(result[0][0]);
}

std::unique_ptr<AbstractReader>
PqConnection::executeReader(Command &command, ReaderBehavior behavior) {
  if (behavior == ReaderBehavior::SequentialAccess) {
    requireOpen();
    auto statement = prepare(command);
    BOOST_LOG_TRIVIAL(debug) << "[БД] Последовательное чтение: "
                             << statement.sql;
    return translateErrors([&]() -> std::unique_ptr<AbstractReader> {
      return std::make_unique<SequentialPqReader>(*dbConnection_, statement);
    });
  }
  auto result = run(command);
  BOOST_LOG_TRIVIAL(debug) << "[БД] Получено строк: " << result.size();
  return std::make_unique<PqReader>(std::move(result));
}
} // namespace sqlflow::database
