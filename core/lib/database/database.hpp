#pragma once

#include <memory>
#include <vector>

#include <pqxx/pqxx>

#include "database_iface.hpp"
#include "dialect.hpp"

namespace sqlflow::database {
/**
 * @brief Соединение с PostgreSQL поверх libpqxx.
 *
 * Каждая команда выполняется в собственной транзакции pqxx::work.
 */
struct PqConnection final : AbstractConnection {
  explicit PqConnection(ConnectionSettings settings);
  ~PqConnection() override;

  PqConnection(const PqConnection &) = delete;
  PqConnection &operator=(const PqConnection &) = delete;

  void open() final;
  void close() final;
  void changeDatabase(std::string_view name) final;
  ConnectionState state() const final;

  void onStateChange(StateChangeListener listener) final;
  void onInfoMessage(InfoMessageListener listener) final;

  std::string identityClause() const final;

  size_t executeNonQuery(Command &command) final;
  Field executeScalar(Command &command) final;
  std::unique_ptr<AbstractReader> executeReader(Command &command,
                                                ReaderBehavior behavior) final;

private:
  struct NoticeForwarder;

  void requireOpen() const;
  pqxx::result run(Command &command);
  void transition(ConnectionState next);

  ConnectionSettings settings_;
  // FIXME: pimpl
  std::unique_ptr<pqxx::connection> dbConnection_;
  std::unique_ptr<NoticeForwarder> noticeForwarder_;
  std::vector<StateChangeListener> stateListeners_;
  std::vector<InfoMessageListener> infoListeners_;
};
} // namespace sqlflow::database
