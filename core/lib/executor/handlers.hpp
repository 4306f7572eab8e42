#pragma once

#include <chrono>
#include <deque>
#include <functional>

#include "database_iface.hpp"

namespace sqlflow {
class CommandExecutor;

struct CommandExecutedEvent {
  std::chrono::nanoseconds elapsed;
  const database::Command &command;
};

/**
 * @brief Список обработчиков события. Только добавление, вызов в порядке
 * регистрации.
 */
template <typename Payload> struct HandlerList {
  using Handler = std::function<void(CommandExecutor &, const Payload &)>;

  void add(Handler handler) { handlers_.push_back(std::move(handler)); }

  // Обработчики, добавленные во время рассылки, её не получают.
  // deque не перемещает элементы при push_back
  void dispatch(CommandExecutor &sender, const Payload &payload) const {
    const size_t count = handlers_.size();
    for (size_t idx = 0; idx < count; ++idx) {
      handlers_[idx](sender, payload);
    }
  }

  const Handler &at(size_t idx) const { return handlers_.at(idx); }
  size_t size() const { return handlers_.size(); }
  bool empty() const { return handlers_.empty(); }

private:
  std::deque<Handler> handlers_;
};

struct HandlerRegistry {
  HandlerList<database::DatabaseError> errors;
  HandlerList<database::InfoMessage> infoMessages;
  HandlerList<database::StateChange> stateChanges;
  HandlerList<CommandExecutedEvent> executed;
};
} // namespace sqlflow
