#include "parameter_store.hpp"
#include "errors.hpp"

#include <algorithm>

namespace sqlflow {
namespace {
auto byName(std::string_view name) {
  return [name](const ParameterStore::Entry &entry) {
    return entry.first == name;
  };
}
} // namespace

void ParameterStore::add(std::string name, database::Field value) {
  if (contains(name)) {
    throw DuplicateParameterError(name);
  }
  entries_.emplace_back(std::move(name), std::move(value));
}

void ParameterStore::assign(std::string name, database::Field value) {
  auto found = std::find_if(entries_.begin(), entries_.end(), byName(name));
  if (found != entries_.end()) {
    found->second = std::move(value);
    return;
  }
  entries_.emplace_back(std::move(name), std::move(value));
}

bool ParameterStore::remove(std::string_view name) {
  auto found = std::find_if(entries_.begin(), entries_.end(), byName(name));
  if (found == entries_.end()) {
    return false;
  }
  entries_.erase(found);
  return true;
}

size_t ParameterStore::removeIf(const Predicate &predicate) {
  auto before = entries_.size();
  std::erase_if(entries_,
                [&](const Entry &entry) { return predicate(entry.second); });
  return before - entries_.size();
}

bool ParameterStore::contains(std::string_view name) const {
  return find(name) != nullptr;
}

const database::Field *ParameterStore::find(std::string_view name) const {
  auto found = std::find_if(entries_.begin(), entries_.end(), byName(name));
  return found == entries_.end() ? nullptr : &found->second;
}

std::vector<std::string> ParameterStore::names() const {
  std::vector<std::string> result;
  result.reserve(entries_.size());
  for (auto &&[name, _] : entries_) {
    result.push_back(name);
  }
  return result;
}
} // namespace sqlflow
