#pragma once

#include <memory>

#include "database_iface.hpp"

namespace sqlflow {
// Закрывает курсор при выходе из области видимости, в том числе по исключению
class ReaderScope {
public:
  explicit ReaderScope(std::unique_ptr<database::AbstractReader> reader)
      : reader_(std::move(reader)) {}

  ~ReaderScope() {
    if (reader_) {
      reader_->close();
    }
  }

  ReaderScope(const ReaderScope &) = delete;
  ReaderScope &operator=(const ReaderScope &) = delete;

  explicit operator bool() const noexcept { return reader_ != nullptr; }

  database::AbstractReader &operator*() const { return *reader_; }
  database::AbstractReader *operator->() const { return reader_.get(); }

private:
  std::unique_ptr<database::AbstractReader> reader_;
};
} // namespace sqlflow
