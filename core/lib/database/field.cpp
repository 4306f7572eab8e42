#include "field.hpp"

#include <iomanip>
#include <sstream>

namespace sqlflow::database {
std::ostream &operator<<(std::ostream &os, const Field &field) {
  auto visitor = Overload{
      [&os](std::monostate) { os << "NULL"; },
      [&os](bool b) { os << (b ? "true" : "false"); },
      [&os](int16_t x) { os << x; },
      [&os](int32_t x) { os << x; },
      [&os](int64_t x) { os << x; },
      [&os](float x) { os << x; },
      [&os](double x) { os << x; },
      [&os](const std::string &s) { os << "'" << s << "'"; },
      [&os](const boost::uuids::uuid &u) {
        os << "'" << boost::uuids::to_string(u) << "'::uuid";
      },
      [&os](const Blob &blob) {
        std::ostringstream hex;
        hex << std::hex << std::setfill('0');
        for (std::byte b : blob) {
          hex << std::setw(2) << std::to_integer<int>(b);
        }
        os << "'\\x" << hex.str() << "'";
      },
  };
  std::visit(visitor, field);
  return os;
}

std::string stringify(const Field &field) {
  std::stringstream sss;
  sss << field;
  return sss.str();
}
} // namespace sqlflow::database
