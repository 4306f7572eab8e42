#include "dialect.hpp"
#include "database_iface.hpp"

#include <algorithm>
#include <format>
#include <sstream>

namespace sqlflow::database {
namespace {
std::string quoteValue(std::string_view value) {
  std::string quoted = "'";
  for (char c : value) {
    if (c == '\'' || c == '\\') {
      quoted.push_back('\\');
    }
    quoted.push_back(c);
  }
  quoted.push_back('\'');
  return quoted;
}

bool isIdentifierStart(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool isIdentifierChar(char c) {
  return isIdentifierStart(c) || (c >= '0' && c <= '9');
}

// Копирует в out фрагмент от pos до закрывающего terminator включительно
size_t copyQuoted(std::string_view sql, size_t pos, char terminator,
                  std::string &out) {
  out.push_back(sql[pos++]);
  while (pos < sql.size()) {
    char c = sql[pos++];
    out.push_back(c);
    if (c == terminator) {
      break;
    }
  }
  return pos;
}

size_t copyUntil(std::string_view sql, size_t pos, std::string_view terminator,
                 std::string &out) {
  size_t end = sql.find(terminator, pos);
  end = end == std::string_view::npos ? sql.size() : end + terminator.size();
  out.append(sql.substr(pos, end - pos));
  return end;
}

int hexDigit(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  throw DatabaseError(std::format("Invalid hex digit in bytea value: {}", c));
}

std::string_view hexDigits(std::string_view hexText) {
  if (!hexText.starts_with("\\x")) {
    throw DatabaseError("Unsupported bytea output format, expected hex");
  }
  return hexText.substr(2);
}
} // namespace

std::string connectionString(const ConnectionSettings &settings) {
  std::stringstream connBuilder;
  connBuilder << "host=" << quoteValue(settings.host)
              << " port=" << settings.port;
  if (!settings.databaseName.empty()) {
    connBuilder << " dbname=" << quoteValue(settings.databaseName);
  }
  if (!settings.userName.empty()) {
    connBuilder << " user=" << quoteValue(settings.userName);
  }
  if (!settings.password.empty()) {
    connBuilder << " password=" << quoteValue(settings.password);
  }
  connBuilder << " connect_timeout=" << settings.connectTimeout.count()
              << " application_name=" << quoteValue(settings.applicationName);
  return connBuilder.str();
}

PositionalSql rewriteNamedParameters(std::string_view sql,
                                     const std::vector<std::string> &available) {
  PositionalSql positional;
  auto &result = positional.text;
  auto &names = positional.names;
  result.reserve(sql.size());
  size_t pos = 0;
  while (pos < sql.size()) {
    char c = sql[pos];
    if (c == '\'' || c == '"') {
      pos = copyQuoted(sql, pos, c, result);
      continue;
    }
    if (sql.substr(pos, 2) == "--") {
      pos = copyUntil(sql, pos, "\n", result);
      continue;
    }
    if (sql.substr(pos, 2) == "/*") {
      pos = copyUntil(sql, pos, "*/", result);
      continue;
    }
    if (c == '@' && pos + 1 < sql.size() && sql[pos + 1] == '@') {
      result.append("@@");
      pos += 2;
      continue;
    }
    if (c == '@' && pos + 1 < sql.size() && isIdentifierStart(sql[pos + 1])) {
      size_t end = pos + 1;
      while (end < sql.size() && isIdentifierChar(sql[end])) {
        ++end;
      }
      auto name = sql.substr(pos + 1, end - pos - 1);
      if (std::find(available.begin(), available.end(), name) ==
          available.end()) {
        throw DatabaseError(std::format("Parameter @{} is not bound", name),
                            "42P02");
      }
      auto found = std::find(names.begin(), names.end(), name);
      if (found == names.end()) {
        found = names.insert(names.end(), std::string(name));
      }
      result.append(std::format("${}", found - names.begin() + 1));
      pos = end;
      continue;
    }
    result.push_back(c);
    ++pos;
  }
  return positional;
}

std::string procedureCall(std::string_view procedureName,
                          const std::vector<std::string> &names) {
  std::stringstream args;
  int idx = 1;
  for (auto &&name : names) {
    if (idx != 1) {
      args << ", ";
    }
    args << name << " => $" << idx;
    idx++;
  }
  return std::format("select * from {}({})", procedureName, args.str());
}

std::string tableDirect(std::string_view tableName) {
  return std::format("select * from {}", tableName);
}

size_t hexSliceLength(std::string_view hexText) {
  return hexDigits(hexText).size() / 2;
}

size_t decodeHexSlice(std::string_view hexText, size_t offset,
                      std::span<std::byte> buffer) {
  auto digits = hexDigits(hexText);
  size_t length = digits.size() / 2;
  if (offset >= length) {
    return 0;
  }
  size_t count = std::min(buffer.size(), length - offset);
  for (size_t i = 0; i < count; ++i) {
    size_t at = (offset + i) * 2;
    buffer[i] = static_cast<std::byte>(hexDigit(digits[at]) * 16 +
                                       hexDigit(digits[at + 1]));
  }
  return count;
}
std::string quoteIdentifier(std::string_view name) {
  std::string quoted = "\"";
  for (char c : name) {
    if (c == '"') {
      quoted.push_back('"');
    }
    quoted.push_back(c);
  }
  quoted.push_back('"');
  return quoted;
}

std::string streamMaterialize(std::string_view sql) {
  return std::format("create temporary table {} on commit drop as "
                     "select row_number() over () as {}, src.* from ({}) as src",
                     kStreamTable, kStreamRowColumn, sql);
}

std::string streamDescribe() {
  return std::format("select * from {} limit 0", kStreamTable);
}

std::string streamRow(const std::vector<StreamColumn> &columns) {
  std::stringstream select;
  int idx = 1;
  for (auto &&column : columns) {
    if (idx != 1) {
      select << ", ";
    }
    auto name = quoteIdentifier(column.name);
    if (column.binary) {
      select << "null::bytea as " << name;
    } else {
      select << name;
    }
    idx++;
  }
  return std::format("select {} from {} where {} = $1", select.str(),
                     kStreamTable, kStreamRowColumn);
}

std::string streamSlice(const StreamColumn &column) {
  auto name = quoteIdentifier(column.name);
  auto bytes = column.binary
                   ? name
                   : std::format("convert_to({}::text, 'UTF8')", name);
  return std::format("select substring({} from $1::integer + 1 "
                     "for $2::integer) from {} where {} = $3",
                     bytes, kStreamTable, kStreamRowColumn);
}

std::string streamValue(const StreamColumn &column) {
  return std::format("select {} from {} where {} = $1",
                     quoteIdentifier(column.name), kStreamTable,
                     kStreamRowColumn);
}
} // namespace sqlflow::database
