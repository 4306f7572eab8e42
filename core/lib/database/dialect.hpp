#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sqlflow::database {
struct ConnectionSettings {
  std::string host = "localhost";
  uint16_t port = 5432;
  std::string databaseName;
  std::string userName;
  std::string password;
  std::string applicationName = "sqlflow";
  std::chrono::seconds connectTimeout{30};
};

std::string connectionString(const ConnectionSettings &settings);

// Текст для сервера и имена параметров в порядке $1, $2, ...
struct PositionalSql {
  std::string text;
  std::vector<std::string> names;
};

/**
 * @brief Заменяет именованные параметры @name на позиционные $n.
 *
 * Номера выдаются подряд в порядке первого упоминания, поэтому в names
 * попадают только параметры, которые встречаются в тексте. Строковые
 * литералы, идентификаторы в кавычках, комментарии и "@@" не трогаются.
 * Имя, которого нет в available, приводит к DatabaseError.
 */
PositionalSql rewriteNamedParameters(std::string_view sql,
                                     const std::vector<std::string> &available);

// select * from proc(a => $1, b => $2)
std::string procedureCall(std::string_view procedureName,
                          const std::vector<std::string> &names);

// select * from table
std::string tableDirect(std::string_view tableName);

/**
 * @brief Декодирует часть значения bytea в hex-формате ("\x0a0b...").
 *
 * @return Число байт, записанных в buffer; 0 за концом значения.
 */
size_t decodeHexSlice(std::string_view hexText, size_t offset,
                      std::span<std::byte> buffer);

// Длина значения bytea в байтах
size_t hexSliceLength(std::string_view hexText);

// "name" с удвоением кавычек внутри
std::string quoteIdentifier(std::string_view name);

/*
 * Последовательное чтение: результат запроса один раз сохраняется во
 * временной таблице на время транзакции, а строки и куски колонок
 * забираются оттуда отдельными запросами.
 */
inline constexpr std::string_view kStreamTable = "sqlflow_stream";
inline constexpr std::string_view kStreamRowColumn = "sqlflow_row";

struct StreamColumn {
  std::string name;
  bool binary = false;
};

// create temporary table sqlflow_stream on commit drop as ...
std::string streamMaterialize(std::string_view sql);

// Пустая выборка для имён и типов колонок
std::string streamDescribe();

// Строка номер $1 без содержимого бинарных колонок
std::string streamRow(const std::vector<StreamColumn> &columns);

// Не больше $2 байт колонки начиная с байта $1 (с нуля) в строке $3
std::string streamSlice(const StreamColumn &column);

// Полное значение одной колонки в строке $1
std::string streamValue(const StreamColumn &column);
} // namespace sqlflow::database
