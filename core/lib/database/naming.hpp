#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace sqlflow::naming {
/**
 * @brief Разбивает идентификатор на слова по '_', '-', пробелам и смене
 * регистра: "HTTPServerName" -> {"http", "server", "name"}.
 */
std::vector<std::string> splitWords(std::string_view name);

// person_name
std::string snakeCase(std::string_view name);

// personName
std::string camelCase(std::string_view name);

// PersonName
std::string titleCase(std::string_view name);
} // namespace sqlflow::naming
