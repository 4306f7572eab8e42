#include "naming.hpp"

#include <cctype>
#include <sstream>

namespace sqlflow::naming {
namespace {
bool isSeparator(char c) { return c == '_' || c == '-' || c == ' '; }

bool isUpper(char c) { return std::isupper(static_cast<unsigned char>(c)); }

bool isLower(char c) { return std::islower(static_cast<unsigned char>(c)); }

bool isDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)); }

char toLower(char c) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

char toUpper(char c) {
  return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

std::string capitalize(std::string word) {
  if (!word.empty()) {
    word.front() = toUpper(word.front());
  }
  return word;
}
} // namespace

std::vector<std::string> splitWords(std::string_view name) {
  std::vector<std::string> words;
  std::string current;
  for (size_t i = 0; i < name.size(); ++i) {
    char c = name[i];
    if (isSeparator(c)) {
      if (!current.empty()) {
        words.push_back(std::move(current));
        current.clear();
      }
      continue;
    }
    if (isUpper(c) && !current.empty()) {
      char prev = name[i - 1];
      bool nextIsLower = i + 1 < name.size() && isLower(name[i + 1]);
      if (isLower(prev) || isDigit(prev) || (isUpper(prev) && nextIsLower)) {
        words.push_back(std::move(current));
        current.clear();
      }
    }
    current.push_back(toLower(c));
  }
  if (!current.empty()) {
    words.push_back(std::move(current));
  }
  return words;
}

std::string snakeCase(std::string_view name) {
  std::stringstream result;
  int idx = 0;
  for (auto &&word : splitWords(name)) {
    if (idx++ != 0) {
      result << "_";
    }
    result << word;
  }
  return result.str();
}

std::string camelCase(std::string_view name) {
  std::string result;
  int idx = 0;
  for (auto &&word : splitWords(name)) {
    result += idx++ == 0 ? word : capitalize(word);
  }
  return result;
}

std::string titleCase(std::string_view name) {
  std::string result;
  for (auto &&word : splitWords(name)) {
    result += capitalize(word);
  }
  return result;
}
} // namespace sqlflow::naming
