#include <boost/json.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <boost/program_options.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <cctype>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "command_executor.hpp"
#include "dialect.hpp"

namespace json = boost::json;
namespace po = boost::program_options;

namespace {
/**
 * @brief Разбирает "name=value": целые числа становятся int64, "null" -
 * NULL, остальное - строкой.
 */
std::pair<std::string, sqlflow::database::Field>
parseParameter(const std::string &text) {
  auto eq = text.find('=');
  if (eq == std::string::npos || eq == 0) {
    throw po::error("Parameter must look like name=value: " + text);
  }
  auto name = text.substr(0, eq);
  auto value = text.substr(eq + 1);
  if (value == "null") {
    return {name, std::monostate()};
  }
  int64_t number = 0;
  if (boost::conversion::try_lexical_convert(value, number)) {
    return {name, number};
  }
  return {name, value};
}

json::value toJson(const sqlflow::database::Field &field) {
  auto visitor = sqlflow::database::Overload{
      [](std::monostate) -> json::value { return nullptr; },
      [](bool b) -> json::value { return b; },
      [](int16_t x) -> json::value { return x; },
      [](int32_t x) -> json::value { return x; },
      [](int64_t x) -> json::value { return x; },
      [](float x) -> json::value { return static_cast<double>(x); },
      [](double x) -> json::value { return x; },
      [](const std::string &s) -> json::value { return json::string(s); },
      [](const boost::uuids::uuid &u) -> json::value {
        return json::string(boost::uuids::to_string(u));
      },
      [](const sqlflow::database::Blob &blob) -> json::value {
        std::ostringstream hex;
        hex << "\\x" << std::hex << std::setfill('0');
        for (std::byte b : blob) {
          hex << std::setw(2) << std::to_integer<int>(b);
        }
        return json::string(hex.str());
      },
  };
  return std::visit(visitor, field);
}

// SQLFLOW_HOST -> host, SQLFLOW_DBNAME -> dbname
std::string environmentOption(const std::string &variable) {
  static const std::string kPrefix = "SQLFLOW_";
  if (variable.rfind(kPrefix, 0) != 0) {
    return "";
  }
  auto option = variable.substr(kPrefix.size());
  for (auto &c : option) {
    c = c == '_' ? '-'
                 : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return option;
}
} // namespace

/**
 * @brief Выполняет одну команду и печатает результат в JSON
 *
 * @return int Код завершения
 */
int main(int argc, char *argv[]) {
  try {
    po::options_description desc("Allowed options");
    desc.add_options()("help,h", "Show help message")(
        "host", po::value<std::string>()->default_value("localhost"),
        "Database host")("port", po::value<uint16_t>()->default_value(5432),
                         "Database port")(
        "dbname", po::value<std::string>()->default_value(""),
        "Database name")("user", po::value<std::string>()->default_value(""),
                         "Database user")(
        "password", po::value<std::string>()->default_value(""),
        "Database password")("sql", po::value<std::string>(),
                             "SQL text to execute")(
        "procedure", po::value<std::string>(), "Stored procedure to call")(
        "param,p", po::value<std::vector<std::string>>()->composing(),
        "Parameter as name=value, may be repeated")(
        "mode", po::value<std::string>()->default_value("rows"),
        "rows | scalar | nonquery")("keep-open",
                                    "Do not close the connection after reads")(
        "verbose,v", "Log pipeline details");

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::store(po::parse_environment(desc,
                                    [&desc](const std::string &variable) {
                                      auto option = environmentOption(variable);
                                      return desc.find_nothrow(option, false)
                                                 ? option
                                                 : std::string();
                                    }),
              vm);
    po::notify(vm);

    if (vm.count("help")) {
      std::cout << desc << std::endl;
      return EXIT_SUCCESS;
    }

    boost::log::core::get()->set_filter(
        boost::log::trivial::severity >= (vm.count("verbose")
                                              ? boost::log::trivial::debug
                                              : boost::log::trivial::warning));

    if (vm.count("sql") == vm.count("procedure")) {
      throw po::error("Exactly one of --sql and --procedure is required");
    }

    sqlflow::database::ConnectionSettings settings;
    settings.host = vm["host"].as<std::string>();
    settings.port = vm["port"].as<uint16_t>();
    settings.databaseName = vm["dbname"].as<std::string>();
    settings.userName = vm["user"].as<std::string>();
    settings.password = vm["password"].as<std::string>();

    sqlflow::database::FieldList params;
    if (vm.count("param")) {
      for (auto &&text : vm["param"].as<std::vector<std::string>>()) {
        params.push_back(parseParameter(text));
      }
    }

    sqlflow::CommandExecutor executor(settings, !vm.count("keep-open"));
    executor.onInfo([](auto &, const sqlflow::database::InfoMessage &info) {
      BOOST_LOG_TRIVIAL(info) << "[MAIN] " << info.severity << ": "
                              << info.message;
    });
    if (vm.count("sql")) {
      executor.createTextCommand(vm["sql"].as<std::string>(), params);
    } else {
      executor.createProcedureCommand(vm["procedure"].as<std::string>(),
                                      params);
    }

    auto mode = vm["mode"].as<std::string>();
    json::value output;
    if (mode == "rows") {
      json::array rows;
      for (auto &&row : executor.executeDictionaries()) {
        json::object entry;
        for (auto &&[name, value] : row) {
          entry[name] = toJson(value);
        }
        rows.push_back(std::move(entry));
      }
      output = std::move(rows);
    } else if (mode == "scalar") {
      output = toJson(executor.executeScalar<sqlflow::database::Field>());
    } else if (mode == "nonquery") {
      output = json::object{
          {"records_affected", executor.executeRecordsAffected()}};
    } else {
      throw po::error("Unknown mode: " + mode);
    }
    std::cout << json::serialize(output) << std::endl;
  } catch (const std::exception &e) {
    BOOST_LOG_TRIVIAL(fatal) << "[MAIN] Ошибка: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
