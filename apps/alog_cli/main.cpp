#include "alog/core/clock.h"
#include "alog/core/id_generator.h"
#include "alog/core/version.h"
#include "alog/storage/sqlite/sqlite_access_log.h"
#include "alog/storage/sqlite/sqlite_db.h"

#include "alog_cli/cli_config.h"
#include "commands/access_log_commands.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr const char* kEphemeralDb = ":memory:";

void print_usage() {
  std::cerr << "access-log-store v" << alog::core::kBuildVersion << "\n"
            << "Usage: alog_cli <command> [arguments] [options]\n\n"
            << "Commands:\n"
            << "  install | uninstall\n"
            << "  record             create a log record (--scope --origin --subject --object "
               "--id --time)\n"
            << "  get <id>           print one record\n"
            << "  search             print matching records, one JSON object per line\n"
            << "  count              count matching records\n"
            << "  delete <id>        remove one record\n"
            << "  prune              remove dated records (--before <t>)\n"
            << "  scopes             list distinct scopes\n"
            << "  cooldown           --scope <s> --amount <n> --period <seconds> [--origin] "
               "[--subject]\n"
            << "  anonymize-id <id>  replace a subject/object id (--new-id)\n"
            << "  anonymize-origins  coarsen origins of matching records\n\n"
            << "Options:\n"
            << alog::apps::describe_options(alog::cli::build_option_registry());
}

// Commands that take one positional id.
bool needs_positional_id(const std::string& command) {
  return command == "get" || command == "delete" || command == "anonymize-id";
}

int run_command(const std::string& command,
                const alog::apps::ParsedArgs<alog::cli::CliConfig>& args,
                alog::storage::sqlite::SqliteAccessLog& log, alog::core::IIdGenerator& id_gen,
                alog::core::IClock& clock) {
  const auto& config = args.config;
  const std::string positional = args.positional.empty() ? "" : args.positional.front();

  if (command == "install") {
    // install() already ran before dispatch.
    std::cout << nlohmann::json{{"installed", true}, {"table", log.table_name()}}.dump() << "\n";
    return 0;
  }
  if (command == "uninstall") {
    auto dropped = log.uninstall();
    if (!dropped.has_value()) {
      return alog::cli::report_error(dropped.error());
    }
    std::cout << nlohmann::json{{"uninstalled", true}, {"table", log.table_name()}}.dump()
              << "\n";
    return 0;
  }
  if (command == "record") {
    return alog::cli::execute_record(config, log, std::cout);
  }
  if (command == "get") {
    return alog::cli::execute_get(positional, log, std::cout);
  }
  if (command == "search") {
    return alog::cli::execute_search(config, log, std::cout);
  }
  if (command == "count") {
    return alog::cli::execute_count(config, log, std::cout);
  }
  if (command == "delete") {
    return alog::cli::execute_delete(positional, log, std::cout);
  }
  if (command == "prune") {
    return alog::cli::execute_prune(config, log, std::cout);
  }
  if (command == "scopes") {
    return alog::cli::execute_scopes(log, std::cout);
  }
  if (command == "cooldown") {
    return alog::cli::execute_cooldown(config, log, clock, std::cout);
  }
  if (command == "anonymize-id") {
    return alog::cli::execute_anonymize_id(positional, config, log, id_gen, std::cout);
  }
  if (command == "anonymize-origins") {
    return alog::cli::execute_anonymize_origins(config, log, id_gen, std::cout);
  }

  std::cerr << "Unknown command: " << command << "\n";
  print_usage();
  return 1;
}

}  // namespace

int main(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string command = argv[1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  if (command == "help" || command == "--help" || command == "-h") {
    print_usage();
    return 0;
  }

  const auto args = alog::cli::parse_cli_args(argc, argv);
  if (!args.errors.empty()) {
    for (const auto& error : args.errors) {
      std::cerr << error << "\n";
    }
    return 1;
  }

  const std::string config_error = alog::cli::validate_cli_config(args.config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  if (needs_positional_id(command) && args.positional.empty()) {
    std::cerr << "Error: " << command << " requires an <id> argument\n";
    return 1;
  }

  // ── Storage ──
  const std::string db_path = args.config.db_path.value_or(kEphemeralDb);
  if (!args.config.db_path.has_value()) {
    std::cerr << "WARNING: no --db given; using an ephemeral in-memory database.\n"
              << "         Records are discarded when the command exits.\n";
  }

  auto db_result = alog::storage::sqlite::SqliteDb::open(db_path);
  if (!db_result.has_value()) {
    std::cerr << "Failed to open database: " << db_result.error().message << "\n";
    return 1;
  }

  auto store_config = alog::cli::to_access_log_config(args.config);
  if (!store_config.has_value()) {
    return alog::cli::report_error(store_config.error());
  }

  alog::core::RandomIdGenerator id_gen;
  alog::core::SystemClock clock;

  auto log_result = alog::storage::sqlite::SqliteAccessLog::open(
      db_result.value(), store_config.value(), id_gen, clock);
  if (!log_result.has_value()) {
    return alog::cli::report_error(log_result.error());
  }
  auto& log = *log_result.value();

  if (command != "uninstall") {
    auto installed = log.install();
    if (!installed.has_value()) {
      std::cerr << "Failed to initialize schema: " << installed.error().message << "\n";
      return 1;
    }
  }

  return run_command(command, args, log, id_gen, clock);
}
