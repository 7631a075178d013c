#pragma once

#include "alog/core/clock.h"
#include "alog/core/id_generator.h"
#include "alog/storage/access_log.h"

#include "alog_cli/cli_config.h"

#include <ostream>
#include <string>

// Subcommand bodies. Each prints JSON results to `out`, diagnostics to stderr, and
// returns the process exit code. They take only interface types; no concrete storage
// headers may be included in this TU.
namespace alog::cli {

int execute_record(const CliConfig& config, storage::IAccessLog& log, std::ostream& out);
int execute_get(const std::string& id_text, const storage::IAccessLog& log, std::ostream& out);
int execute_search(const CliConfig& config, const storage::IAccessLog& log, std::ostream& out);
int execute_count(const CliConfig& config, const storage::IAccessLog& log, std::ostream& out);
int execute_delete(const std::string& id_text, storage::IAccessLog& log, std::ostream& out);
int execute_prune(const CliConfig& config, storage::IAccessLog& log, std::ostream& out);
int execute_scopes(const storage::IAccessLog& log, std::ostream& out);
int execute_cooldown(const CliConfig& config, const storage::IAccessLog& log, core::IClock& clock,
                     std::ostream& out);
int execute_anonymize_id(const std::string& id_text, const CliConfig& config,
                         storage::IAccessLog& log, core::IIdGenerator& id_gen, std::ostream& out);
int execute_anonymize_origins(const CliConfig& config, storage::IAccessLog& log,
                              core::IIdGenerator& id_gen, std::ostream& out);

// Print "Error: <code>: <message>" to stderr and return 1.
int report_error(const core::Error& error);

}  // namespace alog::cli
