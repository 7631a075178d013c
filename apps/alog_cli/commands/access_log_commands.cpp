#include "access_log_commands.h"

#include "alog/cooldown/cooldown_evaluator.h"
#include "alog/domain/log_record_json.h"
#include "alog/privacy/anonymizer.h"

#include <nlohmann/json.hpp>

#include <iostream>

namespace alog::cli {

int report_error(const core::Error& error) {
  std::cerr << "Error: " << core::to_string(error.code) << ": " << error.message << "\n";
  return 1;
}

int execute_record(const CliConfig& config, storage::IAccessLog& log, std::ostream& out) {
  auto fields = to_new_log_record(config);
  if (!fields.has_value()) {
    return report_error(fields.error());
  }

  auto record = log.create(fields.value());
  if (!record.has_value()) {
    return report_error(record.error());
  }

  out << domain::log_record_to_json(record.value()).dump() << "\n";
  return 0;
}

int execute_get(const std::string& id_text, const storage::IAccessLog& log, std::ostream& out) {
  auto id = core::BinaryId::parse(id_text);
  if (!id.has_value()) {
    return report_error(id.error());
  }

  auto record = log.get(id.value());
  if (!record.has_value()) {
    return report_error(record.error());
  }
  if (!record.value().has_value()) {
    std::cerr << "Log not found: " << id_text << "\n";
    return 1;
  }

  out << domain::log_record_to_json(*record.value()).dump() << "\n";
  return 0;
}

int execute_search(const CliConfig& config, const storage::IAccessLog& log, std::ostream& out) {
  auto filter = to_log_filter(config);
  if (!filter.has_value()) {
    return report_error(filter.error());
  }

  auto records = log.search(filter.value(), config.sort, config.page);
  if (!records.has_value()) {
    return report_error(records.error());
  }

  // One record per line, in result order.
  for (const auto& record : records.value()) {
    out << domain::log_record_to_json(record).dump() << "\n";
  }
  return 0;
}

int execute_count(const CliConfig& config, const storage::IAccessLog& log, std::ostream& out) {
  auto filter = to_log_filter(config);
  if (!filter.has_value()) {
    return report_error(filter.error());
  }

  auto count = log.count(filter.value());
  if (!count.has_value()) {
    return report_error(count.error());
  }

  out << nlohmann::json{{"count", count.value()}}.dump() << "\n";
  return 0;
}

int execute_delete(const std::string& id_text, storage::IAccessLog& log, std::ostream& out) {
  auto id = core::BinaryId::parse(id_text);
  if (!id.has_value()) {
    return report_error(id.error());
  }

  auto removed = log.remove(id.value());
  if (!removed.has_value()) {
    return report_error(removed.error());
  }

  out << nlohmann::json{{"deleted", removed.value()}, {"id", id.value().to_string()}}.dump()
      << "\n";
  return 0;
}

int execute_prune(const CliConfig& config, storage::IAccessLog& log, std::ostream& out) {
  auto pruned = log.prune(config.before);
  if (!pruned.has_value()) {
    return report_error(pruned.error());
  }

  nlohmann::json result{{"pruned", pruned.value()}};
  result["created_before"] =
      config.before.has_value() ? nlohmann::json(*config.before) : nlohmann::json(nullptr);
  out << result.dump() << "\n";
  return 0;
}

int execute_scopes(const storage::IAccessLog& log, std::ostream& out) {
  auto scopes = log.unique_scopes();
  if (!scopes.has_value()) {
    return report_error(scopes.error());
  }

  nlohmann::json result = nlohmann::json::array();
  for (const auto& scope : scopes.value()) {
    result.push_back(scope);
  }
  out << result.dump() << "\n";
  return 0;
}

int execute_cooldown(const CliConfig& config, const storage::IAccessLog& log, core::IClock& clock,
                     std::ostream& out) {
  if (!config.scope.has_value() || !config.amount.has_value() || !config.period.has_value()) {
    std::cerr << "Error: cooldown requires --scope <s> --amount <n> --period <seconds>\n";
    return 1;
  }

  std::optional<net::IpAddress> origin;
  if (config.origin.has_value()) {
    auto parsed = net::IpAddress::parse(*config.origin);
    if (!parsed.has_value()) {
      return report_error(parsed.error());
    }
    origin = parsed.value();
  }

  std::optional<core::BinaryId> subject;
  if (config.subject.has_value()) {
    auto parsed = core::BinaryId::parse(*config.subject);
    if (!parsed.has_value()) {
      return report_error(parsed.error());
    }
    subject = parsed.value();
  }

  cooldown::CooldownEvaluator evaluator(log, clock);
  auto limited = evaluator.cooldown(*config.scope, *config.amount, *config.period, origin, subject);
  if (!limited.has_value()) {
    return report_error(limited.error());
  }

  out << nlohmann::json{{"cooldown", limited.value()}, {"scope", *config.scope}}.dump() << "\n";
  return 0;
}

int execute_anonymize_id(const std::string& id_text, const CliConfig& config,
                         storage::IAccessLog& log, core::IIdGenerator& id_gen, std::ostream& out) {
  auto old_id = core::BinaryId::parse(id_text);
  if (!old_id.has_value()) {
    return report_error(old_id.error());
  }
  if (old_id.value().is_nil()) {
    std::cerr << "Error: anonymize-id requires a non-empty id\n";
    return 1;
  }

  std::optional<core::BinaryId> new_id;
  if (config.new_id.has_value()) {
    auto parsed = core::BinaryId::parse(*config.new_id);
    if (!parsed.has_value()) {
      return report_error(parsed.error());
    }
    new_id = parsed.value();
  }

  privacy::Anonymizer anonymizer(log, id_gen);
  auto replacement = anonymizer.anonymize_id(old_id.value(), new_id);
  if (!replacement.has_value()) {
    return report_error(replacement.error());
  }

  out << nlohmann::json{{"old_id", old_id.value().to_string()},
                        {"new_id", replacement.value().to_string()}}
             .dump()
      << "\n";
  return 0;
}

int execute_anonymize_origins(const CliConfig& config, storage::IAccessLog& log,
                              core::IIdGenerator& id_gen, std::ostream& out) {
  auto filter = to_log_filter(config);
  if (!filter.has_value()) {
    return report_error(filter.error());
  }

  auto records = log.search(filter.value(), config.sort, config.page);
  if (!records.has_value()) {
    return report_error(records.error());
  }

  privacy::Anonymizer anonymizer(log, id_gen);
  auto updated = anonymizer.anonymize_origins(records.value());
  if (!updated.has_value()) {
    return report_error(updated.error());
  }

  out << nlohmann::json{{"anonymized", updated.value()}}.dump() << "\n";
  return 0;
}

}  // namespace alog::cli
