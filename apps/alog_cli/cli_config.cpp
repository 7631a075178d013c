#include "cli_config.h"

#include "alog/core/binary_id.h"
#include "alog/net/ip_address.h"

#include <stdexcept>

namespace alog::cli {

namespace {

// ────────────────────────────────────────────────────────────────
// Value Conversion
// ────────────────────────────────────────────────────────────────

bool store_integer(std::optional<std::int64_t>& target, const std::string& value) {
  const auto parsed = parse_integer(value);
  if (!parsed.has_value()) {
    return false;
  }
  target = parsed;
  return true;
}

bool store_size(std::size_t& target, const std::string& value) {
  const auto parsed = parse_integer(value);
  if (!parsed.has_value() || *parsed < 0) {
    return false;
  }
  target = static_cast<std::size_t>(*parsed);
  return true;
}

template <typename T, typename Parse>
core::Result<std::optional<std::vector<T>>, core::Error> parse_list(
    const std::optional<std::string>& flag_value, const char* flag, Parse parse) {
  using ListResult = core::Result<std::optional<std::vector<T>>, core::Error>;
  if (!flag_value.has_value()) {
    return ListResult::ok(std::nullopt);
  }
  std::vector<T> values;
  for (const auto& token : split_list(*flag_value)) {
    auto parsed = parse(token);
    if (!parsed.has_value()) {
      return ListResult::err(core::Error{parsed.error().code, std::string(flag) + ": " +
                                                                  parsed.error().message});
    }
    values.push_back(parsed.value());
  }
  return ListResult::ok(std::move(values));
}

core::Result<core::BinaryId, core::Error> parse_id(const std::string& text) {
  return core::BinaryId::parse(text);
}

core::Result<net::IpAddress, core::Error> parse_address(const std::string& text) {
  return net::IpAddress::parse(text);
}

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

bool handle_sort(CliConfig& config, const std::string& value) {
  const auto field = storage::parse_sort_field(value);
  if (!field.has_value()) {
    return false;
  }
  config.sort.field = *field;
  return true;
}

bool handle_order(CliConfig& config, const std::string& value) {
  const auto order = storage::parse_sort_order(value);
  if (!order.has_value()) {
    return false;
  }
  config.sort.order = *order;
  return true;
}

bool handle_page_size(CliConfig& config, const std::string& value) {
  std::size_t size = 0;
  if (!store_size(size, value)) {
    return false;
  }
  config.page.page_size = size;
  return true;
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<CliConfig>> build_option_registry() {
  using Opt = apps::Option<CliConfig>;
  return {
      Opt{"--db", true, "SQLite database file (default: ephemeral :memory:)",
          [](CliConfig& c, const std::string& v) {
            c.db_path = v;
            return true;
          }},
      Opt{"--prefix", true, "Table name prefix ([A-Za-z0-9_-])",
          [](CliConfig& c, const std::string& v) {
            c.table_prefix = v;
            return true;
          }},
      Opt{"--default-origin", true, "Origin assumed when a record or cooldown gives none",
          [](CliConfig& c, const std::string& v) {
            c.default_origin = v;
            return true;
          }},
      Opt{"--scope-length", true, "Maximum scope length (default 16)",
          [](CliConfig& c, const std::string& v) { return store_size(c.scope_length, v); }},
      Opt{"--id", true, "Log id for record (generated when absent)",
          [](CliConfig& c, const std::string& v) {
            c.id = v;
            return true;
          }},
      Opt{"--time", true, "Creation time in Unix seconds (default: now)",
          [](CliConfig& c, const std::string& v) { return store_integer(c.creation_time, v); }},
      Opt{"--scope", true, "Event scope",
          [](CliConfig& c, const std::string& v) {
            c.scope = v;
            return true;
          }},
      Opt{"--origin", true, "Remote origin (IPv4 or IPv6)",
          [](CliConfig& c, const std::string& v) {
            c.origin = v;
            return true;
          }},
      Opt{"--subject", true, "Subject id",
          [](CliConfig& c, const std::string& v) {
            c.subject = v;
            return true;
          }},
      Opt{"--object", true, "Object id",
          [](CliConfig& c, const std::string& v) {
            c.object = v;
            return true;
          }},
      Opt{"--new-id", true, "Replacement id for anonymize-id (generated when absent)",
          [](CliConfig& c, const std::string& v) {
            c.new_id = v;
            return true;
          }},
      Opt{"--ids", true, "Filter: log ids (comma separated)",
          [](CliConfig& c, const std::string& v) {
            c.ids = v;
            return true;
          }},
      Opt{"--scopes", true, "Filter: scopes (comma separated)",
          [](CliConfig& c, const std::string& v) {
            c.scopes = v;
            return true;
          }},
      Opt{"--origins", true, "Filter: remote origins (comma separated)",
          [](CliConfig& c, const std::string& v) {
            c.origins = v;
            return true;
          }},
      Opt{"--subjects", true, "Filter: subject ids (comma separated)",
          [](CliConfig& c, const std::string& v) {
            c.subjects = v;
            return true;
          }},
      Opt{"--objects", true, "Filter: object ids (comma separated)",
          [](CliConfig& c, const std::string& v) {
            c.objects = v;
            return true;
          }},
      Opt{"--after", true, "Filter: created strictly after (Unix seconds)",
          [](CliConfig& c, const std::string& v) { return store_integer(c.after, v); }},
      Opt{"--before", true, "Filter / prune cutoff: created strictly before (Unix seconds)",
          [](CliConfig& c, const std::string& v) { return store_integer(c.before, v); }},
      Opt{"--sort", true, "Sort field (creation_time|id)", handle_sort},
      Opt{"--order", true, "Sort order (asc|desc)", handle_order},
      Opt{"--page", true, "0-based page number",
          [](CliConfig& c, const std::string& v) { return store_size(c.page.page, v); }},
      Opt{"--page-size", true, "Rows per page (default: all rows)", handle_page_size},
      Opt{"--amount", true, "Cooldown: events allowed per period",
          [](CliConfig& c, const std::string& v) { return store_integer(c.amount, v); }},
      Opt{"--period", true, "Cooldown: window length in seconds",
          [](CliConfig& c, const std::string& v) { return store_integer(c.period, v); }},
  };
}

// ────────────────────────────────────────────────────────────────
// Parser
// ────────────────────────────────────────────────────────────────

apps::ParsedArgs<CliConfig> parse_cli_args(int argc, char* argv[], int start) {
  return apps::parse_options(argc, argv, build_option_registry(), start);
}

std::string validate_cli_config(const CliConfig& config) {
  auto store_config = to_access_log_config(config);
  if (!store_config.has_value()) {
    return "Error: " + store_config.error().message;
  }

  const std::string store_error = storage::validate_access_log_config(store_config.value());
  if (!store_error.empty()) {
    return "Error: " + store_error;
  }

  if (config.db_path.has_value() && config.db_path->empty()) {
    return "Error: --db requires a non-empty path";
  }

  return "";
}

std::vector<std::string> split_list(std::string_view text) {
  std::vector<std::string> tokens;
  std::size_t start = 0;
  while (true) {
    const std::size_t comma = text.find(',', start);
    if (comma == std::string_view::npos) {
      tokens.emplace_back(text.substr(start));
      break;
    }
    tokens.emplace_back(text.substr(start, comma - start));
    start = comma + 1;
  }
  return tokens;
}

std::optional<std::int64_t> parse_integer(std::string_view text) {
  std::string_view digits = text;
  if (!digits.empty() && digits.front() == '-') {
    digits.remove_prefix(1);
  }
  if (digits.empty()) {
    return std::nullopt;
  }

  // Validate: all characters must be decimal digits.
  for (const char c : digits) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
  }

  try {
    return std::stoll(std::string{text});
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

core::Result<storage::AccessLogConfig, core::Error> to_access_log_config(const CliConfig& config) {
  storage::AccessLogConfig store_config;
  store_config.table_prefix = config.table_prefix;
  store_config.scope_length = config.scope_length;

  if (config.default_origin.has_value()) {
    auto origin = net::IpAddress::parse(*config.default_origin);
    if (!origin.has_value()) {
      return core::fail<storage::AccessLogConfig>(
          origin.error().code, "--default-origin: " + origin.error().message);
    }
    store_config.default_remote_origin = origin.value();
  }

  return core::Result<storage::AccessLogConfig, core::Error>::ok(std::move(store_config));
}

core::Result<storage::LogFilter, core::Error> to_log_filter(const CliConfig& config) {
  using FilterResult = core::Result<storage::LogFilter, core::Error>;

  storage::LogFilter filter;
  filter.created_after = config.after;
  filter.created_before = config.before;
  if (config.scopes.has_value()) {
    filter.scopes = split_list(*config.scopes);
  }

  auto ids = parse_list<core::BinaryId>(config.ids, "--ids", parse_id);
  if (!ids.has_value()) {
    return FilterResult::err(ids.error());
  }
  filter.ids = ids.value();

  auto origins = parse_list<net::IpAddress>(config.origins, "--origins", parse_address);
  if (!origins.has_value()) {
    return FilterResult::err(origins.error());
  }
  filter.remote_origins = origins.value();

  auto subjects = parse_list<core::BinaryId>(config.subjects, "--subjects", parse_id);
  if (!subjects.has_value()) {
    return FilterResult::err(subjects.error());
  }
  filter.subject_ids = subjects.value();

  auto objects = parse_list<core::BinaryId>(config.objects, "--objects", parse_id);
  if (!objects.has_value()) {
    return FilterResult::err(objects.error());
  }
  filter.object_ids = objects.value();

  return FilterResult::ok(std::move(filter));
}

core::Result<storage::NewLogRecord, core::Error> to_new_log_record(const CliConfig& config) {
  using RecordResult = core::Result<storage::NewLogRecord, core::Error>;

  storage::NewLogRecord fields;
  fields.creation_time = config.creation_time;
  fields.scope = config.scope.value_or("");

  if (config.id.has_value()) {
    auto id = core::BinaryId::parse(*config.id);
    if (!id.has_value()) {
      return RecordResult::err(core::Error{id.error().code, "--id: " + id.error().message});
    }
    fields.id = id.value();
  }

  if (config.origin.has_value()) {
    auto origin = net::IpAddress::parse(*config.origin);
    if (!origin.has_value()) {
      return RecordResult::err(
          core::Error{origin.error().code, "--origin: " + origin.error().message});
    }
    fields.remote_origin = origin.value();
  }

  if (config.subject.has_value()) {
    auto subject = core::BinaryId::parse(*config.subject);
    if (!subject.has_value()) {
      return RecordResult::err(
          core::Error{subject.error().code, "--subject: " + subject.error().message});
    }
    fields.subject_id = subject.value();
  }

  if (config.object.has_value()) {
    auto object = core::BinaryId::parse(*config.object);
    if (!object.has_value()) {
      return RecordResult::err(
          core::Error{object.error().code, "--object: " + object.error().message});
    }
    fields.object_id = object.value();
  }

  return RecordResult::ok(std::move(fields));
}

}  // namespace alog::cli
