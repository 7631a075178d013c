#include <catch2/catch.hpp>

#include "alog_cli/cli_config.h"

#include <string>
#include <vector>

using namespace alog;
using alog::cli::CliConfig;

namespace {

// Owns argv storage for parse_cli_args.
struct Argv {
  explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
    for (auto& arg : storage) {
      pointers.push_back(arg.data());
    }
  }

  int argc() const { return static_cast<int>(pointers.size()); }
  char** argv() { return pointers.data(); }

  std::vector<std::string> storage;
  std::vector<char*> pointers;
};

}  // namespace

// ── Parsing ─────────────────────────────────────────────────────────────────

TEST_CASE("parse_cli_args reads store, filter and paging flags", "[cli][config]") {
  Argv args({"alog_cli", "search", "--db", "/tmp/log.db", "--prefix", "audit_", "--scopes",
             "login,logout", "--after", "-5", "--sort", "id", "--order", "desc", "--page", "2",
             "--page-size", "25"});

  const auto parsed = cli::parse_cli_args(args.argc(), args.argv());
  REQUIRE(parsed.errors.empty());
  CHECK(parsed.positional.empty());

  const auto& config = parsed.config;
  CHECK(config.db_path == "/tmp/log.db");
  CHECK(config.table_prefix == "audit_");
  CHECK(config.scopes == "login,logout");
  CHECK(config.after == -5);
  CHECK(config.sort.field == storage::SortField::kId);
  CHECK(config.sort.order == storage::SortOrder::kDescending);
  CHECK(config.page.page == 2);
  CHECK(config.page.page_size == 25U);
}

TEST_CASE("parse_cli_args collects positional arguments", "[cli][config]") {
  Argv args({"alog_cli", "get", "AAAAAAAAAAAAAAAAAAAAAQ", "--db", "x.db"});

  const auto parsed = cli::parse_cli_args(args.argc(), args.argv());
  REQUIRE(parsed.errors.empty());
  REQUIRE(parsed.positional.size() == 1);
  CHECK(parsed.positional[0] == "AAAAAAAAAAAAAAAAAAAAAQ");
  CHECK(parsed.config.db_path == "x.db");
}

TEST_CASE("parse_cli_args reports unknown flags and bad values", "[cli][config]") {
  Argv args({"alog_cli", "search", "--bogus", "--page", "two", "--sort", "scope", "--before"});

  const auto parsed = cli::parse_cli_args(args.argc(), args.argv());
  CHECK(parsed.errors.size() == 4);
}

// ── Validation ──────────────────────────────────────────────────────────────

TEST_CASE("validate_cli_config: defaults are valid", "[cli][config]") {
  CHECK(cli::validate_cli_config(CliConfig{}).empty());
}

TEST_CASE("validate_cli_config: bad prefix returns error", "[cli][config]") {
  CliConfig config;
  config.table_prefix = "bad prefix";
  CHECK_FALSE(cli::validate_cli_config(config).empty());
}

TEST_CASE("validate_cli_config: bad default origin returns error", "[cli][config]") {
  CliConfig config;
  config.default_origin = "not-an-ip";
  CHECK_FALSE(cli::validate_cli_config(config).empty());

  config.default_origin = "192.0.2.1";
  CHECK(cli::validate_cli_config(config).empty());
}

TEST_CASE("validate_cli_config: zero scope length returns error", "[cli][config]") {
  CliConfig config;
  config.scope_length = 0;
  CHECK_FALSE(cli::validate_cli_config(config).empty());
}

// ── Conversion ──────────────────────────────────────────────────────────────

TEST_CASE("split_list keeps every token", "[cli][config]") {
  CHECK(cli::split_list("a,b,c") == std::vector<std::string>{"a", "b", "c"});
  CHECK(cli::split_list("") == std::vector<std::string>{""});
  CHECK(cli::split_list("a,,b") == std::vector<std::string>{"a", "", "b"});
}

TEST_CASE("parse_integer accepts signed decimal only", "[cli][config]") {
  CHECK(cli::parse_integer("42") == 42);
  CHECK(cli::parse_integer("-7") == -7);
  CHECK_FALSE(cli::parse_integer("").has_value());
  CHECK_FALSE(cli::parse_integer("-").has_value());
  CHECK_FALSE(cli::parse_integer("4x").has_value());
  CHECK_FALSE(cli::parse_integer("99999999999999999999").has_value());
}

TEST_CASE("to_log_filter converts list flags", "[cli][config]") {
  CliConfig config;
  config.ids = "AAAAAAAAAAAAAAAAAAAAAQ,AAAAAAAAAAAAAAAAAAAAAg";
  config.origins = "1.2.3.4,::1";
  config.before = 100;

  auto filter = cli::to_log_filter(config);
  REQUIRE(filter.has_value());
  REQUIRE(filter.value().ids.has_value());
  CHECK(filter.value().ids->size() == 2);
  REQUIRE(filter.value().remote_origins.has_value());
  CHECK(filter.value().remote_origins->at(1).is_v6());
  CHECK(filter.value().created_before == 100);
  CHECK_FALSE(filter.value().scopes.has_value());
  CHECK_FALSE(filter.value().subject_ids.has_value());
}

TEST_CASE("to_log_filter names the flag with a malformed value", "[cli][config]") {
  CliConfig config;
  config.subjects = "nope";

  auto filter = cli::to_log_filter(config);
  REQUIRE_FALSE(filter.has_value());
  CHECK(filter.error().code == core::ErrorCode::kInvalidIdentifier);
  CHECK(filter.error().message.find("--subjects") != std::string::npos);
}

TEST_CASE("to_new_log_record converts record flags", "[cli][config]") {
  CliConfig config;
  config.scope = "login";
  config.origin = "2001:db8::1";
  config.subject = "00112233-4455-6677-8899-aabbccddeeff";
  config.creation_time = 12;

  auto fields = cli::to_new_log_record(config);
  REQUIRE(fields.has_value());
  CHECK(fields.value().scope == "login");
  CHECK(fields.value().creation_time == 12);
  REQUIRE(fields.value().remote_origin.has_value());
  CHECK(fields.value().remote_origin->is_v6());
  CHECK(fields.value().subject_id.to_string() == "ABEiM0RVZneImaq7zN3u_w");
  CHECK(fields.value().object_id.is_nil());
  CHECK_FALSE(fields.value().id.has_value());
}
