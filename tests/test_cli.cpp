#include "cli.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

namespace {

/// Parse a command line given as strings.
hubrep::CliOptions parse(std::vector<std::string> args) {
  args.insert(args.begin(), "hubrep");
  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  return hubrep::parse_cli(static_cast<int>(args.size()), argv.data());
}

int exit_code_of(std::vector<std::string> args) {
  try {
    parse(std::move(args));
  } catch (const hubrep::CliParseExit &e) {
    return e.exit_code();
  }
  return -1;
}

} // namespace

TEST_CASE("test cli", "[cli]") {
  char prog[] = "hubrep";
  char timestamp[] = "timestamp";
  char value[] = "2011-01-26T19:01:12Z";
  char *argv1[] = {prog, timestamp, value};
  hubrep::CliOptions opts = hubrep::parse_cli(3, argv1);
  REQUIRE(opts.command == hubrep::Command::Timestamp);
  REQUIRE(opts.timestamp_value == "2011-01-26T19:01:12Z");
  REQUIRE(!opts.compact);
  REQUIRE(opts.log_level == "warn");
  REQUIRE(!opts.log_level_explicit);

  char compact[] = "--compact";
  char epoch[] = "1296068472";
  char *argv2[] = {prog, timestamp, compact, epoch};
  hubrep::CliOptions opts2 = hubrep::parse_cli(4, argv2);
  REQUIRE(opts2.compact);
  REQUIRE(opts2.timestamp_value == "1296068472");
}

TEST_CASE("global options", "[cli]") {
  auto opts = parse({"--log-level", "debug", "--pretty", "-C", "cfg.yaml",
                     "-F", "hubrep.log", "--log-compress", "--log-category", "decode=trace",
                     "--log-category", "stars", "timestamp", "0"});
  REQUIRE(opts.log_level == "debug");
  REQUIRE(opts.log_level_explicit);
  REQUIRE(opts.pretty);
  REQUIRE(opts.config_file == "cfg.yaml");
  REQUIRE(opts.log_file == "hubrep.log");
  REQUIRE(opts.log_compress);
  REQUIRE(opts.log_categories.at("decode") == "trace");
  REQUIRE(opts.log_categories.at("stars") == "debug");
}

TEST_CASE("decode command", "[cli]") {
  const char *path = "hubrep_cli_payload.json";
  {
    std::ofstream f(path);
    f << "{}";
  }
  auto opts = parse({"decode", "repo", path, "--format", "MsgPack"});
  REQUIRE(opts.command == hubrep::Command::Decode);
  REQUIRE(opts.record_kind == "repo");
  REQUIRE(opts.input_file == path);
  REQUIRE(opts.payload_format == "msgpack");

  auto defaults = parse({"decode", "key", path});
  REQUIRE(defaults.payload_format.empty());
  std::remove(path);

  REQUIRE(exit_code_of({"decode", "repo", "hubrep_cli_missing.json"}) != 0);
}

TEST_CASE("encode command", "[cli]") {
  SECTION("deployment") {
    auto opts = parse({"encode", "deployment", "--ref", "main", "--task",
                       "deploy", "--auto-merge", "false", "--required-context",
                       "ci/build", "--required-context", "ci/test",
                       "--payload", "{\"a\":1}"});
    REQUIRE(opts.command == hubrep::Command::Encode);
    const auto &e = opts.encode;
    REQUIRE(e.kind == "deployment");
    REQUIRE(e.commit_ref == "main");
    REQUIRE(e.task == std::string("deploy"));
    REQUIRE(e.auto_merge == false);
    REQUIRE(e.required_contexts);
    REQUIRE(*e.required_contexts ==
            std::vector<std::string>{"ci/build", "ci/test"});
    REQUIRE(e.payload == std::string("{\"a\":1}"));
    REQUIRE(!e.environment);
    REQUIRE(!e.description);
  }

  SECTION("empty required contexts") {
    auto opts = parse({"encode", "deployment", "--ref", "main",
                       "--no-required-contexts"});
    REQUIRE(opts.encode.required_contexts);
    REQUIRE(opts.encode.required_contexts->empty());
  }

  SECTION("unset options stay unset") {
    auto opts = parse({"encode", "pull-edit", "--title", "test"});
    REQUIRE(opts.encode.title == std::string("test"));
    REQUIRE(!opts.encode.body);
    REQUIRE(!opts.encode.pull_state);
  }

  SECTION("empty strings are kept") {
    auto opts = parse({"encode", "status", "--state", "success",
                       "--description", ""});
    REQUIRE(opts.encode.state == "success");
    REQUIRE(opts.encode.description == std::string());
  }

  SECTION("gist files") {
    auto opts = parse({"encode", "gist", "--file", "foo=bar", "--file",
                       "a.txt=", "--public", "true"});
    REQUIRE(opts.encode.files ==
            std::vector<std::string>{"foo=bar", "a.txt="});
    REQUIRE(opts.encode.is_public == true);
  }
}

TEST_CASE("cli exits", "[cli]") {
  REQUIRE(exit_code_of({"--help"}) == 0);
  REQUIRE(exit_code_of({"--version"}) == 0);
  REQUIRE(exit_code_of({}) != 0);
  REQUIRE(exit_code_of({"frobnicate"}) != 0);
  REQUIRE(exit_code_of({"encode", "status", "--state", "done"}) != 0);
  REQUIRE(exit_code_of({"encode", "comment"}) != 0);
  REQUIRE(exit_code_of({"--log-level", "loud", "timestamp", "0"}) != 0);
  REQUIRE(exit_code_of({"timestamp"}) != 0);
}
