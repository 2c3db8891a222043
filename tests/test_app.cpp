#include "app.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct RunResult {
  int run_code{0};
  bool should_exit{false};
  int exec_code{-1};
  std::string output;
};

RunResult run_app(std::vector<std::string> args) {
  args.insert(args.begin(), "hubrep");
  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  hubrep::App app;
  RunResult result;
  result.run_code = app.run(static_cast<int>(args.size()), argv.data());
  result.should_exit = app.should_exit();
  if (result.run_code == 0 && !result.should_exit) {
    std::ostringstream out;
    result.exec_code = app.execute(out);
    result.output = out.str();
  }
  return result;
}

} // namespace

TEST_CASE("timestamp command prints canonical form", "[app]") {
  auto result = run_app({"timestamp", "2011-01-26T20:01:12+01:00"});
  REQUIRE(result.run_code == 0);
  REQUIRE(result.exec_code == 0);
  REQUIRE(result.output == "2011-01-26T19:01:12Z 1296068472\n");

  auto rejected = run_app({"timestamp", "2011-01-26"});
  REQUIRE(rejected.exec_code == 1);
  REQUIRE(rejected.output.empty());

  auto compact = run_app({"timestamp", "--compact", "2011-01-26T19:01:12Z"});
  REQUIRE(compact.exec_code == 1);
}

TEST_CASE("encode command prints the request", "[app]") {
  auto result = run_app({"encode", "deployment", "--ref", "topic-branch",
                         "--no-required-contexts"});
  REQUIRE(result.exec_code == 0);
  REQUIRE(result.output ==
          "{\"ref\":\"topic-branch\",\"required_contexts\":[]}\n");

  auto pretty = run_app({"--pretty", "encode", "status", "--state", "success"});
  REQUIRE(pretty.exec_code == 0);
  REQUIRE(pretty.output == "{\n  \"state\": \"success\"\n}\n");

  auto missing = run_app({"encode", "release"});
  REQUIRE(missing.exec_code == 1);
}

TEST_CASE("decode command summarizes payload files", "[app]") {
  const char *path = "hubrep_app_key.json";
  {
    std::ofstream f(path);
    f << R"({"id":7,"key":"ssh-rsa AAA","title":"ci",)"
      << R"("created_at":"2014-06-18T09:30:00Z"})";
  }
  auto result = run_app({"decode", "key", path});
  REQUIRE(result.exec_code == 0);
  REQUIRE(result.output ==
          "{\"id\":7,\"title\":\"ci\",\"verified\":false,\"read_only\":false,"
          "\"created_at\":\"2014-06-18T09:30:00Z\"}\n");

  auto binary = run_app({"decode", "key", path, "--format", "cbor"});
  REQUIRE(binary.exec_code == 1);

  auto wrong_kind = run_app({"decode", "repo", path});
  REQUIRE(wrong_kind.exec_code == 1);
  std::remove(path);
}

TEST_CASE("start-up failures stop before executing", "[app]") {
  auto help = run_app({"--help"});
  REQUIRE(help.run_code == 0);
  REQUIRE(help.should_exit);

  auto bad = run_app({"encode"});
  REQUIRE(bad.run_code != 0);
  REQUIRE(bad.should_exit);

  auto config = run_app({"-C", "hubrep_missing.yaml", "timestamp", "0"});
  REQUIRE(config.run_code == 1);
  REQUIRE(config.should_exit);
}

TEST_CASE("config file settings apply to commands", "[app]") {
  const char *path = "hubrep_app_config.json";
  {
    std::ofstream f(path);
    f << R"({"output":{"indent":1},"logging":{"log_level":"error"}})";
  }
  auto result = run_app({"-C", path, "encode", "pull-edit", "--title", "t"});
  REQUIRE(result.exec_code == 0);
  REQUIRE(result.output == "{\n \"title\": \"t\"\n}\n");
  std::remove(path);
}
