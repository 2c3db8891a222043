#include "cli.hpp"
#include "log.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <array>
#include <iostream>
#include <memory>
#include <sstream>
#include <string_view>

#include <spdlog/spdlog.h>

namespace hubrep {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string log_category_help_text() {
  static const std::array<std::string_view, 8> categories = {
      "app", "cli", "config", "decode", "encode", "logging", "main", "stars"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., decode=debug).";
  oss << " Configuration files accept the same mapping under 'log_categories'.";
  return oss.str();
}

/// Register a string option that only lands in @p target when given.
CLI::Option *optional_string(CLI::App *cmd, const std::string &flags,
                             std::optional<std::string> &target,
                             const std::string &help) {
  return cmd
      ->add_option_function<std::string>(
          flags, [&target](const std::string &value) { target = value; },
          help)
      ->type_name("TEXT");
}

/// Register a boolean option taking an explicit true/false value.
CLI::Option *optional_bool(CLI::App *cmd, const std::string &flags,
                           std::optional<bool> &target,
                           const std::string &help) {
  return cmd
      ->add_option_function<bool>(
          flags, [&target](const bool &value) { target = value; }, help)
      ->type_name("BOOL");
}

void add_encode_options(CLI::App *encode, EncodeOptions &e) {
  encode
      ->add_option("kind", e.kind,
                   "Request to build: deployment, deployment-status, status, "
                   "pull-edit, gist, release")
      ->required()
      ->check(CLI::IsMember({"deployment", "deployment-status", "status",
                             "pull-edit", "gist", "release"}));

  encode->add_option("--ref", e.commit_ref, "Deployment ref (deployment)")
      ->type_name("REF")
      ->group("Deployment");
  optional_string(encode, "--task", e.task, "Deployment task")
      ->group("Deployment");
  optional_bool(encode, "--auto-merge", e.auto_merge,
                "Merge the default branch into the ref first")
      ->group("Deployment");
  encode
      ->add_option_function<std::vector<std::string>>(
          "--required-context",
          [&e](const std::vector<std::string> &values) {
            if (!e.required_contexts) {
              e.required_contexts.emplace();
            }
            e.required_contexts->insert(e.required_contexts->end(),
                                        values.begin(), values.end());
          },
          "Status context that must pass before deploying (repeatable)")
      ->type_name("CONTEXT")
      ->group("Deployment");
  encode
      ->add_flag_function(
          "--no-required-contexts",
          [&e](std::int64_t) { e.required_contexts.emplace(); },
          "Send an empty required_contexts list to bypass status checks")
      ->group("Deployment");
  optional_string(encode, "--payload", e.payload,
                  "Extra JSON document for the deployment consumer")
      ->group("Deployment");
  optional_string(encode, "--environment", e.environment,
                  "Deployment target environment")
      ->group("Deployment");

  encode->add_option("--state", e.state,
                     "Status state (deployment-status, status)")
      ->type_name("STATE")
      ->check(CLI::IsMember({"pending", "success", "error", "failure"}))
      ->group("Status");
  optional_string(encode, "--target-url", e.target_url,
                  "Link attached to the status")
      ->group("Status");
  optional_string(encode, "--context", e.context,
                  "Label distinguishing this status from others")
      ->group("Status");

  optional_string(encode, "--description", e.description,
                  "Short description (deployment, statuses, gist)");
  optional_string(encode, "--title", e.title, "Pull request title")
      ->group("Pull request");
  optional_string(encode, "--body", e.body, "Pull request or release body");
  encode
      ->add_option_function<std::string>(
          "--pull-state",
          [&e](const std::string &value) { e.pull_state = value; },
          "Open or close the pull request")
      ->type_name("STATE")
      ->check(CLI::IsMember({"open", "closed"}))
      ->group("Pull request");

  optional_bool(encode, "--public", e.is_public, "Gist visibility")
      ->group("Gist");
  encode->add_option("--file", e.files, "Gist file as NAME=CONTENT (repeatable)")
      ->type_name("NAME=CONTENT")
      ->group("Gist");

  encode->add_option("--tag", e.tag_name, "Release tag name")
      ->type_name("TAG")
      ->group("Release");
  optional_string(encode, "--commitish", e.commitish,
                  "Branch or commit the tag is created from")
      ->group("Release");
  optional_string(encode, "--name", e.name, "Release name")
      ->group("Release");
  optional_bool(encode, "--draft", e.draft, "Create an unpublished release")
      ->group("Release");
  optional_bool(encode, "--prerelease", e.prerelease,
                "Mark the release as a prerelease")
      ->group("Release");
}

} // namespace

/**
 * Parse command line arguments into a CliOptions structure.
 *
 * Global options may appear before the subcommand. Exactly one subcommand is
 * required.
 *
 * @param argc Argument count provided to @c main().
 * @param argv Argument vector provided to @c main().
 * @return Fully populated CLI options.
 */
CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"hubrep: GitHub representation decoding and encoding"};
  app.footer(log_category_help_text());
  app.require_subcommand(1);
  CliOptions options;

  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file")
      ->type_name("FILE")
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::int64_t) {
           std::cout << "hubrep " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");
  app.add_flag("--pretty", options.pretty, "Pretty-print JSON output")
      ->group("General");
  app.add_option_function<std::string>(
         "-G,--log-level",
         [&options](const std::string &value) {
           options.log_level = value;
           options.log_level_explicit = true;
         },
         "Set logging level (trace, debug, info, warn, error, critical, off)")
      ->type_name("LEVEL")
      ->check(CLI::IsMember(
          {"trace", "debug", "info", "warn", "error", "critical", "off"}))
      ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to rotating log file")
      ->type_name("FILE")
      ->group("Logging");
  app.add_flag("--log-compress", options.log_compress,
               "Gzip log files as they are rotated")
      ->group("Logging");
  app.add_option_function<std::string>(
         "--log-category",
         [&options](const std::string &value) {
           auto pos = value.find('=');
           std::string name =
               pos == std::string::npos ? value : value.substr(0, pos);
           std::string level = pos == std::string::npos ? std::string{"debug"}
                                                        : value.substr(pos + 1);
           if (name.empty()) {
             throw CLI::ValidationError("--log-category",
                                        "category name must not be empty");
           }
           if (level.empty()) {
             level = "debug";
           }
           options.log_categories[name] = level;
         },
         "Enable a logging category (NAME or NAME=LEVEL). See help footer for "
         "available categories.")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");

  CLI::App *timestamp = app.add_subcommand(
      "timestamp", "Decode a date time string or seconds since the epoch");
  timestamp
      ->add_option("value", options.timestamp_value,
                   "RFC 3339 text or integer seconds (use -- before negative "
                   "numbers)")
      ->required();
  timestamp->add_flag("--compact", options.compact,
                      "Decode as a binary payload would (integers only)");
  timestamp->callback([&options] { options.command = Command::Timestamp; });

  CLI::App *decode =
      app.add_subcommand("decode", "Decode a response payload file");
  decode
      ->add_option("kind", options.record_kind,
                   "Record kind (user, repo, deployment, deployment-status, "
                   "status, release, issue, pull, key, gist, gist-fork, "
                   "client-error)")
      ->required();
  decode->add_option("file", options.input_file, "Payload file")
      ->required()
      ->check(CLI::ExistingFile);
  decode
      ->add_option("--format", options.payload_format,
                   "Payload encoding (json, cbor, msgpack, bson, ubjson)")
      ->type_name("FORMAT")
      ->check(CLI::IsMember({"json", "cbor", "msgpack", "messagepack", "bson",
                             "ubjson"},
                            CLI::ignore_case));
  decode->callback([&options] { options.command = Command::Decode; });

  CLI::App *encode = app.add_subcommand("encode", "Build a request body");
  add_encode_options(encode, options.encode);
  encode->callback([&options] { options.command = Command::Encode; });

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }
  cli_log()->debug("Parsed command line ({} argument(s))", argc);
  return options;
}

} // namespace hubrep
