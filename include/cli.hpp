/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for hubrep.
 *
 * Declares CLI parsing helpers, option structures, and related exceptions for
 * the tool.
 */

#ifndef HUBREP_CLI_HPP
#define HUBREP_CLI_HPP

#include <exception>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hubrep {

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /**
   * Construct an exit signal with the desired exit code.
   *
   * @param exit_code Process exit code that should be returned to the caller.
   */
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Numeric process exit code.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/// Subcommand selected on the command line.
enum class Command { None, Timestamp, Decode, Encode };

/**
 * Request fields collected by `hubrep encode`.
 *
 * Every optional stays unset unless its flag was given, so the built request
 * only carries what the user asked for.
 */
struct EncodeOptions {
  std::string kind; ///< deployment, deployment-status, status, pull-edit,
                    ///< gist, release
  std::string commit_ref;
  std::optional<std::string> task;
  std::optional<bool> auto_merge;
  std::optional<std::vector<std::string>> required_contexts;
  std::optional<std::string> payload; ///< JSON text
  std::optional<std::string> environment;
  std::optional<std::string> description;
  std::string state;
  std::optional<std::string> target_url;
  std::optional<std::string> context;
  std::optional<std::string> title;
  std::optional<std::string> body;
  std::optional<std::string> pull_state;
  std::optional<bool> is_public;
  std::vector<std::string> files; ///< NAME=CONTENT pairs
  std::string tag_name;
  std::optional<std::string> commitish;
  std::optional<std::string> name;
  std::optional<bool> draft;
  std::optional<bool> prerelease;
};

/// Parsed command line options supplied via the CLI.
struct CliOptions {
  Command command{Command::None};
  std::string config_file;
  std::string log_level{"warn"};
  bool log_level_explicit{false};
  std::string log_file;
  bool log_compress{false};
  std::unordered_map<std::string, std::string> log_categories;
  bool pretty{false};

  std::string timestamp_value; ///< `timestamp` argument
  bool compact{false};         ///< Decode as a non human readable format

  std::string record_kind;    ///< `decode` record kind
  std::string input_file;     ///< `decode` payload file
  std::string payload_format; ///< Empty uses the configured format

  EncodeOptions encode;
};

/**
 * Parse command line arguments into a CliOptions structure.
 *
 * @param argc Argument count provided to @c main().
 * @param argv Argument vector provided to @c main().
 * @return Fully populated CLI options.
 * @throws CliParseExit When help or version output was requested or the
 *         arguments are invalid.
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace hubrep

#endif // HUBREP_CLI_HPP
