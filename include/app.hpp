/**
 * @file app.hpp
 * @brief Main application entry point and orchestrator for hubrep.
 *
 * Declares the App class, which manages high-level application flow,
 * configuration loading, and CLI parsing for the hubrep tool.
 */

#ifndef HUBREP_APP_HPP
#define HUBREP_APP_HPP

#include "cli.hpp"
#include "config.hpp"
#include <iosfwd>

namespace hubrep {

/**
 * Main application entry point responsible for orchestrating high level
 * application flow, configuration loading, and CLI parsing.
 */
class App {
public:
  /**
   * Parse the command line, load configuration and set up logging.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Null-terminated array containing the raw CLI arguments.
   * @return Zero on success, non-zero when execution should terminate due to
   *         an error.
   */
  int run(int argc, char **argv);

  /**
   * Execute the selected subcommand.
   *
   * @param out Stream receiving the command result.
   * @return Process exit code.
   */
  int execute(std::ostream &out) const;

  /// Parsed command line options.
  const CliOptions &options() const { return options_; }

  /// Configuration after command line overrides were applied.
  const Config &config() const { return config_; }

  /**
   * Determine whether the application should exit immediately after
   * `run()` completes.
   */
  bool should_exit() const { return should_exit_; }

private:
  int run_timestamp(std::ostream &out) const;
  int run_decode(std::ostream &out) const;
  int run_encode(std::ostream &out) const;

  CliOptions options_;
  Config config_;
  bool should_exit_{false};
};

} // namespace hubrep

#endif // HUBREP_APP_HPP
