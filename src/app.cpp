#include "app.hpp"
#include "cli.hpp"
#include "commands.hpp"
#include "config.hpp"
#include "decode.hpp"
#include "log.hpp"
#include <exception>
#include <fstream>
#include <iterator>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace hubrep {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}

std::string read_file(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to open " + path);
  }
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}
} // namespace

/**
 * Execute the start-up flow.
 *
 * This routine orchestrates CLI parsing, configuration loading and logger
 * initialization. Command line values take precedence over the
 * configuration file.
 *
 * @param argc Argument count passed from @c main().
 * @param argv Argument vector passed from @c main().
 * @return Zero on success, non-zero if execution should terminate with an
 *         error code.
 */
int App::run(int argc, char **argv) {
  should_exit_ = false;
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    should_exit_ = true;
    return exit.exit_code();
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    should_exit_ = true;
    return 1;
  }
  try {
    if (!options_.config_file.empty()) {
      config_ = Config::from_file(options_.config_file);
    }
    if (options_.log_level_explicit) {
      config_.set_log_level(options_.log_level);
    }
    if (!options_.log_file.empty()) {
      config_.set_log_file(options_.log_file);
    }
    if (options_.log_compress) {
      config_.set_log_compress(true);
    }
    if (options_.pretty && config_.indent() < 0) {
      config_.set_indent(2);
    }
    if (!options_.payload_format.empty()) {
      config_.set_payload_format(
          payload_format_from_string(options_.payload_format));
    }
    auto categories = config_.log_categories();
    for (const auto &[name, level] : options_.log_categories) {
      categories[name] = level;
    }
    config_.set_log_categories(std::move(categories));
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    should_exit_ = true;
    return 1;
  }

  spdlog::level::level_enum lvl = spdlog::level::warn;
  try {
    lvl = parse_log_level(config_.log_level());
  } catch (const std::invalid_argument &e) {
    app_log()->warn("{}; keeping warn", e.what());
  }
  init_logger(lvl, config_.log_pattern(), config_.log_file(),
              static_cast<std::size_t>(config_.log_rotate()),
              config_.log_compress());
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, level_str] : config_.log_categories()) {
    try {
      category_levels[category] = parse_log_level(level_str);
    } catch (const std::invalid_argument &) {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      level_str, category);
    }
  }
  configure_log_categories(category_levels);
  app_log()->debug("Running hubrep");
  return 0;
}

int App::execute(std::ostream &out) const {
  try {
    switch (options_.command) {
    case Command::Timestamp:
      return run_timestamp(out);
    case Command::Decode:
      return run_decode(out);
    case Command::Encode:
      return run_encode(out);
    case Command::None:
      break;
    }
    app_log()->error("No command given");
    return 1;
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    return 1;
  }
}

int App::run_timestamp(std::ostream &out) const {
  try {
    out << describe_timestamp(options_.timestamp_value, options_.compact)
        << '\n';
  } catch (const TimestampError &e) {
    app_log()->error("{} ({})", e.what(), to_string(e.kind()));
    return 1;
  }
  return 0;
}

int App::run_decode(std::ostream &out) const {
  Payload payload =
      decode_payload(read_file(options_.input_file), config_.payload_format());
  out << summarize_record(options_.record_kind, payload).dump(config_.indent())
      << '\n';
  return 0;
}

int App::run_encode(std::ostream &out) const {
  out << build_request(options_.encode).dump(config_.indent()) << '\n';
  return 0;
}

} // namespace hubrep
