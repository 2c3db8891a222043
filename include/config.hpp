/**
 * @file config.hpp
 * @brief Configuration loading for hubrep.
 *
 * Declares the Config class which reads logging, decoding and output
 * settings from YAML, TOML or JSON files.
 */

#ifndef HUBREP_CONFIG_HPP
#define HUBREP_CONFIG_HPP

#include "decode.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>
#include <utility>

namespace hubrep {

/// Tool configuration loaded from a YAML, TOML, or JSON file.
class Config {
public:
  /// Get logging verbosity level.
  const std::string &log_level() const { return log_level_; }

  /// Set logging verbosity level.
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// Get logging pattern.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set logging pattern.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Path to the log file (empty disables file logging).
  const std::string &log_file() const { return log_file_; }

  /// Set path for the log file.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to retain (0 disables rotation).
  int log_rotate() const { return log_rotate_; }

  /// Set number of rotated log files to retain.
  void set_log_rotate(int count) { log_rotate_ = count < 0 ? 0 : count; }

  /// Whether rotated log files are gzip compressed.
  bool log_compress() const { return log_compress_; }

  /// Enable or disable compression of rotated log files.
  void set_log_compress(bool enable) { log_compress_ = enable; }

  /// Retrieve configured log category overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }

  /// Replace configured log category overrides.
  void set_log_categories(std::unordered_map<std::string, std::string> values) {
    log_categories_ = std::move(values);
  }

  /// Encoding of payload files read by `hubrep decode`.
  PayloadFormat payload_format() const { return payload_format_; }

  /// Set the default payload encoding.
  void set_payload_format(PayloadFormat format) { payload_format_ = format; }

  /// Indentation used when printing JSON (-1 prints compact output).
  int indent() const { return indent_; }

  /// Set indentation; values below -1 are clamped to -1.
  void set_indent(int indent) { indent_ = indent < -1 ? -1 : indent; }

  /**
   * Populate configuration settings from a JSON object.
   *
   * Keys may appear at the top level or inside the `logging`, `decode` or
   * `output` sections.
   *
   * @throws nlohmann::json::exception When a value has the wrong type.
   * @throws std::invalid_argument When an enumerated value is unknown.
   */
  void load_json(const nlohmann::json &j);

  /// Construct a configuration object from a JSON representation.
  static Config from_json(const nlohmann::json &j);

  /**
   * Load configuration from a file, choosing the parser by extension
   * (`.yaml`/`.yml`, `.toml`/`.tml`, or `.json`).
   *
   * @throws std::runtime_error When the file cannot be read or parsed, or the
   *         extension is unsupported.
   */
  static Config from_file(const std::string &path);

private:
  std::string log_level_{"warn"};
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_{3};
  bool log_compress_{false};
  std::unordered_map<std::string, std::string> log_categories_;
  PayloadFormat payload_format_{PayloadFormat::Json};
  int indent_{-1};
};

} // namespace hubrep

#endif // HUBREP_CONFIG_HPP
