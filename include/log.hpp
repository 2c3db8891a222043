/**
 * @file log.hpp
 * @brief Logging utilities for hubrep.
 *
 * Declares logger initialization, category loggers, and log category
 * configuration.
 */

#ifndef HUBREP_LOG_HPP
#define HUBREP_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace hubrep {

/**
 * Initialize the global logger with a console sink and an optional file sink.
 *
 * @param level Logging verbosity level to use for all loggers.
 * @param pattern Log message pattern. Provide an empty string to keep the
 *        underlying spdlog default.
 * @param file Optional log file path. When empty no file output is
 *        configured.
 * @param rotate_files Number of rotated files to retain when @p file is
 *        provided; zero writes a single file without rotation.
 * @param compress_rotations Gzip rotated files into `<name>.N.ext.gz`.
 */
void init_logger(spdlog::level::level_enum level,
                 const std::string &pattern = "", const std::string &file = "",
                 std::size_t rotate_files = 3, bool compress_rotations = false);

/**
 * Gzip @p path into `<path>.gz` and remove the original.
 *
 * @return `false` when the file could not be read or written; the original is
 *         left in place.
 */
bool compress_log_file(const std::string &path);

/**
 * Retrieve or create a logger dedicated to a specific category.
 *
 * Category loggers share sinks with the default logger so messages appear in
 * the same destinations. They allow fine-grained log-level overrides.
 *
 * @param category Arbitrary category name used as the logger identifier.
 * @return Shared pointer to the category logger.
 */
std::shared_ptr<spdlog::logger> category_logger(const std::string &category);

/**
 * Apply log level overrides for specific categories.
 *
 * @param overrides Mapping of category name to desired log level.
 */
void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides);

/**
 * Ensure a default logger exists before logging.
 *
 * Library code logs through category loggers, which need the default logger
 * for their sinks. This helper creates one on demand when the application
 * did not call init_logger().
 */
void ensure_default_logger();

/**
 * Parse a level name such as "debug" or "warn".
 *
 * @throws std::invalid_argument When the name is not a spdlog level.
 */
spdlog::level::level_enum parse_log_level(const std::string &name);

} // namespace hubrep

#endif // HUBREP_LOG_HPP
