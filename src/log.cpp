#include "log.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>
#include <zlib.h>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/os.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
constexpr const char *kRootLogger = "hubrep";
constexpr std::size_t kMaxLogFileSize = 1024 * 1024 * 5;

std::weak_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;
std::mutex g_pool_mutex;

/// Destination shared by the root logger and every category logger.
std::shared_ptr<spdlog::sinks::dist_sink_mt> shared_sink() {
  static auto sink = std::make_shared<spdlog::sinks::dist_sink_mt>();
  return sink;
}

/// Return the async thread pool, creating it again after spdlog::shutdown().
std::shared_ptr<spdlog::details::thread_pool> logging_pool() {
  std::lock_guard<std::mutex> lock(g_pool_mutex);
  auto pool = spdlog::thread_pool();
  if (!pool) {
    constexpr std::size_t queue_size = 8192;
    constexpr std::size_t num_threads = 1;
    spdlog::init_thread_pool(queue_size, num_threads);
    pool = spdlog::thread_pool();
  }
  return pool;
}

namespace fs = std::filesystem;

/// Path of the @p index-th rotation of @p base, e.g. `hubrep.2.log`.
fs::path rotated_path(const fs::path &base, std::size_t index) {
  if (index == 0) {
    return base;
  }
  const std::string name = base.filename().string();
  std::string stem = name;
  std::string ext;
  auto dot = name.find_last_of('.');
  if (dot != std::string::npos && dot != 0) {
    stem = name.substr(0, dot);
    ext = name.substr(dot);
  }
  return base.parent_path() / (stem + "." + std::to_string(index) + ext);
}

/// Shift the `.gz` archives one slot up, dropping the oldest.
void shift_archives(const fs::path &base, std::size_t keep) {
  std::error_code ec;
  fs::remove(rotated_path(base, keep).string() + ".gz", ec);
  for (std::size_t i = keep; i > 1; --i) {
    fs::path from = rotated_path(base, i - 1).string() + ".gz";
    if (!fs::exists(from, ec)) {
      continue;
    }
    fs::path to = rotated_path(base, i).string() + ".gz";
    fs::remove(to, ec);
    fs::rename(from, to, ec);
  }
}
} // namespace

namespace hubrep {

namespace {

/// Gzip @p path, reporting problems on @p log.
bool gzip_file(const std::string &path, spdlog::logger &log) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    log.warn("Cannot open {} for compression", path);
    return false;
  }
  const std::string target = path + ".gz";
  gzFile gz = gzopen(target.c_str(), "wb");
  if (!gz) {
    log.warn("Cannot create {}", target);
    return false;
  }
  char buffer[16 * 1024];
  bool ok = true;
  while (ok && input) {
    input.read(buffer, sizeof(buffer));
    const std::streamsize got = input.gcount();
    if (got > 0 &&
        gzwrite(gz, buffer, static_cast<unsigned>(got)) != got) {
      int err = 0;
      const char *msg = gzerror(gz, &err);
      log.warn("Compressing {} failed: {}", path, msg ? msg : "unknown");
      ok = false;
    }
  }
  if (gzclose(gz) != Z_OK) {
    ok = false;
  }
  input.close();
  std::error_code ec;
  if (!ok) {
    fs::remove(target, ec);
    return false;
  }
  fs::remove(path, ec);
  if (ec) {
    log.warn("Keeping {} after compression: {}", path, ec.message());
  }
  log.debug("Compressed rotated log into {}", target);
  return true;
}

} // namespace

bool compress_log_file(const std::string &path) {
  return gzip_file(path, *category_logger("logging"));
}

/**
 * Initialize the global spdlog logger.
 *
 * The root logger is created once. Every call replaces the destinations of
 * the shared distribution sink, so category loggers created earlier pick up
 * a newly configured log file as well.
 *
 * @param level Logging verbosity level for the default logger.
 * @param pattern Log message pattern; empty string retains the default.
 * @param file Optional log file path.
 * @param rotate_files Maximum number of rotated files to keep.
 * @param compress_rotations Gzip each file as it is rotated out.
 */
void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files,
                 bool compress_rotations) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!file.empty()) {
    if (rotate_files > 0) {
      spdlog::file_event_handlers handlers;
      if (compress_rotations) {
        // Runs on the async worker inside the sink; it must not log through
        // the shared sink or take the registry lock, so it reports to a
        // private console logger.
        auto rotation_log = std::make_shared<spdlog::logger>(
            std::string(kRootLogger) + ".logging",
            std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        rotation_log->set_level(level);
        handlers.before_open = [rotate_files,
                                rotation_log](const spdlog::filename_t &name) {
          const fs::path base = spdlog::details::os::filename_to_str(name);
          shift_archives(base, rotate_files);
          std::error_code ec;
          const fs::path newest = rotated_path(base, 1);
          if (fs::exists(newest, ec)) {
            gzip_file(newest.string(), *rotation_log);
          }
        };
      }
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          file, kMaxLogFileSize, rotate_files, false, handlers));
    } else {
      sinks.push_back(
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, true));
    }
  }
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto logger = g_logger.lock();
  if (!logger) {
    logger = std::make_shared<spdlog::async_logger>(
        kRootLogger, shared_sink(), logging_pool(),
        spdlog::async_overflow_policy::block);
    spdlog::set_default_logger(logger);
    g_logger = logger;
  }
  shared_sink()->set_sinks(std::move(sinks));
  lock.unlock();
  // Applies to the root and every registered category logger.
  spdlog::set_level(level);
  if (!pattern.empty()) {
    spdlog::set_pattern(pattern);
  }
  logger->debug("Logger initialised (level={}, file='{}', rotate={}, "
                "compress={})",
                spdlog::level::to_string_view(level), file, rotate_files,
                compress_rotations);
}

/**
 * Ensure that the default logger exists before logging.
 *
 * Library users that never configure logging get a warn-level console
 * logger so decoding diagnostics stay quiet by default.
 */
void ensure_default_logger() {
  auto locked = g_logger.lock();
  auto logger = spdlog::default_logger();
  if (!locked || !logger || logger.get() != locked.get()) {
    init_logger(spdlog::level::warn);
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  ensure_default_logger();
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  const std::string name = std::string(kRootLogger) + "." + category;
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  auto root = g_logger.lock();
  auto new_logger = std::make_shared<spdlog::async_logger>(
      name, shared_sink(), logging_pool(),
      spdlog::async_overflow_policy::block);
  new_logger->set_level(root ? root->level() : spdlog::level::warn);
  spdlog::register_logger(new_logger);
  return new_logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  for (const auto &[category, level] : overrides) {
    category_logger(category)->set_level(level);
  }
  if (!overrides.empty()) {
    category_logger("logging")->debug("Applied {} log category override(s)",
                                      overrides.size());
  }
}

spdlog::level::level_enum parse_log_level(const std::string &name) {
  auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to "off"; only accept "off" when asked for.
  if (level == spdlog::level::off && name != "off") {
    throw std::invalid_argument("unknown log level '" + name + "'");
  }
  return level;
}

} // namespace hubrep
