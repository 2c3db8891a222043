#include "app.hpp"
#include "log.hpp"

#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>

namespace {
std::shared_ptr<spdlog::logger> main_log() {
  static auto logger = [] {
    hubrep::ensure_default_logger();
    return hubrep::category_logger("main");
  }();
  return logger;
}
} // namespace

/**
 * Program entry point: set up the application and run the chosen command.
 *
 * @param argc Number of CLI arguments received from the OS.
 * @param argv Null-terminated array containing the raw CLI arguments.
 * @return Process exit code forwarded from the application logic.
 */
int main(int argc, char **argv) {
  hubrep::App app;
  int ret = app.run(argc, argv);
  if (ret == 0 && !app.should_exit()) {
    ret = app.execute(std::cout);
  }
  main_log()->debug("Exiting with status {}", ret);
  // Drain the async queue before the process exits.
  spdlog::shutdown();
  return ret;
}
