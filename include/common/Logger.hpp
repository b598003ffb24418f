#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace sbu::common {

/// Thin wrapper over spdlog shared by every sync component.
/// Uses spdlog's default logger to avoid static destruction order issues.
/// Class abbreviation: N/A (static interface)
///
/// Usage:
///   Logger::init("debug");
///   Logger::get()->info("Stable sync: {} releases", iCount);
class Logger {
 public:
  /// Install the "sbu" stdout logger at the given level, or update the level
  /// when already installed.
  /// Valid levels: "trace", "debug", "info", "warn", "error", "critical", "off"
  static void init(const std::string& sLevel);

  /// Get the shared spdlog logger instance.
  /// Returns spdlog's default logger (always valid).
  static std::shared_ptr<spdlog::logger> get();

  /// Flush and drop all loggers. Safe to call more than once.
  static void shutdown();

 private:
  static bool _bInitialized;
};

}  // namespace sbu::common
