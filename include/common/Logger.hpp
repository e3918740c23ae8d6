#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace ldp::common {

/// spdlog wrapper shared by every deploy stage.
/// stdout is reserved for progress messages and plan output, so log lines go
/// to stderr and, when configured, to an append-only log file.
/// Class abbreviation: N/A (static interface)
///
/// Usage:
///   Logger::init("debug", cfgApp.sLogFile);
///   Logger::get()->info("Planned {} instructions", plPlan.size());
class Logger {
 public:
  /// Install the "ldp" logger as spdlog's default. sLogFile may be empty.
  /// A second call only changes the level; sinks are fixed at first init.
  static void init(const std::string& sLevel, const std::string& sLogFile = "");

  /// spdlog's default logger; initializes at "info" on first use.
  static std::shared_ptr<spdlog::logger> get();

 private:
  static bool _bInitialized;
};

}  // namespace ldp::common
