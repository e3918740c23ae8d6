#include "common/Logger.hpp"

#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace ldp::common {

bool Logger::_bInitialized = false;

void Logger::init(const std::string& sLevel, const std::string& sLogFile) {
  const auto level = spdlog::level::from_str(sLevel);
  if (_bInitialized) {
    spdlog::set_level(level);
    return;
  }

  std::vector<spdlog::sink_ptr> vSinks;
  vSinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!sLogFile.empty()) {
    vSinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(sLogFile));
  }

  auto spLogger = std::make_shared<spdlog::logger>("ldp", vSinks.begin(), vSinks.end());
  spLogger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
  spLogger->set_level(level);
  spLogger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(spLogger);

  _bInitialized = true;
  spLogger->debug("Logger initialized at level '{}'{}", sLevel,
                  sLogFile.empty() ? std::string() : ", also writing to " + sLogFile);
}

std::shared_ptr<spdlog::logger> Logger::get() {
  if (!_bInitialized) {
    init("info");
  }
  return spdlog::default_logger();
}

}  // namespace ldp::common
