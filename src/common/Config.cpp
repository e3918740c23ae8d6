#include "common/Config.hpp"

#include <cstdlib>
#include <filesystem>
#include <set>
#include <stdexcept>
#include <string>

namespace ldp::common {

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  try {
    return std::stoi(sValue);
  } catch (const std::logic_error&) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
}

bool Config::getEnvBool(const char* pVarName, bool bDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return bDefault;
  }
  return sValue == "true" || sValue == "1" || sValue == "yes";
}

Config Config::load() {
  Config cfg;

  // ── Required vars ──────────────────────────────────────────────────────
  cfg.sProjectDir = getEnv("LDP_PROJECT_DIR");
  if (cfg.sProjectDir.empty()) {
    throw std::runtime_error("Required environment variable LDP_PROJECT_DIR is not set");
  }

  // ── Optional vars with defaults ────────────────────────────────────────
  const std::string sStage = getEnv("LDP_STAGE");
  if (!sStage.empty()) {
    cfg.sStage = sStage;
  }

  cfg.sAppName = getEnv("LDP_APP_NAME");
  if (cfg.sAppName.empty()) {
    std::filesystem::path pathProject(cfg.sProjectDir);
    if (!pathProject.has_filename()) {
      pathProject = pathProject.parent_path();
    }
    cfg.sAppName = pathProject.filename().string();
  }

  const std::string sRegion = getEnv("LDP_REGION");
  if (!sRegion.empty()) {
    cfg.sRegion = sRegion;
  }

  cfg.iLambdaTimeout = getEnvInt("LDP_LAMBDA_TIMEOUT", 60);
  cfg.iLambdaMemorySize = getEnvInt("LDP_LAMBDA_MEMORY_SIZE", 128);
  cfg.bXray = getEnvBool("LDP_XRAY", false);

  // Logging
  const std::string sLogLevel = getEnv("LDP_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    cfg.sLogLevel = sLogLevel;
  }
  cfg.sLogFile = getEnv("LDP_LOG_FILE");

  // ── Validation ─────────────────────────────────────────────────────────

  if (cfg.iLambdaTimeout < 1) {
    throw std::runtime_error(
        "LDP_LAMBDA_TIMEOUT must be >= 1 (got " + std::to_string(cfg.iLambdaTimeout) + ")");
  }

  // Lambda accepts 128 MB .. 10240 MB
  if (cfg.iLambdaMemorySize < 128 || cfg.iLambdaMemorySize > 10240) {
    throw std::runtime_error(
        "LDP_LAMBDA_MEMORY_SIZE must be between 128 and 10240 (got " +
        std::to_string(cfg.iLambdaMemorySize) + ")");
  }

  static const std::set<std::string> kLogLevels = {"trace", "debug", "info", "warn",
                                                   "error", "critical", "off"};
  if (!kLogLevels.contains(cfg.sLogLevel)) {
    throw std::runtime_error("LDP_LOG_LEVEL must be one of trace, debug, info, warn, error, "
                             "critical, off (got '" + cfg.sLogLevel + "')");
  }

  return cfg;
}

}  // namespace ldp::common
