#pragma once

#include <string>

namespace ldp::common {

/// Environment variable loader for deployer runtime settings.
/// Loads all env vars into a typed struct with validation.
/// Class abbreviation: cfg
struct Config {
  // ── Required ──────────────────────────────────────────────────────────
  std::string sProjectDir;

  // ── Project ───────────────────────────────────────────────────────────
  std::string sStage = "dev";
  std::string sAppName;  // defaults to the project directory's basename

  // ── Cloud session ─────────────────────────────────────────────────────
  std::string sRegion = "us-east-1";

  // ── Lambda defaults (injected by the build stage) ─────────────────────
  int iLambdaTimeout = 60;
  int iLambdaMemorySize = 128;
  bool bXray = false;

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";
  std::string sLogFile;  // empty: stderr only

  /// Load and validate all config from environment variables.
  /// Throws on missing required vars or invalid constraints.
  static Config load();

 private:
  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);

  /// Read an env var as bool (true/false/1/0), default false.
  static bool getEnvBool(const char* pVarName, bool bDefault);
};

}  // namespace ldp::common
