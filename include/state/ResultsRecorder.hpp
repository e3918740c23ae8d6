#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace ldp::state {

/// Persists the deployed values of a stage once a deploy has fully succeeded.
/// Class abbreviation: rr
class ResultsRecorder {
 public:
  ResultsRecorder();
  ~ResultsRecorder();

  /// Wrap executor resource values into the persisted document shape.
  static nlohmann::json buildDeployedValues(const nlohmann::json& jResourceValues);

  /// Write jResults to <projectDir>/.deployer/deployed/<stage>.json, creating
  /// directories as needed. Other stages' files are left untouched.
  void record(const nlohmann::json& jResults, const std::string& sStage,
              const std::string& sProjectDir) const;
};

}  // namespace ldp::state
