#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ldp::state {

/// Read-only view of the record written by the previous successful deploy of a stage.
/// Class abbreviation: drs
class DeployedResources {
 public:
  /// Wrap a {"resources": [...], "schema_version": ...} document.
  /// Throws common::StateError when the shape or schema version is not supported.
  explicit DeployedResources(nlohmann::json jDeployedValues);
  ~DeployedResources();

  /// Load <projectDir>/.deployer/deployed/<stage>.json.
  /// Returns nullopt when the stage was never deployed; throws common::StateError
  /// when the file cannot be parsed.
  static std::optional<DeployedResources> load(const std::string& sProjectDir,
                                               const std::string& sStage);

  /// Path of a stage's record file under a project directory.
  static std::string recordPath(const std::string& sProjectDir, const std::string& sStage);

  /// Resource names in record order.
  std::vector<std::string> resourceNames() const;

  /// Record for a resource name; throws common::NotFoundError when absent.
  const nlohmann::json& resourceValues(const std::string& sName) const;

  bool contains(const std::string& sName) const;

  const nlohmann::json& document() const { return _jDeployedValues; }

 private:
  const nlohmann::json* find(const std::string& sName) const;

  nlohmann::json _jDeployedValues;
};

}  // namespace ldp::state
