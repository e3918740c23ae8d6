#include "state/DeployedResources.hpp"

#include <filesystem>
#include <fstream>

#include "common/Errors.hpp"
#include "common/Logger.hpp"

namespace ldp::state {

DeployedResources::DeployedResources(nlohmann::json jDeployedValues)
    : _jDeployedValues(std::move(jDeployedValues)) {
  if (!_jDeployedValues.is_object() || !_jDeployedValues.contains("resources") ||
      !_jDeployedValues["resources"].is_array()) {
    throw common::StateError("invalid_deployed_values",
                             "Deployed values must contain a 'resources' list");
  }
  const std::string sVersion = _jDeployedValues.value("schema_version", std::string("2.0"));
  if (sVersion.rfind("2.", 0) != 0) {
    throw common::StateError("unsupported_schema_version",
                             "Unsupported deployed values schema version: " + sVersion);
  }
  for (const auto& jRecord : _jDeployedValues["resources"]) {
    if (!jRecord.is_object() || !jRecord.contains("name") || !jRecord["name"].is_string() ||
        !jRecord.contains("resource_type")) {
      throw common::StateError("invalid_deployed_values",
                               "Deployed resource record is missing its name or type");
    }
  }
}

DeployedResources::~DeployedResources() = default;

std::string DeployedResources::recordPath(const std::string& sProjectDir,
                                          const std::string& sStage) {
  return (std::filesystem::path(sProjectDir) / ".deployer" / "deployed" / (sStage + ".json"))
      .string();
}

std::optional<DeployedResources> DeployedResources::load(const std::string& sProjectDir,
                                                         const std::string& sStage) {
  const std::string sPath = recordPath(sProjectDir, sStage);
  if (!std::filesystem::exists(sPath)) {
    common::Logger::get()->debug("No deployed record for stage '{}' at {}", sStage, sPath);
    return std::nullopt;
  }

  std::ifstream ifs(sPath);
  if (!ifs) {
    throw common::StateError("unreadable_deployed_values", "Unable to read " + sPath);
  }
  nlohmann::json jDoc;
  try {
    jDoc = nlohmann::json::parse(ifs);
  } catch (const nlohmann::json::parse_error& e) {
    throw common::StateError("corrupt_deployed_values",
                             "Unable to parse " + sPath + ": " + e.what());
  }
  return DeployedResources(std::move(jDoc));
}

std::vector<std::string> DeployedResources::resourceNames() const {
  std::vector<std::string> vNames;
  for (const auto& jRecord : _jDeployedValues["resources"]) {
    vNames.push_back(jRecord["name"].get<std::string>());
  }
  return vNames;
}

const nlohmann::json* DeployedResources::find(const std::string& sName) const {
  for (const auto& jRecord : _jDeployedValues["resources"]) {
    if (jRecord["name"] == sName) {
      return &jRecord;
    }
  }
  return nullptr;
}

bool DeployedResources::contains(const std::string& sName) const {
  return find(sName) != nullptr;
}

const nlohmann::json& DeployedResources::resourceValues(const std::string& sName) const {
  const auto* pRecord = find(sName);
  if (pRecord == nullptr) {
    throw common::NotFoundError("resource_not_deployed",
                                "Resource is not deployed: " + sName);
  }
  return *pRecord;
}

}  // namespace ldp::state
