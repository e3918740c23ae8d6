#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Errors.hpp"
#include "model/Instructions.hpp"
#include "model/ResourceGraph.hpp"

namespace ldp::common {
class IFileReader;
class IUi;
}

namespace ldp::providers {
class ICloudClient;
}

namespace ldp::state {
class DeployedResources;
}

namespace ldp::core {

class BuildStage;

/// Runs one deploy attempt end to end: order, build, plan, sweep, execute, record.
///
/// Cloud failures surface as common::DeploymentError. Results are written only
/// after the whole plan executed; a failed attempt leaves the previous record intact.
/// Class abbreviation: dp
class Deployer {
 public:
  Deployer(providers::ICloudClient& ccClient, common::IUi& uiOut, common::IFileReader& frReader,
           BuildStage& bsBuild, std::string sProjectDir);
  ~Deployer();

  Deployer(const Deployer&) = delete;
  Deployer& operator=(const Deployer&) = delete;

  /// Deploy the application's stage and return the recorded deployed values.
  nlohmann::json deploy(model::ResourceGraph& rgGraph, const model::Application& app);

  /// Plan without executing: the deploy plan plus sweeper deletions.
  model::Plan plan(model::ResourceGraph& rgGraph, const model::Application& app);

  /// Tear down everything recorded for a stage.
  nlohmann::json destroy(const std::string& sStage);

  /// Teardown plan for a stage's record; empty when the stage was never deployed.
  model::Plan planDestroy(const std::string& sStage) const;

  /// Deletions for every resource in a loaded record, without any cloud access.
  static model::Plan teardownPlan(const std::optional<state::DeployedResources>& oDeployed);

  /// User-facing wrapper for a cloud failure.
  static common::DeploymentError wrapError(const common::ProviderError& e);

 private:
  nlohmann::json executeAndRecord(const model::Plan& plPlan, const std::string& sStage);

  providers::ICloudClient& _ccClient;
  common::IUi& _uiOut;
  common::IFileReader& _frReader;
  BuildStage& _bsBuild;
  std::string _sProjectDir;
};

}  // namespace ldp::core
