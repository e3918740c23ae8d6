#include "core/Deployer.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/BuildStage.hpp"
#include "core/DependencyResolver.hpp"
#include "core/Executor.hpp"
#include "core/PlanStage.hpp"
#include "core/RemoteState.hpp"
#include "core/ResourceSweeper.hpp"
#include "state/DeployedResources.hpp"
#include "state/ResultsRecorder.hpp"

namespace ldp::core {

namespace {

std::string verbForClientMethod(const std::string& sClientMethod) {
  if (sClientMethod == "create_function") return "create";
  if (sClientMethod == "update_function") return "update";
  return sClientMethod;
}

std::string joinLabels(const std::vector<std::string>& vLabels) {
  std::string sJoined;
  for (const auto& sLabel : vLabels) {
    if (!sJoined.empty()) {
      sJoined += ", ";
    }
    sJoined += sLabel;
  }
  return sJoined;
}

}  // namespace

Deployer::Deployer(providers::ICloudClient& ccClient, common::IUi& uiOut,
                   common::IFileReader& frReader, BuildStage& bsBuild, std::string sProjectDir)
    : _ccClient(ccClient),
      _uiOut(uiOut),
      _frReader(frReader),
      _bsBuild(bsBuild),
      _sProjectDir(std::move(sProjectDir)) {}

Deployer::~Deployer() = default;

common::DeploymentError Deployer::wrapError(const common::ProviderError& e) {
  std::string sWhere = "While deploying your application";
  if (const auto* pLambda = dynamic_cast<const common::LambdaClientError*>(&e)) {
    sWhere = "While sending your handler code to Lambda to " +
             verbForClientMethod(pLambda->_sClientMethod) + " function \"" +
             pLambda->_sFunctionName + "\"";
  }
  return common::DeploymentError(
      "deployment_failed",
      "ERROR - " + sWhere + ", received the following error:\n\n " + e.what() + "\n\n");
}

model::Plan Deployer::plan(model::ResourceGraph& rgGraph, const model::Application& app) {
  auto spLog = common::Logger::get();

  const auto vOrdered = DependencyResolver().order(rgGraph, app);
  spLog->info("Resolved {} resources for stage '{}'", vOrdered.size(), app.sStage);

  _bsBuild.execute(rgGraph, vOrdered);
  const auto vPending = BuildStage::pendingFields(rgGraph, vOrdered);
  if (!vPending.empty()) {
    throw common::BuildError("unresolved_build_fields",
                             "Build stage left fields unresolved: " + joinLabels(vPending));
  }

  const auto oDeployed = state::DeployedResources::load(_sProjectDir, app.sStage);
  const state::DeployedResources drsEmpty(nlohmann::json{{"resources", nlohmann::json::array()}});
  RemoteState rsRemote(_ccClient, oDeployed ? *oDeployed : drsEmpty);

  auto plPlan = PlanStage(rsRemote, _frReader).execute(rgGraph, vOrdered);
  ResourceSweeper().execute(plPlan, oDeployed);
  return plPlan;
}

nlohmann::json Deployer::deploy(model::ResourceGraph& rgGraph, const model::Application& app) {
  try {
    const auto plPlan = plan(rgGraph, app);
    return executeAndRecord(plPlan, app.sStage);
  } catch (const common::ProviderError& e) {
    common::Logger::get()->error("Deploy of stage '{}' failed: {}", app.sStage, e.what());
    throw wrapError(e);
  }
}

model::Plan Deployer::teardownPlan(const std::optional<state::DeployedResources>& oDeployed) {
  model::Plan plPlan;
  ResourceSweeper().execute(plPlan, oDeployed);
  return plPlan;
}

model::Plan Deployer::planDestroy(const std::string& sStage) const {
  return teardownPlan(state::DeployedResources::load(_sProjectDir, sStage));
}

nlohmann::json Deployer::destroy(const std::string& sStage) {
  try {
    return executeAndRecord(planDestroy(sStage), sStage);
  } catch (const common::ProviderError& e) {
    common::Logger::get()->error("Teardown of stage '{}' failed: {}", sStage, e.what());
    throw wrapError(e);
  }
}

nlohmann::json Deployer::executeAndRecord(const model::Plan& plPlan, const std::string& sStage) {
  Executor exExecutor(_ccClient, _uiOut);
  exExecutor.execute(plPlan);

  auto jResults = state::ResultsRecorder::buildDeployedValues(exExecutor.resourceValues());
  state::ResultsRecorder().record(jResults, sStage, _sProjectDir);
  return jResults;
}

}  // namespace ldp::core
