#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/Instructions.hpp"

namespace ldp::state {
class DeployedResources;
}

namespace ldp::core {

/// Appends teardown instructions for resources that were deployed before but
/// are no longer referenced by the plan.
///
/// A resource counts as referenced when some RecordResource* instruction names
/// it. Event bindings whose identity-defining value changed (s3 bucket, sns
/// topic, sqs queue) are torn down as well; their replacement is already in
/// the plan. Deletions run in reverse record order, dependents first.
/// Class abbreviation: sw
class ResourceSweeper {
 public:
  ResourceSweeper();
  ~ResourceSweeper();

  void execute(model::Plan& plPlan, const std::optional<state::DeployedResources>& oDeployed);

 private:
  using MarkedResources = std::map<std::string, std::vector<const model::RecordResourceValue*>>;

  static MarkedResources markResources(const model::Plan& plPlan,
                                       std::vector<std::string>& vReferenced);
  static std::vector<std::string> determineRemaining(
      const MarkedResources& mMarked, const std::vector<std::string>& vReferenced,
      const state::DeployedResources& drsDeployed);
  static void planDeletion(model::Plan& plPlan, const nlohmann::json& jRecord);
};

}  // namespace ldp::core
