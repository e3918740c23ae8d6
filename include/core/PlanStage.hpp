#pragma once

#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/Instructions.hpp"
#include "model/ResourceGraph.hpp"

namespace ldp::common {
class IFileReader;
}

namespace ldp::core {

class RemoteState;

/// Diffs each resource against remote state and emits the instruction list.
///
/// Updates are field-level: an existing resource gets one targeted call
/// carrying its identifying key plus only the attributes that differ. A
/// resource whose attributes match emits no API calls, only the bookkeeping
/// instructions that re-record its identity. Issues read-only queries only, so
/// planning twice against the same remote state yields equal plans.
/// Class abbreviation: ps
class PlanStage {
 public:
  PlanStage(RemoteState& rsRemote, common::IFileReader& frReader);
  ~PlanStage();

  PlanStage(const PlanStage&) = delete;
  PlanStage& operator=(const PlanStage&) = delete;

  model::Plan execute(const model::ResourceGraph& rgGraph,
                      const std::vector<model::ResourceId>& vOrdered);

  /// Fingerprint recorded for a REST API; changes whenever the definition or
  /// any deployed setting changes.
  static std::string apiFingerprint(const model::ResourceGraph& rgGraph,
                                    const model::RestApi& api);

 private:
  void planLambdaLayer(model::Plan& plPlan, const model::ResourceGraph& rgGraph,
                       model::ResourceId id, const model::LambdaLayer& layer);
  void planLambdaFunction(model::Plan& plPlan, const model::ResourceGraph& rgGraph,
                          model::ResourceId id, const model::LambdaFunction& fn);
  void planManagedIamRole(model::Plan& plPlan, const model::ResourceGraph& rgGraph,
                          model::ResourceId id, const model::ManagedIamRole& role);
  void planScheduledEvent(model::Plan& plPlan, const model::ResourceGraph& rgGraph,
                          model::ResourceId id, const model::ScheduledEvent& ev);
  void planCloudWatchEvent(model::Plan& plPlan, const model::ResourceGraph& rgGraph,
                           model::ResourceId id, const model::CloudWatchEvent& ev);
  void planS3BucketNotification(model::Plan& plPlan, const model::ResourceGraph& rgGraph,
                                model::ResourceId id, const model::S3BucketNotification& notif);
  void planSnsSubscription(model::Plan& plPlan, const model::ResourceGraph& rgGraph,
                           model::ResourceId id, const model::SnsSubscription& sub);
  void planSqsEventSource(model::Plan& plPlan, const model::ResourceGraph& rgGraph,
                          model::ResourceId id, const model::SqsEventSource& src);
  void planKinesisEventSource(model::Plan& plPlan, const model::ResourceGraph& rgGraph,
                              model::ResourceId id, const model::KinesisEventSource& src);
  void planDynamoDBEventSource(model::Plan& plPlan, const model::ResourceGraph& rgGraph,
                               model::ResourceId id, const model::DynamoDBEventSource& src);
  void planRestApi(model::Plan& plPlan, const model::ResourceGraph& rgGraph,
                   model::ResourceId id, const model::RestApi& api);

  /// Shared by scheduled and pattern rules once the rule parameters are known.
  void planRule(model::Plan& plPlan, const model::ResourceGraph& rgGraph, model::ResourceId id,
                const std::string& sRuleName, const model::ResourceId& idFunction,
                model::ParamValue pvRuleParams, const std::string& sSpecField,
                const nlohmann::json& jSpecValue, bool bChanged);

  /// Settings shared by Kinesis and DynamoDB stream mappings.
  struct StreamMapping {
    std::string sResourceType;
    std::string sStreamField;  // identity field of the record: "stream" or "stream_arn"
    std::string sStream;
    std::string sDisplayName;  // "Kinesis stream" or "DynamoDB stream"
    int iBatchSize = 100;
    std::string sStartingPosition;
    int iMaximumBatchingWindowInSeconds = 0;
    model::ResourceId idLambdaFunction;
  };

  /// Expects <resource>_stream_arn to be stored already.
  void planStreamEventSource(model::Plan& plPlan, const model::ResourceGraph& rgGraph,
                             model::ResourceId id, const StreamMapping& smMapping);

  /// True when the binding recorded in jSnapshot does not point at the live
  /// ARN of idFunction, e.g. because the function is new or was swapped.
  bool targetChanged(const model::ResourceGraph& rgGraph, model::ResourceId idFunction,
                     const nlohmann::json& jSnapshot);

  /// Function layers with the managed layer's version ARN first.
  model::ParamValue functionLayers(const model::ResourceGraph& rgGraph,
                                   const model::LambdaFunction& fn);

  /// Literal ARN for pre-created or already deployed roles, else the role's variable.
  model::ParamValue roleArn(const model::ResourceGraph& rgGraph, model::ResourceId idRole);

  /// Package bytes as base64, or a placeholder while the filename is pending.
  model::ParamValue zipContents(const model::DeploymentPackage& pkg);

  bool createdInPlan(model::ResourceId id) const { return _setCreated.contains(id); }

  RemoteState& _rsRemote;
  common::IFileReader& _frReader;
  std::set<model::ResourceId> _setCreated;
};

/// Variable bound to a Lambda function's ARN during execution.
std::string lambdaArnVariable(const std::string& sResourceName);

/// Variable bound to a managed layer's version ARN during execution.
std::string layerArnVariable(const std::string& sResourceName);

}  // namespace ldp::core
