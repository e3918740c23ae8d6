#include "core/PlanStage.hpp"

#include "common/Errors.hpp"
#include "common/FileReader.hpp"
#include "common/Logger.hpp"
#include "core/RemoteState.hpp"
#include "security/CryptoService.hpp"

namespace ldp::core {

using namespace ldp::model;
using providers::ApiMethod;

namespace {

template <typename T>
ParamValue deferredParam(const Deferred<T>& df) {
  if (df.isPending()) {
    return Placeholder{};
  }
  return ParamValue(nlohmann::json(df.value()));
}

nlohmann::json field(const nlohmann::json& jSnapshot, const char* pKey) {
  auto it = jSnapshot.find(pKey);
  return it == jSnapshot.end() ? nlohmann::json() : *it;
}

template <typename T>
nlohmann::json optionalJson(const std::optional<T>& oValue) {
  return oValue ? nlohmann::json(*oValue) : nlohmann::json();
}

/// Number of entries in a map parameter.
std::size_t paramCount(const ParamValue& pvParams) {
  const auto* pEntries = pvParams.entries();
  return pEntries == nullptr ? 0 : pEntries->size();
}

/// parse_arn on the function ARN, then region_name/account_id into the pool.
void appendArnComponents(Plan& plPlan, const std::string& sFunctionArnVar) {
  plPlan.append(BuiltinFunction{Builtin::ParseArn, {Variable{sFunctionArnVar}}, "parsed_lambda_arn"});
  plPlan.append(JpSearch{"account_id", "parsed_lambda_arn", "account_id"});
  plPlan.append(JpSearch{"region", "parsed_lambda_arn", "region_name"});
}

}  // namespace

std::string lambdaArnVariable(const std::string& sResourceName) {
  return sResourceName + "_lambda_arn";
}

std::string layerArnVariable(const std::string& sResourceName) {
  return sResourceName + "_layer_arn";
}

PlanStage::PlanStage(RemoteState& rsRemote, common::IFileReader& frReader)
    : _rsRemote(rsRemote), _frReader(frReader) {}

PlanStage::~PlanStage() = default;

Plan PlanStage::execute(const ResourceGraph& rgGraph, const std::vector<ResourceId>& vOrdered) {
  Plan plPlan;
  _setCreated.clear();

  for (const auto& id : vOrdered) {
    std::visit(
        Overloaded{
            [&](const LambdaLayer& layer) { planLambdaLayer(plPlan, rgGraph, id, layer); },
            [&](const LambdaFunction& fn) { planLambdaFunction(plPlan, rgGraph, id, fn); },
            [&](const ManagedIamRole& role) { planManagedIamRole(plPlan, rgGraph, id, role); },
            [&](const ScheduledEvent& ev) { planScheduledEvent(plPlan, rgGraph, id, ev); },
            [&](const CloudWatchEvent& ev) { planCloudWatchEvent(plPlan, rgGraph, id, ev); },
            [&](const S3BucketNotification& notif) {
              planS3BucketNotification(plPlan, rgGraph, id, notif);
            },
            [&](const SnsSubscription& sub) { planSnsSubscription(plPlan, rgGraph, id, sub); },
            [&](const SqsEventSource& src) { planSqsEventSource(plPlan, rgGraph, id, src); },
            [&](const KinesisEventSource& src) {
              planKinesisEventSource(plPlan, rgGraph, id, src);
            },
            [&](const DynamoDBEventSource& src) {
              planDynamoDBEventSource(plPlan, rgGraph, id, src);
            },
            [&](const RestApi& api) { planRestApi(plPlan, rgGraph, id, api); },
            [](const DeploymentPackage&) {},
            [](const IamPolicy&) {},
            [](const PreCreatedIamRole&) {},
        },
        rgGraph.at(id));
  }

  common::Logger::get()->info("Planned {} instructions for {} resources", plPlan.size(),
                              vOrdered.size());
  return plPlan;
}

// ── Dependency identifiers ─────────────────────────────────────────────────

ParamValue PlanStage::roleArn(const ResourceGraph& rgGraph, ResourceId idRole) {
  if (const auto* pPreCreated = std::get_if<PreCreatedIamRole>(&rgGraph.at(idRole))) {
    return pPreCreated->sRoleArn;
  }
  const auto& role = rgGraph.get<ManagedIamRole>(idRole);
  if (auto oSnapshot = _rsRemote.fetch(rgGraph, idRole)) {
    return field(*oSnapshot, "role_arn");
  }
  return Variable{role.sRoleName + "_role_arn"};
}

bool PlanStage::targetChanged(const ResourceGraph& rgGraph, ResourceId idFunction,
                              const nlohmann::json& jSnapshot) {
  if (createdInPlan(idFunction)) {
    return true;
  }
  const auto oFunction = _rsRemote.fetch(rgGraph, idFunction);
  return !oFunction || field(*oFunction, "function_arn") != field(jSnapshot, "lambda_arn");
}

ParamValue PlanStage::functionLayers(const ResourceGraph& rgGraph, const LambdaFunction& fn) {
  if (!fn.oManagedLayer) {
    return nlohmann::json(fn.vLayers);
  }
  const ResourceId idLayer = *fn.oManagedLayer;
  if (!createdInPlan(idLayer)) {
    if (const auto oSnapshot = _rsRemote.fetch(rgGraph, idLayer)) {
      auto jLayers = nlohmann::json::array({field(*oSnapshot, "layer_version_arn")});
      for (const auto& sLayer : fn.vLayers) {
        jLayers.push_back(sLayer);
      }
      return jLayers;
    }
  }
  ParamValue::List vLayers{Variable{layerArnVariable(rgGraph.resourceName(idLayer))}};
  for (const auto& sLayer : fn.vLayers) {
    vLayers.emplace_back(sLayer);
  }
  return vLayers;
}

ParamValue PlanStage::zipContents(const DeploymentPackage& pkg) {
  if (pkg.dfFilename.isPending()) {
    return Placeholder{};
  }
  return security::CryptoService::base64Encode(_frReader.readFile(pkg.dfFilename.value()));
}

// ── Lambda layer ───────────────────────────────────────────────────────────

void PlanStage::planLambdaLayer(Plan& plPlan, const ResourceGraph& rgGraph, ResourceId id,
                                const LambdaLayer& layer) {
  const std::string sVarName = layerArnVariable(layer.sResourceName);
  const auto& pkg = rgGraph.get<DeploymentPackage>(layer.idDeploymentPackage);
  const auto oSnapshot = _rsRemote.fetch(rgGraph, id);

  ParamValue pvContents = Placeholder{};
  if (!pkg.dfFilename.isPending()) {
    const std::string sContents = _frReader.readFile(pkg.dfFilename.value());
    if (oSnapshot && field(*oSnapshot, "code_sha256") ==
                         security::CryptoService::sha256Base64(sContents)) {
      plPlan.append(StoreValue{sVarName, field(*oSnapshot, "layer_version_arn")});
      plPlan.append(RecordResourceVariable{"lambda_layer", layer.sResourceName,
                                           "layer_version_arn", sVarName});
      return;
    }
    pvContents = security::CryptoService::base64Encode(sContents);
  }

  _setCreated.insert(id);
  plPlan.append(ApiCall{ApiMethod::PublishLayer,
                        ParamValue::map({{"layer_name", layer.sLayerName},
                                         {"zip_contents", std::move(pvContents)},
                                         {"runtime", layer.sRuntime}}),
                        sVarName},
                "Publishing lambda layer: " + layer.sLayerName + "\n");
  plPlan.append(
      RecordResourceVariable{"lambda_layer", layer.sResourceName, "layer_version_arn", sVarName});
  if (oSnapshot) {
    // Versions are immutable; the superseded one is released once replaced
    plPlan.append(ApiCall{ApiMethod::DeleteLayerVersion,
                          ParamValue::map({{"layer_version_arn",
                                            field(*oSnapshot, "layer_version_arn")}}),
                          std::nullopt});
  }
}

// ── Lambda ─────────────────────────────────────────────────────────────────

void PlanStage::planLambdaFunction(Plan& plPlan, const ResourceGraph& rgGraph, ResourceId id,
                                   const LambdaFunction& fn) {
  const std::string sVarName = lambdaArnVariable(fn.sResourceName);
  const auto& pkg = rgGraph.get<DeploymentPackage>(fn.idDeploymentPackage);
  const ParamValue pvRoleArn = roleArn(rgGraph, fn.idRole);
  const auto oSnapshot = _rsRemote.fetch(rgGraph, id);

  if (!oSnapshot) {
    _setCreated.insert(id);
    auto pvParams = ParamValue::map({
        {"function_name", fn.sFunctionName},
        {"role_arn", pvRoleArn},
        {"zip_contents", zipContents(pkg)},
        {"runtime", fn.sRuntime},
        {"handler", fn.sHandler},
        {"environment_variables", nlohmann::json(fn.mEnvironmentVariables)},
        {"tags", nlohmann::json(fn.mTags)},
        {"timeout", deferredParam(fn.dfTimeout)},
        {"memory_size", deferredParam(fn.dfMemorySize)},
        {"security_group_ids", nlohmann::json(fn.vSecurityGroupIds)},
        {"subnet_ids", nlohmann::json(fn.vSubnetIds)},
        {"layers", functionLayers(rgGraph, fn)},
        {"xray", fn.bXray},
    });
    plPlan.append(ApiCall{ApiMethod::CreateFunction, std::move(pvParams), sVarName},
                  "Creating lambda function: " + fn.sFunctionName + "\n");
    plPlan.append(RecordResourceVariable{"lambda_function", fn.sResourceName, "lambda_arn",
                                         sVarName});
    if (fn.oReservedConcurrency) {
      plPlan.append(ApiCall{ApiMethod::PutFunctionConcurrency,
                            ParamValue::map({{"function_name", fn.sFunctionName},
                                             {"reserved_concurrent_executions",
                                              *fn.oReservedConcurrency}}),
                            std::string("reserved_concurrency_result")},
                    "Updating lambda function concurrency limit: " + fn.sFunctionName + "\n");
    }
    return;
  }

  // ── Existing function: targeted update of differing attributes ──────────
  const auto& jLive = *oSnapshot;
  ParamValue pvUpdate = ParamValue::map({{"function_name", fn.sFunctionName}});
  auto diff = [&](const char* pKey, const nlohmann::json& jDesired) {
    if (field(jLive, pKey) != jDesired) {
      pvUpdate.set(pKey, jDesired);
    }
  };
  auto diffDeferred = [&](const char* pKey, const Deferred<int>& dfValue) {
    if (dfValue.isPending()) {
      pvUpdate.set(pKey, Placeholder{});
    } else {
      diff(pKey, dfValue.value());
    }
  };

  if (const auto* pLiteral = pvRoleArn.literal()) {
    diff("role_arn", *pLiteral);
  } else {
    pvUpdate.set("role_arn", pvRoleArn);
  }

  if (pkg.dfFilename.isPending()) {
    pvUpdate.set("zip_contents", Placeholder{});
  } else {
    const std::string sContents = _frReader.readFile(pkg.dfFilename.value());
    if (field(jLive, "code_sha256") != security::CryptoService::sha256Base64(sContents)) {
      pvUpdate.set("zip_contents", security::CryptoService::base64Encode(sContents));
    }
  }

  diff("runtime", fn.sRuntime);
  diff("handler", fn.sHandler);
  diff("environment_variables", nlohmann::json(fn.mEnvironmentVariables));
  diff("tags", nlohmann::json(fn.mTags));
  diffDeferred("timeout", fn.dfTimeout);
  diffDeferred("memory_size", fn.dfMemorySize);
  diff("security_group_ids", nlohmann::json(fn.vSecurityGroupIds));
  diff("subnet_ids", nlohmann::json(fn.vSubnetIds));
  const ParamValue pvLayers = functionLayers(rgGraph, fn);
  if (const auto* pLiteral = pvLayers.literal()) {
    diff("layers", *pLiteral);
  } else {
    pvUpdate.set("layers", pvLayers);
  }
  diff("xray", fn.bXray);

  if (paramCount(pvUpdate) > 1) {
    plPlan.append(ApiCall{ApiMethod::UpdateFunction, std::move(pvUpdate),
                          std::string("update_function_result")},
                  "Updating lambda function: " + fn.sFunctionName + "\n");
    plPlan.append(JpSearch{"function_arn", "update_function_result", sVarName});
  } else {
    plPlan.append(StoreValue{sVarName, field(jLive, "function_arn")});
  }
  plPlan.append(
      RecordResourceVariable{"lambda_function", fn.sResourceName, "lambda_arn", sVarName});

  const auto jLiveConcurrency = field(jLive, "reserved_concurrency");
  if (fn.oReservedConcurrency) {
    if (jLiveConcurrency != *fn.oReservedConcurrency) {
      plPlan.append(ApiCall{ApiMethod::PutFunctionConcurrency,
                            ParamValue::map({{"function_name", fn.sFunctionName},
                                             {"reserved_concurrent_executions",
                                              *fn.oReservedConcurrency}}),
                            std::string("reserved_concurrency_result")},
                    "Updating lambda function concurrency limit: " + fn.sFunctionName + "\n");
    }
  } else if (!jLiveConcurrency.is_null()) {
    plPlan.append(ApiCall{ApiMethod::DeleteFunctionConcurrency,
                          ParamValue::map({{"function_name", fn.sFunctionName}}),
                          std::string("reserved_concurrency_result")});
  }
}

// ── IAM role ───────────────────────────────────────────────────────────────

void PlanStage::planManagedIamRole(Plan& plPlan, const ResourceGraph& rgGraph, ResourceId id,
                                   const ManagedIamRole& role) {
  const std::string sVarName = role.sRoleName + "_role_arn";
  const auto& policy = rgGraph.get<IamPolicy>(role.idPolicy);
  const ParamValue pvDocument = deferredParam(policy.dfDocument);
  const auto oSnapshot = _rsRemote.fetch(rgGraph, id);

  if (!oSnapshot) {
    _setCreated.insert(id);
    plPlan.append(ApiCall{ApiMethod::CreateRole,
                          ParamValue::map({{"name", role.sRoleName},
                                           {"trust_policy", role.jTrustPolicy},
                                           {"policy", pvDocument}}),
                          sVarName},
                  "Creating IAM role: " + role.sRoleName + "\n");
  } else {
    const auto& jLive = *oSnapshot;
    plPlan.append(StoreValue{sVarName, field(jLive, "role_arn")});

    bool bUpdated = false;
    if (policy.dfDocument.isPending() || field(jLive, "policy") != policy.dfDocument.value()) {
      plPlan.append(ApiCall{ApiMethod::PutRolePolicy,
                            ParamValue::map({{"role_name", role.sRoleName},
                                             {"policy_name", role.sRoleName},
                                             {"policy_document", pvDocument}}),
                            std::nullopt},
                    "Updating policy for IAM role: " + role.sRoleName + "\n");
      bUpdated = true;
    }
    if (field(jLive, "trust_policy") != role.jTrustPolicy) {
      ApiCall call{ApiMethod::UpdateAssumeRolePolicy,
                   ParamValue::map({{"role_name", role.sRoleName},
                                    {"policy_document", role.jTrustPolicy}}),
                   std::nullopt};
      if (bUpdated) {
        plPlan.append(std::move(call));
      } else {
        plPlan.append(std::move(call),
                      "Updating trust policy for IAM role: " + role.sRoleName + "\n");
      }
    }
  }

  plPlan.append(RecordResourceVariable{"iam_role", role.sResourceName, "role_arn", sVarName});
  plPlan.append(RecordResourceValue{"iam_role", role.sResourceName, "role_name", role.sRoleName});
}

// ── CloudWatch rules ───────────────────────────────────────────────────────

void PlanStage::planScheduledEvent(Plan& plPlan, const ResourceGraph& rgGraph, ResourceId id,
                                   const ScheduledEvent& ev) {
  ParamValue pvParams = ParamValue::map(
      {{"rule_name", ev.sRuleName}, {"schedule_expression", ev.sScheduleExpression}});
  if (ev.oRuleDescription) {
    pvParams.set("rule_description", *ev.oRuleDescription);
  }

  const auto oSnapshot = _rsRemote.fetch(rgGraph, id);
  const bool bChanged =
      !oSnapshot || targetChanged(rgGraph, ev.idLambdaFunction, *oSnapshot) ||
      field(*oSnapshot, "schedule_expression") != ev.sScheduleExpression ||
      (ev.oRuleDescription && field(*oSnapshot, "description") != *ev.oRuleDescription);
  planRule(plPlan, rgGraph, id, ev.sRuleName, ev.idLambdaFunction, std::move(pvParams),
           "schedule_expression", ev.sScheduleExpression, bChanged);
}

void PlanStage::planCloudWatchEvent(Plan& plPlan, const ResourceGraph& rgGraph, ResourceId id,
                                    const CloudWatchEvent& ev) {
  ParamValue pvParams =
      ParamValue::map({{"rule_name", ev.sRuleName}, {"event_pattern", ev.sEventPattern}});

  const auto oSnapshot = _rsRemote.fetch(rgGraph, id);
  const bool bChanged = !oSnapshot || targetChanged(rgGraph, ev.idLambdaFunction, *oSnapshot) ||
                        field(*oSnapshot, "event_pattern") != ev.sEventPattern;
  planRule(plPlan, rgGraph, id, ev.sRuleName, ev.idLambdaFunction, std::move(pvParams),
           "event_pattern", ev.sEventPattern, bChanged);
}

void PlanStage::planRule(Plan& plPlan, const ResourceGraph& rgGraph, ResourceId id,
                         const std::string& sRuleName, const ResourceId& idFunction,
                         ParamValue pvRuleParams, const std::string& sSpecField,
                         const nlohmann::json& jSpecValue, bool bChanged) {
  const std::string sResourceName = rgGraph.resourceName(id);
  const Variable varFunctionArn{lambdaArnVariable(rgGraph.resourceName(idFunction))};

  if (bChanged) {
    plPlan.append(ApiCall{ApiMethod::GetOrCreateRuleArn, std::move(pvRuleParams),
                          std::string("rule-arn")});
    plPlan.append(ApiCall{ApiMethod::ConnectRuleToLambda,
                          ParamValue::map({{"rule_name", sRuleName},
                                           {"function_arn", varFunctionArn}}),
                          std::nullopt});
    plPlan.append(ApiCall{ApiMethod::AddPermissionForCloudwatchEvent,
                          ParamValue::map({{"rule_arn", Variable{"rule-arn"}},
                                           {"function_arn", varFunctionArn}}),
                          std::nullopt});
  }

  // Targets have to be removed by rule name before the rule can be deleted
  plPlan.append(RecordResourceValue{"cloudwatch_event", sResourceName, "rule_name", sRuleName});
  plPlan.append(RecordResourceValue{"cloudwatch_event", sResourceName, sSpecField, jSpecValue});
  plPlan.append(RecordResourceVariable{"cloudwatch_event", sResourceName, "lambda_arn",
                                       varFunctionArn.sName});
}

// ── S3 ─────────────────────────────────────────────────────────────────────

void PlanStage::planS3BucketNotification(Plan& plPlan, const ResourceGraph& rgGraph,
                                         ResourceId id, const S3BucketNotification& notif) {
  const auto& fn = rgGraph.get<LambdaFunction>(notif.idLambdaFunction);
  const Variable varFunctionArn{lambdaArnVariable(fn.sResourceName)};
  const nlohmann::json jEvents(notif.vEvents);
  const nlohmann::json jPrefix = optionalJson(notif.oPrefix);
  const nlohmann::json jSuffix = optionalJson(notif.oSuffix);

  const auto oSnapshot = _rsRemote.fetch(rgGraph, id);
  const bool bChanged = !oSnapshot ||
                        targetChanged(rgGraph, notif.idLambdaFunction, *oSnapshot) ||
                        field(*oSnapshot, "events") != jEvents ||
                        field(*oSnapshot, "prefix") != jPrefix ||
                        field(*oSnapshot, "suffix") != jSuffix;

  if (bChanged) {
    plPlan.append(ApiCall{ApiMethod::AddPermissionForS3Event,
                          ParamValue::map({{"bucket", notif.sBucket},
                                           {"function_arn", varFunctionArn}}),
                          std::nullopt});
    plPlan.append(ApiCall{ApiMethod::ConnectS3BucketToLambda,
                          ParamValue::map({{"bucket", notif.sBucket},
                                           {"function_arn", varFunctionArn},
                                           {"prefix", jPrefix},
                                           {"suffix", jSuffix},
                                           {"events", jEvents}}),
                          std::nullopt},
                  "Configuring S3 events in bucket " + notif.sBucket + " to function " +
                      fn.sFunctionName + "\n");
  }

  plPlan.append(RecordResourceValue{"s3_event", notif.sResourceName, "bucket", notif.sBucket});
  plPlan.append(RecordResourceValue{"s3_event", notif.sResourceName, "events", jEvents});
  plPlan.append(RecordResourceValue{"s3_event", notif.sResourceName, "prefix", jPrefix});
  plPlan.append(RecordResourceValue{"s3_event", notif.sResourceName, "suffix", jSuffix});
  plPlan.append(RecordResourceVariable{"s3_event", notif.sResourceName, "lambda_arn",
                                       varFunctionArn.sName});
}

// ── SNS ────────────────────────────────────────────────────────────────────

void PlanStage::planSnsSubscription(Plan& plPlan, const ResourceGraph& rgGraph, ResourceId id,
                                    const SnsSubscription& sub) {
  const auto& fn = rgGraph.get<LambdaFunction>(sub.idLambdaFunction);
  const Variable varFunctionArn{lambdaArnVariable(fn.sResourceName)};
  const std::string sTopicArnVar = sub.sResourceName + "_topic_arn";
  const std::string sSubscriptionVar = sub.sResourceName + "_subscription_arn";

  // Only the topic name is required; the API wants the full ARN
  if (sub.sTopic.rfind("arn:aws:sns:", 0) == 0) {
    plPlan.append(StoreValue{sTopicArnVar, sub.sTopic});
  } else {
    appendArnComponents(plPlan, varFunctionArn.sName);
    plPlan.append(StoreValue{
        sTopicArnVar,
        StringFormat{"arn:aws:sns:{region_name}:{account_id}:" + sub.sTopic,
                     {"region_name", "account_id"}}});
  }

  if (_rsRemote.resourceExists(rgGraph, id)) {
    // Nothing on a subscription is configurable; the record is carried forward
    const auto jDeployed = _rsRemote.resourceDeployedValues(rgGraph, id);
    plPlan.append(RecordResourceValue{"sns_event", sub.sResourceName, "topic", sub.sTopic});
    plPlan.append(RecordResourceVariable{"sns_event", sub.sResourceName, "lambda_arn",
                                         varFunctionArn.sName});
    plPlan.append(RecordResourceValue{"sns_event", sub.sResourceName, "subscription_arn",
                                      field(jDeployed, "subscription_arn")});
    plPlan.append(
        RecordResourceVariable{"sns_event", sub.sResourceName, "topic_arn", sTopicArnVar});
    return;
  }

  plPlan.append(ApiCall{ApiMethod::AddPermissionForSnsTopic,
                        ParamValue::map({{"topic_arn", Variable{sTopicArnVar}},
                                         {"function_arn", varFunctionArn}}),
                        std::nullopt});
  plPlan.append(ApiCall{ApiMethod::SubscribeFunctionToTopic,
                        ParamValue::map({{"topic_arn", Variable{sTopicArnVar}},
                                         {"function_arn", varFunctionArn}}),
                        sSubscriptionVar},
                "Subscribing " + fn.sFunctionName + " to SNS topic " + sub.sTopic + "\n");
  plPlan.append(RecordResourceValue{"sns_event", sub.sResourceName, "topic", sub.sTopic});
  plPlan.append(RecordResourceVariable{"sns_event", sub.sResourceName, "lambda_arn",
                                       varFunctionArn.sName});
  plPlan.append(RecordResourceVariable{"sns_event", sub.sResourceName, "subscription_arn",
                                       sSubscriptionVar});
  plPlan.append(
      RecordResourceVariable{"sns_event", sub.sResourceName, "topic_arn", sTopicArnVar});
}

// ── SQS ────────────────────────────────────────────────────────────────────

void PlanStage::planSqsEventSource(Plan& plPlan, const ResourceGraph& rgGraph, ResourceId id,
                                   const SqsEventSource& src) {
  const auto& fn = rgGraph.get<LambdaFunction>(src.idLambdaFunction);
  const Variable varFunctionArn{lambdaArnVariable(fn.sResourceName)};
  const std::string sQueueArnVar = src.sResourceName + "_queue_arn";
  const std::string sUuidVar = src.sResourceName + "_uuid";
  const nlohmann::json jMaxConcurrency = optionalJson(src.oMaximumConcurrency);

  appendArnComponents(plPlan, varFunctionArn.sName);
  plPlan.append(StoreValue{
      sQueueArnVar, StringFormat{"arn:aws:sqs:{region_name}:{account_id}:" + src.sQueue,
                                 {"region_name", "account_id"}}});

  auto oSnapshot = _rsRemote.fetch(rgGraph, id);
  if (oSnapshot && targetChanged(rgGraph, src.idLambdaFunction, *oSnapshot)) {
    // A mapping cannot move to another function; the old one is removed first
    plPlan.append(ApiCall{ApiMethod::RemoveSqsEventSource,
                          ParamValue::map({{"event_uuid", field(*oSnapshot, "event_uuid")}}),
                          std::nullopt});
    oSnapshot.reset();
  }

  if (oSnapshot) {
    const auto& jLive = *oSnapshot;
    const nlohmann::json jUuid = field(jLive, "event_uuid");
    ParamValue pvUpdate = ParamValue::map({{"event_uuid", jUuid}});
    if (field(jLive, "batch_size") != src.iBatchSize) {
      pvUpdate.set("batch_size", src.iBatchSize);
    }
    if (field(jLive, "maximum_batching_window_in_seconds") !=
        src.iMaximumBatchingWindowInSeconds) {
      pvUpdate.set("maximum_batching_window_in_seconds", src.iMaximumBatchingWindowInSeconds);
    }
    if (field(jLive, "maximum_concurrency") != jMaxConcurrency) {
      pvUpdate.set("maximum_concurrency", jMaxConcurrency);
    }
    if (paramCount(pvUpdate) > 1) {
      plPlan.append(ApiCall{ApiMethod::UpdateSqsEventSource, std::move(pvUpdate), std::nullopt},
                    "Updating SQS event source for queue " + src.sQueue + "\n");
    }
    plPlan.append(RecordResourceValue{"sqs_event", src.sResourceName, "queue_arn",
                                      field(jLive, "queue_arn")});
    plPlan.append(RecordResourceValue{"sqs_event", src.sResourceName, "event_uuid", jUuid});
    plPlan.append(RecordResourceValue{"sqs_event", src.sResourceName, "queue", src.sQueue});
    plPlan.append(RecordResourceValue{"sqs_event", src.sResourceName, "lambda_arn",
                                      field(jLive, "lambda_arn")});
    return;
  }

  ParamValue pvParams = ParamValue::map(
      {{"queue_arn", Variable{sQueueArnVar}},
       {"batch_size", src.iBatchSize},
       {"function_name", varFunctionArn},
       {"maximum_batching_window_in_seconds", src.iMaximumBatchingWindowInSeconds}});
  if (src.oMaximumConcurrency) {
    pvParams.set("maximum_concurrency", *src.oMaximumConcurrency);
  }
  plPlan.append(ApiCall{ApiMethod::CreateSqsEventSource, std::move(pvParams), sUuidVar},
                "Subscribing " + fn.sFunctionName + " to SQS queue " + src.sQueue + "\n");
  plPlan.append(
      RecordResourceVariable{"sqs_event", src.sResourceName, "queue_arn", sQueueArnVar});
  // The event source UUID is what unsubscribes the function from the queue
  plPlan.append(RecordResourceVariable{"sqs_event", src.sResourceName, "event_uuid", sUuidVar});
  plPlan.append(RecordResourceValue{"sqs_event", src.sResourceName, "queue", src.sQueue});
  plPlan.append(RecordResourceVariable{"sqs_event", src.sResourceName, "lambda_arn",
                                       varFunctionArn.sName});
}

// ── Kinesis and DynamoDB streams ───────────────────────────────────────────

void PlanStage::planKinesisEventSource(Plan& plPlan, const ResourceGraph& rgGraph, ResourceId id,
                                       const KinesisEventSource& src) {
  const auto& fn = rgGraph.get<LambdaFunction>(src.idLambdaFunction);
  appendArnComponents(plPlan, lambdaArnVariable(fn.sResourceName));
  plPlan.append(StoreValue{
      src.sResourceName + "_stream_arn",
      StringFormat{"arn:aws:kinesis:{region_name}:{account_id}:stream/" + src.sStream,
                   {"region_name", "account_id"}}});
  planStreamEventSource(plPlan, rgGraph, id,
                        StreamMapping{"kinesis_event", "stream", src.sStream, "Kinesis stream",
                                      src.iBatchSize, src.sStartingPosition,
                                      src.iMaximumBatchingWindowInSeconds, src.idLambdaFunction});
}

void PlanStage::planDynamoDBEventSource(Plan& plPlan, const ResourceGraph& rgGraph,
                                        ResourceId id, const DynamoDBEventSource& src) {
  plPlan.append(StoreValue{src.sResourceName + "_stream_arn", src.sStreamArn});
  planStreamEventSource(plPlan, rgGraph, id,
                        StreamMapping{"dynamodb_event", "stream_arn", src.sStreamArn,
                                      "DynamoDB stream", src.iBatchSize, src.sStartingPosition,
                                      src.iMaximumBatchingWindowInSeconds, src.idLambdaFunction});
}

void PlanStage::planStreamEventSource(Plan& plPlan, const ResourceGraph& rgGraph, ResourceId id,
                                      const StreamMapping& smMapping) {
  const auto& fn = rgGraph.get<LambdaFunction>(smMapping.idLambdaFunction);
  const Variable varFunctionArn{lambdaArnVariable(fn.sResourceName)};
  const std::string sResourceName = rgGraph.resourceName(id);
  const std::string& sType = smMapping.sResourceType;
  const std::string sStreamArnVar = sResourceName + "_stream_arn";
  const std::string sUuidVar = sResourceName + "_uuid";
  // DynamoDB is identified by its stream ARN, so there is no separate ARN to record
  const bool bRecordArn = smMapping.sStreamField != "stream_arn";

  auto oSnapshot = _rsRemote.fetch(rgGraph, id);
  if (oSnapshot && targetChanged(rgGraph, smMapping.idLambdaFunction, *oSnapshot)) {
    plPlan.append(ApiCall{ApiMethod::RemoveLambdaEventSource,
                          ParamValue::map({{"event_uuid", field(*oSnapshot, "event_uuid")}}),
                          std::nullopt});
    oSnapshot.reset();
  }

  if (oSnapshot) {
    const auto& jLive = *oSnapshot;
    const nlohmann::json jUuid = field(jLive, "event_uuid");
    ParamValue pvUpdate = ParamValue::map({{"event_uuid", jUuid}});
    if (field(jLive, "batch_size") != smMapping.iBatchSize) {
      pvUpdate.set("batch_size", smMapping.iBatchSize);
    }
    if (field(jLive, "maximum_batching_window_in_seconds") !=
        smMapping.iMaximumBatchingWindowInSeconds) {
      pvUpdate.set("maximum_batching_window_in_seconds",
                   smMapping.iMaximumBatchingWindowInSeconds);
    }
    if (paramCount(pvUpdate) > 1) {
      plPlan.append(
          ApiCall{ApiMethod::UpdateLambdaEventSource, std::move(pvUpdate), std::nullopt},
          "Updating event source for " + smMapping.sDisplayName + " " + smMapping.sStream + "\n");
    }
    if (bRecordArn) {
      plPlan.append(
          RecordResourceValue{sType, sResourceName, "stream_arn", field(jLive, "stream_arn")});
    }
    plPlan.append(RecordResourceValue{sType, sResourceName, "event_uuid", jUuid});
    plPlan.append(
        RecordResourceValue{sType, sResourceName, smMapping.sStreamField, smMapping.sStream});
    plPlan.append(
        RecordResourceValue{sType, sResourceName, "lambda_arn", field(jLive, "lambda_arn")});
    return;
  }

  plPlan.append(
      ApiCall{ApiMethod::CreateLambdaEventSource,
              ParamValue::map({{"event_source_arn", Variable{sStreamArnVar}},
                               {"batch_size", smMapping.iBatchSize},
                               {"function_name", varFunctionArn},
                               {"starting_position", smMapping.sStartingPosition},
                               {"maximum_batching_window_in_seconds",
                                smMapping.iMaximumBatchingWindowInSeconds}}),
              sUuidVar},
      "Subscribing " + fn.sFunctionName + " to " + smMapping.sDisplayName + " " +
          smMapping.sStream + "\n");
  if (bRecordArn) {
    plPlan.append(RecordResourceVariable{sType, sResourceName, "stream_arn", sStreamArnVar});
  }
  plPlan.append(RecordResourceVariable{sType, sResourceName, "event_uuid", sUuidVar});
  plPlan.append(
      RecordResourceValue{sType, sResourceName, smMapping.sStreamField, smMapping.sStream});
  plPlan.append(
      RecordResourceVariable{sType, sResourceName, "lambda_arn", varFunctionArn.sName});
}

// ── REST API ───────────────────────────────────────────────────────────────

std::string PlanStage::apiFingerprint(const ResourceGraph& rgGraph, const RestApi& api) {
  nlohmann::json jSettings = {{"swagger_doc", api.dfSwaggerDoc.value()},
                              {"minimum_compression", api.sMinimumCompression},
                              {"api_gateway_stage", api.sApiGatewayStage},
                              {"endpoint_type", api.sEndpointType},
                              {"handler", rgGraph.resourceName(api.idLambdaFunction)},
                              {"authorizers", nlohmann::json::array()}};
  for (const auto& idAuth : api.vAuthorizers) {
    jSettings["authorizers"].push_back(rgGraph.resourceName(idAuth));
  }
  return security::CryptoService::sha256Hex(jSettings.dump());
}

void PlanStage::planRestApi(Plan& plPlan, const ResourceGraph& rgGraph, ResourceId id,
                            const RestApi& api) {
  const auto& fn = rgGraph.get<LambdaFunction>(api.idLambdaFunction);
  const std::string sFunctionArnVar = lambdaArnVariable(fn.sResourceName);
  const bool bExists = _rsRemote.resourceExists(rgGraph, id);
  const std::string sFingerprint =
      api.dfSwaggerDoc.isPending() ? std::string() : apiFingerprint(rgGraph, api);

  bool bHandlersCreated = createdInPlan(api.idLambdaFunction);
  for (const auto& idAuth : api.vAuthorizers) {
    bHandlersCreated = bHandlersCreated || createdInPlan(idAuth);
  }

  nlohmann::json jDeployed;
  if (bExists) {
    jDeployed = _rsRemote.resourceDeployedValues(rgGraph, id);
    if (!sFingerprint.empty() && !bHandlersCreated &&
        field(jDeployed, "api_fingerprint") == sFingerprint &&
        field(jDeployed, "rest_api_url").is_string()) {
      plPlan.append(StoreValue{"rest_api_id", field(jDeployed, "rest_api_id")});
      plPlan.append(
          RecordResourceVariable{"rest_api", api.sResourceName, "rest_api_id", "rest_api_id"});
      plPlan.append(RecordResourceValue{"rest_api", api.sResourceName, "rest_api_url",
                                        field(jDeployed, "rest_api_url")});
      plPlan.append(
          RecordResourceValue{"rest_api", api.sResourceName, "api_fingerprint", sFingerprint});
      return;
    }
  }

  // Region and account are needed by several API Gateway calls; the definition
  // document refers to the handler as api_handler_lambda_arn.
  appendArnComponents(plPlan, sFunctionArnVar);
  plPlan.append(CopyVariable{sFunctionArnVar, "api_handler_lambda_arn"});

  ParamValue::List vPatchOps{ParamValue::map({{"op", "replace"},
                                              {"path", "/minimumCompressionSize"},
                                              {"value", api.sMinimumCompression}})};

  if (!bExists) {
    plPlan.append(ApiCall{ApiMethod::ImportRestApi,
                          ParamValue::map({{"swagger_document", deferredParam(api.dfSwaggerDoc)},
                                           {"endpoint_type", api.sEndpointType}}),
                          std::string("rest_api_id")},
                  "Creating Rest API\n");
    plPlan.append(
        RecordResourceVariable{"rest_api", api.sResourceName, "rest_api_id", "rest_api_id"});
  } else {
    vPatchOps.push_back(ParamValue::map(
        {{"op", "replace"},
         {"path", StringFormat{"/endpointConfiguration/types/"
                               "{rest_api[endpointConfiguration][types][0]}",
                               {"rest_api"}}},
         {"value", api.sEndpointType}}));
    plPlan.append(StoreValue{"rest_api_id", field(jDeployed, "rest_api_id")});
    plPlan.append(
        RecordResourceVariable{"rest_api", api.sResourceName, "rest_api_id", "rest_api_id"});
    plPlan.append(ApiCall{ApiMethod::UpdateApiFromSwagger,
                          ParamValue::map({{"rest_api_id", Variable{"rest_api_id"}},
                                           {"swagger_document", deferredParam(api.dfSwaggerDoc)}}),
                          std::nullopt},
                  "Updating rest API\n");
    plPlan.append(ApiCall{ApiMethod::GetRestApi,
                          ParamValue::map({{"rest_api_id", Variable{"rest_api_id"}}}),
                          std::string("rest_api")});
  }

  // ── Shared epilogue ──────────────────────────────────────────────────────
  plPlan.append(ApiCall{ApiMethod::UpdateRestApi,
                        ParamValue::map({{"rest_api_id", Variable{"rest_api_id"}},
                                         {"patch_operations", std::move(vPatchOps)}}),
                        std::nullopt});
  auto addPermission = [&plPlan](const std::string& sFunctionName) {
    plPlan.append(ApiCall{ApiMethod::AddPermissionForApigateway,
                          ParamValue::map({{"function_name", sFunctionName},
                                           {"region_name", Variable{"region_name"}},
                                           {"account_id", Variable{"account_id"}},
                                           {"rest_api_id", Variable{"rest_api_id"}}}),
                          std::nullopt});
  };
  addPermission(fn.sFunctionName);
  plPlan.append(ApiCall{ApiMethod::DeployRestApi,
                        ParamValue::map({{"rest_api_id", Variable{"rest_api_id"}},
                                         {"api_gateway_stage", api.sApiGatewayStage}}),
                        std::nullopt});
  plPlan.append(StoreValue{
      "rest_api_url",
      StringFormat{"https://{rest_api_id}.execute-api.{region_name}.amazonaws.com/" +
                       api.sApiGatewayStage + "/",
                   {"rest_api_id", "region_name"}}});
  plPlan.append(
      RecordResourceVariable{"rest_api", api.sResourceName, "rest_api_url", "rest_api_url"});
  if (!sFingerprint.empty()) {
    plPlan.append(
        RecordResourceValue{"rest_api", api.sResourceName, "api_fingerprint", sFingerprint});
  }
  for (const auto& idAuth : api.vAuthorizers) {
    addPermission(rgGraph.get<LambdaFunction>(idAuth).sFunctionName);
  }
}

}  // namespace ldp::core
