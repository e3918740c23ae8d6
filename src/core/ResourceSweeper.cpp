#include "core/ResourceSweeper.hpp"

#include <algorithm>

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "state/DeployedResources.hpp"

namespace ldp::core {

using namespace ldp::model;
using providers::ApiMethod;

namespace {

nlohmann::json recordField(const nlohmann::json& jRecord, const char* pKey) {
  auto it = jRecord.find(pKey);
  if (it == jRecord.end()) {
    throw common::StateError("deployed_value_missing",
                             "Deployed record for " + jRecord.value("name", std::string("?")) +
                                 " has no '" + pKey + "' value");
  }
  return *it;
}

std::string recordText(const nlohmann::json& jRecord, const char* pKey) {
  const auto jValue = recordField(jRecord, pKey);
  return jValue.is_string() ? jValue.get<std::string>() : jValue.dump();
}

/// Identity-defining field of event bindings whose resource name outlives a
/// change of target.
const char* identityField(const std::string& sResourceType) {
  if (sResourceType == "s3_event") return "bucket";
  if (sResourceType == "sns_event") return "topic";
  if (sResourceType == "sqs_event") return "queue";
  if (sResourceType == "kinesis_event") return "stream";
  if (sResourceType == "dynamodb_event") return "stream_arn";
  return nullptr;
}

}  // namespace

ResourceSweeper::ResourceSweeper() = default;
ResourceSweeper::~ResourceSweeper() = default;

void ResourceSweeper::execute(Plan& plPlan,
                              const std::optional<state::DeployedResources>& oDeployed) {
  if (!oDeployed) {
    return;
  }
  std::vector<std::string> vReferenced;
  const auto mMarked = markResources(plPlan, vReferenced);
  const auto vRemaining = determineRemaining(mMarked, vReferenced, *oDeployed);

  for (const auto& sName : vRemaining) {
    planDeletion(plPlan, oDeployed->resourceValues(sName));
  }
  common::Logger::get()->info("Sweeper scheduled {} resources for deletion", vRemaining.size());
}

ResourceSweeper::MarkedResources ResourceSweeper::markResources(
    const Plan& plPlan, std::vector<std::string>& vReferenced) {
  MarkedResources mMarked;
  auto reference = [&vReferenced](const std::string& sName) {
    if (std::find(vReferenced.begin(), vReferenced.end(), sName) == vReferenced.end()) {
      vReferenced.push_back(sName);
    }
  };
  for (const auto& instruction : plPlan.vInstructions) {
    if (const auto* pValue = std::get_if<RecordResourceValue>(&instruction)) {
      reference(pValue->sResourceName);
      mMarked[pValue->sResourceName].push_back(pValue);
    } else if (const auto* pVariable = std::get_if<RecordResourceVariable>(&instruction)) {
      reference(pVariable->sResourceName);
    }
  }
  return mMarked;
}

std::vector<std::string> ResourceSweeper::determineRemaining(
    const MarkedResources& mMarked, const std::vector<std::string>& vReferenced,
    const state::DeployedResources& drsDeployed) {
  std::vector<std::string> vRemaining;
  auto vNames = drsDeployed.resourceNames();
  std::reverse(vNames.begin(), vNames.end());

  for (const auto& sName : vNames) {
    if (std::find(vReferenced.begin(), vReferenced.end(), sName) == vReferenced.end()) {
      vRemaining.push_back(sName);
      continue;
    }

    const auto& jRecord = drsDeployed.resourceValues(sName);
    const char* pField = identityField(recordText(jRecord, "resource_type"));
    if (pField == nullptr) {
      continue;
    }
    auto itMarked = mMarked.find(sName);
    if (itMarked == mMarked.end()) {
      continue;
    }
    for (const auto* pRecord : itMarked->second) {
      if (pRecord->sName == pField) {
        if (pRecord->jValue != recordField(jRecord, pField)) {
          vRemaining.push_back(sName);
        }
        break;
      }
    }
  }
  return vRemaining;
}

void ResourceSweeper::planDeletion(Plan& plPlan, const nlohmann::json& jRecord) {
  const std::string sType = recordText(jRecord, "resource_type");
  std::vector<Instruction> vInstructions;
  std::optional<std::string> oMessage;

  if (sType == "lambda_function") {
    const auto jArn = recordField(jRecord, "lambda_arn");
    vInstructions.emplace_back(ApiCall{ApiMethod::DeleteFunction,
                                       ParamValue::map({{"function_name", jArn}}), std::nullopt});
    oMessage = "Deleting function: " + recordText(jRecord, "lambda_arn") + "\n";
  } else if (sType == "iam_role") {
    vInstructions.emplace_back(ApiCall{ApiMethod::DeleteRole,
                                       ParamValue::map({{"name", recordField(jRecord, "role_name")}}),
                                       std::nullopt});
    oMessage = "Deleting IAM role: " + recordText(jRecord, "role_name") + "\n";
  } else if (sType == "cloudwatch_event") {
    vInstructions.emplace_back(
        ApiCall{ApiMethod::DeleteRule,
                ParamValue::map({{"rule_name", recordField(jRecord, "rule_name")}}), std::nullopt});
  } else if (sType == "rest_api") {
    vInstructions.emplace_back(
        ApiCall{ApiMethod::DeleteRestApi,
                ParamValue::map({{"rest_api_id", recordField(jRecord, "rest_api_id")}}),
                std::nullopt});
    oMessage = "Deleting Rest API: " + recordText(jRecord, "rest_api_id") + "\n";
  } else if (sType == "s3_event") {
    const auto pvParams = ParamValue::map({{"bucket", recordField(jRecord, "bucket")},
                                           {"function_arn", recordField(jRecord, "lambda_arn")}});
    vInstructions.emplace_back(
        ApiCall{ApiMethod::DisconnectS3BucketFromLambda, pvParams, std::nullopt});
    vInstructions.emplace_back(
        ApiCall{ApiMethod::RemovePermissionForS3Event, pvParams, std::nullopt});
  } else if (sType == "sns_event") {
    vInstructions.emplace_back(ApiCall{
        ApiMethod::UnsubscribeFromTopic,
        ParamValue::map({{"subscription_arn", recordField(jRecord, "subscription_arn")}}),
        std::nullopt});
    vInstructions.emplace_back(
        ApiCall{ApiMethod::RemovePermissionForSnsTopic,
                ParamValue::map({{"topic_arn", recordField(jRecord, "topic_arn")},
                                 {"function_arn", recordField(jRecord, "lambda_arn")}}),
                std::nullopt});
  } else if (sType == "sqs_event") {
    vInstructions.emplace_back(
        ApiCall{ApiMethod::RemoveSqsEventSource,
                ParamValue::map({{"event_uuid", recordField(jRecord, "event_uuid")}}),
                std::nullopt});
  } else if (sType == "kinesis_event" || sType == "dynamodb_event") {
    vInstructions.emplace_back(
        ApiCall{ApiMethod::RemoveLambdaEventSource,
                ParamValue::map({{"event_uuid", recordField(jRecord, "event_uuid")}}),
                std::nullopt});
  } else if (sType == "lambda_layer") {
    vInstructions.emplace_back(ApiCall{
        ApiMethod::DeleteLayerVersion,
        ParamValue::map({{"layer_version_arn", recordField(jRecord, "layer_version_arn")}}),
        std::nullopt});
    oMessage = "Deleting layer version: " + recordText(jRecord, "layer_version_arn") + "\n";
  } else {
    throw common::StateError("unknown_resource_type",
                             "Sweeper encountered an unknown resource: " + jRecord.dump());
  }

  // The message belongs to the last instruction of the deletion
  for (std::size_t i = 0; i < vInstructions.size(); ++i) {
    if (oMessage && i + 1 == vInstructions.size()) {
      plPlan.append(std::move(vInstructions[i]), *oMessage);
    } else {
      plPlan.append(std::move(vInstructions[i]));
    }
  }
}

}  // namespace ldp::core
