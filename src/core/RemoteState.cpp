#include "core/RemoteState.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "providers/ICloudClient.hpp"
#include "state/DeployedResources.hpp"

namespace ldp::core {

using namespace ldp::model;

namespace {

std::string stringField(const nlohmann::json& jRecord, const char* pKey) {
  auto it = jRecord.find(pKey);
  return (it != jRecord.end() && it->is_string()) ? it->get<std::string>() : std::string{};
}

}  // namespace

RemoteState::RemoteState(providers::ICloudClient& ccClient,
                         const state::DeployedResources& drsDeployed)
    : _ccClient(ccClient), _drsDeployed(drsDeployed) {}

RemoteState::~RemoteState() = default;

const nlohmann::json* RemoteState::record(const std::string& sResourceName) const {
  if (!_drsDeployed.contains(sResourceName)) {
    return nullptr;
  }
  return &_drsDeployed.resourceValues(sResourceName);
}

bool RemoteState::resourceExists(const ResourceGraph& rgGraph, ResourceId id) {
  if (!rgGraph.isManaged(id)) {
    throw common::InternalError("unsupported_resource",
                                "Remote state received an unsupported resource: " +
                                    rgGraph.resourceType(id));
  }
  CacheKey key{rgGraph.resourceType(id), rgGraph.resourceName(id)};
  auto it = _mExistsCache.find(key);
  if (it != _mExistsCache.end()) {
    common::Logger::get()->debug("Existence cache hit for {} {}", key.first, key.second);
    return it->second;
  }
  const bool bExists = checkExists(rgGraph, id);
  _mExistsCache.emplace(std::move(key), bExists);
  return bExists;
}

bool RemoteState::checkExists(const ResourceGraph& rgGraph, ResourceId id) {
  return std::visit(
      Overloaded{
          [this](const LambdaFunction& fn) {
            return _ccClient.lambdaFunctionExists(fn.sFunctionName);
          },
          [this](const ManagedIamRole& role) {
            try {
              _ccClient.getRoleArnForName(role.sRoleName);
              return true;
            } catch (const common::ResourceNotFoundError&) {
              return false;
            }
          },
          [this](const RestApi& api) {
            const auto* pRecord = record(api.sResourceName);
            if (pRecord == nullptr) {
              return false;
            }
            const std::string sRestApiId = stringField(*pRecord, "rest_api_id");
            return !sRestApiId.empty() && !_ccClient.getRestApi(sRestApiId).empty();
          },
          [this](const SnsSubscription& sub) {
            const auto* pRecord = record(sub.sResourceName);
            if (pRecord == nullptr) {
              return false;
            }
            return _ccClient.verifySnsSubscriptionCurrent(
                stringField(*pRecord, "subscription_arn"), sub.sTopic,
                stringField(*pRecord, "lambda_arn"));
          },
          [this](const SqsEventSource& src) {
            const auto* pRecord = record(src.sResourceName);
            if (pRecord == nullptr) {
              return false;
            }
            return _ccClient.verifyEventSourceCurrent(stringField(*pRecord, "event_uuid"),
                                                      src.sQueue, "sqs",
                                                      stringField(*pRecord, "lambda_arn"));
          },
          [this](const KinesisEventSource& src) {
            const auto* pRecord = record(src.sResourceName);
            if (pRecord == nullptr) {
              return false;
            }
            return _ccClient.verifyEventSourceCurrent(stringField(*pRecord, "event_uuid"),
                                                      src.sStream, "kinesis",
                                                      stringField(*pRecord, "lambda_arn"));
          },
          [this](const DynamoDBEventSource& src) {
            const auto* pRecord = record(src.sResourceName);
            if (pRecord == nullptr) {
              return false;
            }
            return _ccClient.verifyEventSourceCurrent(stringField(*pRecord, "event_uuid"),
                                                      src.sStreamArn, "dynamodb",
                                                      stringField(*pRecord, "lambda_arn"));
          },
          [this](const LambdaLayer& layer) {
            const auto* pRecord = record(layer.sResourceName);
            if (pRecord == nullptr) {
              return false;
            }
            const std::string sVersionArn = stringField(*pRecord, "layer_version_arn");
            return !sVersionArn.empty() && !_ccClient.getLayerVersion(sVersionArn).empty();
          },
          [this](const S3BucketNotification& notif) {
            const auto* pRecord = record(notif.sResourceName);
            return pRecord != nullptr && stringField(*pRecord, "bucket") == notif.sBucket;
          },
          [this](const ScheduledEvent& ev) {
            const auto* pRecord = record(ev.sResourceName);
            return pRecord != nullptr && stringField(*pRecord, "rule_name") == ev.sRuleName;
          },
          [this](const CloudWatchEvent& ev) {
            const auto* pRecord = record(ev.sResourceName);
            return pRecord != nullptr && stringField(*pRecord, "rule_name") == ev.sRuleName;
          },
          [](const auto&) -> bool {
            throw common::InternalError("unsupported_resource",
                                        "Remote state received an unmanaged resource");
          },
      },
      rgGraph.at(id));
}

nlohmann::json RemoteState::resourceDeployedValues(const ResourceGraph& rgGraph, ResourceId id) {
  const std::string sName = rgGraph.resourceName(id);
  if (const auto* pRecord = record(sName)) {
    return *pRecord;
  }
  if (const auto* pRole = std::get_if<ManagedIamRole>(&rgGraph.at(id))) {
    return {{"name", sName},
            {"resource_type", "iam_role"},
            {"role_name", pRole->sRoleName},
            {"role_arn", _ccClient.getRoleArnForName(pRole->sRoleName)}};
  }
  throw common::NotFoundError("deployed_values_missing",
                              "Deployed values for resource does not exist: " + sName);
}

std::optional<nlohmann::json> RemoteState::fetch(const ResourceGraph& rgGraph, ResourceId id) {
  if (!resourceExists(rgGraph, id)) {
    return std::nullopt;
  }
  CacheKey key{rgGraph.resourceType(id), rgGraph.resourceName(id)};
  auto it = _mSnapshotCache.find(key);
  if (it != _mSnapshotCache.end()) {
    return it->second;
  }

  // A recorded resource may have been deleted outside the deployer
  try {
    auto jSnapshot = loadSnapshot(rgGraph, id);
    return _mSnapshotCache.emplace(std::move(key), std::move(jSnapshot)).first->second;
  } catch (const common::ResourceNotFoundError& e) {
    common::Logger::get()->info("Recorded {} '{}' no longer exists: {}", key.first, key.second,
                                e.what());
    _mExistsCache[key] = false;
    return std::nullopt;
  }
}

nlohmann::json RemoteState::withEventSourceMapping(const nlohmann::json& jRecord) {
  auto jSnapshot = jRecord;
  jSnapshot.update(_ccClient.getEventSourceMapping(stringField(jRecord, "event_uuid")));
  return jSnapshot;
}

nlohmann::json RemoteState::loadSnapshot(const ResourceGraph& rgGraph, ResourceId id) {
  const auto* pRecord = record(rgGraph.resourceName(id));
  const nlohmann::json jRecord = pRecord ? *pRecord : nlohmann::json::object();

  return std::visit(
      Overloaded{
          [this](const LambdaFunction& fn) {
            return _ccClient.getFunctionConfiguration(fn.sFunctionName);
          },
          [this](const ManagedIamRole& role) {
            auto jRole = _ccClient.getRole(role.sRoleName);
            jRole["policy"] = _ccClient.getRolePolicy(role.sRoleName, role.sRoleName);
            return jRole;
          },
          [this, &jRecord](const SqsEventSource&) { return withEventSourceMapping(jRecord); },
          [this, &jRecord](const KinesisEventSource&) { return withEventSourceMapping(jRecord); },
          [this, &jRecord](const DynamoDBEventSource&) {
            return withEventSourceMapping(jRecord);
          },
          [this, &jRecord](const LambdaLayer&) {
            auto jSnapshot = jRecord;
            jSnapshot.update(_ccClient.getLayerVersion(stringField(jRecord, "layer_version_arn")));
            return jSnapshot;
          },
          [this, &jRecord](const ScheduledEvent& ev) {
            auto jSnapshot = jRecord;
            jSnapshot.update(_ccClient.describeRule(ev.sRuleName));
            return jSnapshot;
          },
          [this, &jRecord](const CloudWatchEvent& ev) {
            auto jSnapshot = jRecord;
            jSnapshot.update(_ccClient.describeRule(ev.sRuleName));
            return jSnapshot;
          },
          [&jRecord](const auto&) { return jRecord; },
      },
      rgGraph.at(id));
}

}  // namespace ldp::core
