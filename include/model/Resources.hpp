#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace ldp::model {

/// Opaque handle into a ResourceGraph arena.
/// Two edges sharing a sub-resource hold the same id.
struct ResourceId {
  uint32_t uIndex = 0;

  auto operator<=>(const ResourceId&) const = default;
};

/// A field whose value is supplied by the build stage.
/// Pending until resolve() is called.
template <typename T>
class Deferred {
 public:
  Deferred() = default;
  Deferred(T value) : _oValue(std::move(value)) {}  // NOLINT(google-explicit-constructor)

  bool isPending() const { return !_oValue.has_value(); }
  void resolve(T value) { _oValue = std::move(value); }

  /// Precondition: !isPending().
  const T& value() const { return *_oValue; }

  bool operator==(const Deferred&) const = default;

 private:
  std::optional<T> _oValue;
};

using StrMap = std::map<std::string, std::string>;

enum class PolicyKind { Inline, AutoGen, FileBased };

enum class RoleTrait { VpcNeeded };

// ── Unmanaged resources (no persisted identity) ───────────────────────────

struct DeploymentPackage {
  Deferred<std::string> dfFilename;
};

struct IamPolicy {
  PolicyKind kind = PolicyKind::Inline;
  Deferred<nlohmann::json> dfDocument;
  std::string sFilename;  // FileBased only
  std::set<RoleTrait> setTraits;  // AutoGen only
};

struct PreCreatedIamRole {
  std::string sRoleArn;
};

// ── Managed resources ─────────────────────────────────────────────────────

struct ManagedIamRole {
  std::string sResourceName;
  std::string sRoleName;
  nlohmann::json jTrustPolicy;
  ResourceId idPolicy;
};

/// Layer published from its own deployment package and prepended to the
/// layers of the functions that reference it.
struct LambdaLayer {
  std::string sResourceName;
  std::string sLayerName;
  std::string sRuntime;
  ResourceId idDeploymentPackage;
};

struct LambdaFunction {
  std::string sResourceName;
  std::string sFunctionName;
  ResourceId idDeploymentPackage;
  std::optional<ResourceId> oManagedLayer;
  StrMap mEnvironmentVariables;
  std::string sRuntime;
  std::string sHandler;
  StrMap mTags;
  Deferred<int> dfTimeout;
  Deferred<int> dfMemorySize;
  ResourceId idRole;
  std::vector<std::string> vSecurityGroupIds;
  std::vector<std::string> vSubnetIds;
  std::optional<int> oReservedConcurrency;
  std::vector<std::string> vLayers;
  bool bXray = false;
};

struct ScheduledEvent {
  std::string sResourceName;
  std::string sRuleName;
  std::string sScheduleExpression;
  std::optional<std::string> oRuleDescription;
  ResourceId idLambdaFunction;
};

struct CloudWatchEvent {
  std::string sResourceName;
  std::string sRuleName;
  std::string sEventPattern;
  ResourceId idLambdaFunction;
};

struct S3BucketNotification {
  std::string sResourceName;
  std::string sBucket;
  std::vector<std::string> vEvents;
  std::optional<std::string> oPrefix;
  std::optional<std::string> oSuffix;
  ResourceId idLambdaFunction;
};

struct SnsSubscription {
  std::string sResourceName;
  std::string sTopic;  // topic name or full topic ARN
  ResourceId idLambdaFunction;
};

struct SqsEventSource {
  std::string sResourceName;
  std::string sQueue;
  int iBatchSize = 10;
  int iMaximumBatchingWindowInSeconds = 0;
  std::optional<int> oMaximumConcurrency;
  ResourceId idLambdaFunction;
};

struct KinesisEventSource {
  std::string sResourceName;
  std::string sStream;  // stream name
  int iBatchSize = 100;
  std::string sStartingPosition = "LATEST";
  int iMaximumBatchingWindowInSeconds = 0;
  ResourceId idLambdaFunction;
};

struct DynamoDBEventSource {
  std::string sResourceName;
  std::string sStreamArn;
  int iBatchSize = 100;
  std::string sStartingPosition = "LATEST";
  int iMaximumBatchingWindowInSeconds = 0;
  ResourceId idLambdaFunction;
};

struct RestApi {
  std::string sResourceName;
  Deferred<nlohmann::json> dfSwaggerDoc;
  std::string sMinimumCompression;
  std::string sApiGatewayStage = "api";
  std::string sEndpointType = "EDGE";
  ResourceId idLambdaFunction;
  std::vector<ResourceId> vAuthorizers;
};

/// Closed set of resource variants.
using Resource =
    std::variant<DeploymentPackage, IamPolicy, PreCreatedIamRole, ManagedIamRole, LambdaLayer,
                 LambdaFunction, ScheduledEvent, CloudWatchEvent, S3BucketNotification,
                 SnsSubscription, SqsEventSource, KinesisEventSource, DynamoDBEventSource,
                 RestApi>;

/// Root of a declared graph: one stage and its top-level resources in declared order.
struct Application {
  std::string sStage;
  std::vector<ResourceId> vResources;
};

/// Helper for exhaustive std::visit with lambdas.
template <typename... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace ldp::model
