#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "providers/ApiMethod.hpp"

namespace ldp::providers {

/// Pure abstract interface for the cloud API collaborator.
///
/// Mutating operations go through invoke() with keyword parameters as a JSON
/// object and return either a scalar identifier or a structured object.
/// Read-only queries used for diffing are typed. Queries that target a missing
/// resource throw common::ResourceNotFoundError; any other failure throws
/// common::ProviderError. Retries are the implementation's concern.
class ICloudClient {
 public:
  virtual ~ICloudClient() = default;

  /// Region of the active session, e.g. "us-west-2".
  virtual std::string regionName() const = 0;

  virtual nlohmann::json invoke(ApiMethod method, const nlohmann::json& jParams) = 0;

  // ── Lambda ────────────────────────────────────────────────────────────
  virtual bool lambdaFunctionExists(const std::string& sFunctionName) = 0;

  /// Live configuration with keys: function_arn, role_arn, runtime, handler,
  /// timeout, memory_size, environment_variables, tags, security_group_ids,
  /// subnet_ids, layers, xray, code_sha256, reserved_concurrency (null if unset).
  virtual nlohmann::json getFunctionConfiguration(const std::string& sFunctionName) = 0;

  /// Keys: layer_version_arn, code_sha256. Empty object when the version does
  /// not exist.
  virtual nlohmann::json getLayerVersion(const std::string& sLayerVersionArn) = 0;

  // ── IAM ───────────────────────────────────────────────────────────────
  virtual std::string getRoleArnForName(const std::string& sRoleName) = 0;

  /// Keys: role_name, role_arn, trust_policy.
  virtual nlohmann::json getRole(const std::string& sRoleName) = 0;

  /// Inline policy document attached to the role.
  virtual nlohmann::json getRolePolicy(const std::string& sRoleName,
                                       const std::string& sPolicyName) = 0;

  // ── CloudWatch Events ─────────────────────────────────────────────────
  /// Keys: rule_name, rule_arn, schedule_expression?, event_pattern?, description?.
  virtual nlohmann::json describeRule(const std::string& sRuleName) = 0;

  // ── Event sources ─────────────────────────────────────────────────────
  virtual bool verifySnsSubscriptionCurrent(const std::string& sSubscriptionArn,
                                            const std::string& sTopicName,
                                            const std::string& sFunctionArn) = 0;

  /// sResourceName is the queue or stream name; for "dynamodb" it is the
  /// stream ARN.
  virtual bool verifyEventSourceCurrent(const std::string& sEventUuid,
                                        const std::string& sResourceName,
                                        const std::string& sServiceName,
                                        const std::string& sFunctionArn) = 0;

  /// Keys: batch_size, maximum_batching_window_in_seconds, maximum_concurrency.
  virtual nlohmann::json getEventSourceMapping(const std::string& sEventUuid) = 0;

  // ── API Gateway ───────────────────────────────────────────────────────
  /// Empty object when the API does not exist.
  virtual nlohmann::json getRestApi(const std::string& sRestApiId) = 0;
};

}  // namespace ldp::providers
