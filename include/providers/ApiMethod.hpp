#pragma once

#include <string>

namespace ldp::providers {

/// Closed set of cloud client operations a plan may invoke.
enum class ApiMethod {
  // Lambda
  CreateFunction,
  UpdateFunction,
  DeleteFunction,
  PutFunctionConcurrency,
  DeleteFunctionConcurrency,
  PublishLayer,
  DeleteLayerVersion,
  // IAM
  CreateRole,
  PutRolePolicy,
  UpdateAssumeRolePolicy,
  DeleteRole,
  // CloudWatch Events
  GetOrCreateRuleArn,
  ConnectRuleToLambda,
  AddPermissionForCloudwatchEvent,
  DeleteRule,
  // S3
  AddPermissionForS3Event,
  ConnectS3BucketToLambda,
  DisconnectS3BucketFromLambda,
  RemovePermissionForS3Event,
  // SNS
  AddPermissionForSnsTopic,
  SubscribeFunctionToTopic,
  UnsubscribeFromTopic,
  RemovePermissionForSnsTopic,
  // SQS
  CreateSqsEventSource,
  UpdateSqsEventSource,
  RemoveSqsEventSource,
  // Kinesis and DynamoDB stream mappings
  CreateLambdaEventSource,
  UpdateLambdaEventSource,
  RemoveLambdaEventSource,
  // API Gateway
  ImportRestApi,
  UpdateApiFromSwagger,
  GetRestApi,
  UpdateRestApi,
  AddPermissionForApigateway,
  DeployRestApi,
  DeleteRestApi,
};

/// Wire name of a method, e.g. ApiMethod::CreateFunction -> "create_function".
std::string apiMethodName(ApiMethod method);

}  // namespace ldp::providers
