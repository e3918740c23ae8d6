#include "providers/ApiMethod.hpp"

#include "common/Errors.hpp"

namespace ldp::providers {

std::string apiMethodName(ApiMethod method) {
  switch (method) {
    case ApiMethod::CreateFunction: return "create_function";
    case ApiMethod::UpdateFunction: return "update_function";
    case ApiMethod::DeleteFunction: return "delete_function";
    case ApiMethod::PutFunctionConcurrency: return "put_function_concurrency";
    case ApiMethod::DeleteFunctionConcurrency: return "delete_function_concurrency";
    case ApiMethod::PublishLayer: return "publish_layer";
    case ApiMethod::DeleteLayerVersion: return "delete_layer_version";
    case ApiMethod::CreateRole: return "create_role";
    case ApiMethod::PutRolePolicy: return "put_role_policy";
    case ApiMethod::UpdateAssumeRolePolicy: return "update_assume_role_policy";
    case ApiMethod::DeleteRole: return "delete_role";
    case ApiMethod::GetOrCreateRuleArn: return "get_or_create_rule_arn";
    case ApiMethod::ConnectRuleToLambda: return "connect_rule_to_lambda";
    case ApiMethod::AddPermissionForCloudwatchEvent: return "add_permission_for_cloudwatch_event";
    case ApiMethod::DeleteRule: return "delete_rule";
    case ApiMethod::AddPermissionForS3Event: return "add_permission_for_s3_event";
    case ApiMethod::ConnectS3BucketToLambda: return "connect_s3_bucket_to_lambda";
    case ApiMethod::DisconnectS3BucketFromLambda: return "disconnect_s3_bucket_from_lambda";
    case ApiMethod::RemovePermissionForS3Event: return "remove_permission_for_s3_event";
    case ApiMethod::AddPermissionForSnsTopic: return "add_permission_for_sns_topic";
    case ApiMethod::SubscribeFunctionToTopic: return "subscribe_function_to_topic";
    case ApiMethod::UnsubscribeFromTopic: return "unsubscribe_from_topic";
    case ApiMethod::RemovePermissionForSnsTopic: return "remove_permission_for_sns_topic";
    case ApiMethod::CreateSqsEventSource: return "create_sqs_event_source";
    case ApiMethod::UpdateSqsEventSource: return "update_sqs_event_source";
    case ApiMethod::RemoveSqsEventSource: return "remove_sqs_event_source";
    case ApiMethod::CreateLambdaEventSource: return "create_lambda_event_source";
    case ApiMethod::UpdateLambdaEventSource: return "update_lambda_event_source";
    case ApiMethod::RemoveLambdaEventSource: return "remove_lambda_event_source";
    case ApiMethod::ImportRestApi: return "import_rest_api";
    case ApiMethod::UpdateApiFromSwagger: return "update_api_from_swagger";
    case ApiMethod::GetRestApi: return "get_rest_api";
    case ApiMethod::UpdateRestApi: return "update_rest_api";
    case ApiMethod::AddPermissionForApigateway: return "add_permission_for_apigateway";
    case ApiMethod::DeployRestApi: return "deploy_rest_api";
    case ApiMethod::DeleteRestApi: return "delete_rest_api";
  }
  throw common::InternalError("unknown_api_method",
                              "Unknown API method: " + std::to_string(static_cast<int>(method)));
}

}  // namespace ldp::providers
