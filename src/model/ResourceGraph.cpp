#include "model/ResourceGraph.hpp"

#include "common/Errors.hpp"

namespace ldp::model {

ResourceGraph::ResourceGraph() = default;
ResourceGraph::~ResourceGraph() = default;

ResourceId ResourceGraph::add(Resource resource) {
  _vResources.push_back(std::move(resource));
  return ResourceId{static_cast<uint32_t>(_vResources.size() - 1)};
}

Resource& ResourceGraph::at(ResourceId id) {
  if (id.uIndex >= _vResources.size()) {
    throw common::InternalError("invalid_resource_id",
                                "Resource id out of range: " + std::to_string(id.uIndex));
  }
  return _vResources[id.uIndex];
}

const Resource& ResourceGraph::at(ResourceId id) const {
  if (id.uIndex >= _vResources.size()) {
    throw common::InternalError("invalid_resource_id",
                                "Resource id out of range: " + std::to_string(id.uIndex));
  }
  return _vResources[id.uIndex];
}

std::vector<ResourceId> ResourceGraph::dependencies(ResourceId id) const {
  return std::visit(
      Overloaded{
          [](const ManagedIamRole& role) { return std::vector<ResourceId>{role.idPolicy}; },
          [](const LambdaLayer& layer) {
            return std::vector<ResourceId>{layer.idDeploymentPackage};
          },
          [](const LambdaFunction& fn) {
            std::vector<ResourceId> vDeps{fn.idRole, fn.idDeploymentPackage};
            if (fn.oManagedLayer) {
              vDeps.push_back(*fn.oManagedLayer);
            }
            return vDeps;
          },
          [](const ScheduledEvent& ev) { return std::vector<ResourceId>{ev.idLambdaFunction}; },
          [](const CloudWatchEvent& ev) { return std::vector<ResourceId>{ev.idLambdaFunction}; },
          [](const S3BucketNotification& ev) {
            return std::vector<ResourceId>{ev.idLambdaFunction};
          },
          [](const SnsSubscription& ev) { return std::vector<ResourceId>{ev.idLambdaFunction}; },
          [](const SqsEventSource& ev) { return std::vector<ResourceId>{ev.idLambdaFunction}; },
          [](const KinesisEventSource& ev) {
            return std::vector<ResourceId>{ev.idLambdaFunction};
          },
          [](const DynamoDBEventSource& ev) {
            return std::vector<ResourceId>{ev.idLambdaFunction};
          },
          [](const RestApi& api) {
            std::vector<ResourceId> vDeps{api.idLambdaFunction};
            vDeps.insert(vDeps.end(), api.vAuthorizers.begin(), api.vAuthorizers.end());
            return vDeps;
          },
          [](const DeploymentPackage&) { return std::vector<ResourceId>{}; },
          [](const IamPolicy&) { return std::vector<ResourceId>{}; },
          [](const PreCreatedIamRole&) { return std::vector<ResourceId>{}; },
      },
      at(id));
}

std::string ResourceGraph::resourceType(ResourceId id) const {
  return std::visit(
      Overloaded{
          [](const DeploymentPackage&) { return std::string("deployment_package"); },
          [](const IamPolicy&) { return std::string("iam_policy"); },
          [](const PreCreatedIamRole&) { return std::string("precreated_iam_role"); },
          [](const ManagedIamRole&) { return std::string("iam_role"); },
          [](const LambdaLayer&) { return std::string("lambda_layer"); },
          [](const LambdaFunction&) { return std::string("lambda_function"); },
          // Scheduled and pattern rules share one persisted type
          [](const ScheduledEvent&) { return std::string("cloudwatch_event"); },
          [](const CloudWatchEvent&) { return std::string("cloudwatch_event"); },
          [](const S3BucketNotification&) { return std::string("s3_event"); },
          [](const SnsSubscription&) { return std::string("sns_event"); },
          [](const SqsEventSource&) { return std::string("sqs_event"); },
          [](const KinesisEventSource&) { return std::string("kinesis_event"); },
          [](const DynamoDBEventSource&) { return std::string("dynamodb_event"); },
          [](const RestApi&) { return std::string("rest_api"); },
      },
      at(id));
}

std::string ResourceGraph::resourceName(ResourceId id) const {
  return std::visit(
      Overloaded{
          [](const DeploymentPackage&) { return std::string(); },
          [](const IamPolicy&) { return std::string(); },
          [](const PreCreatedIamRole&) { return std::string(); },
          [](const auto& managed) { return managed.sResourceName; },
      },
      at(id));
}

bool ResourceGraph::isManaged(ResourceId id) const {
  const auto& resource = at(id);
  return !std::holds_alternative<DeploymentPackage>(resource) &&
         !std::holds_alternative<IamPolicy>(resource) &&
         !std::holds_alternative<PreCreatedIamRole>(resource);
}

void ResourceGraph::throwWrongVariant(ResourceId id) const {
  throw common::InternalError("wrong_resource_variant",
                              "Resource " + std::to_string(id.uIndex) + " is a " +
                                  resourceType(id));
}

}  // namespace ldp::model
