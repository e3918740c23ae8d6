#include "core/BuildStage.hpp"

#include "common/Errors.hpp"
#include "common/FileReader.hpp"
#include "common/Logger.hpp"

namespace ldp::core {

using namespace ldp::model;

// ── Policy documents ───────────────────────────────────────────────────────

nlohmann::json lambdaTrustPolicy() {
  return {{"Version", "2012-10-17"},
          {"Statement", nlohmann::json::array({{{"Sid", ""},
                                                {"Effect", "Allow"},
                                                {"Principal", {{"Service", "lambda.amazonaws.com"}}},
                                                {"Action", "sts:AssumeRole"}}})}};
}

nlohmann::json cloudwatchLogsStatement() {
  return {{"Effect", "Allow"},
          {"Action", {"logs:CreateLogGroup", "logs:CreateLogStream", "logs:PutLogEvents"}},
          {"Resource", "arn:*:logs:*:*:*"}};
}

nlohmann::json vpcAttachStatement() {
  return {{"Effect", "Allow"},
          {"Action",
           {"ec2:CreateNetworkInterface", "ec2:DescribeNetworkInterfaces",
            "ec2:DetachNetworkInterface", "ec2:DeleteNetworkInterface"}},
          {"Resource", "*"}};
}

nlohmann::json xrayStatement() {
  return {{"Effect", "Allow"},
          {"Action", {"xray:PutTraceSegments", "xray:PutTelemetryRecords"}},
          {"Resource", "*"}};
}

DefaultPolicyGenerator::DefaultPolicyGenerator(bool bXray) : _bXray(bXray) {}
DefaultPolicyGenerator::~DefaultPolicyGenerator() = default;

nlohmann::json DefaultPolicyGenerator::generatePolicy() {
  nlohmann::json jPolicy = {{"Version", "2012-10-17"}, {"Statement", nlohmann::json::array()}};
  jPolicy["Statement"].push_back(cloudwatchLogsStatement());
  if (_bXray) {
    jPolicy["Statement"].push_back(xrayStatement());
  }
  return jPolicy;
}

// ── InjectDefaults ─────────────────────────────────────────────────────────

InjectDefaults::InjectDefaults(int iLambdaTimeout, int iLambdaMemorySize)
    : _iLambdaTimeout(iLambdaTimeout), _iLambdaMemorySize(iLambdaMemorySize) {}

InjectDefaults::~InjectDefaults() = default;

void InjectDefaults::handle(ResourceGraph& rgGraph, ResourceId id) {
  auto* pFn = std::get_if<LambdaFunction>(&rgGraph.at(id));
  if (pFn == nullptr) {
    return;
  }
  if (pFn->dfTimeout.isPending()) {
    pFn->dfTimeout.resolve(_iLambdaTimeout);
  }
  if (pFn->dfMemorySize.isPending()) {
    pFn->dfMemorySize.resolve(_iLambdaMemorySize);
  }
}

// ── DeploymentPackager ─────────────────────────────────────────────────────

DeploymentPackager::DeploymentPackager(IDeploymentPackager& dpPackager)
    : _dpPackager(dpPackager) {}

DeploymentPackager::~DeploymentPackager() = default;

void DeploymentPackager::handle(ResourceGraph& rgGraph, ResourceId id) {
  auto* pPackage = std::get_if<DeploymentPackage>(&rgGraph.at(id));
  if (pPackage == nullptr || !pPackage->dfFilename.isPending()) {
    return;
  }
  pPackage->dfFilename.resolve(_dpPackager.createDeploymentPackage());
  common::Logger::get()->debug("Deployment package built: {}", pPackage->dfFilename.value());
}

// ── PolicyGenerator ────────────────────────────────────────────────────────

PolicyGenerator::PolicyGenerator(IPolicyGenerator& pgGenerator, common::IFileReader& frReader)
    : _pgGenerator(pgGenerator), _frReader(frReader) {}

PolicyGenerator::~PolicyGenerator() = default;

void PolicyGenerator::handle(ResourceGraph& rgGraph, ResourceId id) {
  auto* pPolicy = std::get_if<IamPolicy>(&rgGraph.at(id));
  if (pPolicy == nullptr) {
    return;
  }

  if (pPolicy->kind == PolicyKind::FileBased) {
    try {
      pPolicy->dfDocument.resolve(nlohmann::json::parse(_frReader.readFile(pPolicy->sFilename)));
    } catch (const common::NotFoundError& e) {
      throw common::BuildError("policy_file_unreadable", "Unable to load IAM policy file " +
                                                             pPolicy->sFilename + ": " + e.what());
    } catch (const nlohmann::json::parse_error& e) {
      throw common::BuildError("policy_file_invalid", "Unable to load IAM policy file " +
                                                          pPolicy->sFilename + ": " + e.what());
    }
    return;
  }

  if (pPolicy->kind == PolicyKind::AutoGen && pPolicy->dfDocument.isPending()) {
    auto jPolicy = _pgGenerator.generatePolicy();
    if (pPolicy->setTraits.contains(RoleTrait::VpcNeeded)) {
      jPolicy["Statement"].push_back(vpcAttachStatement());
    }
    pPolicy->dfDocument.resolve(std::move(jPolicy));
  }
}

// ── SwaggerBuilder ─────────────────────────────────────────────────────────

SwaggerBuilder::SwaggerBuilder(ISwaggerGenerator& sgGenerator) : _sgGenerator(sgGenerator) {}
SwaggerBuilder::~SwaggerBuilder() = default;

void SwaggerBuilder::handle(ResourceGraph& rgGraph, ResourceId id) {
  auto* pApi = std::get_if<RestApi>(&rgGraph.at(id));
  if (pApi == nullptr || !pApi->dfSwaggerDoc.isPending()) {
    return;
  }
  pApi->dfSwaggerDoc.resolve(_sgGenerator.generateSwagger(*pApi));
}

// ── BuildStage ─────────────────────────────────────────────────────────────

BuildStage::BuildStage(std::vector<std::unique_ptr<IBuildStep>> vSteps)
    : _vSteps(std::move(vSteps)) {}

BuildStage::~BuildStage() = default;

void BuildStage::execute(ResourceGraph& rgGraph, const std::vector<ResourceId>& vOrdered) {
  for (const auto& id : vOrdered) {
    for (auto& upStep : _vSteps) {
      upStep->handle(rgGraph, id);
    }
  }
  common::Logger::get()->info("Build stage completed for {} resources", vOrdered.size());
}

std::vector<std::string> BuildStage::pendingFields(const ResourceGraph& rgGraph,
                                                   const std::vector<ResourceId>& vOrdered) {
  std::vector<std::string> vPending;
  for (const auto& id : vOrdered) {
    std::string sLabel = rgGraph.resourceName(id);
    if (sLabel.empty()) {
      sLabel = rgGraph.resourceType(id) + "#" + std::to_string(id.uIndex);
    }
    std::visit(Overloaded{
                   [&](const DeploymentPackage& pkg) {
                     if (pkg.dfFilename.isPending()) vPending.push_back(sLabel + ".filename");
                   },
                   [&](const IamPolicy& policy) {
                     if (policy.dfDocument.isPending()) vPending.push_back(sLabel + ".document");
                   },
                   [&](const LambdaFunction& fn) {
                     if (fn.dfTimeout.isPending()) vPending.push_back(sLabel + ".timeout");
                     if (fn.dfMemorySize.isPending()) vPending.push_back(sLabel + ".memory_size");
                   },
                   [&](const RestApi& api) {
                     if (api.dfSwaggerDoc.isPending()) vPending.push_back(sLabel + ".swagger_doc");
                   },
                   [](const auto&) {},
               },
               rgGraph.at(id));
  }
  return vPending;
}

}  // namespace ldp::core
