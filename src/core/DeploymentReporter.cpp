#include "core/DeploymentReporter.hpp"

#include <algorithm>
#include <vector>

#include "common/Ui.hpp"

namespace ldp::core {

namespace {

constexpr int kDefaultOrder = 50;
constexpr int kRestApiOrder = 100;

int sortOrder(const nlohmann::json& jResource) {
  return jResource.value("resource_type", std::string()) == "rest_api" ? kRestApiOrder
                                                                        : kDefaultOrder;
}

}  // namespace

DeploymentReporter::DeploymentReporter(common::IUi& uiOut) : _uiOut(uiOut) {}

DeploymentReporter::~DeploymentReporter() = default;

std::string DeploymentReporter::generateReport(const nlohmann::json& jDeployedValues) const {
  std::vector<nlohmann::json> vResources;
  if (jDeployedValues.contains("resources")) {
    vResources.assign(jDeployedValues["resources"].begin(), jDeployedValues["resources"].end());
  }
  std::stable_sort(vResources.begin(), vResources.end(),
                   [](const auto& a, const auto& b) { return sortOrder(a) < sortOrder(b); });

  std::string sReport = "Resources deployed:\n";
  for (const auto& jResource : vResources) {
    const std::string sType = jResource.value("resource_type", std::string());
    if (sType == "lambda_function") {
      sReport += "  - Lambda ARN: " + jResource.value("lambda_arn", std::string()) + "\n";
    } else if (sType == "lambda_layer") {
      sReport +=
          "  - Lambda Layer ARN: " + jResource.value("layer_version_arn", std::string()) + "\n";
    } else if (sType == "rest_api") {
      sReport += "  - Rest API URL: " + jResource.value("rest_api_url", std::string()) + "\n";
    }
  }
  return sReport;
}

void DeploymentReporter::displayReport(const nlohmann::json& jDeployedValues) {
  _uiOut.write(generateReport(jDeployedValues));
}

}  // namespace ldp::core
