#include "core/DeploymentReporter.hpp"

#include <gtest/gtest.h>

#include <sstream>

#include "FakeCloudClient.hpp"
#include "common/Ui.hpp"

using ldp::core::DeploymentReporter;

namespace {

nlohmann::json deployedValues() {
  return {{"resources",
           nlohmann::json::array(
               {{{"name", "api"},
                 {"resource_type", "rest_api"},
                 {"rest_api_url", "https://abc123.execute-api.us-west-2.amazonaws.com/api/"}},
                {{"name", "role"}, {"resource_type", "iam_role"}, {"role_arn", "arn:role"}},
                {{"name", "api_handler"},
                 {"resource_type", "lambda_function"},
                 {"lambda_arn", "arn:fn:api_handler"}},
                {{"name", "worker"},
                 {"resource_type", "lambda_function"},
                 {"lambda_arn", "arn:fn:worker"}}})},
          {"schema_version", "2.0"}};
}

}  // namespace

TEST(DeploymentReporterTest, FunctionsBeforeApiInRecordOrder) {
  ldp::test::RecordingUi ruUi;
  EXPECT_EQ(DeploymentReporter(ruUi).generateReport(deployedValues()),
            "Resources deployed:\n"
            "  - Lambda ARN: arn:fn:api_handler\n"
            "  - Lambda ARN: arn:fn:worker\n"
            "  - Rest API URL: https://abc123.execute-api.us-west-2.amazonaws.com/api/\n");
}

TEST(DeploymentReporterTest, EmptyRecordHasHeaderOnly) {
  ldp::test::RecordingUi ruUi;
  EXPECT_EQ(DeploymentReporter(ruUi).generateReport({{"resources", nlohmann::json::array()}}),
            "Resources deployed:\n");
}

TEST(DeploymentReporterTest, DisplayWritesThroughUi) {
  std::ostringstream oss;
  ldp::common::ConsoleUi cuOut(oss);
  DeploymentReporter drReporter(cuOut);
  drReporter.displayReport(deployedValues());
  EXPECT_EQ(oss.str(), drReporter.generateReport(deployedValues()));
}

TEST(DeploymentReporterTest, LayersAreListedWithFunctions) {
  ldp::test::RecordingUi ruUi;
  const nlohmann::json jDeployed = {
      {"resources",
       nlohmann::json::array(
           {{{"name", "managed-layer"},
             {"resource_type", "lambda_layer"},
             {"layer_version_arn", "arn:aws:lambda:us-west-2:123456789012:layer:deps:3"}},
            {{"name", "api_handler"},
             {"resource_type", "lambda_function"},
             {"lambda_arn", "arn:fn:api_handler"}}})}};
  EXPECT_EQ(DeploymentReporter(ruUi).generateReport(jDeployed),
            "Resources deployed:\n"
            "  - Lambda Layer ARN: arn:aws:lambda:us-west-2:123456789012:layer:deps:3\n"
            "  - Lambda ARN: arn:fn:api_handler\n");
}
