#include "core/RemoteState.hpp"

#include <gtest/gtest.h>

#include "FakeCloudClient.hpp"
#include "GraphFixtures.hpp"
#include "common/Errors.hpp"
#include "state/DeployedResources.hpp"

using namespace ldp::model;
using ldp::core::RemoteState;
using ldp::state::DeployedResources;
using ldp::test::FakeCloudClient;

namespace {

DeployedResources recordOf(nlohmann::json jResources) {
  return DeployedResources(nlohmann::json{{"resources", std::move(jResources)},
                                          {"schema_version", "2.0"}});
}

}  // namespace

class RemoteStateTest : public ::testing::Test {
 protected:
  FakeCloudClient _fccClient;
  ldp::test::SingleFunctionApp _sfa;
};

TEST_F(RemoteStateTest, FunctionExistenceIsQueriedOnce) {
  const auto drsEmpty = recordOf(nlohmann::json::array());
  RemoteState rsRemote(_fccClient, drsEmpty);

  EXPECT_FALSE(rsRemote.resourceExists(_sfa.rgGraph, _sfa.idFunction));
  EXPECT_FALSE(rsRemote.resourceExists(_sfa.rgGraph, _sfa.idFunction));
  EXPECT_FALSE(rsRemote.fetch(_sfa.rgGraph, _sfa.idFunction).has_value());
  EXPECT_EQ(_fccClient.mQueryCounts["lambdaFunctionExists"], 1);
  EXPECT_EQ(_fccClient.mQueryCounts["getFunctionConfiguration"], 0);
}

TEST_F(RemoteStateTest, FetchCachesSnapshot) {
  const auto& fn = _sfa.function();
  _fccClient.mFunctions[fn.sFunctionName] =
      ldp::test::liveConfiguration(fn, ldp::test::kPreCreatedRoleArn);
  const auto drsEmpty = recordOf(nlohmann::json::array());
  RemoteState rsRemote(_fccClient, drsEmpty);

  const auto oFirst = rsRemote.fetch(_sfa.rgGraph, _sfa.idFunction);
  const auto oSecond = rsRemote.fetch(_sfa.rgGraph, _sfa.idFunction);
  ASSERT_TRUE(oFirst.has_value());
  EXPECT_EQ(*oFirst, *oSecond);
  EXPECT_EQ((*oFirst)["runtime"], "python3.12");
  EXPECT_EQ(_fccClient.mQueryCounts["lambdaFunctionExists"], 1);
  EXPECT_EQ(_fccClient.mQueryCounts["getFunctionConfiguration"], 1);
}

TEST_F(RemoteStateTest, UnmanagedResourcesAreRejected) {
  const auto drsEmpty = recordOf(nlohmann::json::array());
  RemoteState rsRemote(_fccClient, drsEmpty);
  EXPECT_THROW(rsRemote.resourceExists(_sfa.rgGraph, _sfa.idRole), ldp::common::InternalError);
  EXPECT_THROW(rsRemote.resourceExists(_sfa.rgGraph, _sfa.idPackage),
               ldp::common::InternalError);
}

TEST_F(RemoteStateTest, RoleLookupTreatsNotFoundAsAbsent) {
  ResourceGraph rgGraph;
  const auto idPolicy = rgGraph.add(IamPolicy{PolicyKind::AutoGen, {}, "", {}});
  const auto idRole = rgGraph.add(ManagedIamRole{"default-role", "myapp-dev", {}, idPolicy});
  const auto drsEmpty = recordOf(nlohmann::json::array());

  {
    RemoteState rsRemote(_fccClient, drsEmpty);
    EXPECT_FALSE(rsRemote.resourceExists(rgGraph, idRole));
  }

  _fccClient.mRoles["myapp-dev"] = {{"role_name", "myapp-dev"},
                                    {"role_arn", "arn:aws:iam::1:role/myapp-dev"},
                                    {"trust_policy", ldp::core::lambdaTrustPolicy()}};
  _fccClient.mRolePolicies["myapp-dev"] = {{"Version", "2012-10-17"}};
  RemoteState rsRemote(_fccClient, drsEmpty);
  const auto oSnapshot = rsRemote.fetch(rgGraph, idRole);
  ASSERT_TRUE(oSnapshot.has_value());
  EXPECT_EQ((*oSnapshot)["role_arn"], "arn:aws:iam::1:role/myapp-dev");
  EXPECT_EQ((*oSnapshot)["policy"], (nlohmann::json{{"Version", "2012-10-17"}}));
}

TEST_F(RemoteStateTest, RoleDeployedValuesFallBackToLiveLookup) {
  ResourceGraph rgGraph;
  const auto idPolicy = rgGraph.add(IamPolicy{PolicyKind::AutoGen, {}, "", {}});
  const auto idRole = rgGraph.add(ManagedIamRole{"default-role", "myapp-dev", {}, idPolicy});
  _fccClient.mRoles["myapp-dev"] = {{"role_name", "myapp-dev"},
                                    {"role_arn", "arn:aws:iam::1:role/myapp-dev"}};
  const auto drsEmpty = recordOf(nlohmann::json::array());
  RemoteState rsRemote(_fccClient, drsEmpty);

  EXPECT_EQ(rsRemote.resourceDeployedValues(rgGraph, idRole),
            (nlohmann::json{{"name", "default-role"},
                            {"resource_type", "iam_role"},
                            {"role_name", "myapp-dev"},
                            {"role_arn", "arn:aws:iam::1:role/myapp-dev"}}));
}

TEST_F(RemoteStateTest, MissingRecordIsNotFound) {
  const auto drsEmpty = recordOf(nlohmann::json::array());
  RemoteState rsRemote(_fccClient, drsEmpty);
  EXPECT_THROW(rsRemote.resourceDeployedValues(_sfa.rgGraph, _sfa.idFunction),
               ldp::common::NotFoundError);
}

TEST_F(RemoteStateTest, RestApiNeedsRecordAndLiveApi) {
  RestApi api;
  api.sResourceName = "rest_api";
  api.idLambdaFunction = _sfa.idFunction;
  const auto idApi = _sfa.rgGraph.add(api);
  const auto drsDeployed = recordOf(nlohmann::json::array(
      {{{"name", "rest_api"}, {"resource_type", "rest_api"}, {"rest_api_id", "abc123"}}}));

  {
    RemoteState rsRemote(_fccClient, drsDeployed);
    EXPECT_FALSE(rsRemote.resourceExists(_sfa.rgGraph, idApi));
  }
  _fccClient.mRestApis["abc123"] = {{"id", "abc123"}};
  RemoteState rsRemote(_fccClient, drsDeployed);
  EXPECT_TRUE(rsRemote.resourceExists(_sfa.rgGraph, idApi));
  EXPECT_EQ((*rsRemote.fetch(_sfa.rgGraph, idApi))["rest_api_id"], "abc123");
}

TEST_F(RemoteStateTest, S3ExistenceComparesBucket) {
  S3BucketNotification notif{"on_upload", "uploads", {"s3:ObjectCreated:*"}, std::nullopt,
                             std::nullopt, _sfa.idFunction};
  const auto idNotif = _sfa.rgGraph.add(notif);
  notif.sBucket = "other";
  const auto idMoved = _sfa.rgGraph.add(notif);
  const auto drsDeployed = recordOf(nlohmann::json::array(
      {{{"name", "on_upload"}, {"resource_type", "s3_event"}, {"bucket", "uploads"}}}));

  RemoteState rsRemote(_fccClient, drsDeployed);
  EXPECT_TRUE(rsRemote.resourceExists(_sfa.rgGraph, idNotif));
  // Same (type, name) key: the cached answer is reused
  EXPECT_TRUE(rsRemote.resourceExists(_sfa.rgGraph, idMoved));

  RemoteState rsFresh(_fccClient, drsDeployed);
  EXPECT_FALSE(rsFresh.resourceExists(_sfa.rgGraph, idMoved));
}

TEST_F(RemoteStateTest, SqsSnapshotMergesLiveMapping) {
  SqsEventSource src{"on_job", "jobs", 10, 0, std::nullopt, _sfa.idFunction};
  const auto idSrc = _sfa.rgGraph.add(src);
  const auto drsDeployed = recordOf(nlohmann::json::array({{{"name", "on_job"},
                                                            {"resource_type", "sqs_event"},
                                                            {"event_uuid", "uuid-1"},
                                                            {"queue", "jobs"},
                                                            {"lambda_arn", "arn:fn"}}}));
  _fccClient.mEventSources["uuid-1"] = {{"batch_size", 5},
                                        {"maximum_batching_window_in_seconds", 0},
                                        {"maximum_concurrency", nullptr}};

  RemoteState rsRemote(_fccClient, drsDeployed);
  const auto oSnapshot = rsRemote.fetch(_sfa.rgGraph, idSrc);
  ASSERT_TRUE(oSnapshot.has_value());
  EXPECT_EQ((*oSnapshot)["batch_size"], 5);
  EXPECT_EQ((*oSnapshot)["event_uuid"], "uuid-1");
  EXPECT_EQ(_fccClient.mQueryCounts["verifyEventSourceCurrent"], 1);
}

TEST_F(RemoteStateTest, StaleSnsSubscriptionIsAbsent) {
  SnsSubscription sub{"on_alert", "alerts", _sfa.idFunction};
  const auto idSub = _sfa.rgGraph.add(sub);
  const auto drsDeployed = recordOf(nlohmann::json::array({{{"name", "on_alert"},
                                                            {"resource_type", "sns_event"},
                                                            {"subscription_arn", "arn:sub"},
                                                            {"lambda_arn", "arn:fn"}}}));
  _fccClient.bSnsSubscriptionCurrent = false;
  RemoteState rsRemote(_fccClient, drsDeployed);
  EXPECT_FALSE(rsRemote.resourceExists(_sfa.rgGraph, idSub));
}

TEST_F(RemoteStateTest, ProviderFailuresPropagate) {
  class FailingClient : public FakeCloudClient {
   public:
    bool lambdaFunctionExists(const std::string&) override {
      throw ldp::common::ProviderError("api_failure", "Throttled");
    }
  };
  FailingClient fcClient;
  const auto drsEmpty = recordOf(nlohmann::json::array());
  RemoteState rsRemote(fcClient, drsEmpty);
  EXPECT_THROW(rsRemote.resourceExists(_sfa.rgGraph, _sfa.idFunction),
               ldp::common::ProviderError);
}

TEST_F(RemoteStateTest, RuleDeletedOutsideDeployerIsAbsent) {
  const auto idRule = _sfa.rgGraph.add(
      ScheduledEvent{"every_hour", "myapp-dev-every_hour", "rate(1 hour)", std::nullopt,
                     _sfa.idFunction});
  const auto drsDeployed = recordOf(nlohmann::json::array({{{"name", "every_hour"},
                                                            {"resource_type", "cloudwatch_event"},
                                                            {"rule_name", "myapp-dev-every_hour"},
                                                            {"lambda_arn", "arn:fn"}}}));
  RemoteState rsRemote(_fccClient, drsDeployed);

  EXPECT_TRUE(rsRemote.resourceExists(_sfa.rgGraph, idRule));
  EXPECT_FALSE(rsRemote.fetch(_sfa.rgGraph, idRule).has_value());
  EXPECT_FALSE(rsRemote.resourceExists(_sfa.rgGraph, idRule));
  EXPECT_FALSE(rsRemote.fetch(_sfa.rgGraph, idRule).has_value());
  EXPECT_EQ(_fccClient.mQueryCounts["describeRule"], 1);
}

TEST_F(RemoteStateTest, MappingDeletedOutsideDeployerIsAbsent) {
  const auto idSrc = _sfa.rgGraph.add(
      SqsEventSource{"on_job", "jobs", 10, 0, std::nullopt, _sfa.idFunction});
  const auto drsDeployed = recordOf(nlohmann::json::array({{{"name", "on_job"},
                                                            {"resource_type", "sqs_event"},
                                                            {"event_uuid", "uuid-gone"},
                                                            {"queue", "jobs"},
                                                            {"lambda_arn", "arn:fn"}}}));
  RemoteState rsRemote(_fccClient, drsDeployed);

  EXPECT_FALSE(rsRemote.fetch(_sfa.rgGraph, idSrc).has_value());
  EXPECT_FALSE(rsRemote.resourceExists(_sfa.rgGraph, idSrc));
}

TEST_F(RemoteStateTest, LayerNeedsRecordAndLiveVersion) {
  const auto idLayer = _sfa.rgGraph.add(
      LambdaLayer{"managed-layer", "myapp-dev-managed-layer", "python3.12", _sfa.idPackage});
  const std::string sVersionArn = "arn:aws:lambda:us-west-2:123456789012:layer:deps:2";
  const auto drsDeployed = recordOf(nlohmann::json::array({{{"name", "managed-layer"},
                                                            {"resource_type", "lambda_layer"},
                                                            {"layer_version_arn", sVersionArn}}}));
  {
    RemoteState rsRemote(_fccClient, drsDeployed);
    EXPECT_FALSE(rsRemote.resourceExists(_sfa.rgGraph, idLayer));
  }

  _fccClient.mLayerVersions[sVersionArn] = {{"layer_version_arn", sVersionArn},
                                            {"code_sha256", "abc="}};
  RemoteState rsRemote(_fccClient, drsDeployed);
  const auto oSnapshot = rsRemote.fetch(_sfa.rgGraph, idLayer);
  ASSERT_TRUE(oSnapshot.has_value());
  EXPECT_EQ((*oSnapshot)["code_sha256"], "abc=");
  EXPECT_EQ((*oSnapshot)["name"], "managed-layer");
}

TEST_F(RemoteStateTest, StreamMappingsAreVerifiedAgainstTheirService) {
  class RecordingClient : public FakeCloudClient {
   public:
    std::vector<std::pair<std::string, std::string>> vVerified;

    bool verifyEventSourceCurrent(const std::string&, const std::string& sResourceName,
                                  const std::string& sServiceName,
                                  const std::string&) override {
      vVerified.emplace_back(sResourceName, sServiceName);
      return true;
    }
  };
  RecordingClient rcClient;
  const auto idKinesis = _sfa.rgGraph.add(
      KinesisEventSource{"on_click", "clicks", 100, "LATEST", 0, _sfa.idFunction});
  const auto idDynamo = _sfa.rgGraph.add(
      DynamoDBEventSource{"on_change", "arn:stream", 100, "LATEST", 0, _sfa.idFunction});
  const auto drsDeployed = recordOf(nlohmann::json::array(
      {{{"name", "on_click"}, {"resource_type", "kinesis_event"}, {"event_uuid", "uuid-k"}},
       {{"name", "on_change"}, {"resource_type", "dynamodb_event"}, {"event_uuid", "uuid-d"}}}));
  RemoteState rsRemote(rcClient, drsDeployed);

  EXPECT_TRUE(rsRemote.resourceExists(_sfa.rgGraph, idKinesis));
  EXPECT_TRUE(rsRemote.resourceExists(_sfa.rgGraph, idDynamo));
  EXPECT_EQ(rcClient.vVerified,
            (std::vector<std::pair<std::string, std::string>>{{"clicks", "kinesis"},
                                                              {"arn:stream", "dynamodb"}}));
}
