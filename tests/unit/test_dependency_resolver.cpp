#include "core/DependencyResolver.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <map>

#include "GraphFixtures.hpp"

using namespace ldp::model;
using ldp::core::DependencyResolver;
using ldp::test::makeFunction;

namespace {

/// Every resource appears once and after each of its dependencies.
void expectTopological(const ResourceGraph& rgGraph, const std::vector<ResourceId>& vOrdered) {
  std::map<ResourceId, std::size_t> mPosition;
  for (std::size_t i = 0; i < vOrdered.size(); ++i) {
    EXPECT_TRUE(mPosition.emplace(vOrdered[i], i).second)
        << "resource " << vOrdered[i].uIndex << " listed twice";
  }
  for (const auto& id : vOrdered) {
    for (const auto& idDep : rgGraph.dependencies(id)) {
      ASSERT_TRUE(mPosition.contains(idDep));
      EXPECT_LT(mPosition[idDep], mPosition[id]);
    }
  }
}

}  // namespace

TEST(DependencyResolverTest, EmptyApplicationOrdersNothing) {
  ResourceGraph rgGraph;
  Application app{"dev", {}};
  EXPECT_TRUE(DependencyResolver().order(rgGraph, app).empty());
}

TEST(DependencyResolverTest, FunctionComesAfterRoleAndPackage) {
  ldp::test::SingleFunctionApp sfa;
  const auto vOrdered = DependencyResolver().order(sfa.rgGraph, sfa.app);
  ASSERT_EQ(vOrdered.size(), 3u);
  EXPECT_EQ(vOrdered[0], sfa.idRole);
  EXPECT_EQ(vOrdered[1], sfa.idPackage);
  EXPECT_EQ(vOrdered[2], sfa.idFunction);
}

TEST(DependencyResolverTest, SharedRoleAppearsOnce) {
  ResourceGraph rgGraph;
  const auto idPolicy = rgGraph.add(IamPolicy{PolicyKind::AutoGen, {}, "", {}});
  const auto idRole = rgGraph.add(ManagedIamRole{"default-role", "myapp-dev", {}, idPolicy});
  const auto idPackage = rgGraph.add(DeploymentPackage{std::string("app.zip")});
  const auto idFirst = rgGraph.add(makeFunction("first", idRole, idPackage));
  const auto idSecond = rgGraph.add(makeFunction("second", idRole, idPackage));
  const auto idRule = rgGraph.add(ScheduledEvent{"every-hour", "myapp-dev-every-hour",
                                                 "rate(1 hour)", std::nullopt, idSecond});
  Application app{"dev", {idFirst, idRule}};

  const auto vOrdered = DependencyResolver().order(rgGraph, app);
  EXPECT_EQ(vOrdered.size(), rgGraph.size());
  EXPECT_EQ(std::count(vOrdered.begin(), vOrdered.end(), idRole), 1);
  EXPECT_EQ(vOrdered.front(), idPolicy);
  EXPECT_EQ(vOrdered.back(), idRule);
  expectTopological(rgGraph, vOrdered);
}

TEST(DependencyResolverTest, EqualValuesAddedTwiceAreDistinctNodes) {
  ResourceGraph rgGraph;
  const auto idRoleA = rgGraph.add(PreCreatedIamRole{"arn:aws:iam::1:role/r"});
  const auto idRoleB = rgGraph.add(PreCreatedIamRole{"arn:aws:iam::1:role/r"});
  const auto idPackage = rgGraph.add(DeploymentPackage{std::string("app.zip")});
  const auto idA = rgGraph.add(makeFunction("a", idRoleA, idPackage));
  const auto idB = rgGraph.add(makeFunction("b", idRoleB, idPackage));
  Application app{"dev", {idA, idB}};

  const auto vOrdered = DependencyResolver().order(rgGraph, app);
  EXPECT_EQ(vOrdered.size(), 5u);
  EXPECT_NE(std::find(vOrdered.begin(), vOrdered.end(), idRoleA), vOrdered.end());
  EXPECT_NE(std::find(vOrdered.begin(), vOrdered.end(), idRoleB), vOrdered.end());
  expectTopological(rgGraph, vOrdered);
}

TEST(DependencyResolverTest, RestApiFollowsHandlerAndAuthorizers) {
  ResourceGraph rgGraph;
  const auto idRole = rgGraph.add(PreCreatedIamRole{"arn:aws:iam::1:role/r"});
  const auto idPackage = rgGraph.add(DeploymentPackage{std::string("app.zip")});
  const auto idHandler = rgGraph.add(makeFunction("api_handler", idRole, idPackage));
  const auto idAuth = rgGraph.add(makeFunction("auth", idRole, idPackage));
  RestApi api;
  api.sResourceName = "rest_api";
  api.idLambdaFunction = idHandler;
  api.vAuthorizers = {idAuth};
  const auto idApi = rgGraph.add(api);
  // Declared root order puts the authorizer function after the API
  Application app{"dev", {idApi, idAuth}};

  const auto vOrdered = DependencyResolver().order(rgGraph, app);
  EXPECT_EQ(vOrdered.size(), 5u);
  EXPECT_EQ(vOrdered.back(), idApi);
  expectTopological(rgGraph, vOrdered);
}

TEST(DependencyResolverTest, ManagedLayerIsPublishedBeforeItsFunction) {
  ldp::test::SingleFunctionApp sfa;
  const auto idLayerPackage = sfa.rgGraph.add(DeploymentPackage{std::string("layer.zip")});
  const auto idLayer = sfa.rgGraph.add(
      LambdaLayer{"managed-layer", "myapp-dev-managed-layer", "python3.12", idLayerPackage});
  sfa.function().oManagedLayer = idLayer;

  const auto vOrdered = DependencyResolver().order(sfa.rgGraph, sfa.app);
  ASSERT_EQ(vOrdered.size(), 5u);
  EXPECT_EQ(vOrdered[2], idLayerPackage);
  EXPECT_EQ(vOrdered[3], idLayer);
  EXPECT_EQ(vOrdered[4], sfa.idFunction);
  EXPECT_EQ(sfa.rgGraph.resourceType(idLayer), "lambda_layer");
  EXPECT_TRUE(sfa.rgGraph.isManaged(idLayer));
}
