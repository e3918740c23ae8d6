#pragma once

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/ResourceGraph.hpp"

namespace ldp::common {
class IFileReader;
}

namespace ldp::core {

// ── Policy documents ───────────────────────────────────────────────────────

/// Trust policy allowing the Lambda service to assume a role.
nlohmann::json lambdaTrustPolicy();

nlohmann::json cloudwatchLogsStatement();
nlohmann::json vpcAttachStatement();
nlohmann::json xrayStatement();

// ── Collaborators ──────────────────────────────────────────────────────────

/// Builds the code bundle and returns its local filename.
class IDeploymentPackager {
 public:
  virtual ~IDeploymentPackager() = default;
  virtual std::string createDeploymentPackage() = 0;
};

/// Produces the policy document for auto-generated roles.
class IPolicyGenerator {
 public:
  virtual ~IPolicyGenerator() = default;
  virtual nlohmann::json generatePolicy() = 0;
};

/// Baseline policy: CloudWatch Logs access, plus X-Ray when tracing is on.
/// Class abbreviation: dpg
class DefaultPolicyGenerator : public IPolicyGenerator {
 public:
  explicit DefaultPolicyGenerator(bool bXray);
  ~DefaultPolicyGenerator() override;

  nlohmann::json generatePolicy() override;

 private:
  bool _bXray;
};

/// Produces the API definition document for a REST API.
class ISwaggerGenerator {
 public:
  virtual ~ISwaggerGenerator() = default;
  virtual nlohmann::json generateSwagger(const model::RestApi& api) = 0;
};

// ── Steps ──────────────────────────────────────────────────────────────────

/// One pass of the build stage. Each step resolves its own set of deferred fields
/// and ignores resources it does not handle.
class IBuildStep {
 public:
  virtual ~IBuildStep() = default;
  virtual void handle(model::ResourceGraph& rgGraph, model::ResourceId id) = 0;
};

/// Fills pending Lambda timeout and memory size.
class InjectDefaults : public IBuildStep {
 public:
  InjectDefaults(int iLambdaTimeout, int iLambdaMemorySize);
  ~InjectDefaults() override;

  void handle(model::ResourceGraph& rgGraph, model::ResourceId id) override;

 private:
  int _iLambdaTimeout;
  int _iLambdaMemorySize;
};

class DeploymentPackager : public IBuildStep {
 public:
  explicit DeploymentPackager(IDeploymentPackager& dpPackager);
  ~DeploymentPackager() override;

  void handle(model::ResourceGraph& rgGraph, model::ResourceId id) override;

 private:
  IDeploymentPackager& _dpPackager;
};

/// Loads file-based policies and generates pending auto-generated ones.
class PolicyGenerator : public IBuildStep {
 public:
  PolicyGenerator(IPolicyGenerator& pgGenerator, common::IFileReader& frReader);
  ~PolicyGenerator() override;

  void handle(model::ResourceGraph& rgGraph, model::ResourceId id) override;

 private:
  IPolicyGenerator& _pgGenerator;
  common::IFileReader& _frReader;
};

class SwaggerBuilder : public IBuildStep {
 public:
  explicit SwaggerBuilder(ISwaggerGenerator& sgGenerator);
  ~SwaggerBuilder() override;

  void handle(model::ResourceGraph& rgGraph, model::ResourceId id) override;

 private:
  ISwaggerGenerator& _sgGenerator;
};

/// Runs every step over every resource. Local side effects only.
/// Class abbreviation: bs
class BuildStage {
 public:
  explicit BuildStage(std::vector<std::unique_ptr<IBuildStep>> vSteps);
  ~BuildStage();

  void execute(model::ResourceGraph& rgGraph, const std::vector<model::ResourceId>& vOrdered);

  /// Labels ("<resource>.<field>") of every field still pending after the build.
  static std::vector<std::string> pendingFields(const model::ResourceGraph& rgGraph,
                                                const std::vector<model::ResourceId>& vOrdered);

 private:
  std::vector<std::unique_ptr<IBuildStep>> _vSteps;
};

}  // namespace ldp::core
