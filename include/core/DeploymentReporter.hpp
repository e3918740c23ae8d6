#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace ldp::common {
class IUi;
}

namespace ldp::core {

/// Summarizes deployed values for the user: Lambda ARNs first, the REST API URL last.
/// Resource types without a summary line are omitted.
/// Class abbreviation: rp
class DeploymentReporter {
 public:
  explicit DeploymentReporter(common::IUi& uiOut);
  ~DeploymentReporter();

  std::string generateReport(const nlohmann::json& jDeployedValues) const;
  void displayReport(const nlohmann::json& jDeployedValues);

 private:
  common::IUi& _uiOut;
};

}  // namespace ldp::core
