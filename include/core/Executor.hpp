#pragma once

#include <cstddef>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include "core/VariableResolver.hpp"
#include "model/Instructions.hpp"

namespace ldp::common {
class IUi;
}

namespace ldp::providers {
class ICloudClient;
}

namespace ldp::core {

/// Runs a plan instruction by instruction against the cloud client.
///
/// Owns the variable pool and the ordered list of deployed resource values
/// built from RecordResource* instructions. Execution stops at the first
/// error; whatever was recorded so far stays available in memory.
/// Class abbreviation: ex
class Executor {
 public:
  Executor(providers::ICloudClient& ccClient, common::IUi& uiOut);
  ~Executor();

  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;

  void execute(const model::Plan& plPlan);

  const VariablePool& variables() const { return _mVariables; }

  /// Array of {name, resource_type, <field>...} objects in first-recorded order.
  const nlohmann::json& resourceValues() const { return _jResourceValues; }

 private:
  void dispatch(const model::Instruction& instruction);
  void apply(const model::ApiCall& call);
  void apply(const model::StoreValue& store);
  void apply(const model::StoreMultipleValue& store);
  void apply(const model::CopyVariable& copy);
  void apply(const model::RecordResourceVariable& rec);
  void apply(const model::RecordResourceValue& rec);
  void apply(const model::JpSearch& search);
  void apply(const model::BuiltinFunction& fn);

  const nlohmann::json& variable(const std::string& sName) const;
  void addToDeployedValues(const std::string& sResourceType, const std::string& sResourceName,
                           const std::string& sField, nlohmann::json jValue);

  providers::ICloudClient& _ccClient;
  common::IUi& _uiOut;
  VariableResolver _vrResolver;
  VariablePool _mVariables;
  nlohmann::json _jResourceValues = nlohmann::json::array();
  std::map<std::string, std::size_t> _mResourceIndex;
};

}  // namespace ldp::core
