#include "core/Executor.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "common/Ui.hpp"
#include "core/BuiltinFunctions.hpp"
#include "core/JsonSearch.hpp"
#include "providers/ICloudClient.hpp"

namespace ldp::core {

Executor::Executor(providers::ICloudClient& ccClient, common::IUi& uiOut)
    : _ccClient(ccClient), _uiOut(uiOut) {}

Executor::~Executor() = default;

void Executor::execute(const model::Plan& plPlan) {
  auto spLog = common::Logger::get();
  spLog->info("Executing plan with {} instructions", plPlan.size());
  for (std::size_t i = 0; i < plPlan.vInstructions.size(); ++i) {
    if (const auto* pMessage = plPlan.messageFor(i)) {
      _uiOut.write(*pMessage);
    }
    dispatch(plPlan.vInstructions[i]);
  }
  spLog->info("Plan executed; {} resources recorded", _jResourceValues.size());
}

void Executor::dispatch(const model::Instruction& instruction) {
  std::visit([this](const auto& inst) { apply(inst); }, instruction);
}

const nlohmann::json& Executor::variable(const std::string& sName) const {
  auto it = _mVariables.find(sName);
  if (it == _mVariables.end()) {
    throw common::InternalError("unknown_variable", "Unknown variable: " + sName);
  }
  return it->second;
}

// ── Instruction handlers ───────────────────────────────────────────────────

void Executor::apply(const model::ApiCall& call) {
  const std::string sMethod = providers::apiMethodName(call.method);
  nlohmann::json jParams;
  try {
    jParams = _vrResolver.resolve(call.pvParams, _mVariables);
  } catch (const common::UnresolvedValueError& e) {
    throw e.withMethodName(sMethod);
  }

  common::Logger::get()->debug("api_call {} {}", sMethod, jParams.dump());
  auto jResult = _ccClient.invoke(call.method, jParams);
  if (call.oOutputVar) {
    _mVariables[*call.oOutputVar] = std::move(jResult);
  }
}

void Executor::apply(const model::StoreValue& store) {
  _mVariables[store.sName] = _vrResolver.resolve(store.pvValue, _mVariables);
}

void Executor::apply(const model::StoreMultipleValue& store) {
  nlohmann::json jValues = _vrResolver.resolve(model::ParamValue(store.vValues), _mVariables);
  auto it = _mVariables.find(store.sName);
  if (it != _mVariables.end() && it->second.is_array()) {
    for (auto& jItem : jValues) {
      it->second.push_back(std::move(jItem));
    }
    return;
  }
  _mVariables[store.sName] = std::move(jValues);
}

void Executor::apply(const model::CopyVariable& copy) {
  _mVariables[copy.sToVar] = variable(copy.sFromVar);
}

void Executor::apply(const model::RecordResourceVariable& rec) {
  addToDeployedValues(rec.sResourceType, rec.sResourceName, rec.sName,
                      variable(rec.sVariableName));
}

void Executor::apply(const model::RecordResourceValue& rec) {
  addToDeployedValues(rec.sResourceType, rec.sResourceName, rec.sName, rec.jValue);
}

void Executor::apply(const model::JpSearch& search) {
  _mVariables[search.sOutputVar] = jsonSearch(search.sExpression, variable(search.sInputVar));
}

void Executor::apply(const model::BuiltinFunction& fn) {
  const auto jArgs = _vrResolver.resolve(model::ParamValue(fn.vArgs), _mVariables);
  _mVariables[fn.sOutputVar] = callBuiltin(fn.function, jArgs, _ccClient);
}

void Executor::addToDeployedValues(const std::string& sResourceType,
                                   const std::string& sResourceName, const std::string& sField,
                                   nlohmann::json jValue) {
  auto it = _mResourceIndex.find(sResourceName);
  if (it == _mResourceIndex.end()) {
    _jResourceValues.push_back({{"name", sResourceName}, {"resource_type", sResourceType}});
    it = _mResourceIndex.emplace(sResourceName, _jResourceValues.size() - 1).first;
  }
  auto& jRecord = _jResourceValues[it->second];
  jRecord["resource_type"] = sResourceType;
  jRecord[sField] = std::move(jValue);
}

}  // namespace ldp::core
