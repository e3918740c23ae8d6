#include "model/Instructions.hpp"

#include "common/Errors.hpp"
#include "model/Resources.hpp"

namespace ldp::model {

void Plan::append(Instruction instruction) {
  vInstructions.push_back(std::move(instruction));
}

void Plan::append(Instruction instruction, std::string sMessage) {
  vInstructions.push_back(std::move(instruction));
  mMessages.emplace(vInstructions.size() - 1, std::move(sMessage));
}

void Plan::extend(const Plan& plOther) {
  const std::size_t iOffset = vInstructions.size();
  vInstructions.insert(vInstructions.end(), plOther.vInstructions.begin(),
                       plOther.vInstructions.end());
  for (const auto& [iIndex, sMessage] : plOther.mMessages) {
    mMessages.emplace(iOffset + iIndex, sMessage);
  }
}

const std::string* Plan::messageFor(std::size_t iIndex) const {
  auto it = mMessages.find(iIndex);
  return it == mMessages.end() ? nullptr : &it->second;
}

std::string builtinName(Builtin function) {
  switch (function) {
    case Builtin::ParseArn: return "parse_arn";
    case Builtin::InterrogateProfile: return "interrogate_profile";
    case Builtin::ServicePrincipal: return "service_principal";
  }
  throw common::InternalError("unknown_builtin",
                              "Unknown builtin function: " +
                                  std::to_string(static_cast<int>(function)));
}

namespace {

nlohmann::json listToJson(const ParamValue::List& vItems) {
  nlohmann::json jArr = nlohmann::json::array();
  for (const auto& pvItem : vItems) {
    jArr.push_back(toDisplayJson(pvItem));
  }
  return jArr;
}

nlohmann::json instructionToJson(const Instruction& instruction) {
  return std::visit(
      Overloaded{
          [](const ApiCall& call) {
            nlohmann::json j = {{"instruction", "api_call"},
                                {"method", providers::apiMethodName(call.method)},
                                {"params", toDisplayJson(call.pvParams)}};
            if (call.oOutputVar) {
              j["output_var"] = *call.oOutputVar;
            }
            return j;
          },
          [](const StoreValue& store) {
            return nlohmann::json{{"instruction", "store_value"},
                                  {"name", store.sName},
                                  {"value", toDisplayJson(store.pvValue)}};
          },
          [](const StoreMultipleValue& store) {
            return nlohmann::json{{"instruction", "store_multiple_value"},
                                  {"name", store.sName},
                                  {"value", listToJson(store.vValues)}};
          },
          [](const CopyVariable& copy) {
            return nlohmann::json{{"instruction", "copy_variable"},
                                  {"from_var", copy.sFromVar},
                                  {"to_var", copy.sToVar}};
          },
          [](const RecordResourceVariable& rec) {
            return nlohmann::json{{"instruction", "record_resource_variable"},
                                  {"resource_type", rec.sResourceType},
                                  {"resource_name", rec.sResourceName},
                                  {"name", rec.sName},
                                  {"variable_name", rec.sVariableName}};
          },
          [](const RecordResourceValue& rec) {
            return nlohmann::json{{"instruction", "record_resource_value"},
                                  {"resource_type", rec.sResourceType},
                                  {"resource_name", rec.sResourceName},
                                  {"name", rec.sName},
                                  {"value", rec.jValue}};
          },
          [](const JpSearch& search) {
            return nlohmann::json{{"instruction", "jp_search"},
                                  {"expression", search.sExpression},
                                  {"input_var", search.sInputVar},
                                  {"output_var", search.sOutputVar}};
          },
          [](const BuiltinFunction& fn) {
            return nlohmann::json{{"instruction", "builtin_function"},
                                  {"function_name", builtinName(fn.function)},
                                  {"args", listToJson(fn.vArgs)},
                                  {"output_var", fn.sOutputVar}};
          },
      },
      instruction);
}

}  // anonymous namespace

nlohmann::json toJson(const Plan& plPlan) {
  nlohmann::json jArr = nlohmann::json::array();
  for (std::size_t i = 0; i < plPlan.vInstructions.size(); ++i) {
    auto jInstruction = instructionToJson(plPlan.vInstructions[i]);
    if (const auto* pMessage = plPlan.messageFor(i)) {
      jInstruction["message"] = *pMessage;
    }
    jArr.push_back(std::move(jInstruction));
  }
  return jArr;
}

}  // namespace ldp::model
