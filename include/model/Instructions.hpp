#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/ParamValue.hpp"
#include "providers/ApiMethod.hpp"

namespace ldp::model {

struct ApiCall {
  providers::ApiMethod method;
  ParamValue pvParams;  // always a map
  std::optional<std::string> oOutputVar;

  bool operator==(const ApiCall&) const = default;
};

struct StoreValue {
  std::string sName;
  ParamValue pvValue;

  bool operator==(const StoreValue&) const = default;
};

/// Appends to the named variable if it already holds a list, else initializes it.
struct StoreMultipleValue {
  std::string sName;
  ParamValue::List vValues;

  bool operator==(const StoreMultipleValue&) const = default;
};

struct CopyVariable {
  std::string sFromVar;
  std::string sToVar;

  bool operator==(const CopyVariable&) const = default;
};

struct RecordResourceVariable {
  std::string sResourceType;
  std::string sResourceName;
  std::string sName;
  std::string sVariableName;

  bool operator==(const RecordResourceVariable&) const = default;
};

struct RecordResourceValue {
  std::string sResourceType;
  std::string sResourceName;
  std::string sName;
  nlohmann::json jValue;

  bool operator==(const RecordResourceValue&) const = default;
};

/// Structural query ("a.b[0].c") against a stored value.
struct JpSearch {
  std::string sExpression;
  std::string sInputVar;
  std::string sOutputVar;

  bool operator==(const JpSearch&) const = default;
};

enum class Builtin { ParseArn, InterrogateProfile, ServicePrincipal };

struct BuiltinFunction {
  Builtin function;
  ParamValue::List vArgs;
  std::string sOutputVar;

  bool operator==(const BuiltinFunction&) const = default;
};

/// Closed set of plan instructions.
using Instruction = std::variant<ApiCall, StoreValue, StoreMultipleValue, CopyVariable,
                                 RecordResourceVariable, RecordResourceValue, JpSearch,
                                 BuiltinFunction>;

/// Ordered instruction list plus progress messages keyed by instruction position.
/// Plans are append-only, so a position identifies one instruction for the plan's lifetime.
/// Class abbreviation: pl
struct Plan {
  std::vector<Instruction> vInstructions;
  std::map<std::size_t, std::string> mMessages;

  void append(Instruction instruction);
  void append(Instruction instruction, std::string sMessage);
  void extend(const Plan& plOther);

  /// Message attached to the instruction at iIndex, or nullptr.
  const std::string* messageFor(std::size_t iIndex) const;

  bool empty() const { return vInstructions.empty(); }
  std::size_t size() const { return vInstructions.size(); }

  bool operator==(const Plan&) const = default;
};

std::string builtinName(Builtin function);

/// Display form of a plan: one JSON object per instruction.
nlohmann::json toJson(const Plan& plPlan);

}  // namespace ldp::model
