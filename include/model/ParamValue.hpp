#pragma once

#include <initializer_list>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace ldp::model {

/// Named reference into the executor's variable pool.
struct Variable {
  std::string sName;

  bool operator==(const Variable&) const = default;
};

/// Template string with {name} fields substituted from the variable pool.
/// Fields may index into structured values: {rest_api[endpointConfiguration][types][0]}.
struct StringFormat {
  std::string sTemplate;
  std::vector<std::string> vVariables;

  bool operator==(const StringFormat&) const = default;
};

/// A value that should have been supplied by the build stage.
struct Placeholder {
  std::string sStage = "build_stage";

  bool operator==(const Placeholder&) const = default;
};

/// Recursive API parameter value: literals mixed with execution-time references.
/// Maps preserve insertion order.
/// Class abbreviation: pv
class ParamValue {
 public:
  using List = std::vector<ParamValue>;
  using Map = std::vector<std::pair<std::string, ParamValue>>;

  ParamValue();
  ParamValue(nlohmann::json jLiteral);  // NOLINT(google-explicit-constructor)
  ParamValue(const char* pLiteral);     // NOLINT(google-explicit-constructor)
  ParamValue(std::string sLiteral);     // NOLINT(google-explicit-constructor)
  ParamValue(int iLiteral);             // NOLINT(google-explicit-constructor)
  ParamValue(bool bLiteral);            // NOLINT(google-explicit-constructor)
  ParamValue(Variable var);             // NOLINT(google-explicit-constructor)
  ParamValue(StringFormat sf);          // NOLINT(google-explicit-constructor)
  ParamValue(Placeholder ph);           // NOLINT(google-explicit-constructor)
  ParamValue(List vItems);              // NOLINT(google-explicit-constructor)
  ParamValue(Map vEntries);             // NOLINT(google-explicit-constructor)

  /// Build a map value: ParamValue::map({{"function_name", "f"}, {"role_arn", Variable{...}}}).
  static ParamValue map(std::initializer_list<std::pair<std::string, ParamValue>> ilEntries);

  bool isLiteral() const { return std::holds_alternative<nlohmann::json>(_vValue); }
  bool isMap() const { return std::holds_alternative<Map>(_vValue); }

  const nlohmann::json* literal() const { return std::get_if<nlohmann::json>(&_vValue); }
  const Variable* variable() const { return std::get_if<Variable>(&_vValue); }
  const StringFormat* stringFormat() const { return std::get_if<StringFormat>(&_vValue); }
  const Placeholder* placeholder() const { return std::get_if<Placeholder>(&_vValue); }
  const List* list() const { return std::get_if<List>(&_vValue); }
  const Map* entries() const { return std::get_if<Map>(&_vValue); }

  /// Map lookup by key; nullptr when absent or not a map.
  const ParamValue* find(const std::string& sKey) const;

  /// Append or overwrite a key in a map value.
  void set(const std::string& sKey, ParamValue pvValue);

  bool operator==(const ParamValue&) const = default;

 private:
  std::variant<nlohmann::json, Variable, StringFormat, Placeholder, List, Map> _vValue;
};

/// Display form of a parameter tree: variables as "${name}", string formats as
/// their template, placeholders as "<build_stage>".
nlohmann::json toDisplayJson(const ParamValue& pvValue);

}  // namespace ldp::model
