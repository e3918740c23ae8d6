#pragma once

#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include "model/ParamValue.hpp"

namespace ldp::core {

using VariablePool = std::map<std::string, nlohmann::json>;

/// Recursively turns a parameter tree into concrete JSON using the variable pool.
/// Class abbreviation: vr
class VariableResolver {
 public:
  VariableResolver();
  ~VariableResolver();

  /// Throws common::InternalError for an unknown variable and
  /// common::UnresolvedValueError (keyed by the innermost map key) for a placeholder.
  nlohmann::json resolve(const model::ParamValue& pvValue, const VariablePool& mPool) const;

  /// Substitute {name} and {name[key][0]} fields of a template.
  /// String values are inserted verbatim, anything else as compact JSON.
  std::string format(const model::StringFormat& sfFormat, const VariablePool& mPool) const;

 private:
  const nlohmann::json& lookup(const std::string& sName, const VariablePool& mPool) const;
};

}  // namespace ldp::core
