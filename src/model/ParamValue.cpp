#include "model/ParamValue.hpp"

#include <algorithm>

namespace ldp::model {

ParamValue::ParamValue() : _vValue(nlohmann::json()) {}
ParamValue::ParamValue(nlohmann::json jLiteral) : _vValue(std::move(jLiteral)) {}
ParamValue::ParamValue(const char* pLiteral) : _vValue(nlohmann::json(pLiteral)) {}
ParamValue::ParamValue(std::string sLiteral) : _vValue(nlohmann::json(std::move(sLiteral))) {}
ParamValue::ParamValue(int iLiteral) : _vValue(nlohmann::json(iLiteral)) {}
ParamValue::ParamValue(bool bLiteral) : _vValue(nlohmann::json(bLiteral)) {}
ParamValue::ParamValue(Variable var) : _vValue(std::move(var)) {}
ParamValue::ParamValue(StringFormat sf) : _vValue(std::move(sf)) {}
ParamValue::ParamValue(Placeholder ph) : _vValue(std::move(ph)) {}
ParamValue::ParamValue(List vItems) : _vValue(std::move(vItems)) {}
ParamValue::ParamValue(Map vEntries) : _vValue(std::move(vEntries)) {}

ParamValue ParamValue::map(std::initializer_list<std::pair<std::string, ParamValue>> ilEntries) {
  return ParamValue(Map(ilEntries));
}

const ParamValue* ParamValue::find(const std::string& sKey) const {
  const auto* pEntries = entries();
  if (pEntries == nullptr) {
    return nullptr;
  }
  auto it = std::find_if(pEntries->begin(), pEntries->end(),
                         [&sKey](const auto& entry) { return entry.first == sKey; });
  return it == pEntries->end() ? nullptr : &it->second;
}

void ParamValue::set(const std::string& sKey, ParamValue pvValue) {
  if (!isMap()) {
    _vValue = Map{};
  }
  auto& vEntries = std::get<Map>(_vValue);
  for (auto& entry : vEntries) {
    if (entry.first == sKey) {
      entry.second = std::move(pvValue);
      return;
    }
  }
  vEntries.emplace_back(sKey, std::move(pvValue));
}

nlohmann::json toDisplayJson(const ParamValue& pvValue) {
  if (const auto* pLiteral = pvValue.literal()) {
    return *pLiteral;
  }
  if (const auto* pVar = pvValue.variable()) {
    return "${" + pVar->sName + "}";
  }
  if (const auto* pFormat = pvValue.stringFormat()) {
    return pFormat->sTemplate;
  }
  if (const auto* pPlaceholder = pvValue.placeholder()) {
    return "<" + pPlaceholder->sStage + ">";
  }
  if (const auto* pList = pvValue.list()) {
    nlohmann::json jArr = nlohmann::json::array();
    for (const auto& pvItem : *pList) {
      jArr.push_back(toDisplayJson(pvItem));
    }
    return jArr;
  }
  nlohmann::json jObj = nlohmann::json::object();
  for (const auto& [sKey, pvItem] : *pvValue.entries()) {
    jObj[sKey] = toDisplayJson(pvItem);
  }
  return jObj;
}

}  // namespace ldp::model
