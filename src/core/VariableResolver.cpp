#include "core/VariableResolver.hpp"

#include <algorithm>
#include <cctype>

#include "common/Errors.hpp"

namespace ldp::core {

namespace {

/// Array index: all digits, short enough that std::stoul cannot overflow.
bool isIndex(const std::string& sKey) {
  return !sKey.empty() && sKey.size() <= 9 &&
         std::all_of(sKey.begin(), sKey.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

std::string toText(const nlohmann::json& jValue) {
  return jValue.is_string() ? jValue.get<std::string>() : jValue.dump();
}

}  // namespace

VariableResolver::VariableResolver() = default;
VariableResolver::~VariableResolver() = default;

const nlohmann::json& VariableResolver::lookup(const std::string& sName,
                                               const VariablePool& mPool) const {
  auto it = mPool.find(sName);
  if (it == mPool.end()) {
    throw common::InternalError("unknown_variable", "Unknown variable: " + sName);
  }
  return it->second;
}

nlohmann::json VariableResolver::resolve(const model::ParamValue& pvValue,
                                         const VariablePool& mPool) const {
  if (const auto* pLiteral = pvValue.literal()) {
    return *pLiteral;
  }
  if (const auto* pVar = pvValue.variable()) {
    return lookup(pVar->sName, mPool);
  }
  if (const auto* pFormat = pvValue.stringFormat()) {
    return format(*pFormat, mPool);
  }
  if (const auto* pPlaceholder = pvValue.placeholder()) {
    throw common::UnresolvedValueError("", "<" + pPlaceholder->sStage + ">", "");
  }
  if (const auto* pList = pvValue.list()) {
    nlohmann::json jArr = nlohmann::json::array();
    for (const auto& pvItem : *pList) {
      jArr.push_back(resolve(pvItem, mPool));
    }
    return jArr;
  }

  nlohmann::json jObj = nlohmann::json::object();
  for (const auto& [sKey, pvItem] : *pvValue.entries()) {
    try {
      jObj[sKey] = resolve(pvItem, mPool);
    } catch (const common::UnresolvedValueError& e) {
      if (!e._sKey.empty()) {
        throw;
      }
      throw e.withKey(sKey);
    }
  }
  return jObj;
}

std::string VariableResolver::format(const model::StringFormat& sfFormat,
                                     const VariablePool& mPool) const {
  for (const auto& sName : sfFormat.vVariables) {
    lookup(sName, mPool);
  }

  const std::string& sTemplate = sfFormat.sTemplate;
  std::string sResult;
  std::size_t i = 0;
  while (i < sTemplate.size()) {
    const char c = sTemplate[i];
    if (c == '{' && i + 1 < sTemplate.size() && sTemplate[i + 1] == '{') {
      sResult += '{';
      i += 2;
      continue;
    }
    if (c == '}' && i + 1 < sTemplate.size() && sTemplate[i + 1] == '}') {
      sResult += '}';
      i += 2;
      continue;
    }
    if (c != '{') {
      sResult += c;
      ++i;
      continue;
    }

    const std::size_t iClose = sTemplate.find('}', i);
    if (iClose == std::string::npos) {
      throw common::ValidationError("invalid_format_string",
                                    "Unterminated field in format string: " + sTemplate);
    }
    const std::string sField = sTemplate.substr(i + 1, iClose - i - 1);
    const std::size_t iBracket = sField.find('[');
    const nlohmann::json* pValue = &lookup(sField.substr(0, iBracket), mPool);

    std::size_t iPos = iBracket;
    while (iPos != std::string::npos && iPos < sField.size()) {
      const std::size_t iEnd = sField.find(']', iPos);
      if (iEnd == std::string::npos) {
        throw common::ValidationError("invalid_format_string",
                                      "Unterminated index in format field: " + sField);
      }
      const std::string sKey = sField.substr(iPos + 1, iEnd - iPos - 1);
      if (pValue->is_array() && isIndex(sKey) && std::stoul(sKey) < pValue->size()) {
        pValue = &pValue->at(std::stoul(sKey));
      } else if (pValue->is_object() && pValue->contains(sKey)) {
        pValue = &pValue->at(sKey);
      } else {
        throw common::InternalError("invalid_format_index",
                                    "Cannot index '" + sKey + "' in format field: " + sField);
      }
      iPos = iEnd + 1;
    }
    sResult += toText(*pValue);
    i = iClose + 1;
  }
  return sResult;
}

}  // namespace ldp::core
