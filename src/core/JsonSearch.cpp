#include "core/JsonSearch.hpp"

#include <cctype>
#include <cstddef>
#include <variant>
#include <vector>

#include "common/Errors.hpp"

namespace ldp::core {

namespace {

using Step = std::variant<std::string, long>;

[[noreturn]] void throwMalformed(const std::string& sExpression, std::size_t iPos) {
  throw common::ValidationError("invalid_search_expression",
                                "Invalid search expression '" + sExpression +
                                    "' at position " + std::to_string(iPos));
}

bool isFieldChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

std::vector<Step> parse(const std::string& sExpression) {
  std::vector<Step> vSteps;
  std::size_t i = 0;
  const std::size_t iLen = sExpression.size();
  if (iLen == 0) {
    throwMalformed(sExpression, 0);
  }

  bool bExpectField = sExpression[0] != '[';
  while (i < iLen) {
    if (bExpectField) {
      const std::size_t iStart = i;
      while (i < iLen && isFieldChar(sExpression[i])) {
        ++i;
      }
      if (i == iStart) {
        throwMalformed(sExpression, i);
      }
      vSteps.emplace_back(sExpression.substr(iStart, i - iStart));
      bExpectField = false;
      continue;
    }

    if (sExpression[i] == '.') {
      ++i;
      bExpectField = true;
      if (i == iLen) {
        throwMalformed(sExpression, i);
      }
      continue;
    }

    if (sExpression[i] != '[') {
      throwMalformed(sExpression, i);
    }
    ++i;
    const std::size_t iStart = i;
    if (i < iLen && sExpression[i] == '-') {
      ++i;
    }
    while (i < iLen && std::isdigit(static_cast<unsigned char>(sExpression[i]))) {
      ++i;
    }
    if (i >= iLen || sExpression[i] != ']' || i == iStart ||
        (i == iStart + 1 && sExpression[iStart] == '-') || i - iStart > 10) {
      throwMalformed(sExpression, i);
    }
    vSteps.emplace_back(std::stol(sExpression.substr(iStart, i - iStart)));
    ++i;
  }
  return vSteps;
}

}  // namespace

nlohmann::json jsonSearch(const std::string& sExpression, const nlohmann::json& jInput) {
  const auto vSteps = parse(sExpression);
  const nlohmann::json* pCurrent = &jInput;

  for (const auto& step : vSteps) {
    if (const auto* pField = std::get_if<std::string>(&step)) {
      if (!pCurrent->is_object()) {
        return nullptr;
      }
      auto it = pCurrent->find(*pField);
      if (it == pCurrent->end()) {
        return nullptr;
      }
      pCurrent = &*it;
      continue;
    }

    if (!pCurrent->is_array()) {
      return nullptr;
    }
    const long iSize = static_cast<long>(pCurrent->size());
    long iIndex = std::get<long>(step);
    if (iIndex < 0) {
      iIndex += iSize;
    }
    if (iIndex < 0 || iIndex >= iSize) {
      return nullptr;
    }
    pCurrent = &(*pCurrent)[static_cast<std::size_t>(iIndex)];
  }
  return *pCurrent;
}

}  // namespace ldp::core
