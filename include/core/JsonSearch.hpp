#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace ldp::core {

/// Evaluates a structural path expression against a JSON value.
///
/// Supported grammar: field names separated by '.', each optionally followed
/// by one or more array indexes ("a.b[0].c", "items[-1]", "[2].name").
/// Negative indexes count from the end. A step that does not match (missing
/// key, index out of range, wrong node type) yields null, never an error.
/// Throws common::ValidationError for a malformed expression.
nlohmann::json jsonSearch(const std::string& sExpression, const nlohmann::json& jInput);

}  // namespace ldp::core
