#include "core/BuiltinFunctions.hpp"

#include <regex>
#include <set>
#include <sstream>
#include <vector>

#include "common/Errors.hpp"
#include "providers/ICloudClient.hpp"

namespace ldp::core {

namespace {

bool startsWith(const std::string& sValue, const std::string& sPrefix) {
  return sValue.rfind(sPrefix, 0) == 0;
}

std::vector<std::string> split(const std::string& sValue, char cDelim) {
  std::vector<std::string> vParts;
  std::string sPart;
  std::istringstream iss(sValue);
  while (std::getline(iss, sPart, cDelim)) {
    vParts.push_back(sPart);
  }
  if (!sValue.empty() && sValue.back() == cDelim) {
    vParts.emplace_back();
  }
  return vParts;
}

std::string stringArg(const nlohmann::json& jArgs, std::size_t iIndex,
                      const std::string& sFunction) {
  if (!jArgs.is_array() || iIndex >= jArgs.size() || !jArgs[iIndex].is_string()) {
    throw common::InternalError("invalid_builtin_args",
                                "Builtin " + sFunction + " expects a string argument at " +
                                    std::to_string(iIndex));
  }
  return jArgs[iIndex].get<std::string>();
}

}  // namespace

std::string partitionFromRegion(const std::string& sRegion) {
  if (startsWith(sRegion, "cn-")) return "aws-cn";
  if (startsWith(sRegion, "us-gov-")) return "aws-us-gov";
  if (startsWith(sRegion, "us-isob-")) return "aws-iso-b";
  if (startsWith(sRegion, "us-iso-")) return "aws-iso";
  return "aws";
}

std::string dnsSuffixFromPartition(const std::string& sPartition) {
  if (sPartition == "aws-cn") return "amazonaws.com.cn";
  if (sPartition == "aws-iso") return "c2s.ic.gov";
  if (sPartition == "aws-iso-b") return "sc2s.sgov.gov";
  return "amazonaws.com";
}

nlohmann::json parseArn(const std::string& sArn) {
  const auto vParts = split(sArn, ':');
  if (vParts.size() < 6 || vParts[0] != "arn") {
    throw common::ValidationError("invalid_arn", "Invalid ARN: " + sArn);
  }
  return {{"partition", vParts[1]},
          {"service", vParts[2]},
          {"region", vParts[3]},
          {"account_id", vParts[4]},
          {"dns_suffix", dnsSuffixFromPartition(vParts[1])}};
}

nlohmann::json interrogateProfile(const providers::ICloudClient& ccClient) {
  const std::string sRegion = ccClient.regionName();
  const std::string sPartition = partitionFromRegion(sRegion);
  return {{"partition", sPartition},
          {"region", sRegion},
          {"dns_suffix", dnsSuffixFromPartition(sPartition)}};
}

std::string servicePrincipal(const std::string& sService, const std::string& sRegion,
                             const std::string& sUrlSuffix) {
  static const std::regex rxService(
      R"(^([^.]+)(?:(?:\.amazonaws\.com(?:\.cn)?)|(?:\.c2s\.ic\.gov)|(?:\.sc2s\.sgov\.gov))?$)");
  std::smatch match;
  if (!std::regex_match(sService, match, rxService)) {
    return sService;
  }
  const std::string sName = match[1].str();

  static const std::set<std::string> setIsoExceptions{"cloudhsm", "config", "states",
                                                      "workspaces"};
  static const std::set<std::string> setIsobExceptions{"dms", "states"};

  if ((startsWith(sRegion, "us-iso-") && setIsoExceptions.contains(sName)) ||
      (startsWith(sRegion, "us-isob-") && setIsobExceptions.contains(sName))) {
    if (sName == "states") {
      return sName + ".amazonaws.com";
    }
    return sName + "." + sUrlSuffix;
  }

  if (sName == "codedeploy" || sName == "logs") {
    return sName + "." + sRegion + "." + sUrlSuffix;
  }
  if (sName == "states") {
    return sName + "." + sRegion + ".amazonaws.com";
  }
  if (sName == "ec2") {
    return sName + "." + sUrlSuffix;
  }
  return sName + ".amazonaws.com";
}

nlohmann::json callBuiltin(model::Builtin function, const nlohmann::json& jArgs,
                           const providers::ICloudClient& ccClient) {
  switch (function) {
    case model::Builtin::ParseArn:
      return parseArn(stringArg(jArgs, 0, "parse_arn"));
    case model::Builtin::InterrogateProfile:
      return interrogateProfile(ccClient);
    case model::Builtin::ServicePrincipal: {
      const std::string sService = stringArg(jArgs, 0, "service_principal");
      if (jArgs.size() == 1) {
        return servicePrincipal(sService);
      }
      const std::string sRegion = stringArg(jArgs, 1, "service_principal");
      if (jArgs.size() == 2) {
        return servicePrincipal(sService, sRegion);
      }
      return servicePrincipal(sService, sRegion, stringArg(jArgs, 2, "service_principal"));
    }
  }
  throw common::InternalError("unknown_builtin",
                              "Unknown builtin function: " + model::builtinName(function));
}

}  // namespace ldp::core
