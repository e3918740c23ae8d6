#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "model/Instructions.hpp"

namespace ldp::providers {
class ICloudClient;
}

namespace ldp::core {

/// Partition for a region name: "cn-north-1" -> "aws-cn", "us-gov-west-1" -> "aws-us-gov".
std::string partitionFromRegion(const std::string& sRegion);

/// Endpoint DNS suffix for a partition; "amazonaws.com" when unknown.
std::string dnsSuffixFromPartition(const std::string& sPartition);

/// Split "arn:partition:service:region:account:resource" into
/// {partition, service, region, account_id, dns_suffix}.
/// Throws common::ValidationError when fewer than six fields are present.
nlohmann::json parseArn(const std::string& sArn);

/// {partition, region, dns_suffix} of the client's active session.
nlohmann::json interrogateProfile(const providers::ICloudClient& ccClient);

/// Standard service principal for a service in a region, e.g.
/// ("logs", "us-west-2", "amazonaws.com") -> "logs.us-west-2.amazonaws.com".
/// A service that does not look like "name[.known-suffix]" is returned as is.
std::string servicePrincipal(const std::string& sService,
                             const std::string& sRegion = "us-east-1",
                             const std::string& sUrlSuffix = "amazonaws.com");

/// Dispatch a builtin with already-resolved arguments.
/// Throws common::InternalError when the argument count does not fit the builtin.
nlohmann::json callBuiltin(model::Builtin function, const nlohmann::json& jArgs,
                           const providers::ICloudClient& ccClient);

}  // namespace ldp::core
