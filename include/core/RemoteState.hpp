#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "model/ResourceGraph.hpp"

namespace ldp::providers {
class ICloudClient;
}

namespace ldp::state {
class DeployedResources;
}

namespace ldp::core {

/// Read-only view of live cloud state for one deploy attempt.
///
/// Existence checks and snapshots are cached per (resource_type, resource_name),
/// so each resource is queried at most once. A missing resource is an ordinary
/// answer; any other client failure propagates.
/// Class abbreviation: rs
class RemoteState {
 public:
  RemoteState(providers::ICloudClient& ccClient, const state::DeployedResources& drsDeployed);
  ~RemoteState();

  RemoteState(const RemoteState&) = delete;
  RemoteState& operator=(const RemoteState&) = delete;

  /// Throws common::InternalError for unmanaged resources.
  bool resourceExists(const model::ResourceGraph& rgGraph, model::ResourceId id);

  /// Values recorded by the previous deploy. Managed roles fall back to a live
  /// lookup; anything else without a record throws common::NotFoundError.
  nlohmann::json resourceDeployedValues(const model::ResourceGraph& rgGraph,
                                        model::ResourceId id);

  /// Hydrated live snapshot used for attribute diffing; nullopt when absent.
  std::optional<nlohmann::json> fetch(const model::ResourceGraph& rgGraph, model::ResourceId id);

 private:
  using CacheKey = std::pair<std::string, std::string>;

  bool checkExists(const model::ResourceGraph& rgGraph, model::ResourceId id);
  nlohmann::json loadSnapshot(const model::ResourceGraph& rgGraph, model::ResourceId id);
  const nlohmann::json* record(const std::string& sResourceName) const;

  /// Record merged with the live mapping of its event_uuid.
  nlohmann::json withEventSourceMapping(const nlohmann::json& jRecord);

  providers::ICloudClient& _ccClient;
  const state::DeployedResources& _drsDeployed;
  std::map<CacheKey, bool> _mExistsCache;
  std::map<CacheKey, nlohmann::json> _mSnapshotCache;
};

}  // namespace ldp::core
