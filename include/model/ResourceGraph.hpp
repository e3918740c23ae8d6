#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "model/Resources.hpp"

namespace ldp::model {

/// Arena owning every resource of one deploy attempt.
/// Resources are addressed by ResourceId; ids stay valid for the graph's lifetime.
/// Class abbreviation: rg
class ResourceGraph {
 public:
  ResourceGraph();
  ~ResourceGraph();

  ResourceGraph(const ResourceGraph&) = delete;
  ResourceGraph& operator=(const ResourceGraph&) = delete;
  ResourceGraph(ResourceGraph&&) noexcept = default;
  ResourceGraph& operator=(ResourceGraph&&) noexcept = default;

  /// Add a resource and return its id. Adding an equal value twice yields two nodes.
  ResourceId add(Resource resource);

  Resource& at(ResourceId id);
  const Resource& at(ResourceId id) const;

  /// Typed access; throws InternalError when the variant does not match.
  template <typename T>
  T& get(ResourceId id) {
    auto* pResource = std::get_if<T>(&at(id));
    if (pResource == nullptr) {
      throwWrongVariant(id);
    }
    return *pResource;
  }

  template <typename T>
  const T& get(ResourceId id) const {
    const auto* pResource = std::get_if<T>(&at(id));
    if (pResource == nullptr) {
      throwWrongVariant(id);
    }
    return *pResource;
  }

  /// Direct dependencies in declared order.
  std::vector<ResourceId> dependencies(ResourceId id) const;

  /// Persisted type discriminator (e.g. "lambda_function").
  std::string resourceType(ResourceId id) const;

  /// Stable name used for diffing across runs; empty for unmanaged resources.
  std::string resourceName(ResourceId id) const;

  /// True for resources that are recorded in deployed state.
  bool isManaged(ResourceId id) const;

  std::size_t size() const { return _vResources.size(); }

 private:
  [[noreturn]] void throwWrongVariant(ResourceId id) const;

  std::vector<Resource> _vResources;
};

}  // namespace ldp::model
