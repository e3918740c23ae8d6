#pragma once

#include <vector>

#include "model/ResourceGraph.hpp"

namespace ldp::core {

/// Flattens a declared graph into dependency order.
/// Class abbreviation: dr
class DependencyResolver {
 public:
  DependencyResolver();
  ~DependencyResolver();

  /// Depth-first post-order from each root in declared order. Every reachable
  /// resource appears once, after all of its dependencies. Cycles are not checked.
  std::vector<model::ResourceId> order(const model::ResourceGraph& rgGraph,
                                       const model::Application& app) const;
};

}  // namespace ldp::core
