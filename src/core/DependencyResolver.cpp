#include "core/DependencyResolver.hpp"

#include <set>

namespace ldp::core {

namespace {

void traverse(const model::ResourceGraph& rgGraph, model::ResourceId id,
              std::set<model::ResourceId>& setSeen, std::vector<model::ResourceId>& vOrdered) {
  for (const auto& idDep : rgGraph.dependencies(id)) {
    if (!setSeen.contains(idDep)) {
      setSeen.insert(idDep);
      traverse(rgGraph, idDep, setSeen, vOrdered);
    }
  }
  vOrdered.push_back(id);
}

}  // namespace

DependencyResolver::DependencyResolver() = default;
DependencyResolver::~DependencyResolver() = default;

std::vector<model::ResourceId> DependencyResolver::order(const model::ResourceGraph& rgGraph,
                                                         const model::Application& app) const {
  std::vector<model::ResourceId> vOrdered;
  std::set<model::ResourceId> setSeen;
  for (const auto& id : app.vResources) {
    if (setSeen.contains(id)) {
      continue;
    }
    setSeen.insert(id);
    traverse(rgGraph, id, setSeen, vOrdered);
  }
  return vOrdered;
}

}  // namespace ldp::core
