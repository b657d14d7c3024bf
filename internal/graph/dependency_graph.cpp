#include "dependency_graph.hpp"

#include <algorithm>
#include <queue>

#include "internal/util/errors.hpp"

namespace modelplan::graph {

namespace {

const DependencyGraph::NameSet& EmptySet() {
  static const DependencyGraph::NameSet kEmpty;
  return kEmpty;
}

} // namespace

// ------------------------------------------------------------
// Construction
// ------------------------------------------------------------

void DependencyGraph::AddNode(const std::string& name) {
  parents_[name];
  children_[name];
}

void DependencyGraph::AddEdge(const std::string& upstream, const std::string& downstream) {
  AddNode(upstream);
  AddNode(downstream);
  children_[upstream].insert(downstream);
  parents_[downstream].insert(upstream);
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

bool DependencyGraph::HasNode(const std::string& name) const {
  return parents_.count(name) > 0;
}

bool DependencyGraph::HasEdge(const std::string& upstream, const std::string& downstream) const {
  auto it = children_.find(upstream);
  return it != children_.end() && it->second.count(downstream) > 0;
}

std::size_t DependencyGraph::NodeCount() const {
  return parents_.size();
}

std::size_t DependencyGraph::EdgeCount() const {
  std::size_t count = 0;
  for (const auto& [name, children] : children_) {
    count += children.size();
  }
  return count;
}

std::vector<std::string> DependencyGraph::Nodes() const {
  std::vector<std::string> nodes;
  nodes.reserve(parents_.size());
  for (const auto& [name, parents] : parents_) {
    nodes.push_back(name);
  }
  return nodes;
}

const DependencyGraph::NameSet& DependencyGraph::Predecessors(const std::string& name) const {
  auto it = parents_.find(name);
  return it == parents_.end() ? EmptySet() : it->second;
}

const DependencyGraph::NameSet& DependencyGraph::Successors(const std::string& name) const {
  auto it = children_.find(name);
  return it == children_.end() ? EmptySet() : it->second;
}

DependencyGraph::NameSet DependencyGraph::Reach(const std::string& name, const std::map<std::string, NameSet>& edges) const {
  NameSet visited;

  auto start = edges.find(name);
  if (start == edges.end()) {
    return visited;
  }

  std::queue<std::string> q;
  for (const auto& next : start->second) {
    q.push(next);
  }

  while (!q.empty()) {
    auto node = q.front();
    q.pop();

    if (!visited.insert(node).second)
      continue;

    auto it = edges.find(node);
    if (it == edges.end())
      continue;

    for (const auto& next : it->second) {
      if (!visited.count(next))
        q.push(next);
    }
  }

  // A node on a cycle reaches itself; closures exclude the start node.
  visited.erase(name);
  return visited;
}

DependencyGraph::NameSet DependencyGraph::Descendants(const std::string& name) const {
  return Reach(name, children_);
}

DependencyGraph::NameSet DependencyGraph::Ancestors(const std::string& name) const {
  return Reach(name, parents_);
}

DependencyGraph DependencyGraph::Subgraph(const NameSet& nodes) const {
  DependencyGraph sub;
  for (const auto& name : nodes) {
    if (HasNode(name)) {
      sub.AddNode(name);
    }
  }

  for (const auto& name : sub.Nodes()) {
    for (const auto& child : Successors(name)) {
      if (nodes.count(child)) {
        sub.AddEdge(name, child);
      }
    }
  }
  return sub;
}

// ------------------------------------------------------------
// Ordering
// ------------------------------------------------------------

std::vector<std::string> DependencyGraph::TopologicalSort() const {
  std::map<std::string, std::size_t> in_degree;
  for (const auto& [name, parents] : parents_) {
    in_degree[name] = parents.size();
  }

  // std::set doubles as a min-heap keyed on name.
  std::set<std::string> ready;
  for (const auto& [name, degree] : in_degree) {
    if (degree == 0) {
      ready.insert(name);
    }
  }

  std::vector<std::string> sorted;
  sorted.reserve(in_degree.size());

  while (!ready.empty()) {
    auto node = *ready.begin();
    ready.erase(ready.begin());
    sorted.push_back(node);

    for (const auto& child : Successors(node)) {
      if (--in_degree[child] == 0) {
        ready.insert(child);
      }
    }
  }

  if (sorted.size() != in_degree.size()) {
    std::vector<std::string> remaining;
    for (const auto& [name, degree] : in_degree) {
      if (degree > 0) {
        remaining.push_back(name);
      }
    }

    std::string msg = "dependency graph contains a cycle among:";
    for (const auto& name : remaining) {
      msg += " " + name;
    }
    throw util::CycleError(msg, std::move(remaining));
  }

  return sorted;
}

std::vector<std::vector<std::string>> DependencyGraph::DetectCycles() const {
  // Kosaraju with explicit stacks: finish order on the forward graph, then
  // collect components on the reversed graph in reverse finish order.
  std::vector<std::string> finish_order;
  NameSet                  seen;

  for (const auto& [root, unused] : children_) {
    if (seen.count(root))
      continue;

    std::vector<std::pair<std::string, NameSet::const_iterator>> stack;
    seen.insert(root);
    stack.emplace_back(root, Successors(root).begin());

    while (!stack.empty()) {
      auto& [node, it] = stack.back();
      if (it != Successors(node).end()) {
        const auto& next = *it;
        ++it;
        if (seen.insert(next).second) {
          stack.emplace_back(next, Successors(next).begin());
        }
        continue;
      }
      finish_order.push_back(node);
      stack.pop_back();
    }
  }

  std::vector<std::vector<std::string>> cycles;
  NameSet                               assigned;

  for (auto root = finish_order.rbegin(); root != finish_order.rend(); ++root) {
    if (assigned.count(*root))
      continue;

    std::vector<std::string> component;
    std::vector<std::string> stack{*root};
    assigned.insert(*root);

    while (!stack.empty()) {
      auto node = stack.back();
      stack.pop_back();
      component.push_back(node);
      for (const auto& parent : Predecessors(node)) {
        if (assigned.insert(parent).second) {
          stack.push_back(parent);
        }
      }
    }

    const bool self_loop = component.size() == 1 && HasEdge(component.front(), component.front());
    if (component.size() > 1 || self_loop) {
      std::sort(component.begin(), component.end());
      cycles.push_back(std::move(component));
    }
  }

  std::sort(cycles.begin(), cycles.end());
  return cycles;
}

std::map<std::string, std::vector<std::string>> DependencyGraph::ToUpstreamAdjacency() const {
  std::map<std::string, std::vector<std::string>> adjacency;
  for (const auto& [name, parents] : parents_) {
    adjacency[name] = std::vector<std::string>(parents.begin(), parents.end());
  }
  return adjacency;
}

// ------------------------------------------------------------
// Builders
// ------------------------------------------------------------

DependencyGraph BuildDependencyGraph(const model::ModelMap& models) {
  DependencyGraph graph;

  for (const auto& [name, definition] : models) {
    graph.AddNode(name);
  }

  for (const auto& [name, definition] : models) {
    for (const auto& upstream : definition.dependencies) {
      if (upstream != name && models.count(upstream)) {
        graph.AddEdge(upstream, name);
      }
    }
  }

  return graph;
}

std::vector<std::string> FindUnknownDependencies(const model::ModelMap& models) {
  std::vector<std::string> warnings;

  for (const auto& [name, definition] : models) {
    std::set<std::string> refs(definition.dependencies.begin(), definition.dependencies.end());
    for (const auto& ref : refs) {
      if (!models.count(ref)) {
        warnings.push_back("Model '" + name + "' references '" + ref +
                           "' which is not a known managed model. It may be an external source table.");
      }
    }
  }

  return warnings;
}

} // namespace modelplan::graph
