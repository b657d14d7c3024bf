#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "internal/model/model_definition.hpp"

namespace modelplan::graph {

/*
  Directed dependency graph over model names.

  Edges point upstream ---> downstream. Adjacency is kept in ordered
  containers so every query returns names in sorted order.
*/
class DependencyGraph {
 public:
  using NameSet = std::set<std::string>;

  void AddNode(const std::string& name);

  // Adds both endpoints if missing.
  void AddEdge(const std::string& upstream, const std::string& downstream);

  bool HasNode(const std::string& name) const;
  bool HasEdge(const std::string& upstream, const std::string& downstream) const;

  std::size_t NodeCount() const;
  std::size_t EdgeCount() const;

  std::vector<std::string> Nodes() const;

  // Empty for unknown nodes.
  const NameSet& Predecessors(const std::string& name) const;
  const NameSet& Successors(const std::string& name) const;

  // Transitive closures; the start node itself is excluded.
  NameSet Descendants(const std::string& name) const;
  NameSet Ancestors(const std::string& name) const;

  // Induced subgraph over the nodes that exist in this graph.
  DependencyGraph Subgraph(const NameSet& nodes) const;

  // Kahn's algorithm, smallest ready name first. Throws util::CycleError.
  std::vector<std::string> TopologicalSort() const;

  // Strongly connected components that contain a cycle, each sorted,
  // ordered by their first member. Empty for an acyclic graph.
  std::vector<std::vector<std::string>> DetectCycles() const;

  // name -> sorted upstream names, one entry per node.
  std::map<std::string, std::vector<std::string>> ToUpstreamAdjacency() const;

 private:
  NameSet Reach(const std::string& name, const std::map<std::string, NameSet>& edges) const;

  std::map<std::string, NameSet> parents_;
  std::map<std::string, NameSet> children_;
};

/*
  One node per model, one edge per declared dependency on another known
  model. Dependencies on unmanaged tables and self references are skipped.
*/
DependencyGraph BuildDependencyGraph(const model::ModelMap& models);

// Warnings for dependencies naming models outside the managed set.
std::vector<std::string> FindUnknownDependencies(const model::ModelMap& models);

} // namespace modelplan::graph
