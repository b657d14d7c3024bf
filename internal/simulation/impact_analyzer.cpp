#include "impact_analyzer.hpp"

#include <algorithm>
#include <cctype>
#include <deque>
#include <iterator>
#include <sstream>
#include <utility>

#include "internal/contracts/type_compat.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/sql/basic_sql_toolkit.hpp"
#include "internal/util/errors.hpp"

namespace modelplan::simulation {

using model::Severity;
using observability::IntField;
using observability::StringField;

namespace {

std::string ToLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::string JoinNames(const std::vector<std::string>& names) {
  std::string out;
  for (const auto& name : names) {
    if (!out.empty()) {
      out += ", ";
    }
    out += name;
  }
  return out;
}

std::string NotFoundSummary(const std::string& name) {
  return "Model '" + name + "' not found.";
}

std::string ColumnChangeSummary(const std::string& source, const std::vector<ColumnChange>& changes,
                                std::size_t direct, std::size_t transitive, int breaking, int warning) {
  std::ostringstream out;
  out << "Simulating ";
  for (std::size_t i = 0; i < changes.size(); ++i) {
    if (i > 0) {
      out << ", ";
    }
    out << ToString(changes[i].action) << " '" << changes[i].column_name << "'";
  }
  out << " on '" << source << "': " << direct << " direct and " << transitive << " transitive models affected.";

  if (breaking > 0) {
    out << " " << breaking << " BREAKING impact(s).";
  }
  if (warning > 0) {
    out << " " << warning << " WARNING impact(s).";
  }
  if (breaking == 0 && warning == 0 && direct == 0 && transitive == 0) {
    out << " No downstream impact detected.";
  }
  return out.str();
}

} // namespace

// ------------------------------------------------------------
// Construction
// ------------------------------------------------------------

ImpactAnalyzer::ImpactAnalyzer(model::ModelMap models, UpstreamAdjacency dag, SimulationConfig config,
                               std::shared_ptr<const sql::SqlToolkit> toolkit)
    : models_(std::move(models)), dag_(std::move(dag)), config_(config), toolkit_(std::move(toolkit)) {
  config_.Validate();
  if (!toolkit_) {
    toolkit_ = std::make_shared<sql::BasicSqlToolkit>();
  }

  for (const auto& [child, parents] : dag_) {
    graph_.AddNode(child);
    for (const auto& parent : parents) {
      graph_.AddEdge(parent, child);
    }
  }
}

// ------------------------------------------------------------
// Traversal
// ------------------------------------------------------------

void ImpactAnalyzer::WalkDownstream(const std::string& source, const Visitor& visit) const {
  std::set<std::string>                               visited{source};
  std::vector<std::pair<std::string, std::uint32_t>> order;
  std::deque<std::pair<std::string, std::uint32_t>>  queue;

  for (const auto& child : graph_.Successors(source)) {
    queue.emplace_back(child, 1);
  }

  while (!queue.empty()) {
    auto [name, depth] = std::move(queue.front());
    queue.pop_front();

    if (name == source) {
      MODELPLAN_LOG_ERROR("Impact analysis reached its own source",
                          {StringField("source", source), IntField("depth", depth)});
      throw util::GraphIntegrityError("Cyclic dependency: model '" + source + "' is downstream of itself.", source,
                                      config_.max_depth);
    }

    if (!visited.insert(name).second) {
      continue;
    }

    if (depth > config_.max_depth) {
      MODELPLAN_LOG_ERROR("Impact analysis exceeded max depth",
                          {StringField("source", source), StringField("model", name),
                           IntField("max_depth", config_.max_depth)});
      throw util::GraphIntegrityError("Impact analysis exceeded max_depth=" + std::to_string(config_.max_depth) +
                                          " at model '" + name +
                                          "'. This may indicate a cyclic dependency graph or an unexpectedly deep chain.",
                                      name, config_.max_depth);
    }

    order.emplace_back(name, depth);

    for (const auto& child : graph_.Successors(name)) {
      if (child == source || !visited.count(child)) {
        queue.emplace_back(child, depth + 1);
      }
    }
  }

  // A cycle below the source never re-enters it, so look at the reached subgraph.
  const auto cycles = graph_.Subgraph(visited).DetectCycles();
  if (!cycles.empty()) {
    const auto& first = cycles.front().front();
    MODELPLAN_LOG_ERROR("Impact analysis found a cycle downstream",
                        {StringField("source", source), StringField("model", first),
                         IntField("cycles", static_cast<std::int64_t>(cycles.size()))});
    throw util::GraphIntegrityError("Cyclic dependency downstream of '" + source + "' involving model '" + first +
                                        "'.",
                                    first, config_.max_depth);
  }

  for (const auto& [name, depth] : order) {
    visit(name, depth);
  }
}

// ------------------------------------------------------------
// Per-model checks
// ------------------------------------------------------------

std::set<std::string> ImpactAnalyzer::ReferencedColumns(const model::ModelDefinition& definition) const {
  auto columns = toolkit_->ExtractColumns(definition.EffectiveSql());
  if (!columns) {
    MODELPLAN_LOG_DEBUG("SQL parse failed during column extraction; assuming no references",
                        {StringField("model", definition.name)});
    return {};
  }
  return *columns;
}

std::vector<ContractViolation> ImpactAnalyzer::CheckContracts(const model::ModelDefinition& definition,
                                                              const std::vector<ColumnChange>& changes) const {
  std::vector<ContractViolation> violations;
  if (definition.contract_mode == model::ContractMode::kDisabled || definition.contract_columns.empty()) {
    return violations;
  }

  std::map<std::string, const model::ColumnContract*> contracts;
  for (const auto& column : definition.contract_columns) {
    contracts.emplace(ToLower(column.name), &column);
  }

  const auto& name = definition.name;
  for (const auto& change : changes) {
    auto it = contracts.find(ToLower(change.column_name));
    if (it == contracts.end()) {
      continue;
    }
    const auto& contract = *it->second;

    switch (change.action) {
      case ChangeAction::kRemove:
        violations.push_back({name, change.column_name, "COLUMN_REMOVED", Severity::kBreaking,
                              "Contract on '" + name + "' requires column '" + change.column_name + "' (" +
                                  contract.data_type + "), but it would be removed."});
        break;

      case ChangeAction::kRename:
        violations.push_back({name, change.column_name, "COLUMN_RENAMED", Severity::kBreaking,
                              "Contract on '" + name + "' requires column '" + change.column_name +
                                  "', but it would be renamed to '" + change.new_name.value_or("") + "'."});
        break;

      case ChangeAction::kTypeChange:
        if (change.new_type && !contracts::IsTypeCompatible(contract.data_type, *change.new_type)) {
          violations.push_back({name, change.column_name, "TYPE_CHANGED", Severity::kBreaking,
                                "Contract on '" + name + "' declares '" + change.column_name + "' as " +
                                    contract.data_type + ", but it would change to " + *change.new_type + "."});
        }
        break;

      case ChangeAction::kAdd:
        break;
    }
  }

  std::stable_sort(violations.begin(), violations.end(),
                   [](const ContractViolation& a, const ContractViolation& b) { return a.column_name < b.column_name; });
  return violations;
}

// ------------------------------------------------------------
// Simulations
// ------------------------------------------------------------

ImpactReport ImpactAnalyzer::SimulateColumnChange(const std::string&               source_model,
                                                  const std::vector<ColumnChange>& changes) const {
  observability::SpanScope span("simulation.column_change");
  span.SetAttribute("simulation.source", source_model);

  ImpactReport report;
  report.source_model   = source_model;
  report.column_changes = changes;

  if (!models_.count(source_model)) {
    report.summary = NotFoundSummary(source_model);
    MODELPLAN_LOG_INFO("Impact simulation on unknown model", {StringField("model", source_model)});
    return report;
  }

  const auto changed_columns = ChangedColumnNames(changes);

  try {
    WalkDownstream(source_model, [&](const std::string& name, std::uint32_t depth) {
      auto it = models_.find(name);
      if (it == models_.end()) {
        return;
      }
      const auto& definition = it->second;

      AffectedModel affected;
      affected.model_name     = name;
      affected.reference_type = depth == 1 ? ReferenceType::kDirect : ReferenceType::kTransitive;

      const auto referenced = ReferencedColumns(definition);
      std::set_intersection(changed_columns.begin(), changed_columns.end(), referenced.begin(), referenced.end(),
                            std::back_inserter(affected.columns_affected));

      affected.contract_violations = CheckContracts(definition, changes);

      if (!affected.contract_violations.empty()) {
        for (const auto& v : affected.contract_violations) {
          affected.severity = std::max(affected.severity, v.severity);
        }
      } else if (!affected.columns_affected.empty()) {
        affected.severity = ClassifyChangeSeverity(changes);
      }

      report.contract_violations.insert(report.contract_violations.end(), affected.contract_violations.begin(),
                                        affected.contract_violations.end());

      auto& bucket = depth == 1 ? report.directly_affected : report.transitively_affected;
      bucket.push_back(std::move(affected));
    });
  } catch (const util::GraphIntegrityError& e) {
    span.RecordException(e.what());
    throw;
  }

  for (const auto* group : {&report.directly_affected, &report.transitively_affected}) {
    for (const auto& affected : *group) {
      if (affected.severity == Severity::kBreaking) {
        ++report.breaking_count;
      } else if (affected.severity == Severity::kWarning) {
        ++report.warning_count;
      }
    }
  }

  report.summary = ColumnChangeSummary(source_model, changes, report.directly_affected.size(),
                                       report.transitively_affected.size(), report.breaking_count,
                                       report.warning_count);

  span.SetAttribute("simulation.breaking", static_cast<std::int64_t>(report.breaking_count));
  MODELPLAN_LOG_DEBUG("Column change simulated",
                      {StringField("model", source_model),
                       IntField("direct", static_cast<std::int64_t>(report.directly_affected.size())),
                       IntField("transitive", static_cast<std::int64_t>(report.transitively_affected.size())),
                       IntField("breaking", report.breaking_count)});
  return report;
}

ModelRemovalReport ImpactAnalyzer::SimulateModelRemoval(const std::string& model_name) const {
  observability::SpanScope span("simulation.model_removal");
  span.SetAttribute("simulation.source", model_name);

  ModelRemovalReport report;
  report.removed_model = model_name;

  if (!models_.count(model_name)) {
    report.summary = NotFoundSummary(model_name);
    MODELPLAN_LOG_INFO("Removal simulation on unknown model", {StringField("model", model_name)});
    return report;
  }

  try {
    WalkDownstream(model_name, [&](const std::string& name, std::uint32_t depth) {
      // Orphaned when the removed model was its only upstream.
      bool has_other_upstream = false;
      auto upstream           = dag_.find(name);
      if (upstream != dag_.end()) {
        has_other_upstream = std::any_of(upstream->second.begin(), upstream->second.end(),
                                         [&](const std::string& parent) { return parent != model_name; });
      }
      if (!has_other_upstream) {
        report.orphaned_models.push_back(name);
      }

      AffectedModel affected;
      affected.model_name     = name;
      affected.reference_type = depth == 1 ? ReferenceType::kDirect : ReferenceType::kTransitive;
      affected.severity       = Severity::kBreaking;

      auto& bucket = depth == 1 ? report.directly_affected : report.transitively_affected;
      bucket.push_back(std::move(affected));
    });
  } catch (const util::GraphIntegrityError& e) {
    span.RecordException(e.what());
    throw;
  }

  std::sort(report.orphaned_models.begin(), report.orphaned_models.end());
  report.breaking_count = static_cast<int>(report.directly_affected.size() + report.transitively_affected.size());

  report.summary = "Removing '" + model_name + "' would affect " + std::to_string(report.directly_affected.size()) +
                   " direct and " + std::to_string(report.transitively_affected.size()) + " transitive models.";
  if (!report.orphaned_models.empty()) {
    report.summary += " " + std::to_string(report.orphaned_models.size()) +
                      " model(s) would be orphaned: " + JoinNames(report.orphaned_models) + ".";
  }

  span.SetAttribute("simulation.breaking", static_cast<std::int64_t>(report.breaking_count));
  return report;
}

ImpactReport ImpactAnalyzer::SimulateTypeChange(const std::string& source_model, const std::string& column_name,
                                                const std::string& old_type, const std::string& new_type) const {
  ColumnChange change;
  change.action      = ChangeAction::kTypeChange;
  change.column_name = column_name;
  change.old_type    = old_type;
  change.new_type    = new_type;
  return SimulateColumnChange(source_model, {change});
}

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------

std::set<std::string> ChangedColumnNames(const std::vector<ColumnChange>& changes) {
  std::set<std::string> names;
  for (const auto& change : changes) {
    names.insert(ToLower(change.column_name));
    if (change.new_name && !change.new_name->empty()) {
      names.insert(ToLower(*change.new_name));
    }
  }
  return names;
}

Severity ClassifyChangeSeverity(const std::vector<ColumnChange>& changes) {
  auto worst = Severity::kInfo;
  for (const auto& change : changes) {
    auto severity = Severity::kWarning;
    switch (change.action) {
      case ChangeAction::kRemove:
      case ChangeAction::kRename:
        severity = Severity::kBreaking;
        break;
      case ChangeAction::kTypeChange:
        if (change.old_type && change.new_type && !contracts::IsTypeCompatible(*change.old_type, *change.new_type)) {
          severity = Severity::kBreaking;
        }
        break;
      case ChangeAction::kAdd:
        break;
    }
    worst = std::max(worst, severity);
  }
  return worst;
}

} // namespace modelplan::simulation
