#include "RuleEngine.hpp"

#include <algorithm>
#include <format>

#include "Conditions.hpp"
#include "IOManager.hpp"
#include "utils.hpp"

RuleEngine::RuleEngine(const DestinationResolver& resolver)
    : m_resolver(resolver) {}

FileItem RuleEngine::classify(FileItem file, const std::vector<Rule>& rules) {
  const TimePoint now = Clock::now();

  for (const auto& rule : rules) {
    if (!matches(file, rule, now)) continue;

    Destination destination;
    if (rule.action == ActionType::Delete) {
      destination = Destination::trash();
    } else if (!rule.destination) {
      IOManager::log(std::format(
          "Warning: Rule '{}' matched '{}' but has no destination configured, "
          "skipping.",
          rule.id, file.name));
      continue;
    } else if (auto resolved = resolve_destination(*rule.destination)) {
      destination = std::move(*resolved);
    } else {
      IOManager::log(std::format(
          "Warning: Rule '{}' matched '{}' but its destination '{}' could not "
          "be resolved, trying the next rule.",
          rule.id, file.name, rule.destination->display_path));
      continue;
    }

    return apply_classification(
        std::move(file),
        Classification{std::move(destination), confidence_for(rule),
                       match_reason_for(rule), rule.id,
                       SuggestionSource::Rule});
  }

  return clear_classification(std::move(file));
}

std::vector<FileItem> RuleEngine::classify_batch(
    const std::vector<FileItem>& files, const std::vector<Rule>& rules) {
  std::vector<FileItem> result;
  result.reserve(files.size());
  for (const auto& file : files) {
    result.push_back(classify(file, rules));
  }
  IOManager::log(std::format("Classified {} files against {} rules.",
                             files.size(), rules.size()));
  return result;
}

bool RuleEngine::file_matches_rule(const FileItem& file,
                                   const Rule& rule) const {
  return matches(file, rule, Clock::now());
}

std::optional<Destination> RuleEngine::resolve_destination(
    const Destination& destination) {
  if (!destination.needs_resolution()) return destination;

  const std::string& key = destination.display_path;
  if (auto it = m_resolved_cache.find(key); it != m_resolved_cache.end()) {
    return it->second;
  }

  auto resolved = m_resolver.resolve(destination);
  if (!resolved || resolved->needs_resolution()) return std::nullopt;

  IOManager::log(std::format("Resolved placeholder destination '{}'.", key));
  m_resolved_cache.emplace(key, *resolved);
  return resolved;
}

void RuleEngine::clear_cache() { m_resolved_cache.clear(); }

double RuleEngine::confidence_for(const Rule& rule) {
  if (rule.conditions.size() > 1) return 0.9;
  if (rule.conditions.empty()) return 0.5;

  switch (kind_of(rule.conditions.front())) {
    case ConditionKind::ExtensionEquals:
      return 0.5;
    case ConditionKind::NameStartsWith:
    case ConditionKind::NameContains:
    case ConditionKind::NameEndsWith:
    case ConditionKind::OlderThan:
    case ConditionKind::ModifiedOlderThan:
    case ConditionKind::AccessedOlderThan:
    case ConditionKind::LargerThan:
      return 0.7;
    case ConditionKind::KindEquals:
      return 0.6;
    case ConditionKind::FromLocation:
      return 0.8;
    case ConditionKind::Negated:
      break;
  }
  // A lone negation is scored like a contextual condition.
  return 0.7;
}

std::string RuleEngine::match_reason_for(const Rule& rule) {
  if (rule.conditions.empty()) return "Matches rule condition";

  std::vector<std::string> descriptions;
  descriptions.reserve(rule.conditions.size());
  for (const auto& condition : rule.conditions) {
    descriptions.push_back(Conditions::describe(condition));
  }
  const char* joiner =
      rule.logical_operator == LogicalOperator::Or ? " OR " : " AND ";
  std::string reason = join_strings(descriptions, joiner);
  if (!reason.empty() && reason[0] >= 'a' && reason[0] <= 'z') {
    reason[0] = static_cast<char>(reason[0] - ('a' - 'A'));
  }
  return reason;
}

bool RuleEngine::matches(const FileItem& file, const Rule& rule,
                         TimePoint now) const {
  if (!rule.is_enabled) return false;
  if (!is_file_in_category_scope(file, rule)) return false;
  if (!matches_primary_conditions(file, rule, now)) return false;

  const bool excluded = std::any_of(
      rule.exclusions.begin(), rule.exclusions.end(),
      [&](const Condition& c) { return Conditions::evaluate(c, file, now); });
  if (excluded) {
    IOManager::log(std::format(
        "File '{}' excluded from rule '{}' by exclusion condition.", file.name,
        rule.id));
    return false;
  }
  return true;
}

bool RuleEngine::is_file_in_category_scope(const FileItem& file,
                                           const Rule& rule) const {
  if (!rule.category) return true;

  const Category& category = *rule.category;
  if (!category.is_enabled) {
    IOManager::log(std::format("Skipping rule '{}': category '{}' is disabled.",
                               rule.id, category.name));
    return false;
  }
  if (category.scope.is_global()) return true;

  const bool in_scope = std::any_of(
      category.scope.folders.begin(), category.scope.folders.end(),
      [&](const std::string& folder) {
        return is_path_within(fs::path(file.path), fs::path(folder));
      });
  if (!in_scope) {
    IOManager::log(std::format("File '{}' not in scope for category '{}'.",
                               file.name, category.name));
  }
  return in_scope;
}

bool RuleEngine::matches_primary_conditions(const FileItem& file,
                                            const Rule& rule,
                                            TimePoint now) const {
  const auto& conditions = rule.conditions;
  if (conditions.empty()) return false;

  auto holds = [&](const Condition& c) {
    return Conditions::evaluate(c, file, now);
  };
  switch (rule.logical_operator) {
    case LogicalOperator::And:
      return std::all_of(conditions.begin(), conditions.end(), holds);
    case LogicalOperator::Or:
      return std::any_of(conditions.begin(), conditions.end(), holds);
    case LogicalOperator::Single:
      break;
  }
  return holds(conditions.front());
}

void sort_rules_by_priority(std::vector<Rule>& rules) {
  std::stable_sort(rules.begin(), rules.end(),
                   [](const Rule& a, const Rule& b) {
                     if (a.sort_order != b.sort_order) {
                       return a.sort_order < b.sort_order;
                     }
                     return a.creation_date < b.creation_date;
                   });
}

FileItem apply_classification(FileItem file, const Classification& decision) {
  file.destination = decision.destination;
  file.status = FileStatus::Ready;
  file.match_reason = decision.explanation;
  file.confidence_score = decision.confidence;
  file.matched_rule_id = decision.rule_id;
  file.suggestion_source = decision.source;
  return file;
}

FileItem clear_classification(FileItem file) {
  file.destination.reset();
  file.status = FileStatus::Pending;
  file.match_reason.reset();
  file.confidence_score.reset();
  file.matched_rule_id.reset();
  file.suggestion_source.reset();
  return file;
}
