#include "OverlapDetector.hpp"

#include <algorithm>
#include <format>

#include "Conditions.hpp"
#include "IOManager.hpp"
#include "utils.hpp"

namespace {

// Pairs of condition kinds without a dedicated comparison: they could match
// the same file, so they are reported as a possible partial overlap.
ConditionRelation assume_partial_overlap() { return ConditionRelation::Partial; }

// Numeric bounds where a larger value matches fewer files.
ConditionRelation compare_bounds(std::int64_t first, std::int64_t second) {
  if (first == second) return ConditionRelation::Identical;
  return first > second ? ConditionRelation::Subset
                        : ConditionRelation::Superset;
}

ConditionRelation invert(ConditionRelation relation) {
  switch (relation) {
    case ConditionRelation::Subset:
      return ConditionRelation::Superset;
    case ConditionRelation::Superset:
      return ConditionRelation::Subset;
    case ConditionRelation::None:
      // Two negations of disjoint sets still share everything else.
      return ConditionRelation::Partial;
    case ConditionRelation::Identical:
    case ConditionRelation::Partial:
      break;
  }
  return relation;
}

// Every condition in `needles` has an equivalent in `haystack`.
bool contains_all(const std::vector<Condition>& haystack,
                  const std::vector<Condition>& needles) {
  return std::all_of(needles.begin(), needles.end(), [&](const Condition& n) {
    return std::any_of(haystack.begin(), haystack.end(),
                       [&](const Condition& h) {
                         return Conditions::equivalent(h, n);
                       });
  });
}

bool same_condition_set(const std::vector<Condition>& first,
                        const std::vector<Condition>& second) {
  return first.size() == second.size() && contains_all(second, first) &&
         contains_all(first, second);
}

std::string condition_value(const Condition& condition) {
  return std::visit(
      [](const auto& c) -> std::string {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, ExtensionEquals>) {
          return c.extension;
        } else if constexpr (std::is_same_v<T, NameStartsWith> ||
                             std::is_same_v<T, NameContains> ||
                             std::is_same_v<T, NameEndsWith>) {
          return c.text;
        } else if constexpr (std::is_same_v<T, OlderThan> ||
                             std::is_same_v<T, ModifiedOlderThan> ||
                             std::is_same_v<T, AccessedOlderThan>) {
          return std::to_string(c.days);
        } else if constexpr (std::is_same_v<T, LargerThan>) {
          return std::to_string(c.bytes);
        } else if constexpr (std::is_same_v<T, KindEquals>) {
          return c.kind;
        } else if constexpr (std::is_same_v<T, FromLocation>) {
          return json(c.location).get<std::string>();
        } else {
          if (!c.inner) return "NOT";
          return "NOT " + condition_value(*c.inner);
        }
      },
      condition.value);
}

// "General/pdf & draft"
std::string rule_label(const Rule& rule) {
  const std::string category = rule.category ? rule.category->name : "General";
  std::vector<std::string> values;
  for (const auto& condition : rule.conditions) {
    values.push_back(condition_value(condition));
  }
  const char* separator =
      rule.logical_operator == LogicalOperator::Or ? " | " : " & ";
  return std::format("{}/{}", category, join_strings(values, separator));
}

}  // namespace

int severity(OverlapType type) {
  switch (type) {
    case OverlapType::ExactDuplicate:
      return 3;
    case OverlapType::ConflictingDestination:
      return 2;
    case OverlapType::Subset:
    case OverlapType::Superset:
      return 1;
    case OverlapType::PartialOverlap:
      break;
  }
  return 0;
}

std::string display_name(OverlapType type) {
  switch (type) {
    case OverlapType::ExactDuplicate:
      return "Exact Duplicate";
    case OverlapType::ConflictingDestination:
      return "Conflicting Destination";
    case OverlapType::Subset:
      return "Subset Rule";
    case OverlapType::Superset:
      return "Broader Rule";
    case OverlapType::PartialOverlap:
      break;
  }
  return "Partial Overlap";
}

std::vector<Overlap> OverlapDetector::detect_overlaps(
    const Rule& candidate, const std::vector<Rule>& existing,
    const std::optional<std::string>& exclude_id) const {
  std::vector<Overlap> overlaps;

  for (const auto& rule : existing) {
    if (exclude_id && rule.id == *exclude_id) continue;
    if (!rule.is_enabled) continue;
    if (!scopes_could_overlap(candidate, rule)) continue;

    if (auto overlap = classify_pair(candidate, rule)) {
      overlaps.push_back(std::move(*overlap));
    }
  }

  std::stable_sort(overlaps.begin(), overlaps.end(),
                   [](const Overlap& a, const Overlap& b) {
                     return severity(a.type) > severity(b.type);
                   });
  if (!overlaps.empty()) {
    IOManager::log(std::format("Rule '{}' overlaps {} existing rule(s).",
                               candidate.id, overlaps.size()));
  }
  return overlaps;
}

ConditionRelation OverlapDetector::compare_conditions(
    const std::vector<Condition>& first, LogicalOperator first_op,
    const std::vector<Condition>& second, LogicalOperator second_op) {
  if (first.empty() || second.empty()) return ConditionRelation::None;

  if (first.size() == 1 && second.size() == 1) {
    return compare_single(first.front(), second.front());
  }

  if (same_condition_set(first, second)) return ConditionRelation::Identical;

  // Containment between condition sets. Adding a condition to an AND set
  // narrows it; adding one to an OR set widens it. A lone condition reads
  // either way.
  const bool first_all = first.size() == 1 || first_op != LogicalOperator::Or;
  const bool second_all = second.size() == 1 || second_op != LogicalOperator::Or;
  const bool first_any = first.size() == 1 || first_op == LogicalOperator::Or;
  const bool second_any = second.size() == 1 || second_op == LogicalOperator::Or;
  const bool first_in_second =
      first.size() < second.size() && contains_all(second, first);
  const bool second_in_first =
      second.size() < first.size() && contains_all(first, second);

  if (first_all && second_all) {
    if (first_in_second) return ConditionRelation::Superset;
    if (second_in_first) return ConditionRelation::Subset;
  }
  if (first_any && second_any) {
    if (first_in_second) return ConditionRelation::Subset;
    if (second_in_first) return ConditionRelation::Superset;
  }

  for (const auto& a : first) {
    for (const auto& b : second) {
      if (compare_single(a, b) != ConditionRelation::None) {
        return ConditionRelation::Partial;
      }
    }
  }
  return ConditionRelation::None;
}

ConditionRelation OverlapDetector::compare_single(const Condition& first,
                                                  const Condition& second) {
  return std::visit(
      [](const auto& a, const auto& b) -> ConditionRelation {
        using A = std::decay_t<decltype(a)>;
        using B = std::decay_t<decltype(b)>;

        if constexpr (!std::is_same_v<A, B>) {
          return assume_partial_overlap();
        } else if constexpr (std::is_same_v<A, ExtensionEquals>) {
          return normalize_extension(a.extension) ==
                         normalize_extension(b.extension)
                     ? ConditionRelation::Identical
                     : ConditionRelation::None;
        } else if constexpr (std::is_same_v<A, NameContains>) {
          const auto x = string_to_lower_ascii(a.text);
          const auto y = string_to_lower_ascii(b.text);
          if (x == y) return ConditionRelation::Identical;
          if (x.find(y) != std::string::npos) return ConditionRelation::Subset;
          if (y.find(x) != std::string::npos) return ConditionRelation::Superset;
          // Both fragments may still appear in one name.
          return ConditionRelation::Partial;
        } else if constexpr (std::is_same_v<A, NameStartsWith>) {
          const auto x = string_to_lower_ascii(a.text);
          const auto y = string_to_lower_ascii(b.text);
          if (x == y) return ConditionRelation::Identical;
          if (x.starts_with(y)) return ConditionRelation::Subset;
          if (y.starts_with(x)) return ConditionRelation::Superset;
          return ConditionRelation::None;
        } else if constexpr (std::is_same_v<A, NameEndsWith>) {
          const auto x = string_to_lower_ascii(a.text);
          const auto y = string_to_lower_ascii(b.text);
          if (x == y) return ConditionRelation::Identical;
          if (x.ends_with(y)) return ConditionRelation::Subset;
          if (y.ends_with(x)) return ConditionRelation::Superset;
          return ConditionRelation::None;
        } else if constexpr (std::is_same_v<A, OlderThan>) {
          const auto x = normalize_extension(a.extension.value_or(""));
          const auto y = normalize_extension(b.extension.value_or(""));
          if (x == y) return compare_bounds(a.days, b.days);
          if (!x.empty() && !y.empty()) return ConditionRelation::None;
          return ConditionRelation::Partial;
        } else if constexpr (std::is_same_v<A, ModifiedOlderThan> ||
                             std::is_same_v<A, AccessedOlderThan>) {
          return compare_bounds(a.days, b.days);
        } else if constexpr (std::is_same_v<A, LargerThan>) {
          return compare_bounds(a.bytes, b.bytes);
        } else if constexpr (std::is_same_v<A, KindEquals>) {
          return Conditions::equivalent(Condition{a}, Condition{b})
                     ? ConditionRelation::Identical
                     : ConditionRelation::None;
        } else if constexpr (std::is_same_v<A, FromLocation>) {
          return a.location == b.location ? ConditionRelation::Identical
                                          : ConditionRelation::None;
        } else {
          if (!a.inner || !b.inner) return assume_partial_overlap();
          return invert(compare_single(*a.inner, *b.inner));
        }
      },
      first.value, second.value);
}

bool OverlapDetector::scopes_could_overlap(const Rule& first,
                                           const Rule& second) {
  if (!first.category || first.category->scope.is_global()) return true;
  if (!second.category || second.category->scope.is_global()) return true;

  for (const auto& a : first.category->scope.folders) {
    for (const auto& b : second.category->scope.folders) {
      if (is_path_within(fs::path(a), fs::path(b)) ||
          is_path_within(fs::path(b), fs::path(a))) {
        return true;
      }
    }
  }
  return false;
}

bool OverlapDetector::destinations_match(
    const std::optional<Destination>& first,
    const std::optional<Destination>& second) {
  if (!first || !second) return !first && !second;
  if (first->is_trash() || second->is_trash()) {
    return first->is_trash() && second->is_trash();
  }
  return first->display_path == second->display_path;
}

std::optional<Overlap> OverlapDetector::classify_pair(
    const Rule& candidate, const Rule& existing) const {
  const ConditionRelation relation =
      compare_conditions(candidate.conditions, candidate.logical_operator,
                         existing.conditions, existing.logical_operator);
  if (relation == ConditionRelation::None) return std::nullopt;

  const bool same_destination =
      destinations_match(candidate.destination, existing.destination);
  const std::string label = rule_label(existing);

  Overlap overlap;
  overlap.existing_rule = existing;

  switch (relation) {
    case ConditionRelation::Identical:
      if (same_destination) {
        overlap.type = OverlapType::ExactDuplicate;
        overlap.explanation = std::format(
            "This rule has identical conditions and destination as '{}'.",
            label);
        overlap.suggestion = "Consider deleting one of these rules.";
      } else {
        overlap.type = OverlapType::ConflictingDestination;
        overlap.explanation = std::format(
            "This rule matches the same files as '{}' but sends them to a "
            "different location.",
            label);
        overlap.suggestion =
            "The higher-priority rule will take precedence. Adjust rule order "
            "if needed.";
      }
      break;
    case ConditionRelation::Subset:
      overlap.type = OverlapType::Subset;
      overlap.explanation = std::format(
          "This rule is more specific than '{}'. Files matching your rule "
          "would also match the existing rule.",
          label);
      if (!same_destination) {
        overlap.suggestion =
            "Ensure your rule has higher priority if you want it to take "
            "precedence.";
      }
      break;
    case ConditionRelation::Superset:
      overlap.type = OverlapType::Superset;
      overlap.explanation = std::format(
          "This rule is broader than '{}'. It may match files the existing "
          "rule was meant to handle.",
          label);
      overlap.suggestion =
          "Consider making conditions more specific to avoid unexpected "
          "matches.";
      break;
    case ConditionRelation::Partial:
      // Sending shared files to the same place is harmless.
      if (same_destination) return std::nullopt;
      overlap.type = OverlapType::PartialOverlap;
      overlap.explanation = std::format(
          "This rule may match some of the same files as '{}'.", label);
      break;
    case ConditionRelation::None:
      return std::nullopt;
  }
  return overlap;
}
