#pragma once

#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

enum class OverlapType {
  ExactDuplicate,
  ConflictingDestination,
  Subset,
  Superset,
  PartialOverlap
};

// 3 for exact duplicates down to 0 for partial overlaps.
int severity(OverlapType type);
std::string display_name(OverlapType type);

// How the files matched by a first condition (set) relate to those matched
// by a second one. Subset: the first matches fewer files.
enum class ConditionRelation { None, Identical, Subset, Superset, Partial };

struct Overlap {
  Rule existing_rule;
  OverlapType type = OverlapType::PartialOverlap;
  std::string explanation;
  std::optional<std::string> suggestion;
};

// Warns about rules that duplicate, shadow or contradict each other. Looks
// only at conditions, category scopes and destinations; never at files.
class OverlapDetector {
 public:
  // Overlaps of `candidate` with every enabled rule in `existing` (except
  // `exclude_id`, the rule being edited), most severe first.
  std::vector<Overlap> detect_overlaps(
      const Rule& candidate, const std::vector<Rule>& existing,
      const std::optional<std::string>& exclude_id = std::nullopt) const;

  static ConditionRelation compare_conditions(
      const std::vector<Condition>& first, LogicalOperator first_op,
      const std::vector<Condition>& second, LogicalOperator second_op);

  static ConditionRelation compare_single(const Condition& first,
                                          const Condition& second);

  // Global scopes always may overlap; folder scopes only when one folder
  // lies within the other.
  static bool scopes_could_overlap(const Rule& first, const Rule& second);

  // Trash matches trash, folders match by display path, and two missing
  // destinations match each other.
  static bool destinations_match(const std::optional<Destination>& first,
                                 const std::optional<Destination>& second);

 private:
  std::optional<Overlap> classify_pair(const Rule& candidate,
                                       const Rule& existing) const;
};
