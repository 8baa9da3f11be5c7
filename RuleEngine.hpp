#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "DestinationResolver.hpp"
#include "types.hpp"

// Decides, per file, which rule applies and where the file should go.
//
// Rules are tried in list order and the first enabled, in-scope, matching
// rule with a usable destination wins. Placeholder destinations are resolved
// through the injected resolver and cached by display path for the lifetime
// of the engine (or until clear_cache()). The cache is not synchronized: use
// one engine per thread.
class RuleEngine {
 public:
  explicit RuleEngine(const DestinationResolver& resolver);

  // Returns the file with either every decision field populated
  // (status == Ready) or every decision field cleared (status == Pending).
  FileItem classify(FileItem file, const std::vector<Rule>& rules);

  std::vector<FileItem> classify_batch(const std::vector<FileItem>& files,
                                       const std::vector<Rule>& rules);

  // The match predicate alone: enabled, in scope, primary conditions pass and
  // no exclusion vetoes. Does not look at the destination.
  bool file_matches_rule(const FileItem& file, const Rule& rule) const;

  // Resolves a placeholder through the cache and the resolver. Trash and
  // already-resolved destinations are returned unchanged.
  std::optional<Destination> resolve_destination(const Destination& destination);

  void clear_cache();

  static double confidence_for(const Rule& rule);
  static std::string match_reason_for(const Rule& rule);

 private:
  bool matches(const FileItem& file, const Rule& rule, TimePoint now) const;
  bool is_file_in_category_scope(const FileItem& file, const Rule& rule) const;
  bool matches_primary_conditions(const FileItem& file, const Rule& rule,
                                  TimePoint now) const;

  const DestinationResolver& m_resolver;
  std::unordered_map<std::string, Destination> m_resolved_cache;
};

// Orders rules by sort_order, then creation date; stable for full ties.
void sort_rules_by_priority(std::vector<Rule>& rules);

// Writes a decision into the file's decision fields.
FileItem apply_classification(FileItem file, const Classification& decision);

// Clears every decision field and marks the file pending.
FileItem clear_classification(FileItem file);
