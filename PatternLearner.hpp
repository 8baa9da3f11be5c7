#pragma once

#include <optional>
#include <vector>

#include "types.hpp"

// Mines an activity history for recurring (file, destination) behaviour and
// turns it into learned patterns. Holds only its configuration, so one
// instance may be shared between threads.
class PatternLearner {
 public:
  explicit PatternLearner(LearnerConfig config = {});

  // Runs the simple, multi-condition, temporal and negative passes,
  // de-duplicates the result and orders it by confidence (stable, so equal
  // inputs give identical output).
  std::vector<LearnedPattern> induce_patterns(
      const std::vector<ActivityRecord>& activities) const;

  std::vector<LearnedPattern> detect_simple_patterns(
      const std::vector<ActivityRecord>& activities) const;
  std::vector<LearnedPattern> detect_multi_condition_patterns(
      const std::vector<ActivityRecord>& activities) const;
  std::vector<LearnedPattern> detect_temporal_patterns(
      const std::vector<ActivityRecord>& activities) const;
  std::vector<LearnedPattern> detect_negative_patterns(
      const std::vector<ActivityRecord>& activities) const;

  // More specific patterns win over simpler ones for the same
  // (extension, destination). Positive and negative patterns are
  // de-duplicated separately.
  std::vector<LearnedPattern> deduplicate(
      std::vector<LearnedPattern> patterns) const;

  // Highest-confidence positive pattern whose every condition holds for the
  // file at `now`. Patterns without conditions never match.
  std::optional<LearnedPattern> find_matching_pattern(
      const FileItem& file, const std::vector<LearnedPattern>& patterns,
      TimePoint now) const;

  std::vector<LearnedPattern> filter_with_negative_patterns(
      const std::vector<LearnedPattern>& suggestions,
      const std::vector<LearnedPattern>& negatives) const;

  // Negative-pattern filtering, then drops a suggestion when more than the
  // configured share of files with its extension rejected its destination
  // at least the configured number of times.
  std::vector<LearnedPattern> filter_suggestions(
      const std::vector<LearnedPattern>& suggestions,
      const std::vector<LearnedPattern>& negatives,
      const std::vector<FileItem>& files) const;

  // Re-induces from `activities`. Existing patterns that were detected again
  // record a new occurrence; newly detected ones are appended.
  std::vector<LearnedPattern> update_patterns(
      const std::vector<LearnedPattern>& existing,
      const std::vector<ActivityRecord>& activities) const;

  std::vector<TrainingRecord> make_training_records(
      const std::vector<ActivityRecord>& activities) const;

  bool should_suggest(const LearnedPattern& pattern) const;

  const LearnerConfig& config() const { return m_config; }

 private:
  LearnedPattern make_pattern(std::string description, const std::string& ext,
                              const std::string& destination,
                              const std::vector<const ActivityRecord*>& hits,
                              double confidence) const;

  LearnerConfig m_config;
};
