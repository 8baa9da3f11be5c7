#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

// Value-level operations on learned patterns. Every "mutation" returns a new
// pattern and leaves its argument untouched.
namespace Patterns {

// Bumps the occurrence count, replaces the confidence (clamped to [0, 1]),
// records the temporal context of `timestamp` and re-derives the time
// category.
LearnedPattern record_new_occurrence(
    const LearnedPattern& pattern, double confidence, TimePoint timestamp,
    std::chrono::minutes utc_offset = std::chrono::minutes{0});

// Turns the pattern into a suppression signal with full confidence.
LearnedPattern convert_to_negative(const LearnedPattern& pattern);

LearnedPattern record_rejection(const LearnedPattern& pattern);
LearnedPattern mark_converted(const LearnedPattern& pattern);

// Appends the condition unless already present. A second condition upgrades a
// single-condition pattern to an AND pattern.
LearnedPattern add_condition(const LearnedPattern& pattern,
                             PatternCondition condition);

// Lower-cased, trimmed, ignored when empty or already known.
LearnedPattern add_keyword(const LearnedPattern& pattern,
                           std::string_view keyword);

// The extension of the first extension condition, or the pattern's own
// extension when it carries none.
std::string primary_extension(const LearnedPattern& pattern);

// A negative pattern suppresses a positive one when they share a condition
// and point at the same destination.
bool should_suppress(const LearnedPattern& negative,
                     const LearnedPattern& positive);
bool should_suppress(const LearnedPattern& negative,
                     std::string_view extension, std::string_view destination);

// Needs at least 3 contexts, one bucket holding 60% of them. Buckets are
// checked in the order work hours, evenings, mornings, weekends.
TimeCategory categorize(const std::vector<TemporalContext>& contexts);

// "High" (>= 0.7), "Medium" (>= 0.5) or "Low".
std::string confidence_level(double score);

std::string time_category_name(TimeCategory category);

std::string conditions_description(const LearnedPattern& pattern);
std::string negative_description(const LearnedPattern& pattern);

// Rule built from the pattern. Conditions and combinator are copied; size
// ranges become "larger than" their lower bound and time conditions are
// dropped. The destination is an unresolved placeholder.
Rule to_rule(const LearnedPattern& pattern, bool enabled = false);

// Text after the first destination marker ("Moved to ", "Organized to ",
// "to "), matched case-insensitively. Empty when there is none.
std::string extract_destination(std::string_view details);

// Same, for skip records ("Skipped suggestion for ", "Rejected ",
// "Skipped: ").
std::string extract_rejected_destination(std::string_view details);

// Overridden and dismissed predictions count as a rejection of
// `predicted_path`; an accepted one resets the file's rejection history.
FileItem record_prediction_outcome(FileItem file, std::string_view predicted_path,
                                   PredictionOutcome outcome);

}  // namespace Patterns
