#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "types.hpp"

// Construction, evaluation and description of rule and pattern conditions.
namespace Conditions {

Condition extension_equals(std::string extension);
Condition name_starts_with(std::string text);
Condition name_contains(std::string text);
Condition name_ends_with(std::string text);
Condition older_than(int days,
                     std::optional<std::string> extension = std::nullopt);
Condition modified_older_than(int days);
Condition accessed_older_than(int days);
Condition larger_than(std::int64_t bytes);
Condition kind_equals(std::string kind);
Condition from_location(LocationKind location);
Condition negated(Condition inner);

// Evaluates a rule condition. Never throws: a non-positive day count is
// logged and treated as a non-match.
bool evaluate(const Condition& condition, const FileItem& file, TimePoint now);

// Evaluates a learned-pattern condition. Time conditions use `now`, shifted
// by `utc_offset`.
bool evaluate(const PatternCondition& condition, const FileItem& file,
              TimePoint now,
              std::chrono::minutes utc_offset = std::chrono::minutes{0});

// Whether `extension` belongs to the semantic kind (image, audio, video,
// document, spreadsheet, presentation, archive, code). Plural kind names are
// accepted. Unknown kinds and extensions never match.
bool matches_kind(std::string_view extension, std::string_view kind);

// Case-insensitive structural equality.
bool equivalent(const Condition& a, const Condition& b);

std::string describe(const Condition& condition);
std::string describe(const PatternCondition& condition);

// Stable textual key used when de-duplicating learned patterns.
std::string signature(const PatternCondition& condition);

TemporalContext temporal_context_at(
    TimePoint t, std::chrono::minutes utc_offset = std::chrono::minutes{0});

}  // namespace Conditions
