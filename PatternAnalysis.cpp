#include "PatternAnalysis.hpp"

#include <algorithm>
#include <array>
#include <format>

#include "Conditions.hpp"
#include "utils.hpp"

namespace {

std::string text_after_marker(
    std::string_view details,
    const std::array<std::string_view, 3>& markers) {
  // ASCII lower-casing keeps byte offsets aligned with `details`.
  const std::string lowered = string_to_lower_ascii(details);
  for (std::string_view marker : markers) {
    const auto pos = lowered.find(string_to_lower_ascii(marker));
    if (pos != std::string::npos) {
      return trim_whitespace(details.substr(pos + marker.size()));
    }
  }
  return {};
}

}  // namespace

namespace Patterns {

LearnedPattern record_new_occurrence(const LearnedPattern& pattern,
                                     double confidence, TimePoint timestamp,
                                     std::chrono::minutes utc_offset) {
  LearnedPattern updated = pattern;
  updated.occurrence_count += 1;
  updated.confidence_score = std::clamp(confidence, 0.0, 1.0);
  updated.last_seen_date = timestamp;
  updated.temporal_contexts.push_back(
      Conditions::temporal_context_at(timestamp, utc_offset));
  updated.time_category = categorize(updated.temporal_contexts);
  return updated;
}

LearnedPattern convert_to_negative(const LearnedPattern& pattern) {
  LearnedPattern updated = pattern;
  updated.is_negative = true;
  updated.confidence_score = 1.0;
  return updated;
}

LearnedPattern record_rejection(const LearnedPattern& pattern) {
  LearnedPattern updated = pattern;
  updated.rejection_count += 1;
  return updated;
}

LearnedPattern mark_converted(const LearnedPattern& pattern) {
  LearnedPattern updated = pattern;
  updated.converted_to_rule = true;
  return updated;
}

LearnedPattern add_condition(const LearnedPattern& pattern,
                             PatternCondition condition) {
  LearnedPattern updated = pattern;
  if (std::find(updated.conditions.begin(), updated.conditions.end(),
                condition) != updated.conditions.end()) {
    return updated;
  }
  updated.conditions.push_back(std::move(condition));
  if (updated.conditions.size() > 1 &&
      updated.logical_operator == LogicalOperator::Single) {
    updated.logical_operator = LogicalOperator::And;
  }
  return updated;
}

LearnedPattern add_keyword(const LearnedPattern& pattern,
                           std::string_view keyword) {
  LearnedPattern updated = pattern;
  const std::string normalized = string_to_lower_ascii(trim_whitespace(keyword));
  if (normalized.empty()) return updated;
  auto& keywords = updated.extracted_keywords;
  if (std::find(keywords.begin(), keywords.end(), normalized) ==
      keywords.end()) {
    keywords.push_back(normalized);
  }
  return updated;
}

std::string primary_extension(const LearnedPattern& pattern) {
  for (const auto& condition : pattern.conditions) {
    if (const auto* ext = std::get_if<ExtensionEquals>(&condition)) {
      return normalize_extension(ext->extension);
    }
  }
  return normalize_extension(pattern.file_extension);
}

bool should_suppress(const LearnedPattern& negative,
                     const LearnedPattern& positive) {
  if (!negative.is_negative) return false;
  const bool shares_condition = std::any_of(
      negative.conditions.begin(), negative.conditions.end(),
      [&](const PatternCondition& mine) {
        return std::find(positive.conditions.begin(), positive.conditions.end(),
                         mine) != positive.conditions.end();
      });
  return shares_condition &&
         positive.destination_path == negative.destination_path;
}

bool should_suppress(const LearnedPattern& negative,
                     std::string_view extension, std::string_view destination) {
  if (!negative.is_negative) return false;
  return primary_extension(negative) == normalize_extension(extension) &&
         negative.destination_path == destination;
}

TimeCategory categorize(const std::vector<TemporalContext>& contexts) {
  if (contexts.size() < 3) return TimeCategory::AnyTime;

  int work_hours = 0;
  int evenings = 0;
  int mornings = 0;
  int weekends = 0;
  for (const auto& context : contexts) {
    const bool is_weekend =
        context.day_of_week == 1 || context.day_of_week == 7;
    if (is_weekend) {
      ++weekends;
    } else if (context.is_work_hours) {
      ++work_hours;
    } else if (context.hour_of_day >= 18 && context.hour_of_day <= 23) {
      ++evenings;
    } else if (context.hour_of_day >= 5 && context.hour_of_day < 9) {
      ++mornings;
    }
  }

  const int threshold =
      static_cast<int>(static_cast<double>(contexts.size()) * 0.6);
  if (work_hours >= threshold) return TimeCategory::WorkHours;
  if (evenings >= threshold) return TimeCategory::Evenings;
  if (mornings >= threshold) return TimeCategory::Mornings;
  if (weekends >= threshold) return TimeCategory::Weekends;
  return TimeCategory::AnyTime;
}

std::string confidence_level(double score) {
  if (score >= 0.7) return "High";
  if (score >= 0.5) return "Medium";
  return "Low";
}

std::string time_category_name(TimeCategory category) {
  switch (category) {
    case TimeCategory::WorkHours:
      return "Work Hours";
    case TimeCategory::Evenings:
      return "Evenings";
    case TimeCategory::Mornings:
      return "Mornings";
    case TimeCategory::Weekends:
      return "Weekends";
    case TimeCategory::AnyTime:
      break;
  }
  return "Any Time";
}

std::string conditions_description(const LearnedPattern& pattern) {
  if (pattern.conditions.empty()) {
    return std::format(".{} files", pattern.file_extension);
  }
  std::vector<std::string> parts;
  parts.reserve(pattern.conditions.size());
  for (const auto& condition : pattern.conditions) {
    parts.push_back(Conditions::describe(condition));
  }
  const char* joiner =
      pattern.logical_operator == LogicalOperator::Or ? " OR " : " AND ";
  return join_strings(parts, joiner);
}

std::string negative_description(const LearnedPattern& pattern) {
  if (!pattern.is_negative) return pattern.description;
  return std::format("Never move {} to {}", conditions_description(pattern),
                     pattern.destination_path);
}

Rule to_rule(const LearnedPattern& pattern, bool enabled) {
  Rule rule;
  const std::string folder = last_path_component(pattern.destination_path);

  if (pattern.conditions.size() > 1) {
    std::vector<std::string> summary;
    std::vector<std::string> signatures;
    for (const auto& condition : pattern.conditions) {
      if (summary.size() < 2) summary.push_back(Conditions::describe(condition));
      signatures.push_back(Conditions::signature(condition));

      std::visit(
          [&rule](const auto& c) {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, ExtensionEquals>) {
              rule.conditions.push_back(Conditions::extension_equals(c.extension));
            } else if constexpr (std::is_same_v<T, NameContains>) {
              rule.conditions.push_back(Conditions::name_contains(c.text));
            } else if constexpr (std::is_same_v<T, NameStartsWith>) {
              rule.conditions.push_back(Conditions::name_starts_with(c.text));
            } else if constexpr (std::is_same_v<T, NameEndsWith>) {
              rule.conditions.push_back(Conditions::name_ends_with(c.text));
            } else if constexpr (std::is_same_v<T, SizeRange>) {
              rule.conditions.push_back(Conditions::larger_than(c.min_bytes));
            }
            // Rules cannot express time-of-day or weekday conditions.
          },
          condition);
    }
    rule.name = std::format("{} → {}", join_strings(summary, " + "), folder);
    rule.logical_operator = pattern.logical_operator;
    rule.id = std::format("learned:{}:{}", join_strings(signatures, ","),
                          pattern.destination_path);
  } else {
    const std::string ext = normalize_extension(pattern.file_extension);
    rule.name =
        std::format("{} → {}", string_to_upper_ascii(ext), folder);
    rule.conditions.push_back(Conditions::extension_equals(ext));
    rule.logical_operator = LogicalOperator::Single;
    rule.id = std::format("learned:ext:{}:{}", ext, pattern.destination_path);
  }

  rule.action = ActionType::Move;
  rule.destination = Destination::folder(pattern.destination_path);
  rule.is_enabled = enabled;
  rule.creation_date = pattern.last_seen_date;
  return rule;
}

std::string extract_destination(std::string_view details) {
  static constexpr std::array<std::string_view, 3> markers = {
      "Moved to ", "Organized to ", "to "};
  return text_after_marker(details, markers);
}

std::string extract_rejected_destination(std::string_view details) {
  static constexpr std::array<std::string_view, 3> markers = {
      "Skipped suggestion for ", "Rejected ", "Skipped: "};
  return text_after_marker(details, markers);
}

FileItem record_prediction_outcome(FileItem file,
                                   std::string_view predicted_path,
                                   PredictionOutcome outcome) {
  switch (outcome) {
    case PredictionOutcome::Overridden:
    case PredictionOutcome::Dismissed:
      file.rejected_destination = std::string(predicted_path);
      file.rejection_count += 1;
      break;
    case PredictionOutcome::Accepted:
      file.rejection_count = 0;
      file.rejected_destination.reset();
      break;
    case PredictionOutcome::Unknown:
      break;
  }
  return file;
}

}  // namespace Patterns
