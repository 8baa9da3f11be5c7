#include "PatternLearner.hpp"

#include <algorithm>
#include <format>
#include <map>
#include <set>

#include "Conditions.hpp"
#include "IOManager.hpp"
#include "PatternAnalysis.hpp"
#include "utils.hpp"

namespace {

using Group = std::vector<const ActivityRecord*>;

bool is_organization(const ActivityRecord& activity) {
  return activity.type == ActivityType::FileOrganized ||
         activity.type == ActivityType::FileMoved;
}

std::string activity_extension(const ActivityRecord& activity) {
  return normalize_extension(activity.file_extension.value_or(""));
}

template <typename Pred>
std::map<std::string, Group> group_by_extension(
    const std::vector<ActivityRecord>& activities, Pred keep) {
  std::map<std::string, Group> groups;
  for (const auto& activity : activities) {
    if (!keep(activity)) continue;
    std::string ext = activity_extension(activity);
    if (ext.empty()) continue;
    groups[std::move(ext)].push_back(&activity);
  }
  return groups;
}

// Empty keys are dropped: an unparsable detail string yields no pattern.
template <typename KeyFn>
std::map<std::string, Group> group_by(const Group& records, KeyFn key_of) {
  std::map<std::string, Group> groups;
  for (const ActivityRecord* record : records) {
    std::string key = key_of(*record);
    if (key.empty()) continue;
    groups[std::move(key)].push_back(record);
  }
  return groups;
}

std::string destination_of(const ActivityRecord& activity) {
  return Patterns::extract_destination(activity.details);
}

std::string rejected_destination_of(const ActivityRecord& activity) {
  return Patterns::extract_rejected_destination(activity.details);
}

double ratio(size_t part, size_t whole) {
  if (whole == 0) return 0.0;
  return static_cast<double>(part) / static_cast<double>(whole);
}

TimeCategory time_bucket(const TemporalContext& context) {
  const bool weekend = context.day_of_week == 1 || context.day_of_week == 7;
  if (!context.is_work_hours && weekend) return TimeCategory::Weekends;
  if (context.is_work_hours) return TimeCategory::WorkHours;
  if (context.hour_of_day >= 5 && context.hour_of_day < 12) {
    return TimeCategory::Mornings;
  }
  return TimeCategory::Evenings;
}

// "work hours", "evenings", ...
std::string bucket_phrase(TimeCategory category) {
  switch (category) {
    case TimeCategory::WorkHours:
      return "work hours";
    case TimeCategory::Evenings:
      return "evenings";
    case TimeCategory::Mornings:
      return "mornings";
    case TimeCategory::Weekends:
      return "weekends";
    case TimeCategory::AnyTime:
      break;
  }
  return "any time";
}

std::optional<LocationKind> infer_source_location(std::string_view details) {
  const std::string lowered = string_to_lower_ascii(details);
  if (lowered.find("desktop") != std::string::npos) {
    return LocationKind::Desktop;
  }
  if (lowered.find("downloads") != std::string::npos) {
    return LocationKind::Downloads;
  }
  if (lowered.find("documents") != std::string::npos) {
    return LocationKind::Documents;
  }
  if (lowered.find("pictures") != std::string::npos) {
    return LocationKind::Pictures;
  }
  return std::nullopt;
}

std::string pattern_key(const LearnedPattern& pattern) {
  return std::format("{}-{}", pattern.file_extension, pattern.destination_path);
}

std::vector<LearnedPattern> keep_most_specific(
    std::vector<LearnedPattern> patterns) {
  std::stable_sort(patterns.begin(), patterns.end(),
                   [](const LearnedPattern& a, const LearnedPattern& b) {
                     if (a.conditions.size() != b.conditions.size()) {
                       return a.conditions.size() > b.conditions.size();
                     }
                     return a.confidence_score > b.confidence_score;
                   });

  std::vector<LearnedPattern> result;
  std::set<std::string> seen;
  for (auto& pattern : patterns) {
    const std::string key = pattern_key(pattern);

    if (pattern.conditions.size() > 1) {
      std::vector<std::string> signatures;
      for (const auto& condition : pattern.conditions) {
        signatures.push_back(Conditions::signature(condition));
      }
      std::sort(signatures.begin(), signatures.end());
      const std::string full_key =
          std::format("{}-{}", key, join_strings(signatures, ","));
      if (seen.insert(full_key).second) result.push_back(std::move(pattern));
      continue;
    }

    const bool has_more_specific =
        std::any_of(result.begin(), result.end(), [&](const LearnedPattern& kept) {
          return kept.file_extension == pattern.file_extension &&
                 kept.destination_path == pattern.destination_path &&
                 kept.conditions.size() > pattern.conditions.size();
        });
    if (!has_more_specific && seen.insert(key).second) {
      result.push_back(std::move(pattern));
    }
  }
  return result;
}

void sort_by_confidence(std::vector<LearnedPattern>& patterns) {
  std::stable_sort(patterns.begin(), patterns.end(),
                   [](const LearnedPattern& a, const LearnedPattern& b) {
                     return a.confidence_score > b.confidence_score;
                   });
}

}  // namespace

PatternLearner::PatternLearner(LearnerConfig config)
    : m_config(std::move(config)) {}

std::vector<LearnedPattern> PatternLearner::induce_patterns(
    const std::vector<ActivityRecord>& activities) const {
  std::vector<LearnedPattern> all = detect_simple_patterns(activities);

  auto append = [&all](std::vector<LearnedPattern> more) {
    all.insert(all.end(), std::make_move_iterator(more.begin()),
               std::make_move_iterator(more.end()));
  };
  append(detect_multi_condition_patterns(activities));
  append(detect_temporal_patterns(activities));
  append(detect_negative_patterns(activities));

  auto patterns = deduplicate(std::move(all));
  sort_by_confidence(patterns);
  IOManager::log(std::format("Learned {} patterns from {} activity records.",
                             patterns.size(), activities.size()));
  return patterns;
}

std::vector<LearnedPattern> PatternLearner::detect_simple_patterns(
    const std::vector<ActivityRecord>& activities) const {
  std::vector<LearnedPattern> patterns;

  for (const auto& [ext, records] :
       group_by_extension(activities, is_organization)) {
    for (const auto& [destination, hits] : group_by(records, destination_of)) {
      if (hits.size() < static_cast<size_t>(m_config.minimum_occurrences)) {
        continue;
      }
      auto pattern = make_pattern(
          std::format("Move {} files to {}", string_to_upper_ascii(ext),
                      abbreviate_path(destination, m_config.home_directory)),
          ext, destination, hits, ratio(hits.size(), records.size()));
      patterns.push_back(
          Patterns::add_condition(pattern, ExtensionEquals{ext}));
    }
  }
  return patterns;
}

std::vector<LearnedPattern> PatternLearner::detect_multi_condition_patterns(
    const std::vector<ActivityRecord>& activities) const {
  std::vector<LearnedPattern> patterns;
  const auto minimum = static_cast<size_t>(m_config.minimum_occurrences);
  const auto groups = group_by_extension(activities, is_organization);

  // Extension + name prefix
  for (const auto& [ext, records] : groups) {
    for (const auto& prefix : m_config.significant_prefixes) {
      Group matching;
      for (const ActivityRecord* record : records) {
        if (istarts_with(record->file_name, prefix)) matching.push_back(record);
      }
      if (matching.size() < minimum) continue;

      for (const auto& [destination, hits] :
           group_by(matching, destination_of)) {
        if (hits.size() < minimum) continue;
        const double confidence = std::min(
            1.0, ratio(hits.size(), matching.size()) * m_config.prefix_boost);
        auto pattern = make_pattern(
            std::format("Move {} {} files to {}", prefix,
                        string_to_upper_ascii(ext),
                        abbreviate_path(destination, m_config.home_directory)),
            ext, destination, hits, confidence);
        pattern = Patterns::add_condition(pattern, ExtensionEquals{ext});
        pattern = Patterns::add_condition(pattern, NameStartsWith{prefix});
        pattern.logical_operator = LogicalOperator::And;
        pattern.extracted_keywords = {string_to_lower_ascii(prefix)};
        patterns.push_back(std::move(pattern));
      }
    }
  }

  // Extension + purpose keyword
  for (const auto& [ext, records] : groups) {
    for (const auto& keyword : m_config.purpose_keywords) {
      Group matching;
      for (const ActivityRecord* record : records) {
        if (icontains(record->file_name, keyword)) matching.push_back(record);
      }
      if (matching.size() < minimum) continue;

      for (const auto& [destination, hits] :
           group_by(matching, destination_of)) {
        if (hits.size() < minimum) continue;
        const double confidence = std::min(
            1.0, ratio(hits.size(), matching.size()) * m_config.keyword_boost);
        auto pattern = make_pattern(
            std::format("Move {} files containing '{}' to {}",
                        string_to_upper_ascii(ext), keyword,
                        abbreviate_path(destination, m_config.home_directory)),
            ext, destination, hits, confidence);
        pattern = Patterns::add_condition(pattern, ExtensionEquals{ext});
        pattern = Patterns::add_condition(pattern, NameContains{keyword});
        pattern.logical_operator = LogicalOperator::And;
        pattern = Patterns::add_keyword(pattern, keyword);
        patterns.push_back(std::move(pattern));
      }
    }
  }
  return patterns;
}

std::vector<LearnedPattern> PatternLearner::detect_temporal_patterns(
    const std::vector<ActivityRecord>& activities) const {
  std::vector<LearnedPattern> patterns;
  const auto minimum = static_cast<size_t>(m_config.minimum_occurrences);
  const std::chrono::minutes offset{m_config.utc_offset_minutes};

  // Overall destination share per extension, the baseline each time slot is
  // compared against.
  const auto overall = group_by_extension(activities, is_organization);
  std::map<std::string, std::map<std::string, size_t>> overall_counts;
  for (const auto& [ext, records] : overall) {
    for (const ActivityRecord* record : records) {
      overall_counts[ext][destination_of(*record)] += 1;
    }
  }

  std::map<TimeCategory, Group> buckets;
  for (const auto& [ext, records] : overall) {
    for (const ActivityRecord* record : records) {
      const auto context =
          Conditions::temporal_context_at(record->timestamp, offset);
      buckets[time_bucket(context)].push_back(record);
    }
  }

  for (const auto& [category, slot] : buckets) {
    if (slot.size() < minimum) continue;

    std::map<std::string, Group> slot_by_ext;
    for (const ActivityRecord* record : slot) {
      slot_by_ext[activity_extension(*record)].push_back(record);
    }

    for (const auto& [ext, records] : slot_by_ext) {
      const size_t ext_total = overall.at(ext).size();

      for (const auto& [destination, hits] : group_by(records, destination_of)) {
        if (hits.size() < minimum) continue;

        const double overall_ratio =
            ratio(overall_counts.at(ext).at(destination), ext_total);
        const double slot_ratio = ratio(hits.size(), records.size());
        if (!(slot_ratio > overall_ratio * m_config.temporal_ratio_factor)) {
          continue;
        }

        auto pattern = make_pattern(
            std::format("During {}: Move {} files to {}",
                        bucket_phrase(category), string_to_upper_ascii(ext),
                        abbreviate_path(destination, m_config.home_directory)),
            ext, destination, hits, slot_ratio);
        pattern = Patterns::add_condition(pattern, ExtensionEquals{ext});
        pattern.time_category = category;
        for (const ActivityRecord* hit : hits) {
          pattern.temporal_contexts.push_back(
              Conditions::temporal_context_at(hit->timestamp, offset));
        }

        switch (category) {
          case TimeCategory::WorkHours:
            pattern = Patterns::add_condition(pattern, TimeOfDay{9, 17});
            pattern = Patterns::add_condition(pattern,
                                              DayOfWeek{{2, 3, 4, 5, 6}});
            break;
          case TimeCategory::Evenings:
            pattern = Patterns::add_condition(pattern, TimeOfDay{17, 23});
            break;
          case TimeCategory::Mornings:
            pattern = Patterns::add_condition(pattern, TimeOfDay{5, 12});
            break;
          case TimeCategory::Weekends:
            pattern = Patterns::add_condition(pattern, DayOfWeek{{1, 7}});
            break;
          case TimeCategory::AnyTime:
            break;
        }
        patterns.push_back(std::move(pattern));
      }
    }
  }
  return patterns;
}

std::vector<LearnedPattern> PatternLearner::detect_negative_patterns(
    const std::vector<ActivityRecord>& activities) const {
  std::vector<LearnedPattern> patterns;
  const auto minimum = static_cast<size_t>(m_config.minimum_rejections);

  const auto groups = group_by_extension(
      activities, [](const ActivityRecord& activity) {
        return activity.type == ActivityType::FileSkipped;
      });

  for (const auto& [ext, skipped] : groups) {
    if (skipped.size() < minimum) continue;

    for (const auto& [destination, rejections] :
         group_by(skipped, rejected_destination_of)) {
      if (rejections.size() < minimum) continue;

      const double confidence =
          std::min(m_config.negative_confidence_cap,
                   static_cast<double>(rejections.size()) /
                       m_config.negative_confidence_divisor);
      auto pattern = make_pattern(
          std::format("Don't suggest {} for {} files",
                      abbreviate_path(destination, m_config.home_directory),
                      string_to_upper_ascii(ext)),
          ext, destination, rejections, confidence);
      pattern = Patterns::add_condition(pattern, ExtensionEquals{ext});
      pattern.is_negative = true;
      pattern.rejection_count = static_cast<int>(rejections.size());
      patterns.push_back(std::move(pattern));
    }
  }
  return patterns;
}

std::vector<LearnedPattern> PatternLearner::deduplicate(
    std::vector<LearnedPattern> patterns) const {
  std::vector<LearnedPattern> positive;
  std::vector<LearnedPattern> negative;
  for (auto& pattern : patterns) {
    (pattern.is_negative ? negative : positive).push_back(std::move(pattern));
  }

  auto result = keep_most_specific(std::move(positive));
  auto negatives = keep_most_specific(std::move(negative));
  result.insert(result.end(), std::make_move_iterator(negatives.begin()),
                std::make_move_iterator(negatives.end()));
  return result;
}

std::optional<LearnedPattern> PatternLearner::find_matching_pattern(
    const FileItem& file, const std::vector<LearnedPattern>& patterns,
    TimePoint now) const {
  std::vector<const LearnedPattern*> ordered;
  ordered.reserve(patterns.size());
  for (const auto& pattern : patterns) ordered.push_back(&pattern);
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const LearnedPattern* a, const LearnedPattern* b) {
                     return a->confidence_score > b->confidence_score;
                   });

  const std::chrono::minutes offset{m_config.utc_offset_minutes};
  for (const LearnedPattern* pattern : ordered) {
    if (pattern->is_negative) continue;
    if (pattern->rejection_count >= m_config.pattern_rejection_limit) continue;
    if (pattern->conditions.empty()) continue;

    const bool all_match = std::all_of(
        pattern->conditions.begin(), pattern->conditions.end(),
        [&](const PatternCondition& condition) {
          return Conditions::evaluate(condition, file, now, offset);
        });
    if (all_match) return *pattern;
  }
  return std::nullopt;
}

std::vector<LearnedPattern> PatternLearner::filter_with_negative_patterns(
    const std::vector<LearnedPattern>& suggestions,
    const std::vector<LearnedPattern>& negatives) const {
  std::vector<LearnedPattern> kept;
  for (const auto& suggestion : suggestions) {
    const bool suppressed = std::any_of(
        negatives.begin(), negatives.end(), [&](const LearnedPattern& negative) {
          return Patterns::should_suppress(negative, suggestion.file_extension,
                                           suggestion.destination_path);
        });
    if (suppressed) {
      IOManager::log(std::format("Suppressed suggestion '{}' (negative pattern).",
                                 suggestion.description));
      continue;
    }
    kept.push_back(suggestion);
  }
  return kept;
}

std::vector<LearnedPattern> PatternLearner::filter_suggestions(
    const std::vector<LearnedPattern>& suggestions,
    const std::vector<LearnedPattern>& negatives,
    const std::vector<FileItem>& files) const {
  std::vector<LearnedPattern> kept;
  for (auto& suggestion : filter_with_negative_patterns(suggestions, negatives)) {
    const std::string ext = normalize_extension(suggestion.file_extension);
    size_t relevant = 0;
    size_t rejected = 0;
    for (const auto& file : files) {
      if (normalize_extension(file.extension) != ext) continue;
      ++relevant;
      if (file.rejected_destination == suggestion.destination_path &&
          file.rejection_count >= m_config.file_rejection_threshold) {
        ++rejected;
      }
    }
    if (relevant > 0 && ratio(rejected, relevant) > m_config.file_rejection_rate) {
      IOManager::log(std::format(
          "Suppressed suggestion '{}': rejected by {} of {} .{} files.",
          suggestion.description, rejected, relevant, ext));
      continue;
    }
    kept.push_back(std::move(suggestion));
  }
  return kept;
}

std::vector<LearnedPattern> PatternLearner::update_patterns(
    const std::vector<LearnedPattern>& existing,
    const std::vector<ActivityRecord>& activities) const {
  const auto fresh = induce_patterns(activities);
  const std::chrono::minutes offset{m_config.utc_offset_minutes};

  auto same_pair = [](const LearnedPattern& a, const LearnedPattern& b) {
    return a.file_extension == b.file_extension &&
           a.destination_path == b.destination_path;
  };

  std::vector<LearnedPattern> updated;
  updated.reserve(existing.size() + fresh.size());
  for (const auto& pattern : existing) {
    auto match = std::find_if(fresh.begin(), fresh.end(),
                              [&](const LearnedPattern& candidate) {
                                return same_pair(candidate, pattern);
                              });
    if (match != fresh.end()) {
      updated.push_back(Patterns::record_new_occurrence(
          pattern, match->confidence_score, match->last_seen_date, offset));
    } else {
      updated.push_back(pattern);
    }
  }

  for (const auto& candidate : fresh) {
    const bool known = std::any_of(
        existing.begin(), existing.end(),
        [&](const LearnedPattern& pattern) { return same_pair(pattern, candidate); });
    if (!known) updated.push_back(candidate);
  }
  return updated;
}

std::vector<TrainingRecord> PatternLearner::make_training_records(
    const std::vector<ActivityRecord>& activities) const {
  std::vector<TrainingRecord> records;
  for (const auto& activity : activities) {
    if (!is_organization(activity) &&
        activity.type != ActivityType::RuleApplied) {
      continue;
    }

    std::string destination = destination_of(activity);
    if (destination.empty()) continue;

    std::string ext = activity_extension(activity);
    if (ext.empty()) {
      ext = normalize_extension(
          safe_path_to_string(fs::path(activity.file_name).extension()));
    }
    if (ext.empty()) continue;

    const std::string& home = m_config.home_directory;
    if (!home.empty() && destination.starts_with(home)) {
      destination = "~" + destination.substr(home.size());
    }

    records.push_back(TrainingRecord{
        string_to_lower_ascii(trim_whitespace(activity.file_name)),
        std::move(ext), infer_source_location(activity.details),
        std::move(destination), activity.timestamp});
  }
  return records;
}

bool PatternLearner::should_suggest(const LearnedPattern& pattern) const {
  if (pattern.is_negative) return false;
  if (pattern.converted_to_rule) return false;
  if (pattern.rejection_count >= m_config.pattern_rejection_limit) return false;
  return pattern.confidence_score >= m_config.suggestion_threshold;
}

LearnedPattern PatternLearner::make_pattern(
    std::string description, const std::string& ext,
    const std::string& destination, const std::vector<const ActivityRecord*>& hits,
    double confidence) const {
  LearnedPattern pattern;
  pattern.description = std::move(description);
  pattern.file_extension = ext;
  pattern.destination_path = destination;
  pattern.occurrence_count = static_cast<int>(hits.size());
  pattern.confidence_score = std::clamp(confidence, 0.0, 1.0);
  for (const ActivityRecord* hit : hits) {
    pattern.last_seen_date = std::max(pattern.last_seen_date, hit->timestamp);
  }
  return pattern;
}
