#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Timestamps travel through JSON as whole seconds since the Unix epoch.
namespace nlohmann {
template <>
struct adl_serializer<TimePoint> {
  static void to_json(json& j, const TimePoint& t) {
    j = std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch())
            .count();
  }
  static void from_json(const json& j, TimePoint& t) {
    constexpr auto limit = std::chrono::duration_cast<std::chrono::seconds>(
                               TimePoint::duration::max())
                               .count();
    const auto seconds = j.get<std::int64_t>();
    if (seconds > limit || seconds < -limit) {
      throw std::invalid_argument("Timestamp out of range: " +
                                  std::to_string(seconds));
    }
    t = TimePoint(std::chrono::seconds(seconds));
  }
};
}  // namespace nlohmann

// ---------------------------------------------------------------------------
// Conditions
// ---------------------------------------------------------------------------

enum class LocationKind {
  Home,
  Desktop,
  Downloads,
  Documents,
  Pictures,
  Music,
  Custom,
  Unknown
};
NLOHMANN_JSON_SERIALIZE_ENUM(LocationKind,
                             {{LocationKind::Unknown, "unknown"},
                              {LocationKind::Home, "home"},
                              {LocationKind::Desktop, "desktop"},
                              {LocationKind::Downloads, "downloads"},
                              {LocationKind::Documents, "documents"},
                              {LocationKind::Pictures, "pictures"},
                              {LocationKind::Music, "music"},
                              {LocationKind::Custom, "custom"}});

struct ExtensionEquals {
  std::string extension;
  bool operator==(const ExtensionEquals&) const = default;
};

struct NameStartsWith {
  std::string text;
  bool operator==(const NameStartsWith&) const = default;
};

struct NameContains {
  std::string text;
  bool operator==(const NameContains&) const = default;
};

struct NameEndsWith {
  std::string text;
  bool operator==(const NameEndsWith&) const = default;
};

// Creation date strictly earlier than now - days. When an extension filter is
// set the file extension must also match it.
struct OlderThan {
  int days = 0;
  std::optional<std::string> extension;
  bool operator==(const OlderThan&) const = default;
};

struct ModifiedOlderThan {
  int days = 0;
  bool operator==(const ModifiedOlderThan&) const = default;
};

struct AccessedOlderThan {
  int days = 0;
  bool operator==(const AccessedOlderThan&) const = default;
};

struct LargerThan {
  std::int64_t bytes = 0;
  bool operator==(const LargerThan&) const = default;
};

struct KindEquals {
  std::string kind;
  bool operator==(const KindEquals&) const = default;
};

struct FromLocation {
  LocationKind location = LocationKind::Unknown;
  bool operator==(const FromLocation&) const = default;
};

struct Condition;

struct Negated {
  std::shared_ptr<const Condition> inner;
  bool operator==(const Negated& other) const;
};

// The alternatives are listed in ConditionKind order.
struct Condition {
  using Variant =
      std::variant<ExtensionEquals, NameStartsWith, NameContains, NameEndsWith,
                   OlderThan, ModifiedOlderThan, AccessedOlderThan, LargerThan,
                   KindEquals, FromLocation, Negated>;

  Variant value;

  bool operator==(const Condition&) const = default;
};

enum class ConditionKind {
  ExtensionEquals,
  NameStartsWith,
  NameContains,
  NameEndsWith,
  OlderThan,
  ModifiedOlderThan,
  AccessedOlderThan,
  LargerThan,
  KindEquals,
  FromLocation,
  Negated
};

inline bool Negated::operator==(const Negated& other) const {
  if (!inner || !other.inner) return inner == other.inner;
  return *inner == *other.inner;
}

inline ConditionKind kind_of(const Condition& c) {
  static_assert(std::variant_size_v<Condition::Variant> == 11);
  return static_cast<ConditionKind>(c.value.index());
}

// Conditions a learned pattern may carry. Time conditions are checked against
// the evaluation instant, not against file timestamps.
struct SizeRange {
  std::int64_t min_bytes = 0;
  std::int64_t max_bytes = 0;
  bool operator==(const SizeRange&) const = default;
};

struct TimeOfDay {
  int start_hour = 0;
  int end_hour = 0;
  bool operator==(const TimeOfDay&) const = default;
};

// 1 = Sunday ... 7 = Saturday
struct DayOfWeek {
  std::vector<int> days;
  bool operator==(const DayOfWeek&) const = default;
};

using PatternCondition =
    std::variant<ExtensionEquals, NameContains, NameStartsWith, NameEndsWith,
                 SizeRange, TimeOfDay, DayOfWeek>;

// ---------------------------------------------------------------------------
// Destinations, categories and rules
// ---------------------------------------------------------------------------

struct Unresolved {
  bool operator==(const Unresolved&) const = default;
};

struct Resolved {
  std::string token;
  bool operator==(const Resolved&) const = default;
};

using ResolutionState = std::variant<Unresolved, Resolved>;

struct Destination {
  enum class Kind { Trash, Folder };

  Kind kind = Kind::Trash;
  ResolutionState state;
  std::string display_path;

  static Destination trash() { return Destination{}; }

  static Destination folder(std::string display_path) {
    return Destination{Kind::Folder, Unresolved{}, std::move(display_path)};
  }

  static Destination resolved_folder(std::string display_path,
                                     std::string token) {
    return Destination{Kind::Folder, Resolved{std::move(token)},
                       std::move(display_path)};
  }

  bool is_trash() const { return kind == Kind::Trash; }

  bool needs_resolution() const {
    return kind == Kind::Folder && std::holds_alternative<Unresolved>(state);
  }

  std::optional<std::string> token() const {
    if (const auto* r = std::get_if<Resolved>(&state)) return r->token;
    return std::nullopt;
  }

  bool operator==(const Destination&) const = default;
};

struct CategoryScope {
  enum class Kind { Global, Folders };

  Kind kind = Kind::Global;
  std::vector<std::string> folders;

  bool is_global() const { return kind == Kind::Global; }

  bool operator==(const CategoryScope&) const = default;
};

struct Category {
  std::string id;
  std::string name;
  bool is_enabled = true;
  CategoryScope scope;
};

enum class LogicalOperator { Single, And, Or };
NLOHMANN_JSON_SERIALIZE_ENUM(LogicalOperator,
                             {{LogicalOperator::Single, "single"},
                              {LogicalOperator::And, "and"},
                              {LogicalOperator::Or, "or"}});

enum class ActionType { Move, Copy, Delete };
NLOHMANN_JSON_SERIALIZE_ENUM(ActionType, {{ActionType::Move, "move"},
                                          {ActionType::Copy, "copy"},
                                          {ActionType::Delete, "delete"}});

struct Rule {
  std::string id;
  std::string name;
  std::vector<Condition> conditions;
  LogicalOperator logical_operator = LogicalOperator::Single;
  std::vector<Condition> exclusions;
  ActionType action = ActionType::Move;
  std::optional<Destination> destination;
  std::shared_ptr<const Category> category;
  bool is_enabled = true;
  int sort_order = 0;
  TimePoint creation_date{};
};

// ---------------------------------------------------------------------------
// Files and classifications
// ---------------------------------------------------------------------------

enum class FileStatus { Pending, Ready, Completed, Skipped };
NLOHMANN_JSON_SERIALIZE_ENUM(FileStatus, {{FileStatus::Pending, "pending"},
                                          {FileStatus::Ready, "ready"},
                                          {FileStatus::Completed, "completed"},
                                          {FileStatus::Skipped, "skipped"}});

enum class SuggestionSource { Rule, Pattern, Prediction };
NLOHMANN_JSON_SERIALIZE_ENUM(SuggestionSource,
                             {{SuggestionSource::Rule, "rule"},
                              {SuggestionSource::Pattern, "pattern"},
                              {SuggestionSource::Prediction, "prediction"}});

struct FileItem {
  std::string name;
  std::string path;
  std::string extension;
  TimePoint creation_date{};
  TimePoint modification_date{};
  TimePoint last_accessed_date{};
  std::int64_t size_in_bytes = 0;
  LocationKind location = LocationKind::Unknown;

  // Decision outputs, written only by the classification step.
  std::optional<Destination> destination;
  FileStatus status = FileStatus::Pending;
  std::optional<std::string> match_reason;
  std::optional<double> confidence_score;
  std::optional<std::string> matched_rule_id;
  std::optional<SuggestionSource> suggestion_source;

  std::optional<std::string> rejected_destination;
  int rejection_count = 0;
};

// A destination decision from any source: the rule engine, a learned pattern
// or an external predictor.
struct Classification {
  Destination destination;
  double confidence = 0.0;
  std::string explanation;
  std::optional<std::string> rule_id;
  SuggestionSource source = SuggestionSource::Prediction;
};

// ---------------------------------------------------------------------------
// Activity history and learned patterns
// ---------------------------------------------------------------------------

enum class ActivityType {
  FileScanned,
  FileOrganized,
  FileMoved,
  FileSkipped,
  FileDeleted,
  OperationFailed,
  RuleCreated,
  RuleApplied,
  RuleDeleted,
  RuleUpdated,
  PatternLearned,
  PatternApplied,
  AiSuggestionAccepted,
  AiSuggestionRejected
};
NLOHMANN_JSON_SERIALIZE_ENUM(
    ActivityType,
    {{ActivityType::FileScanned, "fileScanned"},
     {ActivityType::FileOrganized, "fileOrganized"},
     {ActivityType::FileMoved, "fileMoved"},
     {ActivityType::FileSkipped, "fileSkipped"},
     {ActivityType::FileDeleted, "fileDeleted"},
     {ActivityType::OperationFailed, "operationFailed"},
     {ActivityType::RuleCreated, "ruleCreated"},
     {ActivityType::RuleApplied, "ruleApplied"},
     {ActivityType::RuleDeleted, "ruleDeleted"},
     {ActivityType::RuleUpdated, "ruleUpdated"},
     {ActivityType::PatternLearned, "patternLearned"},
     {ActivityType::PatternApplied, "patternApplied"},
     {ActivityType::AiSuggestionAccepted, "aiSuggestionAccepted"},
     {ActivityType::AiSuggestionRejected, "aiSuggestionRejected"}});

struct ActivityRecord {
  ActivityType type = ActivityType::FileScanned;
  std::string file_name;
  std::optional<std::string> file_extension;
  std::string details;
  TimePoint timestamp{};
};

enum class TimeCategory { WorkHours, Evenings, Mornings, Weekends, AnyTime };
NLOHMANN_JSON_SERIALIZE_ENUM(TimeCategory,
                             {{TimeCategory::AnyTime, "anyTime"},
                              {TimeCategory::WorkHours, "workHours"},
                              {TimeCategory::Evenings, "evenings"},
                              {TimeCategory::Mornings, "mornings"},
                              {TimeCategory::Weekends, "weekends"}});

struct TemporalContext {
  int hour_of_day = 0;
  int day_of_week = 1;  // 1 = Sunday
  bool is_work_hours = false;
  bool operator==(const TemporalContext&) const = default;
};

struct LearnedPattern {
  std::string description;
  std::string file_extension;
  std::string destination_path;
  std::vector<PatternCondition> conditions;
  LogicalOperator logical_operator = LogicalOperator::Single;
  int occurrence_count = 0;
  double confidence_score = 0.0;
  TimePoint last_seen_date{};
  bool is_negative = false;
  int rejection_count = 0;
  bool converted_to_rule = false;
  TimeCategory time_category = TimeCategory::AnyTime;
  std::vector<TemporalContext> temporal_contexts;
  std::vector<std::string> extracted_keywords;
};

// Input record for an external destination predictor.
struct TrainingRecord {
  std::string file_name;
  std::string file_extension;
  std::optional<LocationKind> source_location;
  std::string destination_path;
  TimePoint timestamp{};
};

enum class PredictionOutcome { Accepted, Overridden, Dismissed, Unknown };

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

struct LearnerConfig {
  int minimum_occurrences = 3;
  int minimum_rejections = 2;
  double temporal_ratio_factor = 1.3;
  double prefix_boost = 1.15;
  double keyword_boost = 1.10;
  double negative_confidence_divisor = 5.0;
  double negative_confidence_cap = 0.9;
  double suggestion_threshold = 0.5;
  int pattern_rejection_limit = 3;
  int file_rejection_threshold = 2;
  double file_rejection_rate = 0.5;
  // Offset applied to activity timestamps before hour / weekday bucketing.
  int utc_offset_minutes = 0;
  // Replaced by "~" when abbreviating destination paths; empty disables it.
  std::string home_directory;
  std::vector<std::string> significant_prefixes = {
      "Invoice", "Receipt",  "Screenshot", "Photo",   "IMG",
      "DSC",     "VID",      "Report",     "Contract", "Agreement",
      "Proposal", "Draft",   "Final",      "Meeting", "Notes",
      "Summary", "Backup",   "Archive",    "Export"};
  std::vector<std::string> purpose_keywords = {
      "invoice", "receipt",  "statement", "contract",     "agreement",
      "report",  "presentation", "proposal", "meeting",   "notes",
      "screenshot", "photo", "image",     "video",        "audio",
      "backup",  "archive",  "export",    "download",     "temp"};
};

struct Config {
  std::vector<std::shared_ptr<const Category>> categories;
  std::vector<Rule> rules;
  LearnerConfig learner;
};

// ---------------------------------------------------------------------------
// JSON mapping (types.cpp)
// ---------------------------------------------------------------------------

void to_json(json& j, const Condition& c);
void from_json(const json& j, Condition& c);
void to_json(json& j, const PatternCondition& c);
void from_json(const json& j, PatternCondition& c);
void to_json(json& j, const Destination& d);
void from_json(const json& j, Destination& d);
void to_json(json& j, const CategoryScope& s);
void from_json(const json& j, CategoryScope& s);
void to_json(json& j, const Category& c);
void from_json(const json& j, Category& c);
// Rules refer to their category by id; IOManager::load_config links them.
void to_json(json& j, const Rule& r);
void from_json(const json& j, Rule& r);
void to_json(json& j, const FileItem& f);
void from_json(const json& j, FileItem& f);
void to_json(json& j, const Classification& c);
void from_json(const json& j, Classification& c);
void to_json(json& j, const ActivityRecord& a);
void from_json(const json& j, ActivityRecord& a);
void to_json(json& j, const TemporalContext& c);
void from_json(const json& j, TemporalContext& c);
void to_json(json& j, const LearnedPattern& p);
void from_json(const json& j, LearnedPattern& p);
void from_json(const json& j, LearnerConfig& c);
