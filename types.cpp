#include "types.hpp"

#include <format>
#include <stdexcept>

namespace {

template <typename T>
std::optional<T> optional_field(const json& j, const char* key) {
  if (j.contains(key) && !j.at(key).is_null()) {
    return j.at(key).get<T>();
  }
  return std::nullopt;
}

template <typename T>
void put_optional(json& j, const char* key, const std::optional<T>& value) {
  if (value) j[key] = *value;
}

}  // namespace

// ---------------------------------------------------------------------------
// Condition
// ---------------------------------------------------------------------------

void to_json(json& j, const Condition& c) {
  std::visit(
      [&j](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, ExtensionEquals>) {
          j = json{{"type", "extensionEquals"}, {"value", v.extension}};
        } else if constexpr (std::is_same_v<T, NameStartsWith>) {
          j = json{{"type", "nameStartsWith"}, {"value", v.text}};
        } else if constexpr (std::is_same_v<T, NameContains>) {
          j = json{{"type", "nameContains"}, {"value", v.text}};
        } else if constexpr (std::is_same_v<T, NameEndsWith>) {
          j = json{{"type", "nameEndsWith"}, {"value", v.text}};
        } else if constexpr (std::is_same_v<T, OlderThan>) {
          j = json{{"type", "olderThan"}, {"days", v.days}};
          put_optional(j, "extension", v.extension);
        } else if constexpr (std::is_same_v<T, ModifiedOlderThan>) {
          j = json{{"type", "modifiedOlderThan"}, {"days", v.days}};
        } else if constexpr (std::is_same_v<T, AccessedOlderThan>) {
          j = json{{"type", "accessedOlderThan"}, {"days", v.days}};
        } else if constexpr (std::is_same_v<T, LargerThan>) {
          j = json{{"type", "largerThan"}, {"bytes", v.bytes}};
        } else if constexpr (std::is_same_v<T, KindEquals>) {
          j = json{{"type", "kindEquals"}, {"value", v.kind}};
        } else if constexpr (std::is_same_v<T, FromLocation>) {
          j = json{{"type", "fromLocation"}, {"value", v.location}};
        } else {
          j = json{{"type", "negated"}};
          if (v.inner) j["condition"] = *v.inner;
        }
      },
      c.value);
}

void from_json(const json& j, Condition& c) {
  const auto type = j.at("type").get<std::string>();
  if (type == "extensionEquals") {
    c.value = ExtensionEquals{j.at("value").get<std::string>()};
  } else if (type == "nameStartsWith") {
    c.value = NameStartsWith{j.at("value").get<std::string>()};
  } else if (type == "nameContains") {
    c.value = NameContains{j.at("value").get<std::string>()};
  } else if (type == "nameEndsWith") {
    c.value = NameEndsWith{j.at("value").get<std::string>()};
  } else if (type == "olderThan") {
    c.value = OlderThan{j.at("days").get<int>(),
                        optional_field<std::string>(j, "extension")};
  } else if (type == "modifiedOlderThan") {
    c.value = ModifiedOlderThan{j.at("days").get<int>()};
  } else if (type == "accessedOlderThan") {
    c.value = AccessedOlderThan{j.at("days").get<int>()};
  } else if (type == "largerThan") {
    c.value = LargerThan{j.at("bytes").get<std::int64_t>()};
  } else if (type == "kindEquals") {
    c.value = KindEquals{j.at("value").get<std::string>()};
  } else if (type == "fromLocation") {
    c.value = FromLocation{j.at("value").get<LocationKind>()};
  } else if (type == "negated") {
    c.value =
        Negated{std::make_shared<const Condition>(j.at("condition").get<Condition>())};
  } else {
    throw std::invalid_argument(std::format("Unknown condition type '{}'", type));
  }
}

void to_json(json& j, const PatternCondition& c) {
  std::visit(
      [&j](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, ExtensionEquals>) {
          j = json{{"type", "extension"}, {"value", v.extension}};
        } else if constexpr (std::is_same_v<T, NameContains>) {
          j = json{{"type", "nameContains"}, {"value", v.text}};
        } else if constexpr (std::is_same_v<T, NameStartsWith>) {
          j = json{{"type", "nameStartsWith"}, {"value", v.text}};
        } else if constexpr (std::is_same_v<T, NameEndsWith>) {
          j = json{{"type", "nameEndsWith"}, {"value", v.text}};
        } else if constexpr (std::is_same_v<T, SizeRange>) {
          j = json{{"type", "sizeRange"},
                   {"minBytes", v.min_bytes},
                   {"maxBytes", v.max_bytes}};
        } else if constexpr (std::is_same_v<T, TimeOfDay>) {
          j = json{{"type", "timeOfDay"},
                   {"startHour", v.start_hour},
                   {"endHour", v.end_hour}};
        } else {
          j = json{{"type", "dayOfWeek"}, {"days", v.days}};
        }
      },
      c);
}

void from_json(const json& j, PatternCondition& c) {
  const auto type = j.at("type").get<std::string>();
  if (type == "extension") {
    c = ExtensionEquals{j.at("value").get<std::string>()};
  } else if (type == "nameContains") {
    c = NameContains{j.at("value").get<std::string>()};
  } else if (type == "nameStartsWith") {
    c = NameStartsWith{j.at("value").get<std::string>()};
  } else if (type == "nameEndsWith") {
    c = NameEndsWith{j.at("value").get<std::string>()};
  } else if (type == "sizeRange") {
    c = SizeRange{j.at("minBytes").get<std::int64_t>(),
                  j.at("maxBytes").get<std::int64_t>()};
  } else if (type == "timeOfDay") {
    c = TimeOfDay{j.at("startHour").get<int>(), j.at("endHour").get<int>()};
  } else if (type == "dayOfWeek") {
    c = DayOfWeek{j.at("days").get<std::vector<int>>()};
  } else {
    throw std::invalid_argument(
        std::format("Unknown pattern condition type '{}'", type));
  }
}

// ---------------------------------------------------------------------------
// Destination, category, rule
// ---------------------------------------------------------------------------

void to_json(json& j, const Destination& d) {
  if (d.is_trash()) {
    j = json{{"type", "trash"}};
    return;
  }
  j = json{{"type", "folder"}, {"path", d.display_path}};
  put_optional(j, "token", d.token());
}

void from_json(const json& j, Destination& d) {
  const auto type = j.at("type").get<std::string>();
  if (type == "trash") {
    d = Destination::trash();
  } else if (type == "folder") {
    auto path = j.at("path").get<std::string>();
    if (auto token = optional_field<std::string>(j, "token")) {
      d = Destination::resolved_folder(std::move(path), std::move(*token));
    } else {
      d = Destination::folder(std::move(path));
    }
  } else {
    throw std::invalid_argument(
        std::format("Unknown destination type '{}'", type));
  }
}

void to_json(json& j, const CategoryScope& s) {
  if (s.is_global()) {
    j = json{{"type", "global"}};
  } else {
    j = json{{"type", "folders"}, {"folders", s.folders}};
  }
}

void from_json(const json& j, CategoryScope& s) {
  if (j.value("type", "global") == "folders") {
    s.kind = CategoryScope::Kind::Folders;
    s.folders = j.at("folders").get<std::vector<std::string>>();
  } else {
    s = CategoryScope{};
  }
}

void to_json(json& j, const Category& c) {
  j = json{{"id", c.id},
           {"name", c.name},
           {"isEnabled", c.is_enabled},
           {"scope", c.scope}};
}

void from_json(const json& j, Category& c) {
  j.at("id").get_to(c.id);
  c.name = j.value("name", c.id);
  c.is_enabled = j.value("isEnabled", true);
  if (j.contains("scope")) j.at("scope").get_to(c.scope);
}

void to_json(json& j, const Rule& r) {
  j = json{{"id", r.id},
           {"name", r.name},
           {"conditions", r.conditions},
           {"logicalOperator", r.logical_operator},
           {"exclusions", r.exclusions},
           {"action", r.action},
           {"isEnabled", r.is_enabled},
           {"sortOrder", r.sort_order},
           {"creationDate", r.creation_date}};
  put_optional(j, "destination", r.destination);
  if (r.category) j["category"] = r.category->id;
}

void from_json(const json& j, Rule& r) {
  j.at("id").get_to(r.id);
  r.name = j.value("name", "");
  j.at("conditions").get_to(r.conditions);
  r.logical_operator = j.value("logicalOperator", r.conditions.size() > 1
                                                      ? LogicalOperator::And
                                                      : LogicalOperator::Single);
  if (j.contains("exclusions")) j.at("exclusions").get_to(r.exclusions);
  r.action = j.value("action", ActionType::Move);
  r.destination = optional_field<Destination>(j, "destination");
  r.is_enabled = j.value("isEnabled", true);
  r.sort_order = j.value("sortOrder", 0);
  if (j.contains("creationDate")) j.at("creationDate").get_to(r.creation_date);
}

// ---------------------------------------------------------------------------
// Files and classifications
// ---------------------------------------------------------------------------

void to_json(json& j, const FileItem& f) {
  j = json{{"name", f.name},
           {"path", f.path},
           {"extension", f.extension},
           {"creationDate", f.creation_date},
           {"modificationDate", f.modification_date},
           {"lastAccessedDate", f.last_accessed_date},
           {"sizeInBytes", f.size_in_bytes},
           {"location", f.location},
           {"status", f.status},
           {"rejectionCount", f.rejection_count}};
  put_optional(j, "destination", f.destination);
  put_optional(j, "matchReason", f.match_reason);
  put_optional(j, "confidenceScore", f.confidence_score);
  put_optional(j, "matchedRuleId", f.matched_rule_id);
  put_optional(j, "suggestionSource", f.suggestion_source);
  put_optional(j, "rejectedDestination", f.rejected_destination);
}

void from_json(const json& j, FileItem& f) {
  j.at("name").get_to(f.name);
  f.path = j.value("path", f.name);
  if (j.contains("extension")) {
    j.at("extension").get_to(f.extension);
  } else {
    auto ext = fs::path(f.name).extension().string();
    f.extension = ext.empty() ? ext : ext.substr(1);
  }
  if (j.contains("creationDate")) j.at("creationDate").get_to(f.creation_date);
  if (j.contains("modificationDate"))
    j.at("modificationDate").get_to(f.modification_date);
  if (j.contains("lastAccessedDate"))
    j.at("lastAccessedDate").get_to(f.last_accessed_date);
  f.size_in_bytes = j.value("sizeInBytes", std::int64_t{0});
  f.location = j.value("location", LocationKind::Unknown);
  f.rejected_destination = optional_field<std::string>(j, "rejectedDestination");
  f.rejection_count = j.value("rejectionCount", 0);
}

void to_json(json& j, const Classification& c) {
  j = json{{"destination", c.destination},
           {"confidence", c.confidence},
           {"explanation", c.explanation},
           {"source", c.source}};
  put_optional(j, "ruleId", c.rule_id);
}

void from_json(const json& j, Classification& c) {
  j.at("destination").get_to(c.destination);
  j.at("confidence").get_to(c.confidence);
  c.explanation = j.value("explanation", "");
  c.rule_id = optional_field<std::string>(j, "ruleId");
  c.source = j.value("source", SuggestionSource::Prediction);
}

// ---------------------------------------------------------------------------
// Activity history and patterns
// ---------------------------------------------------------------------------

void to_json(json& j, const ActivityRecord& a) {
  j = json{{"type", a.type},
           {"fileName", a.file_name},
           {"details", a.details},
           {"timestamp", a.timestamp}};
  put_optional(j, "fileExtension", a.file_extension);
}

void from_json(const json& j, ActivityRecord& a) {
  j.at("type").get_to(a.type);
  j.at("fileName").get_to(a.file_name);
  a.file_extension = optional_field<std::string>(j, "fileExtension");
  a.details = j.value("details", "");
  j.at("timestamp").get_to(a.timestamp);
}

void to_json(json& j, const TemporalContext& c) {
  j = json{{"hourOfDay", c.hour_of_day},
           {"dayOfWeek", c.day_of_week},
           {"isWorkHours", c.is_work_hours}};
}

void from_json(const json& j, TemporalContext& c) {
  j.at("hourOfDay").get_to(c.hour_of_day);
  j.at("dayOfWeek").get_to(c.day_of_week);
  c.is_work_hours = j.value("isWorkHours", false);
}

void to_json(json& j, const LearnedPattern& p) {
  j = json{{"description", p.description},
           {"fileExtension", p.file_extension},
           {"destinationPath", p.destination_path},
           {"conditions", p.conditions},
           {"logicalOperator", p.logical_operator},
           {"occurrenceCount", p.occurrence_count},
           {"confidenceScore", p.confidence_score},
           {"lastSeenDate", p.last_seen_date},
           {"isNegativePattern", p.is_negative},
           {"rejectionCount", p.rejection_count},
           {"convertedToRule", p.converted_to_rule},
           {"timeCategory", p.time_category},
           {"temporalContexts", p.temporal_contexts},
           {"extractedKeywords", p.extracted_keywords}};
}

void from_json(const json& j, LearnedPattern& p) {
  p.description = j.value("description", "");
  j.at("fileExtension").get_to(p.file_extension);
  j.at("destinationPath").get_to(p.destination_path);
  if (j.contains("conditions")) j.at("conditions").get_to(p.conditions);
  p.logical_operator = j.value("logicalOperator", LogicalOperator::Single);
  p.occurrence_count = j.value("occurrenceCount", 0);
  p.confidence_score = j.value("confidenceScore", 0.0);
  if (j.contains("lastSeenDate")) j.at("lastSeenDate").get_to(p.last_seen_date);
  p.is_negative = j.value("isNegativePattern", false);
  p.rejection_count = j.value("rejectionCount", 0);
  p.converted_to_rule = j.value("convertedToRule", false);
  p.time_category = j.value("timeCategory", TimeCategory::AnyTime);
  if (j.contains("temporalContexts"))
    j.at("temporalContexts").get_to(p.temporal_contexts);
  if (j.contains("extractedKeywords"))
    j.at("extractedKeywords").get_to(p.extracted_keywords);
}

void from_json(const json& j, LearnerConfig& c) {
  c.minimum_occurrences = j.value("minimumOccurrences", c.minimum_occurrences);
  c.minimum_rejections = j.value("minimumRejections", c.minimum_rejections);
  c.temporal_ratio_factor =
      j.value("temporalRatioFactor", c.temporal_ratio_factor);
  c.prefix_boost = j.value("prefixBoost", c.prefix_boost);
  c.keyword_boost = j.value("keywordBoost", c.keyword_boost);
  c.negative_confidence_divisor =
      j.value("negativeConfidenceDivisor", c.negative_confidence_divisor);
  c.negative_confidence_cap =
      j.value("negativeConfidenceCap", c.negative_confidence_cap);
  c.suggestion_threshold =
      j.value("suggestionThreshold", c.suggestion_threshold);
  c.pattern_rejection_limit =
      j.value("patternRejectionLimit", c.pattern_rejection_limit);
  c.file_rejection_threshold =
      j.value("fileRejectionThreshold", c.file_rejection_threshold);
  c.file_rejection_rate = j.value("fileRejectionRate", c.file_rejection_rate);
  c.utc_offset_minutes = j.value("utcOffsetMinutes", c.utc_offset_minutes);
  c.home_directory = j.value("homeDirectory", c.home_directory);
  if (j.contains("significantPrefixes"))
    j.at("significantPrefixes").get_to(c.significant_prefixes);
  if (j.contains("purposeKeywords"))
    j.at("purposeKeywords").get_to(c.purpose_keywords);
}
