#include "Conditions.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <unordered_map>
#include <vector>

#include "IOManager.hpp"
#include "utils.hpp"

namespace {

using KindTable =
    std::unordered_map<std::string_view, std::vector<std::string_view>>;

const KindTable& kind_table() {
  static const KindTable table = {
      {"image",
       {"jpg", "jpeg", "png", "gif", "bmp", "tiff", "tif", "heic", "heif",
        "webp", "svg", "ico"}},
      {"audio",
       {"mp3", "wav", "aac", "flac", "ogg", "m4a", "wma", "aiff", "ape"}},
      {"video",
       {"mp4", "mov", "avi", "mkv", "flv", "wmv", "m4v", "mpg", "mpeg",
        "webm"}},
      {"document", {"pdf", "doc", "docx", "txt", "rtf", "odt", "pages", "tex"}},
      {"spreadsheet", {"xls", "xlsx", "csv", "numbers", "ods"}},
      {"presentation", {"ppt", "pptx", "key", "odp"}},
      {"archive",
       {"zip", "rar", "7z", "tar", "gz", "bz2", "xz", "dmg", "pkg", "iso"}},
      {"code",
       {"swift", "py", "js", "ts", "java", "cpp", "c", "h", "cs", "rb", "go",
        "rs", "php", "html", "css", "json", "xml", "yaml", "yml"}},
  };
  return table;
}

std::string singular_kind(std::string_view kind) {
  std::string k = string_to_lower_ascii(kind);
  if (k == "images" || k == "videos" || k == "documents" ||
      k == "spreadsheets" || k == "presentations" || k == "archives") {
    k.pop_back();
  }
  return k;
}

// Day-count conditions fail closed on non-positive values.
bool older_than_days(TimePoint timestamp, int days, TimePoint now,
                     std::string_view what) {
  if (days <= 0) {
    IOManager::log(std::format(
        "Warning: Days value must be positive in {} condition: {}", what,
        days));
    return false;
  }
  // Spans the clock cannot represent reach further back than any timestamp.
  constexpr auto max_days =
      std::chrono::duration_cast<std::chrono::days>(TimePoint::duration::max())
          .count();
  if (days > max_days) return false;
  const TimePoint::duration span = std::chrono::days(days);
  if (now < TimePoint::min() + span) return false;
  return timestamp < now - span;
}

std::string location_display_name(LocationKind location) {
  switch (location) {
    case LocationKind::Home:
      return "Home";
    case LocationKind::Desktop:
      return "Desktop";
    case LocationKind::Downloads:
      return "Downloads";
    case LocationKind::Documents:
      return "Documents";
    case LocationKind::Pictures:
      return "Pictures";
    case LocationKind::Music:
      return "Music";
    case LocationKind::Custom:
      return "Custom Folder";
    case LocationKind::Unknown:
      break;
  }
  return "Unknown";
}

}  // namespace

namespace Conditions {

Condition extension_equals(std::string extension) {
  return Condition{ExtensionEquals{std::move(extension)}};
}

Condition name_starts_with(std::string text) {
  return Condition{NameStartsWith{std::move(text)}};
}

Condition name_contains(std::string text) {
  return Condition{NameContains{std::move(text)}};
}

Condition name_ends_with(std::string text) {
  return Condition{NameEndsWith{std::move(text)}};
}

Condition older_than(int days, std::optional<std::string> extension) {
  return Condition{OlderThan{days, std::move(extension)}};
}

Condition modified_older_than(int days) {
  return Condition{ModifiedOlderThan{days}};
}

Condition accessed_older_than(int days) {
  return Condition{AccessedOlderThan{days}};
}

Condition larger_than(std::int64_t bytes) { return Condition{LargerThan{bytes}}; }

Condition kind_equals(std::string kind) {
  return Condition{KindEquals{std::move(kind)}};
}

Condition from_location(LocationKind location) {
  return Condition{FromLocation{location}};
}

Condition negated(Condition inner) {
  return Condition{
      Negated{std::make_shared<const Condition>(std::move(inner))}};
}

bool matches_kind(std::string_view extension, std::string_view kind) {
  const auto& table = kind_table();
  const auto it = table.find(singular_kind(kind));
  if (it == table.end()) return false;
  const auto ext = normalize_extension(extension);
  return std::find(it->second.begin(), it->second.end(), ext) !=
         it->second.end();
}

bool evaluate(const Condition& condition, const FileItem& file, TimePoint now) {
  return std::visit(
      [&](const auto& c) -> bool {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, ExtensionEquals>) {
          return normalize_extension(file.extension) ==
                 normalize_extension(c.extension);
        } else if constexpr (std::is_same_v<T, NameStartsWith>) {
          return istarts_with(file.name, c.text);
        } else if constexpr (std::is_same_v<T, NameContains>) {
          return icontains(file.name, c.text);
        } else if constexpr (std::is_same_v<T, NameEndsWith>) {
          return iends_with(file.name, c.text);
        } else if constexpr (std::is_same_v<T, OlderThan>) {
          if (c.days > 0 && c.extension && !c.extension->empty() &&
              normalize_extension(file.extension) !=
                  normalize_extension(*c.extension)) {
            return false;
          }
          return older_than_days(file.creation_date, c.days, now, "olderThan");
        } else if constexpr (std::is_same_v<T, ModifiedOlderThan>) {
          return older_than_days(file.modification_date, c.days, now,
                                 "modifiedOlderThan");
        } else if constexpr (std::is_same_v<T, AccessedOlderThan>) {
          return older_than_days(file.last_accessed_date, c.days, now,
                                 "accessedOlderThan");
        } else if constexpr (std::is_same_v<T, LargerThan>) {
          return file.size_in_bytes > c.bytes;
        } else if constexpr (std::is_same_v<T, KindEquals>) {
          return matches_kind(file.extension, c.kind);
        } else if constexpr (std::is_same_v<T, FromLocation>) {
          return file.location == c.location;
        } else {
          if (!c.inner) return false;
          return !evaluate(*c.inner, file, now);
        }
      },
      condition.value);
}

bool evaluate(const PatternCondition& condition, const FileItem& file,
              TimePoint now, std::chrono::minutes utc_offset) {
  return std::visit(
      [&](const auto& c) -> bool {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, ExtensionEquals>) {
          return normalize_extension(file.extension) ==
                 normalize_extension(c.extension);
        } else if constexpr (std::is_same_v<T, NameContains>) {
          return icontains(file.name, c.text);
        } else if constexpr (std::is_same_v<T, NameStartsWith>) {
          return istarts_with(file.name, c.text);
        } else if constexpr (std::is_same_v<T, NameEndsWith>) {
          return iends_with(file.name, c.text);
        } else if constexpr (std::is_same_v<T, SizeRange>) {
          return file.size_in_bytes >= c.min_bytes &&
                 file.size_in_bytes <= c.max_bytes;
        } else if constexpr (std::is_same_v<T, TimeOfDay>) {
          const int hour = temporal_context_at(now, utc_offset).hour_of_day;
          return hour >= c.start_hour && hour < c.end_hour;
        } else {
          const int day = temporal_context_at(now, utc_offset).day_of_week;
          return std::find(c.days.begin(), c.days.end(), day) != c.days.end();
        }
      },
      condition);
}

bool equivalent(const Condition& a, const Condition& b) {
  if (a.value.index() != b.value.index()) return false;
  return std::visit(
      [&b](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.value);
        if constexpr (std::is_same_v<T, ExtensionEquals>) {
          return normalize_extension(lhs.extension) ==
                 normalize_extension(rhs.extension);
        } else if constexpr (std::is_same_v<T, NameStartsWith> ||
                             std::is_same_v<T, NameContains> ||
                             std::is_same_v<T, NameEndsWith>) {
          return iequals(lhs.text, rhs.text);
        } else if constexpr (std::is_same_v<T, OlderThan>) {
          return lhs.days == rhs.days &&
                 normalize_extension(lhs.extension.value_or("")) ==
                     normalize_extension(rhs.extension.value_or(""));
        } else if constexpr (std::is_same_v<T, KindEquals>) {
          return singular_kind(lhs.kind) == singular_kind(rhs.kind);
        } else if constexpr (std::is_same_v<T, Negated>) {
          if (!lhs.inner || !rhs.inner) return lhs.inner == rhs.inner;
          return equivalent(*lhs.inner, *rhs.inner);
        } else {
          return lhs == rhs;
        }
      },
      a.value);
}

std::string describe(const Condition& condition) {
  return std::visit(
      [](const auto& c) -> std::string {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, ExtensionEquals>) {
          return std::format("extension is .{}", normalize_extension(c.extension));
        } else if constexpr (std::is_same_v<T, NameStartsWith>) {
          return std::format("name starts with '{}'", c.text);
        } else if constexpr (std::is_same_v<T, NameContains>) {
          return std::format("name contains '{}'", c.text);
        } else if constexpr (std::is_same_v<T, NameEndsWith>) {
          return std::format("name ends with '{}'", c.text);
        } else if constexpr (std::is_same_v<T, OlderThan>) {
          if (c.extension && !c.extension->empty()) {
            return std::format(".{} older than {} days",
                               normalize_extension(*c.extension), c.days);
          }
          return std::format("older than {} days", c.days);
        } else if constexpr (std::is_same_v<T, ModifiedOlderThan>) {
          return std::format("not modified in {} days", c.days);
        } else if constexpr (std::is_same_v<T, AccessedOlderThan>) {
          return std::format("not opened in {} days", c.days);
        } else if constexpr (std::is_same_v<T, LargerThan>) {
          return std::format("larger than {}", format_bytes(c.bytes));
        } else if constexpr (std::is_same_v<T, KindEquals>) {
          return std::format("file kind is {}", c.kind);
        } else if constexpr (std::is_same_v<T, FromLocation>) {
          return std::format("from {}", location_display_name(c.location));
        } else {
          if (!c.inner) return "NOT ()";
          return std::format("NOT ({})", describe(*c.inner));
        }
      },
      condition.value);
}

std::string describe(const PatternCondition& condition) {
  return std::visit(
      [](const auto& c) -> std::string {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, ExtensionEquals>) {
          return std::format(".{} files", c.extension);
        } else if constexpr (std::is_same_v<T, NameContains>) {
          return std::format("name contains '{}'", c.text);
        } else if constexpr (std::is_same_v<T, NameStartsWith>) {
          return std::format("name starts with '{}'", c.text);
        } else if constexpr (std::is_same_v<T, NameEndsWith>) {
          return std::format("name ends with '{}'", c.text);
        } else if constexpr (std::is_same_v<T, SizeRange>) {
          return std::format("{} - {}", format_bytes(c.min_bytes),
                             format_bytes(c.max_bytes));
        } else if constexpr (std::is_same_v<T, TimeOfDay>) {
          return std::format("{}:00 - {}:00", c.start_hour, c.end_hour);
        } else {
          static constexpr std::array<std::string_view, 7> names = {
              "Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
          std::vector<std::string> parts;
          for (int day : c.days) {
            if (day >= 1 && day <= 7) parts.emplace_back(names[day - 1]);
          }
          return join_strings(parts, ", ");
        }
      },
      condition);
}

std::string signature(const PatternCondition& condition) {
  return std::visit(
      [](const auto& c) -> std::string {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, ExtensionEquals>) {
          return "ext:" + normalize_extension(c.extension);
        } else if constexpr (std::is_same_v<T, NameContains>) {
          return "contains:" + string_to_lower_ascii(c.text);
        } else if constexpr (std::is_same_v<T, NameStartsWith>) {
          return "prefix:" + string_to_lower_ascii(c.text);
        } else if constexpr (std::is_same_v<T, NameEndsWith>) {
          return "suffix:" + string_to_lower_ascii(c.text);
        } else if constexpr (std::is_same_v<T, SizeRange>) {
          return std::format("size:{}-{}", c.min_bytes, c.max_bytes);
        } else if constexpr (std::is_same_v<T, TimeOfDay>) {
          return std::format("time:{}-{}", c.start_hour, c.end_hour);
        } else {
          std::vector<std::string> days;
          for (int day : c.days) days.push_back(std::to_string(day));
          return "days:" + join_strings(days, "|");
        }
      },
      condition);
}

TemporalContext temporal_context_at(TimePoint t,
                                    std::chrono::minutes utc_offset) {
  using namespace std::chrono;
  const auto local = t + utc_offset;
  const auto day = floor<days>(local);
  const hh_mm_ss time_of_day{floor<seconds>(local - day)};

  TemporalContext context;
  context.hour_of_day = static_cast<int>(time_of_day.hours().count());
  // c_encoding(): 0 = Sunday
  context.day_of_week =
      static_cast<int>(weekday{day}.c_encoding()) + 1;
  const bool is_weekday = context.day_of_week >= 2 && context.day_of_week <= 6;
  const bool is_business_hours =
      context.hour_of_day >= 9 && context.hour_of_day <= 17;
  context.is_work_hours = is_weekday && is_business_hours;
  return context;
}

}  // namespace Conditions
