#include <algorithm>
#include <exception>
#include <format>
#include <map>
#include <print>
#include <string>
#include <string_view>
#include <vector>

#include "ClassificationPipeline.hpp"
#include "DestinationResolver.hpp"
#include "IOManager.hpp"
#include "OverlapDetector.hpp"
#include "PatternAnalysis.hpp"
#include "PatternLearner.hpp"
#include "RuleEngine.hpp"
#include "types.hpp"
#include "utils.hpp"

namespace {

void print_usage() {
  std::println(stderr, "Usage:");
  std::println(stderr,
               "  organizer classify <config.json> <files.json> "
               "[predictions.json]");
  std::println(stderr, "  organizer learn <config.json> <activity.json>");
  std::println(stderr, "  organizer overlaps <config.json> <rule-id>");
  std::println(stderr,
               "  organizer suggest <config.json> <activity.json> <files.json>");
}

int fail(std::string_view message) {
  IOManager::log(std::format("CRITICAL: {}", message));
  std::println(stderr, "\n=== ERROR ===");
  std::println(stderr, "{}", message);
  std::println(stderr, "Check organizer.log for details.");
  return 1;
}

std::optional<Config> load_config_with_defaults(const fs::path& configPath) {
  auto config = IOManager::load_config(configPath);
  if (config && config->learner.home_directory.empty()) {
    if (auto home = IOManager::get_home_directory()) {
      config->learner.home_directory = safe_path_to_string(*home);
    }
  }
  return config;
}

// Learned patterns live next to the configuration.
fs::path patterns_path_for(const fs::path& configPath) {
  return configPath.parent_path() / "patterns.json";
}

std::string describe_destination(const std::optional<Destination>& destination) {
  if (!destination) return "(none)";
  if (destination->is_trash()) return "Trash";
  return destination->display_path;
}

std::string source_name(const std::optional<SuggestionSource>& source) {
  if (!source) return "-";
  return json(*source).get<std::string>();
}

int run_classify(const fs::path& configPath, const fs::path& filesPath,
                 const std::optional<fs::path>& predictionsPath) {
  auto config = load_config_with_defaults(configPath);
  if (!config) return fail("Failed to load configuration.");

  auto files = IOManager::load_files(filesPath);
  if (!files) return fail("Failed to load the file list.");

  std::map<std::string, Classification> predictions;
  if (predictionsPath) {
    auto loaded = IOManager::load_predictions(*predictionsPath);
    if (!loaded) return fail("Failed to load predictions.");
    predictions = std::move(*loaded);
  }

  std::vector<LearnedPattern> patterns;
  const fs::path patternsPath = patterns_path_for(configPath);
  std::error_code ec;
  if (fs::exists(patternsPath, ec)) {
    if (auto loaded = IOManager::load_patterns(patternsPath)) {
      patterns = std::move(*loaded);
    }
  }

  DirectoryDestinationResolver resolver(configPath.parent_path(),
                                        IOManager::get_home_directory());
  RuleEngine engine(resolver);
  PatternLearner learner(config->learner);
  ClassificationPipeline pipeline(engine, learner);

  const auto classified =
      pipeline.run(*files, config->rules, patterns, predictions);

  for (const auto& file : classified) {
    if (file.status != FileStatus::Ready) {
      std::println("{:<40} pending", file.name);
      continue;
    }
    std::println("{:<40} -> {} ({:.2f}, {}) {}", file.name,
                 describe_destination(file.destination),
                 file.confidence_score.value_or(0.0),
                 source_name(file.suggestion_source),
                 file.match_reason.value_or(""));
  }
  return 0;
}

int run_learn(const fs::path& configPath, const fs::path& activityPath) {
  auto config = load_config_with_defaults(configPath);
  if (!config) return fail("Failed to load configuration.");

  auto activities = IOManager::load_activity_log(activityPath);
  if (!activities) return fail("Failed to load the activity log.");

  PatternLearner learner(config->learner);
  const fs::path patternsPath = patterns_path_for(configPath);

  std::vector<LearnedPattern> patterns;
  std::error_code ec;
  if (fs::exists(patternsPath, ec)) {
    auto existing = IOManager::load_patterns(patternsPath);
    if (!existing) return fail("Failed to read existing learned patterns.");
    patterns = learner.update_patterns(*existing, *activities);
  } else {
    patterns = learner.induce_patterns(*activities);
  }

  if (!IOManager::save_patterns(patternsPath, patterns)) {
    return fail("Failed to save learned patterns.");
  }

  for (const auto& pattern : patterns) {
    std::println("[{:<6}] {:.2f}  x{:<3} {}{}",
                 Patterns::confidence_level(pattern.confidence_score),
                 pattern.confidence_score, pattern.occurrence_count,
                 pattern.description,
                 pattern.is_negative ? "  (negative)" : "");
  }
  std::println("{} patterns saved to {}", patterns.size(),
               safe_path_to_string(patternsPath));
  return 0;
}

int run_overlaps(const fs::path& configPath, const std::string& ruleId) {
  auto config = load_config_with_defaults(configPath);
  if (!config) return fail("Failed to load configuration.");

  const auto& rules = config->rules;
  const auto it = std::find_if(rules.begin(), rules.end(),
                               [&](const Rule& r) { return r.id == ruleId; });
  if (it == rules.end()) {
    return fail(std::format("No rule with id '{}' in the configuration.", ruleId));
  }

  OverlapDetector detector;
  const auto overlaps = detector.detect_overlaps(*it, rules, it->id);
  if (overlaps.empty()) {
    std::println("No overlaps found for rule '{}'.", ruleId);
    return 0;
  }
  for (const auto& overlap : overlaps) {
    std::println("[{}] {} ({})", display_name(overlap.type),
                 overlap.existing_rule.name, overlap.existing_rule.id);
    std::println("    {}", overlap.explanation);
    if (overlap.suggestion) std::println("    {}", *overlap.suggestion);
  }
  return 0;
}

int run_suggest(const fs::path& configPath, const fs::path& activityPath,
                const fs::path& filesPath) {
  auto config = load_config_with_defaults(configPath);
  if (!config) return fail("Failed to load configuration.");

  auto activities = IOManager::load_activity_log(activityPath);
  if (!activities) return fail("Failed to load the activity log.");

  auto files = IOManager::load_files(filesPath);
  if (!files) return fail("Failed to load the file list.");

  PatternLearner learner(config->learner);
  std::vector<LearnedPattern> candidates;
  std::vector<LearnedPattern> negatives;
  for (auto& pattern : learner.induce_patterns(*activities)) {
    if (pattern.is_negative) {
      negatives.push_back(std::move(pattern));
    } else if (learner.should_suggest(pattern)) {
      candidates.push_back(std::move(pattern));
    }
  }

  const auto suggestions =
      learner.filter_suggestions(candidates, negatives, *files);
  if (suggestions.empty()) {
    std::println("No rule suggestions.");
    return 0;
  }

  OverlapDetector detector;
  for (const auto& pattern : suggestions) {
    const Rule rule = Patterns::to_rule(pattern);
    std::println("[{:<6}] {}  =>  {}",
                 Patterns::confidence_level(pattern.confidence_score),
                 pattern.description, rule.name);
    for (const auto& overlap : detector.detect_overlaps(rule, config->rules)) {
      std::println("    {}: {}", display_name(overlap.type), overlap.explanation);
    }
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  try {
    IOManager::initialize_logger();
    IOManager::log("--- Organizer Started ---");

    const std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) {
      print_usage();
      return 1;
    }

    const std::string& command = args[0];
    int result = 1;
    if (command == "classify" && (args.size() == 3 || args.size() == 4)) {
      std::optional<fs::path> predictions;
      if (args.size() == 4) predictions = fs::path(args[3]);
      result = run_classify(args[1], args[2], predictions);
    } else if (command == "learn" && args.size() == 3) {
      result = run_learn(args[1], args[2]);
    } else if (command == "overlaps" && args.size() == 3) {
      result = run_overlaps(args[1], args[2]);
    } else if (command == "suggest" && args.size() == 4) {
      result = run_suggest(args[1], args[2], args[3]);
    } else {
      print_usage();
      return 1;
    }

    IOManager::log(std::format("--- Organizer Exited ({}) ---", result));
    return result;

  } catch (const std::exception& e) {
    IOManager::log(std::format("FATAL EXCEPTION: {}", e.what()));
    std::println(stderr, "\n=== FATAL ERROR ===");
    std::println(stderr, "Exception: {}", e.what());
    std::println(stderr, "Check organizer.log for details.");
    return 1;
  } catch (...) {
    IOManager::log("FATAL: Unknown exception occurred.");
    std::println(stderr, "\n=== FATAL ERROR ===");
    std::println(stderr, "Unknown exception occurred!");
    std::println(stderr, "Check organizer.log for details.");
    return 1;
  }
}
