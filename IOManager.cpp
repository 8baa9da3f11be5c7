#include "IOManager.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <format>
#include <fstream>
#include <functional>
#include <mutex>
#include <unordered_map>

#include "RuleEngine.hpp"
#include "utils.hpp"

namespace {
std::ofstream g_log_file;

std::mutex log_mutex;

std::function<void(std::string_view)> g_log_handler = nullptr;

// Parses a whole JSON document, logging instead of throwing.
std::optional<json> read_json(const fs::path& path, std::string_view what) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    IOManager::log(std::format("Error: {} file not found at {}", what,
                               safe_path_to_string(path)));
    return std::nullopt;
  }
  std::ifstream file(path);
  if (!file) {
    IOManager::log(std::format("Error: Could not open {} file {}", what,
                               safe_path_to_string(path)));
    return std::nullopt;
  }
  try {
    return json::parse(file);
  } catch (const json::exception& e) {
    IOManager::log(std::format("Error parsing {} file '{}': {}", what,
                               safe_path_to_string(path), e.what()));
    return std::nullopt;
  }
}

bool write_json(const fs::path& path, const json& document,
                std::string_view what) {
  std::ofstream out(path);
  if (!out) {
    IOManager::log(std::format("Error: Could not write {} to {}", what,
                               safe_path_to_string(path)));
    return false;
  }
  out << document.dump(2);
  return static_cast<bool>(out);
}

template <typename T>
std::optional<T> decode(const json& document, const fs::path& path,
                        std::string_view what) {
  try {
    return document.get<T>();
  } catch (const json::exception& e) {
    IOManager::log(std::format("Error reading {} from '{}': {}", what,
                               safe_path_to_string(path), e.what()));
  } catch (const std::invalid_argument& e) {
    IOManager::log(std::format("Error reading {} from '{}': {}", what,
                               safe_path_to_string(path), e.what()));
  }
  return std::nullopt;
}

}  // namespace

void IOManager::initialize_logger(const fs::path& logPath) {
  std::scoped_lock lock(log_mutex);
  if (g_log_file.is_open()) g_log_file.close();
  g_log_file.open(logPath, std::ios_base::app);
}

void IOManager::set_log_handler(std::function<void(std::string_view)> handler) {
  std::scoped_lock lock(log_mutex);
  g_log_handler = handler;
}

void IOManager::log(std::string_view message) {
  std::scoped_lock lock(log_mutex);
  if (!g_log_handler && !g_log_file.is_open()) return;

  auto now = std::chrono::floor<std::chrono::seconds>(
      std::chrono::system_clock::now());
  auto time_str = std::format("{:%Y-%m-%d %H:%M:%S}", now);
  std::string full_message = std::format("{} | {}", time_str, message);

  if (g_log_handler) {
    g_log_handler(full_message);
  }

  if (g_log_file.is_open()) {
    g_log_file << full_message << "\n" << std::flush;
  }
}

std::optional<fs::path> IOManager::get_home_directory() {
  const char* home_dir = std::getenv("HOME");
  if (home_dir && *home_dir) return fs::path(home_dir);
#ifdef _WIN32
  const char* profile = std::getenv("USERPROFILE");
  if (profile && *profile) return fs::path(profile);
#endif
  return std::nullopt;
}

std::optional<Config> IOManager::load_config(const fs::path& configPath) {
  auto document = read_json(configPath, "config");
  if (!document) return std::nullopt;

  try {
    const json& configJson = *document;
    Config config;

    std::unordered_map<std::string, std::shared_ptr<const Category>> by_id;
    if (configJson.contains("categories")) {
      for (const auto& entry : configJson.at("categories")) {
        auto category = std::make_shared<const Category>(entry.get<Category>());
        by_id[category->id] = category;
        config.categories.push_back(category);
      }
    }

    if (configJson.contains("rules")) {
      for (const auto& entry : configJson.at("rules")) {
        Rule rule = entry.get<Rule>();
        if (entry.contains("category")) {
          const auto category_id = entry.at("category").get<std::string>();
          if (auto it = by_id.find(category_id); it != by_id.end()) {
            rule.category = it->second;
          } else {
            log(std::format(
                "Warning: Rule '{}' references unknown category '{}'; "
                "treating it as global.",
                rule.id, category_id));
          }
        }
        config.rules.push_back(std::move(rule));
      }
    }
    sort_rules_by_priority(config.rules);

    if (configJson.contains("learner")) {
      configJson.at("learner").get_to(config.learner);
    }

    log(std::format("Loaded {} categories and {} rules from {}",
                    config.categories.size(), config.rules.size(),
                    safe_path_to_string(configPath)));
    return config;
  } catch (const json::exception& e) {
    log(std::format("Error parsing config.json: {}", e.what()));
  } catch (const std::invalid_argument& e) {
    log(std::format("Error parsing config.json: {}", e.what()));
  }
  return std::nullopt;
}

std::optional<std::vector<ActivityRecord>> IOManager::load_activity_log(
    const fs::path& activityPath) {
  auto document = read_json(activityPath, "activity log");
  if (!document) return std::nullopt;
  return decode<std::vector<ActivityRecord>>(*document, activityPath,
                                             "activity records");
}

std::optional<std::vector<FileItem>> IOManager::load_files(
    const fs::path& filesPath) {
  auto document = read_json(filesPath, "file list");
  if (!document) return std::nullopt;
  return decode<std::vector<FileItem>>(*document, filesPath, "files");
}

std::optional<std::map<std::string, Classification>>
IOManager::load_predictions(const fs::path& predictionsPath) {
  auto document = read_json(predictionsPath, "predictions");
  if (!document) return std::nullopt;
  return decode<std::map<std::string, Classification>>(
      *document, predictionsPath, "predictions");
}

std::optional<std::vector<LearnedPattern>> IOManager::load_patterns(
    const fs::path& patternsPath) {
  auto document = read_json(patternsPath, "patterns");
  if (!document) return std::nullopt;
  return decode<std::vector<LearnedPattern>>(*document, patternsPath,
                                             "learned patterns");
}

bool IOManager::save_patterns(const fs::path& patternsPath,
                              const std::vector<LearnedPattern>& patterns) {
  if (!write_json(patternsPath, json(patterns), "patterns")) return false;
  log(std::format("Saved {} learned patterns to {}", patterns.size(),
                  safe_path_to_string(patternsPath)));
  return true;
}

bool IOManager::save_classifications(const fs::path& outputPath,
                                     const std::vector<FileItem>& files) {
  if (!write_json(outputPath, json(files), "classifications")) return false;
  log(std::format("Saved {} classified files to {}", files.size(),
                  safe_path_to_string(outputPath)));
  return true;
}
