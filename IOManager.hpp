#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace IOManager {
// Opens (appending) the log file. Until this is called, messages only reach
// the installed handler, if any.
void initialize_logger(const fs::path& logPath = "organizer.log");

void set_log_handler(std::function<void(std::string_view)> handler);

void log(std::string_view message);

std::optional<fs::path> get_home_directory();

// Loads categories, rules (sorted by priority) and learner settings.
std::optional<Config> load_config(const fs::path& configPath);
std::optional<std::vector<ActivityRecord>> load_activity_log(
    const fs::path& activityPath);
std::optional<std::vector<FileItem>> load_files(const fs::path& filesPath);
// Predictions keyed by file path.
std::optional<std::map<std::string, Classification>> load_predictions(
    const fs::path& predictionsPath);
std::optional<std::vector<LearnedPattern>> load_patterns(
    const fs::path& patternsPath);

bool save_patterns(const fs::path& patternsPath,
                   const std::vector<LearnedPattern>& patterns);
bool save_classifications(const fs::path& outputPath,
                          const std::vector<FileItem>& files);
}  // namespace IOManager
