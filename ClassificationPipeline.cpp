#include "ClassificationPipeline.hpp"

#include <algorithm>
#include <format>

#include "IOManager.hpp"

ClassificationPipeline::ClassificationPipeline(RuleEngine& engine,
                                               const PatternLearner& learner)
    : m_engine(engine), m_learner(learner) {}

std::vector<FileItem> ClassificationPipeline::run(
    const std::vector<FileItem>& files, const std::vector<Rule>& rules,
    const std::vector<LearnedPattern>& patterns,
    const std::map<std::string, Classification>& predictions, TimePoint now) {
  std::vector<LearnedPattern> positives;
  std::vector<LearnedPattern> negatives;
  for (const auto& pattern : patterns) {
    if (pattern.is_negative) {
      negatives.push_back(pattern);
    } else if (!pattern.converted_to_rule) {
      positives.push_back(pattern);
    }
  }
  const auto usable =
      m_learner.filter_with_negative_patterns(positives, negatives);

  std::vector<FileItem> result;
  result.reserve(files.size());
  for (const auto& file : files) {
    result.push_back(classify(file, rules, usable, predictions, now));
  }

  const auto ready = std::count_if(
      result.begin(), result.end(),
      [](const FileItem& f) { return f.status == FileStatus::Ready; });
  IOManager::log(std::format("Pipeline classified {} of {} files.", ready,
                             result.size()));
  return result;
}

FileItem ClassificationPipeline::classify(
    FileItem file, const std::vector<Rule>& rules,
    const std::vector<LearnedPattern>& usable_patterns,
    const std::map<std::string, Classification>& predictions, TimePoint now) {
  file = m_engine.classify(std::move(file), rules);
  if (file.status == FileStatus::Ready) return file;

  if (auto matched = apply_pattern(file, usable_patterns, now)) return *matched;
  if (auto predicted = apply_prediction(file, predictions)) return *predicted;
  return file;
}

std::optional<FileItem> ClassificationPipeline::apply_pattern(
    const FileItem& file, const std::vector<LearnedPattern>& patterns,
    TimePoint now) {
  const auto pattern = m_learner.find_matching_pattern(file, patterns, now);
  if (!pattern) return std::nullopt;

  auto destination =
      m_engine.resolve_destination(Destination::folder(pattern->destination_path));
  if (!destination) {
    IOManager::log(std::format(
        "Warning: Pattern '{}' matched '{}' but its destination could not be "
        "resolved.",
        pattern->description, file.name));
    return std::nullopt;
  }

  return apply_classification(
      file, Classification{std::move(*destination), pattern->confidence_score,
                           std::format("Learned pattern: {}",
                                       pattern->description),
                           std::nullopt, SuggestionSource::Pattern});
}

std::optional<FileItem> ClassificationPipeline::apply_prediction(
    const FileItem& file,
    const std::map<std::string, Classification>& predictions) {
  const auto it = predictions.find(file.path);
  if (it == predictions.end()) return std::nullopt;
  const Classification& prediction = it->second;

  if (file.rejected_destination == prediction.destination.display_path &&
      file.rejection_count >= m_learner.config().file_rejection_threshold) {
    IOManager::log(std::format(
        "Ignoring prediction for '{}': '{}' was rejected {} times.", file.name,
        prediction.destination.display_path, file.rejection_count));
    return std::nullopt;
  }

  auto destination = m_engine.resolve_destination(prediction.destination);
  if (!destination) {
    IOManager::log(std::format(
        "Warning: Predicted destination '{}' for '{}' could not be resolved.",
        prediction.destination.display_path, file.name));
    return std::nullopt;
  }

  return apply_classification(
      file, Classification{std::move(*destination),
                           std::clamp(prediction.confidence, 0.0, 1.0),
                           prediction.explanation, std::nullopt,
                           SuggestionSource::Prediction});
}
