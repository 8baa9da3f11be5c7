#pragma once

#include <map>
#include <string>
#include <vector>

#include "PatternLearner.hpp"
#include "RuleEngine.hpp"
#include "types.hpp"

// Combines the three suggestion sources. Rules are tried first; files they
// leave pending fall back to learned patterns, then to external predictions
// keyed by file path. Every decision records which source produced it.
class ClassificationPipeline {
 public:
  ClassificationPipeline(RuleEngine& engine, const PatternLearner& learner);

  std::vector<FileItem> run(
      const std::vector<FileItem>& files, const std::vector<Rule>& rules,
      const std::vector<LearnedPattern>& patterns,
      const std::map<std::string, Classification>& predictions,
      TimePoint now = Clock::now());

  FileItem classify(FileItem file, const std::vector<Rule>& rules,
                    const std::vector<LearnedPattern>& usable_patterns,
                    const std::map<std::string, Classification>& predictions,
                    TimePoint now);

 private:
  std::optional<FileItem> apply_pattern(
      const FileItem& file, const std::vector<LearnedPattern>& patterns,
      TimePoint now);
  std::optional<FileItem> apply_prediction(
      const FileItem& file,
      const std::map<std::string, Classification>& predictions);

  RuleEngine& m_engine;
  const PatternLearner& m_learner;
};
