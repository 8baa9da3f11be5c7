#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "../PatternAnalysis.hpp"
#include "../types.hpp"

class PatternAnalysisTest : public ::testing::Test {
 protected:
  LearnedPattern MakePattern(const std::string& ext,
                             const std::string& destination,
                             double confidence = 0.8) {
    LearnedPattern pattern;
    pattern.description = "Move " + ext + " files";
    pattern.file_extension = ext;
    pattern.destination_path = destination;
    pattern.occurrence_count = 3;
    pattern.confidence_score = confidence;
    return Patterns::add_condition(pattern, ExtensionEquals{ext});
  }

  static TemporalContext Context(int hour, int day, bool work) {
    return TemporalContext{hour, day, work};
  }
};

TEST_F(PatternAnalysisTest, ExtractsDestinationAfterFirstMarker) {
  EXPECT_EQ(Patterns::extract_destination("Moved to Documents/Finance"),
            "Documents/Finance");
  EXPECT_EQ(Patterns::extract_destination("organized TO ~/Pictures/Screens  "),
            "~/Pictures/Screens");
  EXPECT_EQ(Patterns::extract_destination("Sent to Archive"), "Archive");
  EXPECT_EQ(Patterns::extract_destination("Scanned"), "");
}

TEST_F(PatternAnalysisTest, ExtractsRejectedDestination) {
  EXPECT_EQ(Patterns::extract_rejected_destination(
                "Skipped suggestion for Desktop/Temp"),
            "Desktop/Temp");
  EXPECT_EQ(Patterns::extract_rejected_destination("rejected Downloads/Old"),
            "Downloads/Old");
  EXPECT_EQ(Patterns::extract_rejected_destination("Skipped: Archive "),
            "Archive");
  EXPECT_EQ(Patterns::extract_rejected_destination("Skipped"), "");
}

TEST_F(PatternAnalysisTest, UpdatesReturnNewValuesAndLeaveOriginalIntact) {
  const LearnedPattern original = MakePattern("pdf", "Documents");

  const LearnedPattern negative = Patterns::convert_to_negative(original);
  const LearnedPattern rejected = Patterns::record_rejection(original);
  const LearnedPattern converted = Patterns::mark_converted(original);

  EXPECT_FALSE(original.is_negative);
  EXPECT_EQ(original.rejection_count, 0);
  EXPECT_FALSE(original.converted_to_rule);
  EXPECT_TRUE(negative.is_negative);
  EXPECT_DOUBLE_EQ(negative.confidence_score, 1.0);
  EXPECT_EQ(rejected.rejection_count, 1);
  EXPECT_TRUE(converted.converted_to_rule);
}

TEST_F(PatternAnalysisTest, RecordNewOccurrenceTracksContextAndClampsConfidence) {
  using namespace std::chrono;
  // Wednesday 2024-03-06, 10:00 UTC
  const TimePoint wednesday_morning = sys_days(year{2024} / March / 6) + hours(10);

  LearnedPattern pattern = MakePattern("pdf", "Documents");
  pattern = Patterns::record_new_occurrence(pattern, 1.4, wednesday_morning);
  pattern = Patterns::record_new_occurrence(pattern, 0.9, wednesday_morning + hours(1));
  pattern = Patterns::record_new_occurrence(pattern, 0.95, wednesday_morning + hours(2));

  EXPECT_EQ(pattern.occurrence_count, 6);
  EXPECT_DOUBLE_EQ(pattern.confidence_score, 0.95);
  EXPECT_EQ(pattern.last_seen_date, wednesday_morning + hours(2));
  ASSERT_EQ(pattern.temporal_contexts.size(), 3u);
  EXPECT_EQ(pattern.time_category, TimeCategory::WorkHours);

  const LearnedPattern clamped =
      Patterns::record_new_occurrence(MakePattern("a", "b"), 1.4, wednesday_morning);
  EXPECT_DOUBLE_EQ(clamped.confidence_score, 1.0);
}

TEST_F(PatternAnalysisTest, AddConditionUpgradesToAndAndIgnoresDuplicates) {
  LearnedPattern pattern = MakePattern("pdf", "Documents");
  EXPECT_EQ(pattern.logical_operator, LogicalOperator::Single);

  pattern = Patterns::add_condition(pattern, ExtensionEquals{"pdf"});
  EXPECT_EQ(pattern.conditions.size(), 1u);

  pattern = Patterns::add_condition(pattern, NameContains{"invoice"});
  EXPECT_EQ(pattern.conditions.size(), 2u);
  EXPECT_EQ(pattern.logical_operator, LogicalOperator::And);
}

TEST_F(PatternAnalysisTest, AddKeywordNormalizes) {
  LearnedPattern pattern = MakePattern("pdf", "Documents");
  pattern = Patterns::add_keyword(pattern, "  Invoice ");
  pattern = Patterns::add_keyword(pattern, "invoice");
  pattern = Patterns::add_keyword(pattern, "   ");

  ASSERT_EQ(pattern.extracted_keywords.size(), 1u);
  EXPECT_EQ(pattern.extracted_keywords[0], "invoice");
}

TEST_F(PatternAnalysisTest, CategorizeNeedsThreeContextsAndSixtyPercent) {
  EXPECT_EQ(Patterns::categorize({Context(10, 3, true), Context(11, 3, true)}),
            TimeCategory::AnyTime);
  EXPECT_EQ(Patterns::categorize({Context(10, 3, true), Context(11, 4, true),
                                  Context(20, 4, false)}),
            TimeCategory::WorkHours);
  EXPECT_EQ(Patterns::categorize({Context(19, 3, false), Context(21, 4, false),
                                  Context(22, 5, false)}),
            TimeCategory::Evenings);
  EXPECT_EQ(Patterns::categorize({Context(6, 3, false), Context(7, 4, false),
                                  Context(8, 5, false)}),
            TimeCategory::Mornings);
  EXPECT_EQ(Patterns::categorize({Context(10, 1, false), Context(12, 7, false),
                                  Context(15, 1, false)}),
            TimeCategory::Weekends);
}

TEST_F(PatternAnalysisTest, ConfidenceLevels) {
  EXPECT_EQ(Patterns::confidence_level(0.85), "High");
  EXPECT_EQ(Patterns::confidence_level(0.7), "High");
  EXPECT_EQ(Patterns::confidence_level(0.5), "Medium");
  EXPECT_EQ(Patterns::confidence_level(0.49), "Low");
}

TEST_F(PatternAnalysisTest, NegativePatternSuppressesMatchingPair) {
  const LearnedPattern negative =
      Patterns::convert_to_negative(MakePattern("tmp", "Desktop/Temp"));
  const LearnedPattern positive = MakePattern("tmp", "Desktop/Temp");

  EXPECT_TRUE(Patterns::should_suppress(negative, "tmp", "Desktop/Temp"));
  EXPECT_TRUE(Patterns::should_suppress(negative, ".TMP", "Desktop/Temp"));
  EXPECT_FALSE(Patterns::should_suppress(negative, "tmp", "Desktop/Other"));
  EXPECT_TRUE(Patterns::should_suppress(negative, positive));
  EXPECT_FALSE(Patterns::should_suppress(positive, positive));
  EXPECT_FALSE(Patterns::should_suppress(negative, MakePattern("log", "Desktop/Temp")));
}

TEST_F(PatternAnalysisTest, SimplePatternConvertsToDisabledExtensionRule) {
  const LearnedPattern pattern = MakePattern("pdf", "Documents/Finance");

  const Rule rule = Patterns::to_rule(pattern);

  EXPECT_EQ(rule.name, "PDF → Finance");
  ASSERT_EQ(rule.conditions.size(), 1u);
  EXPECT_EQ(rule.conditions[0].value.index(),
            static_cast<size_t>(ConditionKind::ExtensionEquals));
  EXPECT_EQ(rule.logical_operator, LogicalOperator::Single);
  EXPECT_EQ(rule.action, ActionType::Move);
  ASSERT_TRUE(rule.destination.has_value());
  EXPECT_TRUE(rule.destination->needs_resolution());
  EXPECT_EQ(rule.destination->display_path, "Documents/Finance");
  EXPECT_FALSE(rule.is_enabled);
  EXPECT_TRUE(Patterns::to_rule(pattern, true).is_enabled);
}

TEST_F(PatternAnalysisTest, CompoundPatternKeepsConditionsAndDropsTime) {
  LearnedPattern pattern = MakePattern("pdf", "Documents/Invoices");
  pattern = Patterns::add_condition(pattern, NameContains{"invoice"});
  pattern = Patterns::add_condition(pattern, SizeRange{1024, 4096});
  pattern = Patterns::add_condition(pattern, TimeOfDay{9, 17});

  const Rule rule = Patterns::to_rule(pattern);

  EXPECT_EQ(rule.name, ".pdf files + name contains 'invoice' → Invoices");
  ASSERT_EQ(rule.conditions.size(), 3u);
  EXPECT_EQ(kind_of(rule.conditions[0]), ConditionKind::ExtensionEquals);
  EXPECT_EQ(kind_of(rule.conditions[1]), ConditionKind::NameContains);
  EXPECT_EQ(kind_of(rule.conditions[2]), ConditionKind::LargerThan);
  EXPECT_EQ(std::get<LargerThan>(rule.conditions[2].value).bytes, 1024);
  EXPECT_EQ(rule.logical_operator, LogicalOperator::And);
}

TEST_F(PatternAnalysisTest, NegativeDescriptionMentionsConditions) {
  const LearnedPattern negative =
      Patterns::convert_to_negative(MakePattern("tmp", "Desktop/Temp"));
  EXPECT_EQ(Patterns::negative_description(negative),
            "Never move .tmp files to Desktop/Temp");
}

TEST_F(PatternAnalysisTest, PredictionOutcomesTrackRejections) {
  FileItem file;
  file.name = "a.pdf";

  file = Patterns::record_prediction_outcome(file, "Documents", PredictionOutcome::Dismissed);
  file = Patterns::record_prediction_outcome(file, "Documents", PredictionOutcome::Overridden);
  EXPECT_EQ(file.rejected_destination, "Documents");
  EXPECT_EQ(file.rejection_count, 2);

  file = Patterns::record_prediction_outcome(file, "Documents", PredictionOutcome::Unknown);
  EXPECT_EQ(file.rejection_count, 2);

  file = Patterns::record_prediction_outcome(file, "Documents", PredictionOutcome::Accepted);
  EXPECT_EQ(file.rejection_count, 0);
  EXPECT_FALSE(file.rejected_destination.has_value());
}
