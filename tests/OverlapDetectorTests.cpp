#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../Conditions.hpp"
#include "../OverlapDetector.hpp"
#include "../types.hpp"

class OverlapDetectorTest : public ::testing::Test {
 protected:
  Rule MakeRule(const std::string& id, std::vector<Condition> conditions,
                const std::string& destination,
                LogicalOperator op = LogicalOperator::Single) {
    Rule rule;
    rule.id = id;
    rule.name = id;
    rule.conditions = std::move(conditions);
    rule.logical_operator = op;
    rule.destination = Destination::folder(destination);
    return rule;
  }

  std::shared_ptr<const Category> FolderCategory(
      const std::string& name, std::vector<std::string> folders) {
    auto category = std::make_shared<Category>();
    category->id = name;
    category->name = name;
    category->scope.kind = CategoryScope::Kind::Folders;
    category->scope.folders = std::move(folders);
    return category;
  }

  OverlapDetector detector;
};

TEST_F(OverlapDetectorTest, BroaderCandidateIsReportedAsSuperset) {
  // 1. Arrange
  Rule existing = MakeRule(
      "invoices",
      {Conditions::extension_equals("pdf"), Conditions::name_contains("invoice")},
      "Finance", LogicalOperator::And);
  Rule candidate =
      MakeRule("all-pdfs", {Conditions::extension_equals("pdf")}, "Documents");

  // 2. Act
  auto overlaps = detector.detect_overlaps(candidate, {existing});

  // 3. Assert
  ASSERT_EQ(overlaps.size(), 1u);
  EXPECT_EQ(overlaps[0].type, OverlapType::Superset);
  EXPECT_EQ(overlaps[0].existing_rule.id, "invoices");
  EXPECT_EQ(overlaps[0].explanation,
            "This rule is broader than 'General/pdf & invoice'. It may match "
            "files the existing rule was meant to handle.");
  ASSERT_TRUE(overlaps[0].suggestion.has_value());
}

TEST_F(OverlapDetectorTest, NarrowerCandidateIsReportedAsSubset) {
  Rule existing =
      MakeRule("all-pdfs", {Conditions::extension_equals("pdf")}, "Documents");
  Rule candidate = MakeRule(
      "invoices",
      {Conditions::extension_equals("PDF"), Conditions::name_contains("invoice")},
      "Finance", LogicalOperator::And);

  auto overlaps = detector.detect_overlaps(candidate, {existing});

  ASSERT_EQ(overlaps.size(), 1u);
  EXPECT_EQ(overlaps[0].type, OverlapType::Subset);
  EXPECT_TRUE(overlaps[0].suggestion.has_value());
}

TEST_F(OverlapDetectorTest, SubsetWithSameDestinationHasNoSuggestion) {
  Rule existing =
      MakeRule("all-pdfs", {Conditions::extension_equals("pdf")}, "Documents");
  Rule candidate = MakeRule(
      "invoices",
      {Conditions::extension_equals("pdf"), Conditions::name_contains("invoice")},
      "Documents", LogicalOperator::And);

  auto overlaps = detector.detect_overlaps(candidate, {existing});

  ASSERT_EQ(overlaps.size(), 1u);
  EXPECT_EQ(overlaps[0].type, OverlapType::Subset);
  EXPECT_FALSE(overlaps[0].suggestion.has_value());
}

TEST_F(OverlapDetectorTest, IdenticalConditionsAndDestinationAreDuplicates) {
  Rule existing =
      MakeRule("a", {Conditions::extension_equals(".PDF")}, "Documents");
  Rule candidate =
      MakeRule("b", {Conditions::extension_equals("pdf")}, "Documents");

  auto overlaps = detector.detect_overlaps(candidate, {existing});

  ASSERT_EQ(overlaps.size(), 1u);
  EXPECT_EQ(overlaps[0].type, OverlapType::ExactDuplicate);
  EXPECT_EQ(overlaps[0].suggestion, "Consider deleting one of these rules.");
}

TEST_F(OverlapDetectorTest, IdenticalConditionsWithOtherDestinationConflict) {
  Rule existing = MakeRule(
      "a", {Conditions::kind_equals("image"), Conditions::older_than(30)},
      "Pictures", LogicalOperator::And);
  Rule candidate = MakeRule(
      "b", {Conditions::older_than(30), Conditions::kind_equals("images")},
      "Archive", LogicalOperator::And);

  auto overlaps = detector.detect_overlaps(candidate, {existing});

  ASSERT_EQ(overlaps.size(), 1u);
  EXPECT_EQ(overlaps[0].type, OverlapType::ConflictingDestination);
}

TEST_F(OverlapDetectorTest, TrashDestinationsMatchEachOther) {
  Rule existing = MakeRule("a", {Conditions::extension_equals("tmp")}, "x");
  existing.action = ActionType::Delete;
  existing.destination = Destination::trash();
  Rule candidate = existing;
  candidate.id = "b";

  auto overlaps = detector.detect_overlaps(candidate, {existing});

  ASSERT_EQ(overlaps.size(), 1u);
  EXPECT_EQ(overlaps[0].type, OverlapType::ExactDuplicate);
  EXPECT_FALSE(OverlapDetector::destinations_match(Destination::trash(),
                                                   Destination::folder("Trash")));
  EXPECT_TRUE(OverlapDetector::destinations_match(std::nullopt, std::nullopt));
}

TEST_F(OverlapDetectorTest, LongerAgeThresholdMatchesFewerFiles) {
  EXPECT_EQ(OverlapDetector::compare_single(Conditions::older_than(30),
                                            Conditions::older_than(7)),
            ConditionRelation::Subset);
  EXPECT_EQ(OverlapDetector::compare_single(Conditions::modified_older_than(7),
                                            Conditions::modified_older_than(30)),
            ConditionRelation::Superset);
  EXPECT_EQ(OverlapDetector::compare_single(Conditions::larger_than(100),
                                            Conditions::larger_than(100)),
            ConditionRelation::Identical);
  EXPECT_EQ(OverlapDetector::compare_single(Conditions::older_than(30, "dmg"),
                                            Conditions::older_than(7, "zip")),
            ConditionRelation::None);
  EXPECT_EQ(OverlapDetector::compare_single(Conditions::older_than(30, "dmg"),
                                            Conditions::older_than(7)),
            ConditionRelation::Partial);
}

TEST_F(OverlapDetectorTest, NameFragmentRelations) {
  EXPECT_EQ(OverlapDetector::compare_single(Conditions::name_contains("invoice_2024"),
                                            Conditions::name_contains("Invoice")),
            ConditionRelation::Subset);
  EXPECT_EQ(OverlapDetector::compare_single(Conditions::name_contains("draft"),
                                            Conditions::name_contains("final")),
            ConditionRelation::Partial);
  EXPECT_EQ(OverlapDetector::compare_single(Conditions::name_starts_with("IMG"),
                                            Conditions::name_starts_with("img_20")),
            ConditionRelation::Superset);
  EXPECT_EQ(OverlapDetector::compare_single(Conditions::name_starts_with("IMG"),
                                            Conditions::name_starts_with("DSC")),
            ConditionRelation::None);
  EXPECT_EQ(OverlapDetector::compare_single(Conditions::name_ends_with("_final"),
                                            Conditions::name_ends_with("final")),
            ConditionRelation::Subset);
}

TEST_F(OverlapDetectorTest, DifferentConditionKindsMayOverlap) {
  EXPECT_EQ(OverlapDetector::compare_single(Conditions::extension_equals("pdf"),
                                            Conditions::larger_than(1024)),
            ConditionRelation::Partial);
  EXPECT_EQ(OverlapDetector::compare_single(
                Conditions::from_location(LocationKind::Desktop),
                Conditions::from_location(LocationKind::Downloads)),
            ConditionRelation::None);
}

TEST_F(OverlapDetectorTest, NegationInvertsRelation) {
  const Condition not_old = Conditions::negated(Conditions::older_than(30));
  const Condition not_older = Conditions::negated(Conditions::older_than(7));
  EXPECT_EQ(OverlapDetector::compare_single(not_old, not_older),
            ConditionRelation::Superset);

  const Condition not_pdf = Conditions::negated(Conditions::extension_equals("pdf"));
  const Condition not_doc = Conditions::negated(Conditions::extension_equals("doc"));
  EXPECT_EQ(OverlapDetector::compare_single(not_pdf, not_doc),
            ConditionRelation::Partial);
}

TEST_F(OverlapDetectorTest, OrSetsWidenWithMoreConditions) {
  const std::vector<Condition> audio = {Conditions::extension_equals("mp3"),
                                        Conditions::extension_equals("wav")};
  const std::vector<Condition> mp3 = {Conditions::extension_equals("mp3")};

  EXPECT_EQ(OverlapDetector::compare_conditions(mp3, LogicalOperator::Single,
                                                audio, LogicalOperator::Or),
            ConditionRelation::Subset);
  EXPECT_EQ(OverlapDetector::compare_conditions(audio, LogicalOperator::Or, mp3,
                                                LogicalOperator::Single),
            ConditionRelation::Superset);
  EXPECT_EQ(OverlapDetector::compare_conditions({}, LogicalOperator::Single, mp3,
                                                LogicalOperator::Single),
            ConditionRelation::None);
}

TEST_F(OverlapDetectorTest, PartialOverlapIsReportedOnlyForOtherDestinations) {
  // 1. Arrange
  Rule existing =
      MakeRule("big", {Conditions::larger_than(100 * 1024 * 1024)}, "Archive");
  Rule elsewhere = MakeRule("videos", {Conditions::kind_equals("video")}, "Movies");
  Rule same_place =
      MakeRule("videos", {Conditions::kind_equals("video")}, "Archive");

  // 2. Act
  auto conflicting = detector.detect_overlaps(elsewhere, {existing});
  auto harmless = detector.detect_overlaps(same_place, {existing});

  // 3. Assert
  ASSERT_EQ(conflicting.size(), 1u);
  EXPECT_EQ(conflicting[0].type, OverlapType::PartialOverlap);
  EXPECT_FALSE(conflicting[0].suggestion.has_value());
  EXPECT_TRUE(harmless.empty());
}

TEST_F(OverlapDetectorTest, DifferentExtensionsDoNotOverlap) {
  Rule existing = MakeRule("pdf", {Conditions::extension_equals("pdf")}, "Docs");
  Rule candidate = MakeRule("jpg", {Conditions::extension_equals("jpg")}, "Pics");

  EXPECT_TRUE(detector.detect_overlaps(candidate, {existing}).empty());
}

TEST_F(OverlapDetectorTest, DisabledAndExcludedRulesAreIgnored) {
  Rule candidate = MakeRule("edit-me", {Conditions::extension_equals("pdf")}, "Docs");
  Rule disabled = candidate;
  disabled.id = "disabled";
  disabled.is_enabled = false;
  Rule self = candidate;

  auto overlaps =
      detector.detect_overlaps(candidate, {disabled, self}, std::string("edit-me"));

  EXPECT_TRUE(overlaps.empty());
}

TEST_F(OverlapDetectorTest, DisjointFolderScopesNeverOverlap) {
  Rule existing = MakeRule("a", {Conditions::extension_equals("pdf")}, "Docs");
  existing.category = FolderCategory("Work", {"/Users/test/Work"});
  Rule candidate = MakeRule("b", {Conditions::extension_equals("pdf")}, "Docs");
  candidate.category = FolderCategory("Home", {"/Users/test/Personal"});

  EXPECT_TRUE(detector.detect_overlaps(candidate, {existing}).empty());

  candidate.category = FolderCategory("Projects", {"/Users/test/Work/Projects"});
  auto nested = detector.detect_overlaps(candidate, {existing});
  ASSERT_EQ(nested.size(), 1u);
  EXPECT_EQ(nested[0].explanation,
            "This rule has identical conditions and destination as 'Work/pdf'.");

  candidate.category = nullptr;
  EXPECT_EQ(detector.detect_overlaps(candidate, {existing}).size(), 1u);
}

TEST_F(OverlapDetectorTest, EmptyScopeFolderOverlapsNothing) {
  Rule existing = MakeRule("a", {Conditions::extension_equals("pdf")}, "Docs");
  existing.category = FolderCategory("Work", {"/Users/test/Work"});
  Rule candidate = MakeRule("b", {Conditions::extension_equals("pdf")}, "Docs");
  candidate.category = FolderCategory("Blank", {""});

  EXPECT_FALSE(OverlapDetector::scopes_could_overlap(candidate, existing));
  EXPECT_TRUE(detector.detect_overlaps(candidate, {existing}).empty());
}

TEST_F(OverlapDetectorTest, ResultsAreOrderedBySeverity) {
  Rule candidate = MakeRule("new", {Conditions::extension_equals("pdf")}, "Docs");
  std::vector<Rule> existing = {
      MakeRule("partial", {Conditions::larger_than(1024)}, "Big"),
      MakeRule("conflict", {Conditions::extension_equals("pdf")}, "Other"),
      MakeRule("duplicate", {Conditions::extension_equals("pdf")}, "Docs"),
  };

  auto overlaps = detector.detect_overlaps(candidate, existing);

  ASSERT_EQ(overlaps.size(), 3u);
  EXPECT_EQ(overlaps[0].existing_rule.id, "duplicate");
  EXPECT_EQ(overlaps[1].existing_rule.id, "conflict");
  EXPECT_EQ(overlaps[2].existing_rule.id, "partial");
}

TEST_F(OverlapDetectorTest, SeverityAndDisplayNames) {
  EXPECT_EQ(severity(OverlapType::ExactDuplicate), 3);
  EXPECT_EQ(severity(OverlapType::ConflictingDestination), 2);
  EXPECT_EQ(severity(OverlapType::Subset), 1);
  EXPECT_EQ(severity(OverlapType::Superset), 1);
  EXPECT_EQ(severity(OverlapType::PartialOverlap), 0);
  EXPECT_EQ(display_name(OverlapType::Subset), "Subset Rule");
  EXPECT_EQ(display_name(OverlapType::Superset), "Broader Rule");
  EXPECT_EQ(display_name(OverlapType::PartialOverlap), "Partial Overlap");
}
