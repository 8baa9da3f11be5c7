#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "../DestinationResolver.hpp"
#include "../IOManager.hpp"
#include "../types.hpp"

namespace fs = std::filesystem;

// Test fixture for IOManager and DirectoryDestinationResolver tests.
// Each test gets its own temporary directory.
class IOManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    test_dir = fs::temp_directory_path() /
               (std::string("organizer_io_test_") + info->name());
    fs::create_directories(test_dir);

    // Clear the directory in case a previous run failed to clean up.
    for (const auto& entry : fs::directory_iterator(test_dir)) {
      fs::remove_all(entry.path());
    }
  }

  void TearDown() override {
    IOManager::set_log_handler(nullptr);
    std::error_code ec;
    fs::remove_all(test_dir, ec);
  }

  fs::path WriteFile(const fs::path& relative_path, const std::string& content) {
    fs::path full_path = test_dir / relative_path;
    if (full_path.has_parent_path()) {
      fs::create_directories(full_path.parent_path());
    }
    std::ofstream ofs(full_path);
    ofs << content;
    ofs.close();
    return full_path;
  }

  fs::path test_dir;
};

TEST_F(IOManagerTest, LoadsConfigAndLinksRulesToCategories) {
  // 1. Arrange
  const auto path = WriteFile("config.json", R"({
    "categories": [
      {"id": "work", "name": "Work",
       "scope": {"type": "folders", "folders": ["/Users/test/Work"]}}
    ],
    "rules": [
      {"id": "late", "sortOrder": 2,
       "conditions": [{"type": "extensionEquals", "value": "zip"}],
       "destination": {"type": "folder", "path": "Archive"}},
      {"id": "early", "sortOrder": 1, "category": "work",
       "conditions": [{"type": "extensionEquals", "value": "pdf"},
                      {"type": "nameContains", "value": "invoice"}],
       "destination": {"type": "folder", "path": "Finance"}},
      {"id": "orphan", "sortOrder": 3, "category": "missing", "action": "delete",
       "conditions": [{"type": "negated",
                       "condition": {"type": "olderThan", "days": 30}}]}
    ],
    "learner": {"minimumOccurrences": 4, "utcOffsetMinutes": 60}
  })");

  // 2. Act
  auto config = IOManager::load_config(path);

  // 3. Assert
  ASSERT_TRUE(config.has_value());
  ASSERT_EQ(config->categories.size(), 1u);
  ASSERT_EQ(config->rules.size(), 3u);

  const Rule& early = config->rules[0];
  EXPECT_EQ(early.id, "early");
  ASSERT_NE(early.category, nullptr);
  EXPECT_EQ(early.category->name, "Work");
  EXPECT_FALSE(early.category->scope.is_global());
  EXPECT_EQ(early.logical_operator, LogicalOperator::And);
  ASSERT_TRUE(early.destination.has_value());
  EXPECT_TRUE(early.destination->needs_resolution());

  EXPECT_EQ(config->rules[1].id, "late");
  EXPECT_EQ(config->rules[1].logical_operator, LogicalOperator::Single);

  const Rule& orphan = config->rules[2];
  EXPECT_EQ(orphan.category, nullptr);
  EXPECT_EQ(orphan.action, ActionType::Delete);
  EXPECT_EQ(kind_of(orphan.conditions[0]), ConditionKind::Negated);

  EXPECT_EQ(config->learner.minimum_occurrences, 4);
  EXPECT_EQ(config->learner.utc_offset_minutes, 60);
  EXPECT_EQ(config->learner.minimum_rejections, 2);
}

TEST_F(IOManagerTest, InvalidDocumentsYieldNullopt) {
  const auto broken = WriteFile("broken.json", "{ not json");
  const auto unknown = WriteFile("unknown.json", R"({
    "rules": [{"id": "x", "conditions": [{"type": "isHuge"}]}]
  })");

  EXPECT_FALSE(IOManager::load_config(broken).has_value());
  EXPECT_FALSE(IOManager::load_config(unknown).has_value());
  EXPECT_FALSE(IOManager::load_config(test_dir / "absent.json").has_value());
}

TEST_F(IOManagerTest, PatternsSurviveSaveAndLoad) {
  // 1. Arrange
  LearnedPattern pattern;
  pattern.description = "During weekends: Move PDF files to Personal";
  pattern.file_extension = "pdf";
  pattern.destination_path = "Personal";
  pattern.conditions = {ExtensionEquals{"pdf"}, DayOfWeek{{1, 7}},
                        SizeRange{10, 20}};
  pattern.logical_operator = LogicalOperator::And;
  pattern.occurrence_count = 4;
  pattern.confidence_score = 0.75;
  pattern.last_seen_date = TimePoint(std::chrono::seconds(1700000000));
  pattern.time_category = TimeCategory::Weekends;
  pattern.temporal_contexts = {TemporalContext{12, 7, false}};
  pattern.extracted_keywords = {"family"};
  const auto path = test_dir / "patterns.json";

  // 2. Act
  ASSERT_TRUE(IOManager::save_patterns(path, {pattern}));
  auto loaded = IOManager::load_patterns(path);

  // 3. Assert
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->size(), 1u);
  const LearnedPattern& p = loaded->front();
  EXPECT_EQ(p.description, pattern.description);
  EXPECT_EQ(p.conditions, pattern.conditions);
  EXPECT_EQ(p.logical_operator, LogicalOperator::And);
  EXPECT_EQ(p.last_seen_date, pattern.last_seen_date);
  EXPECT_EQ(p.time_category, TimeCategory::Weekends);
  EXPECT_EQ(p.temporal_contexts, pattern.temporal_contexts);
  EXPECT_EQ(p.extracted_keywords, pattern.extracted_keywords);
}

TEST_F(IOManagerTest, LoadsActivityFilesAndPredictions) {
  const auto activity = WriteFile("activity.json", R"([
    {"type": "fileMoved", "fileName": "a.pdf", "fileExtension": "pdf",
     "details": "Moved to Documents", "timestamp": 1700000000},
    {"type": "fileSkipped", "fileName": "b.tmp",
     "details": "Skipped suggestion for Desktop", "timestamp": 1700000100}
  ])");
  const auto files = WriteFile("files.json", R"([
    {"name": "Report.PDF", "path": "/Users/test/Downloads/Report.PDF",
     "sizeInBytes": 2048, "location": "downloads"}
  ])");
  const auto predictions = WriteFile("predictions.json", R"({
    "/Users/test/Downloads/Report.PDF":
      {"destination": {"type": "folder", "path": "Documents"},
       "confidence": 0.7, "explanation": "Similar reports"}
  })");

  auto records = IOManager::load_activity_log(activity);
  auto items = IOManager::load_files(files);
  auto predicted = IOManager::load_predictions(predictions);

  ASSERT_TRUE(records.has_value());
  ASSERT_EQ(records->size(), 2u);
  EXPECT_EQ((*records)[0].type, ActivityType::FileMoved);
  EXPECT_FALSE((*records)[1].file_extension.has_value());

  ASSERT_TRUE(items.has_value());
  ASSERT_EQ(items->size(), 1u);
  EXPECT_EQ(items->front().extension, "PDF");
  EXPECT_EQ(items->front().location, LocationKind::Downloads);
  EXPECT_EQ(items->front().status, FileStatus::Pending);

  ASSERT_TRUE(predicted.has_value());
  const auto& prediction = predicted->at("/Users/test/Downloads/Report.PDF");
  EXPECT_EQ(prediction.source, SuggestionSource::Prediction);
  EXPECT_EQ(prediction.destination.display_path, "Documents");
}

TEST_F(IOManagerTest, PersistedTemporalContextsUseCamelCaseKeys) {
  LearnedPattern pattern;
  pattern.file_extension = "pdf";
  pattern.destination_path = "Work";
  pattern.temporal_contexts = {TemporalContext{10, 4, true}};
  const auto path = test_dir / "patterns.json";

  ASSERT_TRUE(IOManager::save_patterns(path, {pattern}));

  std::ifstream in(path);
  const json document = json::parse(in);
  const json& context = document.at(0).at("temporalContexts").at(0);
  EXPECT_EQ(context.at("hourOfDay"), 10);
  EXPECT_EQ(context.at("dayOfWeek"), 4);
  EXPECT_EQ(context.at("isWorkHours"), true);
  EXPECT_FALSE(context.contains("hour_of_day"));
}

TEST_F(IOManagerTest, OutOfRangeTimestampsAreRejected) {
  const auto activity = WriteFile("activity.json", R"([
    {"type": "fileMoved", "fileName": "a.pdf", "fileExtension": "pdf",
     "details": "Moved to Documents", "timestamp": 100000000000000}
  ])");

  EXPECT_FALSE(IOManager::load_activity_log(activity).has_value());
}

TEST_F(IOManagerTest, LogHandlerReceivesTimestampedMessages) {
  std::vector<std::string> messages;
  IOManager::set_log_handler(
      [&messages](std::string_view m) { messages.emplace_back(m); });

  IOManager::log("Warning: something happened");

  ASSERT_EQ(messages.size(), 1u);
  EXPECT_NE(messages[0].find(" | Warning: something happened"),
            std::string::npos);
}

TEST_F(IOManagerTest, DirectoryResolverExpandsHomeAndBase) {
  // 1. Arrange
  fs::create_directories(test_dir / "home" / "Pictures");
  fs::create_directories(test_dir / "base" / "Archive");
  DirectoryDestinationResolver resolver(test_dir / "base", test_dir / "home");

  // 2. Act
  auto pictures = resolver.resolve(Destination::folder("~/Pictures"));
  auto archive = resolver.resolve(Destination::folder("Archive"));
  auto missing = resolver.resolve(Destination::folder("Nowhere"));
  auto trash = resolver.resolve(Destination::trash());

  // 3. Assert
  ASSERT_TRUE(pictures.has_value());
  EXPECT_EQ(pictures->display_path, "~/Pictures");
  EXPECT_FALSE(pictures->needs_resolution());
  EXPECT_EQ(fs::path(*pictures->token()),
            fs::canonical(test_dir / "home" / "Pictures"));
  ASSERT_TRUE(archive.has_value());
  EXPECT_EQ(fs::path(*archive->token()),
            fs::canonical(test_dir / "base" / "Archive"));
  EXPECT_FALSE(missing.has_value());
  ASSERT_TRUE(trash.has_value());
  EXPECT_TRUE(trash->is_trash());
}

TEST_F(IOManagerTest, DirectoryResolverNeedsHomeForTilde) {
  DirectoryDestinationResolver resolver(test_dir, std::nullopt);

  EXPECT_FALSE(resolver.resolve(Destination::folder("~/Pictures")).has_value());
}
