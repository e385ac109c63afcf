#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "infrastructure/logging/logger.hpp"

using namespace PSB;

// EN: Test fixture: a private logger with console output disabled and a capturing listener.
// FR: Fixture de test : un logger privé sans sortie console et un écouteur de capture.
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger.setConsoleOutput(false);
        logger.addListener([this](const Logger::LogEntry& entry) { entries.push_back(entry); });
    }

    Logger logger;
    std::vector<Logger::LogEntry> entries;
};

TEST_F(LoggerTest, LevelFiltering) {
    logger.setLogLevel(LogLevel::WARN);

    logger.debug("test", "hidden");
    logger.info("test", "hidden");
    logger.notice("test", "hidden");
    logger.warn("test", "shown");
    logger.error("test", "shown");

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].level, LogLevel::WARN);
    EXPECT_EQ(entries[1].level, LogLevel::ERROR);
}

TEST_F(LoggerTest, VerbosityPresets) {
    logger.setVerbosity(Verbosity::QUIET);
    EXPECT_EQ(logger.getLogLevel(), LogLevel::ERROR);
    logger.setVerbosity(Verbosity::NORMAL);
    EXPECT_EQ(logger.getLogLevel(), LogLevel::NOTICE);
    logger.setVerbosity(Verbosity::VERBOSE);
    EXPECT_EQ(logger.getLogLevel(), LogLevel::INFO);
    logger.setVerbosity(Verbosity::DEBUG);
    EXPECT_EQ(logger.getLogLevel(), LogLevel::DEBUG);
}

TEST_F(LoggerTest, MetadataAndCorrelationId) {
    const std::string correlation_id = logger.generateCorrelationId();
    EXPECT_GT(correlation_id.length(), 30u);
    EXPECT_NE(correlation_id.find('-'), std::string::npos);

    logger.setCorrelationId(correlation_id);
    logger.addGlobalMetadata("site", "blog");
    logger.notice("builder", "Loading pages", {{"step_index", "1"}, {"site", "override"}});

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].correlation_id, correlation_id);
    EXPECT_EQ(entries[0].module, "builder");
    EXPECT_EQ(entries[0].metadata.at("step_index"), "1");
    // EN: Entry metadata wins over global metadata.
    // FR: Les métadonnées de l'entrée priment sur les métadonnées globales.
    EXPECT_EQ(entries[0].metadata.at("site"), "override");
}

TEST_F(LoggerTest, NDJSONEscapesMessages) {
    Logger::LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.level = LogLevel::NOTICE;
    entry.message = "Built \"site\"\nin 1 s";
    entry.module = "builder";
    entry.thread_id = "1";
    entry.metadata = {{"step", "Saving pages"}};

    auto line = nlohmann::json::parse(Logger::formatAsNDJSON(entry));
    EXPECT_EQ(line["level"], "NOTICE");
    EXPECT_EQ(line["message"], "Built \"site\"\nin 1 s");
    EXPECT_EQ(line["step"], "Saving pages");
    EXPECT_TRUE(line.contains("timestamp"));
}

TEST_F(LoggerTest, OutputFileReceivesOneLinePerEntry) {
    const auto path = std::filesystem::temp_directory_path() / "papyrus_logger_test.ndjson";
    std::filesystem::remove(path);

    logger.setOutputFile(path.string());
    logger.info("test", "first");
    logger.error("test", "second");
    logger.flush();

    std::ifstream input(path);
    std::string line;
    int lines = 0;
    while (std::getline(input, line)) {
        auto parsed = nlohmann::json::parse(line);
        EXPECT_EQ(parsed["module"], "test");
        ++lines;
    }
    EXPECT_EQ(lines, 2);

    std::filesystem::remove(path);
}

TEST_F(LoggerTest, ListenersCanBeCleared) {
    logger.info("test", "captured");
    logger.clearListeners();
    logger.info("test", "not captured");
    EXPECT_EQ(entries.size(), 1u);
}
