#ifndef BULK_RENAME_TEST_HELPERS_H
#define BULK_RENAME_TEST_HELPERS_H

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "core/LogManager.h"
#include "features/FileLister.h"
#include "features/MatchReporter.h"

namespace BulkRename {
namespace Testing {

namespace fs = std::filesystem;

/**
 * Reporter that records every event
 */
class RecordingReporter : public MatchReporter {
public:
    void onBatchStart(const RenameOptions& options) override {
        (void)options;
        ++batchStarts;
    }
    void onStage(BatchStage stage) override { stages.push_back(stage); }
    void onNoMatch(const std::string& filename) override { noMatches.push_back(filename); }
    void onMatch(const Match& match, bool dryRun) override {
        matched.push_back(match.sourceName());
        lastDryRun = dryRun;
    }
    void onRenamed(const Match& match) override { renamed.push_back(match.sourceName()); }
    void onRenameFailed(const Match& match, const Error& error) override {
        failed.push_back(match.sourceName());
        failureCodes.push_back(error.code());
    }
    void onBatchFinished(size_t matchCount, bool dryRun) override {
        finishedCount = matchCount;
        finishedDryRun = dryRun;
        ++batchFinishes;
    }

    int batchStarts = 0;
    int batchFinishes = 0;
    std::vector<BatchStage> stages;
    std::vector<std::string> noMatches;
    std::vector<std::string> matched;
    std::vector<std::string> renamed;
    std::vector<std::string> failed;
    std::vector<ErrorCode> failureCodes;
    bool lastDryRun = false;
    size_t finishedCount = 0;
    bool finishedDryRun = false;
};

/**
 * Lister returning a fixed set of names
 */
class FixedLister : public FileLister {
public:
    explicit FixedLister(std::vector<std::string> names) : m_names(std::move(names)) {}

    std::vector<std::string> listFiles(const std::string& root, bool recursive) const override {
        (void)root;
        (void)recursive;
        return m_names;
    }

private:
    std::vector<std::string> m_names;
};

/**
 * Fixture providing an empty scratch directory per test
 */
class TempDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        LogManager::instance().setConsoleOutput(false);

        static std::atomic<int> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_dir = fs::temp_directory_path() /
                ("bulkrename_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        fs::create_directories(m_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(m_dir, ec);
    }

    void touch(const std::string& relative, const std::string& content = "") {
        fs::path path = m_dir / relative;
        fs::create_directories(path.parent_path());
        std::ofstream out(path);
        out << content;
    }

    bool exists(const std::string& relative) const {
        return fs::exists(m_dir / relative);
    }

    std::string readFile(const std::string& relative) const {
        std::ifstream in(m_dir / relative);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    std::string root() const { return m_dir.string(); }

    fs::path m_dir;
};

} // namespace Testing
} // namespace BulkRename

#endif // BULK_RENAME_TEST_HELPERS_H
