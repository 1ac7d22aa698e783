#include "TestHelpers.h"

#include "cli/RenameCommand.h"
#include "cli/ConfigCommand.h"
#include "cli/CommandSupport.h"
#include "core/ConfigManager.h"

using namespace BulkRename;
using namespace BulkRename::CLI;
using namespace BulkRename::Testing;

namespace {

RenameArguments parseOk(const std::vector<std::string>& args) {
    Result<RenameArguments> parsed = RenameCommand::parseArguments(args);
    EXPECT_TRUE(parsed) << parsed.error().toString();
    return parsed.valueOr(RenameArguments());
}

ErrorCode parseError(const std::vector<std::string>& args) {
    Result<RenameArguments> parsed = RenameCommand::parseArguments(args);
    return parsed ? ErrorCode::OK : parsed.error().code();
}

} // namespace

TEST(RenameCommandParseTest, PatternAndReplacement)
{
    RenameArguments arguments = parseOk({"(\\d+)", "x\\1"});
    EXPECT_EQ(arguments.pattern, "(\\d+)");
    ASSERT_TRUE(arguments.replacement.has_value());
    EXPECT_EQ(*arguments.replacement, "x\\1");
    EXPECT_FALSE(arguments.rename);
}

TEST(RenameCommandParseTest, Flags)
{
    RenameArguments arguments = parseOk({"--rename", "-r", "--full", "--pad-to", "3", "--dir", "/tmp/x",
                                         "--continue-on-error", "-v", "--no-color", "--config", "c.json",
                                         "p", "t"});
    EXPECT_TRUE(arguments.rename);
    EXPECT_TRUE(arguments.recursive);
    EXPECT_TRUE(arguments.fullMatch);
    EXPECT_EQ(arguments.padding, std::optional<int>(3));
    EXPECT_EQ(arguments.directory, std::optional<std::string>("/tmp/x"));
    EXPECT_TRUE(arguments.continueOnError);
    EXPECT_TRUE(arguments.verbose);
    EXPECT_TRUE(arguments.noColor);
    EXPECT_EQ(arguments.configFile, "c.json");
    EXPECT_EQ(arguments.pattern, "p");
}

TEST(RenameCommandParseTest, DoubleDashEndsOptions)
{
    RenameArguments arguments = parseOk({"--", "-(\\d)", "--x"});
    EXPECT_EQ(arguments.pattern, "-(\\d)");
    EXPECT_EQ(*arguments.replacement, "--x");
}

TEST(RenameCommandParseTest, Errors)
{
    EXPECT_EQ(parseError({}), ErrorCode::VALIDATION_MISSING_ARGUMENT);
    EXPECT_EQ(parseError({"--rename"}), ErrorCode::VALIDATION_MISSING_ARGUMENT);
    EXPECT_EQ(parseError({"a", "b", "c"}), ErrorCode::VALIDATION_INVALID_ARGUMENT);
    EXPECT_EQ(parseError({"a", "--bogus"}), ErrorCode::VALIDATION_INVALID_ARGUMENT);
    EXPECT_EQ(parseError({"a", "--pad-to"}), ErrorCode::VALIDATION_MISSING_ARGUMENT);
    EXPECT_EQ(parseError({"a", "--pad-to", "three"}), ErrorCode::VALIDATION_INVALID_NUMBER);
    EXPECT_EQ(parseError({"a", "--pad-to", "3x"}), ErrorCode::VALIDATION_INVALID_NUMBER);
    EXPECT_EQ(parseError({"a", "--pad-to", "-1"}), ErrorCode::VALIDATION_INVALID_ARGUMENT);
}

TEST(RenameCommandParseTest, BuildOptionsCombinesConfigAndFlags)
{
    ConfigManager::RenameConfig config;
    config.fullMatch = true;
    config.recursive = false;
    config.padding = 2;
    config.onError = "continue";
    config.root = "/data";

    RenameArguments arguments = parseOk({"p", "t", "-r", "--pad-to", "4"});
    RenameOptions options = RenameCommand::buildOptions(arguments, config);

    EXPECT_TRUE(options.dryRun);
    EXPECT_TRUE(options.fullMatch);
    EXPECT_TRUE(options.recursive);
    EXPECT_EQ(options.padding, 4);
    EXPECT_EQ(options.root, "/data");
    EXPECT_EQ(options.errorPolicy, ErrorPolicy::ContinueOnError);

    config.onError = "stop";
    arguments = parseOk({"p", "--rename", "--dir", "here"});
    options = RenameCommand::buildOptions(arguments, config);
    EXPECT_FALSE(options.dryRun);
    EXPECT_EQ(options.padding, 2);
    EXPECT_EQ(options.root, "here");
    EXPECT_EQ(options.errorPolicy, ErrorPolicy::StopOnFirstError);
    EXPECT_FALSE(options.replacement.has_value());
}

class RenameCommandTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        ConfigManager::getInstance().resetToDefaults();
        touch("config.json", R"({"log": {"console": false, "color": false}})");
        m_config = (m_dir / "config.json").string();
        fs::create_directories(m_dir / "files");
    }

    void TearDown() override {
        ConfigManager::getInstance().resetToDefaults();
        LogManager::instance().setMinLevel(LogLevel::Info);
        LogManager::instance().setConsoleOutput(false);
        TempDirTest::TearDown();
    }

    int run(std::vector<std::string> args) {
        args.push_back("--config");
        args.push_back(m_config);
        args.push_back("--dir");
        args.push_back((m_dir / "files").string());
        RenameCommand command;
        return command.execute(args);
    }

    std::string m_config;
};

TEST_F(RenameCommandTest, DryRunByDefault)
{
    touch("files/a1.txt");
    EXPECT_EQ(run({"a(\\d)\\.txt", "x\\1.dat"}), 0);
    EXPECT_TRUE(exists("files/a1.txt"));
    EXPECT_FALSE(exists("files/x1.dat"));
}

TEST_F(RenameCommandTest, RenameAppliesChanges)
{
    touch("files/a1.txt");
    touch("files/a2.txt");
    EXPECT_EQ(run({"a(\\d)\\.txt", "x\\1.dat", "--rename", "--pad-to", "2"}), 0);
    EXPECT_TRUE(exists("files/x01.dat"));
    EXPECT_TRUE(exists("files/x02.dat"));
}

TEST_F(RenameCommandTest, FailuresExitWithOne)
{
    touch("files/a1.txt");
    touch("files/b1.txt");
    EXPECT_EQ(run({"\\w(\\d)\\.txt", "same\\1.txt", "--rename"}), 1);
    EXPECT_EQ(run({"(\\d)", "--rename"}), 1);
    EXPECT_EQ(run({"(unclosed"}), 1);
    EXPECT_EQ(run({"a", "--bogus"}), 1);
    EXPECT_TRUE(exists("files/a1.txt"));
    EXPECT_TRUE(exists("files/b1.txt"));
}

TEST_F(RenameCommandTest, InvalidConfigFileIsReported)
{
    touch("bad.json", R"({"rename": {"onError": "sometimes"}})");
    RenameCommand command;
    EXPECT_EQ(command.execute({"a", "--config", (m_dir / "bad.json").string()}), 1);

    Result<void> loaded = loadUserConfig((m_dir / "bad.json").string());
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code(), ErrorCode::CONFIG_INVALID_VALUE);
}

TEST_F(RenameCommandTest, ConfigInitWritesDefaultsOnce)
{
    const std::string path = (m_dir / "new/config.json").string();
    ConfigCommand command;
    EXPECT_EQ(command.execute({"init", path}), 0);
    EXPECT_TRUE(exists("new/config.json"));
    EXPECT_EQ(command.execute({"init", path}), 1);
    EXPECT_EQ(command.execute({"validate", path}), 0);
    EXPECT_EQ(command.execute({"show", path}), 0);
}

TEST_F(RenameCommandTest, ConfigValidateReportsProblems)
{
    touch("bad.json", R"({"rename": {"padding": -1}})");
    ConfigCommand command;
    EXPECT_EQ(command.execute({"validate", (m_dir / "bad.json").string()}), 1);
    EXPECT_EQ(command.execute({"validate", (m_dir / "missing.json").string()}), 1);
    EXPECT_EQ(command.execute({"frobnicate"}), 1);
}
