#include "TestHelpers.h"

#include "features/RenameExecutor.h"
#include "core/Error.h"

using namespace BulkRename;
using namespace BulkRename::Testing;

namespace {

Match matchTo(const std::string& source, const std::string& target) {
    return Match(source, target, {}, CaptureResult());
}

} // namespace

class RenameExecutorTest : public TempDirTest {};

TEST_F(RenameExecutorTest, RenamesEveryMatch)
{
    touch("a1.txt", "one");
    touch("a2.txt", "two");

    RecordingReporter reporter;
    RenameExecutor executor(root(), reporter);
    size_t renamed = executor.apply({matchTo("a1.txt", "x1.dat"), matchTo("a2.txt", "x2.dat")});

    EXPECT_EQ(renamed, 2u);
    EXPECT_FALSE(exists("a1.txt"));
    EXPECT_FALSE(exists("a2.txt"));
    EXPECT_EQ(readFile("x1.dat"), "one");
    EXPECT_EQ(readFile("x2.dat"), "two");
    EXPECT_EQ(reporter.renamed, (std::vector<std::string>{"a1.txt", "a2.txt"}));
}

TEST_F(RenameExecutorTest, CreatesMissingTargetDirectories)
{
    touch("photo.jpg", "img");

    RecordingReporter reporter;
    RenameExecutor executor(root(), reporter);
    executor.apply({matchTo("photo.jpg", "2024/05/photo.jpg")});

    EXPECT_EQ(readFile("2024/05/photo.jpg"), "img");
}

TEST_F(RenameExecutorTest, RenameOneReportsMissingSource)
{
    RecordingReporter reporter;
    RenameExecutor executor(root(), reporter);

    Result<void> result = executor.renameOne(matchTo("missing.txt", "other.txt"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::FS_FILE_NOT_FOUND);
}

TEST_F(RenameExecutorTest, RenameOneRequiresTarget)
{
    touch("a.txt");
    RecordingReporter reporter;
    RenameExecutor executor(root(), reporter);

    Result<void> result = executor.renameOne(Match("a.txt", std::nullopt, {}, CaptureResult()));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::RENAME_MISSING_TARGET);
    EXPECT_TRUE(exists("a.txt"));
}

TEST_F(RenameExecutorTest, StopsAtFirstFailure)
{
    touch("a.txt");
    touch("c.txt");

    RecordingReporter reporter;
    RenameExecutor executor(root(), reporter, ErrorPolicy::StopOnFirstError);

    try {
        executor.apply({matchTo("a.txt", "a2.txt"), matchTo("b.txt", "b2.txt"), matchTo("c.txt", "c2.txt")});
        FAIL() << "Expected ErrorException";
    } catch (const ErrorException& e) {
        EXPECT_EQ(e.code(), ErrorCode::FS_FILE_NOT_FOUND);
        EXPECT_NE(e.error().details().find("1 of 3 renames applied"), std::string::npos);
    }

    // No rollback of earlier renames, later files untouched
    EXPECT_TRUE(exists("a2.txt"));
    EXPECT_TRUE(exists("c.txt"));
    EXPECT_FALSE(exists("c2.txt"));
    EXPECT_EQ(reporter.failed, (std::vector<std::string>{"b.txt"}));
}

TEST_F(RenameExecutorTest, ContinueOnErrorAttemptsEveryFile)
{
    touch("a.txt");
    touch("c.txt");

    RecordingReporter reporter;
    RenameExecutor executor(root(), reporter, ErrorPolicy::ContinueOnError);

    try {
        executor.apply({matchTo("a.txt", "a2.txt"), matchTo("b.txt", "b2.txt"), matchTo("c.txt", "c2.txt")});
        FAIL() << "Expected ErrorException";
    } catch (const ErrorException& e) {
        EXPECT_EQ(e.code(), ErrorCode::FS_RENAME_FAILED);
        EXPECT_EQ(e.error().message(), "1 of 3 renames failed");
        EXPECT_NE(e.error().details().find("b.txt"), std::string::npos);
    }

    EXPECT_TRUE(exists("a2.txt"));
    EXPECT_TRUE(exists("c2.txt"));
    EXPECT_EQ(reporter.renamed, (std::vector<std::string>{"a.txt", "c.txt"}));
    EXPECT_EQ(reporter.failureCodes, (std::vector<ErrorCode>{ErrorCode::FS_FILE_NOT_FOUND}));
}

TEST_F(RenameExecutorTest, EmptySetRenamesNothing)
{
    RecordingReporter reporter;
    RenameExecutor executor(root(), reporter);
    EXPECT_EQ(executor.apply({}), 0u);
}
