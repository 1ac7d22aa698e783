#include <gtest/gtest.h>

#include <cerrno>

#include "core/Error.h"

using namespace BulkRename;
namespace fs = std::filesystem;

TEST(ErrorTest, CategoryFollowsCodeRange)
{
    EXPECT_EQ(Error().category(), ErrorCategory::None);
    EXPECT_EQ(Error(ErrorCode::FS_LIST_FAILED, "x").category(), ErrorCategory::FileSystem);
    EXPECT_EQ(Error(ErrorCode::RENAME_DUPLICATE_TARGET, "x").category(), ErrorCategory::Rename);
    EXPECT_EQ(Error(ErrorCode::VALIDATION_INVALID_NUMBER, "x").category(), ErrorCategory::Validation);
    EXPECT_EQ(Error(ErrorCode::CONFIG_PARSE_ERROR, "x").category(), ErrorCategory::Configuration);
    EXPECT_EQ(Error(ErrorCode::UNKNOWN_ERROR, "x").category(), ErrorCategory::Internal);
}

TEST(ErrorTest, ToString)
{
    EXPECT_EQ(Error().toString(), "OK");
    EXPECT_EQ(Error::invalidTemplate("bad").toString(), "[Rename] Invalid replacement template (bad)");
    EXPECT_EQ(Error::missingReplacement().toString(),
              "[Rename] Replacement pattern is required for renaming");
}

TEST(ErrorTest, DuplicateTargetsListsNames)
{
    Error error = Error::duplicateTargets({"a.txt", "b.txt"});
    EXPECT_EQ(error.code(), ErrorCode::RENAME_DUPLICATE_TARGET);
    EXPECT_EQ(error.message(), "Found duplicate replacement filenames");
    EXPECT_EQ(error.details(), "'a.txt', 'b.txt'");
}

TEST(ErrorTest, FromFilesystemError)
{
    fs::filesystem_error notFound("rename", fs::path("a.txt"), fs::path("b.txt"),
                                  std::make_error_code(std::errc::no_such_file_or_directory));
    Error error = Error::fromFilesystemError(notFound);
    EXPECT_EQ(error.code(), ErrorCode::FS_FILE_NOT_FOUND);
    EXPECT_NE(error.details().find("a.txt -> b.txt"), std::string::npos);
    EXPECT_TRUE(error.hasSystemError());
    EXPECT_EQ(error.systemError(), ENOENT);

    fs::filesystem_error denied("rename", fs::path("x"),
                                std::make_error_code(std::errc::permission_denied));
    EXPECT_EQ(Error::fromFilesystemError(denied).code(), ErrorCode::FS_ACCESS_DENIED);

    fs::filesystem_error crossDevice("rename", fs::path("x"),
                                     std::make_error_code(std::errc::cross_device_link));
    EXPECT_EQ(Error::fromFilesystemError(crossDevice).code(), ErrorCode::FS_CROSS_DEVICE);
}

TEST(ErrorTest, ResultCarriesValueOrError)
{
    Result<int> ok(5);
    EXPECT_TRUE(ok);
    EXPECT_EQ(ok.value(), 5);

    Result<int> failed(Error(ErrorCode::VALIDATION_INVALID_NUMBER, "not a number"));
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.valueOr(7), 7);
    EXPECT_THROW(failed.value(), ErrorException);

    Result<void> done;
    EXPECT_TRUE(done);
    Result<void> notDone(Error::directoryNotFound("/nope"));
    EXPECT_EQ(notDone.error().code(), ErrorCode::FS_DIRECTORY_NOT_FOUND);
}

TEST(ErrorTest, ExceptionWhatMatchesToString)
{
    ErrorException e(Error::invalidPattern("missing )"));
    EXPECT_STREQ(e.what(), "[Rename] Invalid regex pattern (missing ))");
    EXPECT_EQ(e.code(), ErrorCode::RENAME_INVALID_PATTERN);
}
