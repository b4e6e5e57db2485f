#include <gtest/gtest.h>

#include "io/StorageTiering.h"
#include "FakeFetchClient.h"
#include "TestSupport.h"

#include <filesystem>

namespace {

namespace fs = std::filesystem;

TEST(StorageTiering, RenamesWithinOneVolume)
{
    TempDir dir;
    const std::string src = dir.sub("scratch.bin");
    const std::string dst = (fs::path(dir.sub("archive")) / "out.bin").string();
    const std::string content = makeContent(5000);
    writeAll(src, content);

    StorageTiering tiering;
    auto result = tiering.relocate(src, dst);

    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_TRUE(result.renamed);
    EXPECT_FALSE(fs::exists(src));
    EXPECT_EQ(content, readAll(dst));
}

TEST(StorageTiering, CopyVerifiesThenDeletesSource)
{
    TempDir dir;
    const std::string src = dir.sub("scratch.bin");
    const std::string dst = dir.sub("out.bin");
    const std::string content = makeContent(3 * 1024 * 1024 + 17);
    writeAll(src, content);

    StorageTiering tiering;
    auto result = tiering.copyVerifyDelete(src, dst);

    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_FALSE(result.renamed);
    EXPECT_FALSE(fs::exists(src));
    EXPECT_FALSE(fs::exists(dst + ".partial"));
    EXPECT_EQ(content, readAll(dst));
}

TEST(StorageTiering, MissingSourceLeavesNothing)
{
    TempDir dir;
    const std::string dst = dir.sub("out.bin");

    StorageTiering tiering;
    auto result = tiering.copyVerifyDelete(dir.sub("nope.bin"), dst);

    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.error.empty());
    EXPECT_FALSE(fs::exists(dst));
    EXPECT_FALSE(fs::exists(dst + ".partial"));
}

TEST(StorageTiering, ArchiveNamesAvoidCollisions)
{
    TempDir dir;
    EXPECT_EQ(dir.sub("movie.mkv"), StorageTiering::uniqueArchivePath(dir.path(), "movie.mkv"));

    writeAll(dir.sub("movie.mkv"), "x");
    EXPECT_EQ(dir.sub("movie (1).mkv"), StorageTiering::uniqueArchivePath(dir.path(), "movie.mkv"));

    writeAll(dir.sub("movie (1).mkv"), "x");
    EXPECT_EQ(dir.sub("movie (2).mkv"), StorageTiering::uniqueArchivePath(dir.path(), "movie.mkv"));

    writeAll(dir.sub("README"), "x");
    EXPECT_EQ(dir.sub("README (1)"), StorageTiering::uniqueArchivePath(dir.path(), "README"));
}

} // namespace
