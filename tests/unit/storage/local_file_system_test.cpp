#include <gtest/gtest.h>

#include <codenexus/storage/file_system.h>

#include "common/test_helpers.h"

using codenexus::storage::LocalFileSystem;
using codenexus::tests::TempDir;
using codenexus::tests::write_file;

TEST(LocalFileSystemTest, ResolvesAgainstRoot) {
    TempDir dir{"codenexus_fs_"};
    write_file(dir.path() / "src" / "main.cpp", "int main() {}\n");

    LocalFileSystem fs(dir.path());
    EXPECT_TRUE(fs.exists("src/main.cpp"));
    EXPECT_FALSE(fs.exists("src/missing.cpp"));
    EXPECT_EQ(fs.root(), dir.path());
}

TEST(LocalFileSystemTest, EmptyPathDoesNotExist) {
    TempDir dir{"codenexus_fs_"};
    LocalFileSystem fs(dir.path());
    EXPECT_FALSE(fs.exists(""));
}
