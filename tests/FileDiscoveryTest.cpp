#include "TestUtil.hpp"
#include "analyzers/FileDiscovery.hpp"
#include <gtest/gtest.h>

using namespace kwl;

TEST(FileDiscoveryTest, WalksDirectoriesInSortedOrder) {
  test::TempDir dir;
  dir.write("z.go", "package main\n");
  dir.write("a/deploy.go", "package main\n");
  dir.write("a/deploy_test.go", "package main\n");
  dir.write("a/notes.txt", "");
  dir.write("b/c/svc.go", "package main\n");

  auto files = discoverSources(dir.path());
  ASSERT_TRUE(static_cast<bool>(files)) << llvm::toString(files.takeError());
  std::vector<std::string> expected = {dir.path() + "/a/deploy.go", dir.path() + "/b/c/svc.go",
                                       dir.path() + "/z.go"};
  EXPECT_EQ(*files, expected);
}

TEST(FileDiscoveryTest, FilePathIsReturnedAsGiven) {
  test::TempDir dir;
  std::string path = dir.write("manifest.txt", "package main\n");
  auto files = discoverSources(path);
  ASSERT_TRUE(static_cast<bool>(files)) << llvm::toString(files.takeError());
  ASSERT_EQ(files->size(), 1u);
  EXPECT_EQ((*files)[0], path);
}

TEST(FileDiscoveryTest, EmptyDirectoryHasNoSources) {
  test::TempDir dir;
  auto files = discoverSources(dir.path());
  ASSERT_TRUE(static_cast<bool>(files)) << llvm::toString(files.takeError());
  EXPECT_TRUE(files->empty());
}

TEST(FileDiscoveryTest, MissingPathIsAnError) {
  test::TempDir dir;
  auto files = discoverSources(dir.path() + "/absent");
  ASSERT_FALSE(static_cast<bool>(files));
  EXPECT_EQ(llvm::toString(files.takeError()), "path does not exist: " + dir.path() + "/absent");
}
