#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include "file_walker.hpp"
#include "test_helpers.hpp"

using namespace Dotsync;

static std::vector<fs::path> RelativePaths(const std::vector<FileEntry> &entries)
{
  std::vector<fs::path> paths;
  for (const auto &entry : entries)
    paths.push_back(entry.relativePath);
  return paths;
}

TEST(FileWalker, Collect_RecursesAndSortsByRelativePath)
{
  TempDir td;
  MakeFile(td.dir / ".bashrc", "a");
  MakeFile(td.dir / ".config" / "app" / "settings.ini", "b");
  MakeFile(td.dir / ".vimrc", "c");
  fs::create_directories(td.dir / "empty");

  auto entries = FileWalker(td.dir).collect();

  std::vector<fs::path> expected = {".bashrc", fs::path(".config") / "app" / "settings.ini", ".vimrc"};
  EXPECT_EQ(RelativePaths(entries), expected);
  EXPECT_EQ(entries[1].absolutePath, td.dir / ".config" / "app" / "settings.ini");
}

TEST(FileWalker, SkipsGitDirectory)
{
  TempDir td;
  MakeFile(td.dir / ".git" / "HEAD", "ref: refs/heads/main");
  MakeFile(td.dir / ".git" / "objects" / "ab" / "cdef", "x");
  MakeFile(td.dir / ".profile", "p");

  auto entries = FileWalker(td.dir).collect();
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].relativePath, fs::path(".profile"));
}

TEST(FileWalker, MissingRoot_IsEmpty)
{
  TempDir td;
  FileWalker walker(td.dir / "nope");
  EXPECT_TRUE(walker.begin() == walker.end());
  EXPECT_TRUE(walker.collect().empty());
}

TEST(FileWalker, IsRestartable)
{
  TempDir td;
  MakeFile(td.dir / "one", "1");
  MakeFile(td.dir / "sub" / "two", "2");

  FileWalker walker(td.dir);
  size_t first = static_cast<size_t>(std::distance(walker.begin(), walker.end()));
  size_t second = 0;
  for (const auto &entry : walker)
  {
    EXPECT_TRUE(fs::is_regular_file(entry.absolutePath));
    ++second;
  }
  EXPECT_EQ(first, 2u);
  EXPECT_EQ(second, 2u);

  // New files show up on the next walk
  MakeFile(td.dir / "three", "3");
  EXPECT_EQ(walker.collect().size(), 3u);
}
