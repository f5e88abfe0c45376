#include <gtest/gtest.h>

#include "cli.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace Dotsync;

TEST(ParseArguments, GlobalOptionsBeforeCommand)
{
  Options options = parseArguments({"--root", "/opt/dots", "repo", "--push", "--commitOnly"});
  EXPECT_EQ(options.command, Command::Repo);
  EXPECT_EQ(options.installRoot, fs::path("/opt/dots"));
  EXPECT_TRUE(options.push);
  EXPECT_TRUE(options.commitOnly);
}

TEST(ParseArguments, LocalWithPullAndFileName)
{
  Options options = parseArguments({"local", "--pull", "--fileName", ".vimrc"});
  EXPECT_EQ(options.command, Command::Local);
  EXPECT_TRUE(options.pull);
  ASSERT_TRUE(options.fileName.has_value());
  EXPECT_EQ(*options.fileName, ".vimrc");
}

TEST(ParseArguments, VersionWithoutCommand)
{
  Options options = parseArguments({"--version"});
  EXPECT_TRUE(options.showVersion);
  EXPECT_EQ(options.command, Command::None);
}

TEST(ParseArguments, RejectsFlagsOfOtherCommands)
{
  EXPECT_THROW(parseArguments({"local", "--push"}), UsageError);
  EXPECT_THROW(parseArguments({"repo", "--pull"}), UsageError);
  EXPECT_THROW(parseArguments({"config", "--fileName", "x"}), UsageError);
}

TEST(ParseArguments, RejectsUnknownCommandAndMissingValue)
{
  EXPECT_THROW(parseArguments({"sync"}), UsageError);
  EXPECT_THROW(parseArguments({"--root"}), UsageError);
  EXPECT_THROW(parseArguments({"config", "--localPaths"}), UsageError);
}

TEST(ParseArguments, ConfigNeedsExactlyOneOperation)
{
  EXPECT_THROW(parseArguments({"config"}), UsageError);
  EXPECT_THROW(parseArguments({"config", "--list", "--lineEnding", "lf"}), UsageError);
  EXPECT_NO_THROW(parseArguments({"config", "--list"}));
}

TEST(ConfigCommand, LocalPathsAreStoredAbsoluteAndOrdered)
{
  TempDir td;
  fs::create_directories(td.dir / "b");
  fs::create_directories(td.dir / "a");
  SettingsStore store(td.dir / "dotsync.yaml");

  Options options = parseArguments({"config", "--localPaths", (td.dir / "b").string() + "," + (td.dir / "a").string()});
  EXPECT_EQ(runConfigCommand(options, store), 0);

  Config config = store.load();
  ASSERT_EQ(config.localPaths.size(), 2u);
  EXPECT_EQ(config.localPaths[0], td.dir / "b");
  EXPECT_EQ(config.localPaths[1], td.dir / "a");
}

TEST(ConfigCommand, RejectsLocationThatIsAFile)
{
  TempDir td;
  MakeFile(td.dir / "file", "x");
  SettingsStore store(td.dir / "dotsync.yaml");

  Options options = parseArguments({"config", "--addPath", (td.dir / "file").string()});
  EXPECT_THROW(runConfigCommand(options, store), SyncError);
  EXPECT_FALSE(store.exists());
}

TEST(ConfigCommand, AddRemoveAndLineEnding)
{
  TempDir td;
  SettingsStore store(td.dir / "dotsync.yaml");
  auto home = (td.dir / "home").string();

  EXPECT_EQ(runConfigCommand(parseArguments({"config", "--addPath", home}), store), 0);
  EXPECT_EQ(runConfigCommand(parseArguments({"config", "--lineEnding", "crlf"}), store), 0);
  EXPECT_EQ(runConfigCommand(parseArguments({"config", "--repoDir", "dots"}), store), 0);

  Config config = store.load();
  ASSERT_EQ(config.localPaths.size(), 1u);
  EXPECT_EQ(config.lineEnding, LineEnding::CRLF);
  EXPECT_EQ(config.repoDotFilesDir, fs::path("dots"));

  EXPECT_EQ(runConfigCommand(parseArguments({"config", "--removePath", home}), store), 0);
  EXPECT_TRUE(store.load().localPaths.empty());
  EXPECT_EQ(runConfigCommand(parseArguments({"config", "--removePath", home}), store), 1);

  EXPECT_THROW(runConfigCommand(parseArguments({"config", "--lineEnding", "cr"}), store), UsageError);
}

TEST(SyncCommand, WithoutConfiguration_ThrowsConfigMissing)
{
  TempDir td;
  SettingsStore store(td.dir / "dotsync.yaml");
  Options options = parseArguments({"--root", td.dir.string(), "local"});

  try
  {
    runSyncCommand(options, store);
    FAIL() << "expected SyncError";
  }
  catch (const SyncError &e)
  {
    EXPECT_EQ(e.kind(), ErrorKind::ConfigMissing);
  }
}

TEST(SyncCommand, LocalCopiesFromInstallRoot)
{
  TempDir td;
  auto home = td.dir / "home";
  MakeFile(td.dir / "DotFiles" / ".bashrc", "bash");

  SettingsStore store(td.dir / "dotsync.yaml");
  Config config;
  config.addLocalPath(home);
  store.save(config);

  Options options = parseArguments({"--root", td.dir.string(), "local"});
  EXPECT_EQ(runSyncCommand(options, store), 0);
  EXPECT_EQ(ReadFile(home / ".bashrc"), "bash");
}
