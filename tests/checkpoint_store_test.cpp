#include <scribe/checkpoint_store.h>

#include "test_support/temporary_project.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <string>

namespace scribe {
namespace {

using ::testing::HasSubstr;

CodeChunk Chunk(const std::string &path, const std::string &content,
                int start_line = 1, int end_line = 1) {
  CodeChunk chunk;
  chunk.file_path = path;
  chunk.content = content;
  chunk.start_line = start_line;
  chunk.end_line = end_line;
  return chunk;
}

TEST(ChunkContentHashTest, DependsOnPathAndContent) {
  const auto base = ChunkContentHash(Chunk("a.cpp", "int x;"));

  EXPECT_EQ(base, ChunkContentHash(Chunk("a.cpp", "int x;")));
  EXPECT_NE(base, ChunkContentHash(Chunk("b.cpp", "int x;")));
  EXPECT_NE(base, ChunkContentHash(Chunk("a.cpp", "int y;")));
}

TEST(ChunkContentHashTest, IdenticalContentAtOtherLinesGetsOwnKey) {
  const auto first = ChunkContentHash(Chunk("src/a.cpp", "return 0;", 1, 3));
  const auto second = ChunkContentHash(Chunk("src/a.cpp", "return 0;", 4, 6));

  EXPECT_NE(first, second);
}

TEST(ChunkContentHashTest, IsHexSha256OfSeparatedFields) {
  EXPECT_EQ("5923c0db9fe07c32f24b32bf09ba969c2d798974d6e1b2348f6f638237597787",
            ChunkContentHash(Chunk("src/a.cpp", "int a();", 1, 3)));
}

TEST(InMemoryCheckpointStoreTest, StoresPerProject) {
  InMemoryCheckpointStore store;
  store.Put("alpha", "h1", "summary one");
  store.Put("alpha", "h2", "summary two");
  store.Put("beta", "h1", "other");

  EXPECT_EQ("summary one", store.Get("alpha", "h1").value_or(""));
  EXPECT_EQ("other", store.Get("beta", "h1").value_or(""));
  EXPECT_FALSE(store.Get("gamma", "h1").has_value());
  EXPECT_EQ(2u, store.Count("alpha"));

  store.Invalidate("alpha");

  EXPECT_EQ(0u, store.Count("alpha"));
  EXPECT_EQ(1u, store.Count("beta"));
}

TEST(DirectoryCheckpointStoreTest, PersistsAcrossInstances) {
  test::TemporaryProject project;
  const auto directory = project.root() / "cache";
  {
    DirectoryCheckpointStore store(directory);
    store.Put("demo", "abc", "line one\nline two\twith tab");
  }

  DirectoryCheckpointStore reopened(directory);

  EXPECT_EQ("line one\nline two\twith tab",
            reopened.Get("demo", "abc").value_or(""));
  EXPECT_EQ(1u, reopened.Count("demo"));
  EXPECT_FALSE(reopened.Get("demo", "missing").has_value());
}

TEST(DirectoryCheckpointStoreTest, UnsafeProjectIdStaysInsideDirectory) {
  test::TemporaryProject project;
  const auto directory = project.root() / "cache";
  DirectoryCheckpointStore store(directory);

  store.Put("../escape", "h", "payload");

  EXPECT_EQ("payload", store.Get("../escape", "h").value_or(""));
  EXPECT_FALSE(std::filesystem::exists(project.root() / "escape"));
}

TEST(DirectoryCheckpointStoreTest, SimilarProjectIdsDoNotShareEntries) {
  test::TemporaryProject project;
  DirectoryCheckpointStore store(project.root() / "cache");

  store.Put("team/app", "h", "slash");
  store.Put("team_app", "h", "underscore");

  EXPECT_EQ("slash", store.Get("team/app", "h").value_or(""));
  EXPECT_EQ("underscore", store.Get("team_app", "h").value_or(""));
  EXPECT_EQ(1u, store.Count("team/app"));
}

TEST(DirectoryCheckpointStoreTest, UnwritableDirectoryIsLoggedNotThrown) {
  test::TemporaryProject project;
  project.AddFile("blocker", "a regular file\n");
  std::ostringstream log;
  DirectoryCheckpointStore store(project.root() / "blocker" / "cache",
                                 MakeLogger({LogLevel::kWarn}, log));

  EXPECT_NO_THROW(store.Put("demo", "h", "payload"));

  EXPECT_FALSE(store.Get("demo", "h").has_value());
  EXPECT_THAT(log.str(), HasSubstr("checkpoint.write.failed"));
}

TEST(DirectoryCheckpointStoreTest, MalformedEntryIsIgnored) {
  test::TemporaryProject project;
  DirectoryCheckpointStore store(project.root() / "cache");
  store.Put("demo", "abc", "good");
  project.AddFile("cache/demo/abc.chk", "not a checkpoint\n");

  EXPECT_FALSE(store.Get("demo", "abc").has_value());
}

TEST(DirectoryCheckpointStoreTest, InvalidateAndCleanRemoveEntries) {
  test::TemporaryProject project;
  DirectoryCheckpointStore store(project.root() / "cache");
  store.Put("one", "a", "x");
  store.Put("two", "b", "y");

  store.Invalidate("one");

  EXPECT_EQ(0u, store.Count("one"));
  EXPECT_EQ(1u, store.Count("two"));

  store.Clean();

  EXPECT_FALSE(std::filesystem::exists(store.Directory()));
  EXPECT_EQ(0u, store.Count("two"));
}

} // namespace
} // namespace scribe
