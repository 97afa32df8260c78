#include <scribe/ingestion.h>
#include <scribe/local_source_resolver.h>

#include "test_support/temporary_project.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

namespace scribe {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Pair;

TEST(LanguageForPathTest, MapsExtensionsAndWellKnownNames) {
  EXPECT_EQ("cpp", LanguageForPath("src/main.CPP").value_or(""));
  EXPECT_EQ("python", LanguageForPath("tool/run.py").value_or(""));
  EXPECT_EQ("cmake", LanguageForPath("lib/CMakeLists.txt").value_or(""));
  EXPECT_FALSE(LanguageForPath("notes.txt").has_value());
  EXPECT_FALSE(LanguageForPath("Makefile").has_value());
}

TEST(IsCodeLanguageTest, DataFormatsAreNotCode) {
  EXPECT_TRUE(IsCodeLanguage("go"));
  EXPECT_FALSE(IsCodeLanguage("markdown"));
  EXPECT_FALSE(IsCodeLanguage("yaml"));
}

TEST(ExtensionLanguageDetectorTest, CountsFilesPerLanguage) {
  SourceTree tree;
  tree.files = {"a.cpp", "b.h", "c.py", "README.md", "LICENSE"};

  const auto languages = ExtensionLanguageDetector().Detect(tree);

  EXPECT_EQ(4u, languages.file_languages.size());
  EXPECT_THAT(languages.language_counts,
              ElementsAre(Pair("cpp", 2), Pair("markdown", 1),
                          Pair("python", 1)));
}

class LineChunkerTest : public ::testing::Test {
protected:
  SourceTree Tree() const {
    SourceTree tree;
    tree.root = project_.root().string();
    return tree;
  }

  test::TemporaryProject project_;
};

TEST_F(LineChunkerTest, SplitsFilesIntoLineWindows) {
  project_.AddFile("src/a.cpp", "one\r\ntwo\nthree\nfour\nfive\n");
  LanguageMap languages;
  languages.file_languages = {{"src/a.cpp", "cpp"}};

  const auto chunks = LineChunker(2).Chunk(Tree(), languages);

  EXPECT_EQ(1, chunks.total_files);
  ASSERT_EQ(3u, chunks.chunks.size());
  EXPECT_EQ("one\ntwo\n", chunks.chunks[0].content);
  EXPECT_EQ(3, chunks.chunks[1].start_line);
  EXPECT_EQ(4, chunks.chunks[1].end_line);
  EXPECT_EQ(5, chunks.chunks[2].start_line);
  EXPECT_EQ(5, chunks.chunks[2].end_line);
  EXPECT_EQ("cpp", chunks.chunks[2].language);
}

TEST_F(LineChunkerTest, SkipsBinaryEmptyAndMissingFiles) {
  project_.AddFile("blob.c", std::string("int\0x;\n", 7));
  project_.AddFile("empty.py", "");
  LanguageMap languages;
  languages.file_languages = {
      {"blob.c", "c"}, {"empty.py", "python"}, {"gone.go", "go"}};

  const auto chunks = LineChunker().Chunk(Tree(), languages);

  EXPECT_EQ(0, chunks.total_files);
  EXPECT_THAT(chunks.chunks, IsEmpty());
}

TEST(LineChunkerConstructionTest, RejectsNonPositiveWindow) {
  EXPECT_THROW(LineChunker(0), std::invalid_argument);
}

TEST(LocalSourceResolverTest, ListsFilesSkippingToolingDirectories) {
  test::TemporaryProject project;
  project.AddFile("src/main.cpp", "int main() {}\n");
  project.AddFile("include/app.h", "#pragma once\n");
  project.AddFile(".git/config", "[core]\n");
  project.AddFile("build/generated.cpp", "\n");
  project.AddFile("third_party/lib.cpp", "\n");
  LocalSourceResolver resolver({"third_party"});

  const auto tree = resolver.Resolve(project.root().string(), "develop");

  EXPECT_THAT(tree.files, ElementsAre("include/app.h", "src/main.cpp"));
  EXPECT_EQ("develop", tree.branch);
}

TEST(LocalSourceResolverTest, RejectsMissingOrEmptyRoots) {
  test::TemporaryProject project;
  LocalSourceResolver resolver;

  EXPECT_THROW(resolver.Resolve("", "main"), std::invalid_argument);
  EXPECT_THROW(resolver.Resolve((project.root() / "absent").string(), "main"),
               std::runtime_error);
  EXPECT_THROW(resolver.Resolve(project.root().string(), "main"),
               std::runtime_error);
}

} // namespace
} // namespace scribe
