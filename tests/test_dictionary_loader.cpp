#include "dictionary/dictionary_loader.hpp"
#include "dictionary/text_filter.hpp"
#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>

using Dictionary::DictionaryLoader;
using Dictionary::LoadError;
using Dictionary::LoaderOptions;

class DictionaryLoaderTest : public ::testing::Test {
protected:
  void SetUp() override {
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    test_dir = std::filesystem::temp_directory_path() /
               (std::string("textguard_loader_test_") + info->name());
    std::filesystem::remove_all(test_dir);
    std::filesystem::create_directories(test_dir);
  }

  void TearDown() override {
    if (std::filesystem::exists(test_dir))
      std::filesystem::remove_all(test_dir);
  }

  std::string write_file(const std::string &name, const std::string &content) {
    auto path = test_dir / name;
    std::ofstream file(path, std::ios::binary);
    file << content;
    file.close();
    return path.string();
  }

  std::string pattern(const std::string &glob) const {
    return (test_dir / glob).string();
  }

  static bool has_warning_containing(const Dictionary::DictionarySnapshot &s,
                                     const std::string &needle) {
    return std::any_of(s.warnings.begin(), s.warnings.end(),
                       [&](const std::string &w) {
                         return w.find(needle) != std::string::npos;
                       });
  }

  std::filesystem::path test_dir;
};

TEST_F(DictionaryLoaderTest, LoadsAllMatchingFiles) {
  write_file("a.txt", "alpha\nbeta\n");
  write_file("b.txt", "gamma\n");
  write_file("ignored.csv", "delta\n");

  DictionaryLoader loader;
  auto snapshot = loader.load(pattern("*.txt"));

  EXPECT_EQ(snapshot->word_count, 3u);
  EXPECT_EQ(snapshot->source_files.size(), 2u);
  EXPECT_EQ(snapshot->source_pattern, pattern("*.txt"));
  EXPECT_EQ(snapshot->lines_read, 3u);
  EXPECT_TRUE(snapshot->warnings.empty());
  EXPECT_EQ(snapshot->version, 0u);

  EXPECT_TRUE(Dictionary::exists(*snapshot, "ALPHA"));
  EXPECT_TRUE(Dictionary::exists(*snapshot, "gamma"));
  EXPECT_FALSE(Dictionary::exists(*snapshot, "delta"));
}

TEST_F(DictionaryLoaderTest, ResolvedFilesAreSorted) {
  write_file("c.txt", "c\n");
  write_file("a.txt", "a\n");
  write_file("b.txt", "b\n");

  DictionaryLoader loader;
  auto files = loader.resolve_pattern(pattern("*.txt"));
  ASSERT_EQ(files.size(), 3u);
  EXPECT_TRUE(std::is_sorted(files.begin(), files.end()));
}

TEST_F(DictionaryLoaderTest, DeduplicatesAcrossFilesAndCase) {
  write_file("one.txt", "Word\nword\n  WORD  \n");
  write_file("two.txt", "word\nother\n");

  DictionaryLoader loader;
  auto snapshot = loader.load(pattern("*.txt"));
  EXPECT_EQ(snapshot->word_count, 2u);
  EXPECT_EQ(snapshot->lines_read, 5u);
}

TEST_F(DictionaryLoaderTest, SkipsBlankLinesAndComments) {
  write_file("words.txt", "# header comment\n\n   \nreal\n  # indented comment\n");

  DictionaryLoader loader;
  auto snapshot = loader.load(pattern("words.txt"));
  EXPECT_EQ(snapshot->word_count, 1u);
  EXPECT_TRUE(Dictionary::exists(*snapshot, "real"));
  EXPECT_FALSE(Dictionary::exists(*snapshot, "header"));
}

TEST_F(DictionaryLoaderTest, HandlesCrlfBomAndMissingTrailingNewline) {
  write_file("win.txt", "\xEF\xBB\xBF" "first\r\nsecond\r\nthird");

  DictionaryLoader loader;
  auto snapshot = loader.load(pattern("win.txt"));
  EXPECT_EQ(snapshot->word_count, 3u);
  EXPECT_EQ(Dictionary::filter(*snapshot, "first second third", U'*'),
            "***** ****** *****");
}

TEST_F(DictionaryLoaderTest, CustomCommentPrefix) {
  write_file("words.txt", "// note\n#hashtag\n");

  LoaderOptions options;
  options.comment_prefix = "//";
  DictionaryLoader loader(options);
  auto snapshot = loader.load(pattern("words.txt"));
  EXPECT_EQ(snapshot->word_count, 1u);
  EXPECT_TRUE(Dictionary::exists(*snapshot, "#HashTag"));
  EXPECT_FALSE(Dictionary::exists(*snapshot, "note"));
}

TEST_F(DictionaryLoaderTest, EmptyCommentPrefixKeepsHashLines) {
  write_file("words.txt", "#one\ntwo\n");

  LoaderOptions options;
  options.comment_prefix = "";
  DictionaryLoader loader(options);
  EXPECT_EQ(loader.load(pattern("words.txt"))->word_count, 2u);
}

TEST_F(DictionaryLoaderTest, NoMatchingFilesIsAnError) {
  DictionaryLoader loader;
  EXPECT_THROW(loader.load(pattern("*.missing")), LoadError);
}

TEST_F(DictionaryLoaderTest, NoMatchingFilesAllowedWhenNotRequired) {
  LoaderOptions options;
  options.require_files = false;
  DictionaryLoader loader(options);

  auto snapshot = loader.load(pattern("*.missing"));
  EXPECT_EQ(snapshot->word_count, 0u);
  EXPECT_TRUE(snapshot->source_files.empty());
  EXPECT_FALSE(Dictionary::exists(*snapshot, "anything"));
}

TEST_F(DictionaryLoaderTest, EmptyFilesGiveAnEmptyDictionary) {
  write_file("empty.txt", "");
  write_file("comments.txt", "# only comments\n");

  DictionaryLoader loader;
  auto snapshot = loader.load(pattern("*.txt"));
  EXPECT_EQ(snapshot->word_count, 0u);
  EXPECT_EQ(snapshot->source_files.size(), 2u);
  EXPECT_TRUE(snapshot->automaton->empty());
}

TEST_F(DictionaryLoaderTest, InvalidPatternsAreRejected) {
  DictionaryLoader loader;
  EXPECT_THROW(loader.load(""), LoadError);
  EXPECT_THROW(loader.load(pattern("[abc.txt")), LoadError);
  EXPECT_THROW(loader.load(pattern("words\\")), LoadError);
}

TEST_F(DictionaryLoaderTest, ValidateGlobPattern) {
  EXPECT_TRUE(Dictionary::validate_glob_pattern("*.txt").empty());
  EXPECT_TRUE(Dictionary::validate_glob_pattern("dict/[a-z]?.txt").empty());
  EXPECT_TRUE(Dictionary::validate_glob_pattern("[]]x").empty());
  EXPECT_TRUE(Dictionary::validate_glob_pattern("[!abc]").empty());
  EXPECT_TRUE(Dictionary::validate_glob_pattern("a\\[b").empty());

  EXPECT_FALSE(Dictionary::validate_glob_pattern("[abc").empty());
  EXPECT_FALSE(Dictionary::validate_glob_pattern("x[!").empty());
  EXPECT_FALSE(Dictionary::validate_glob_pattern("trailing\\").empty());
}

TEST_F(DictionaryLoaderTest, DirectoriesAreSkippedWithWarning) {
  write_file("words.txt", "word\n");
  std::filesystem::create_directories(test_dir / "subdir.txt");

  DictionaryLoader loader;
  auto snapshot = loader.load(pattern("*.txt"));
  EXPECT_EQ(snapshot->word_count, 1u);
  EXPECT_EQ(snapshot->source_files.size(), 1u);
  EXPECT_TRUE(has_warning_containing(*snapshot, "is a directory"));
}

TEST_F(DictionaryLoaderTest, MalformedLinesAreSkippedWithWarning) {
  write_file("words.txt", "good\nbad\xFF\nalso good\n\xC3\n");

  DictionaryLoader loader;
  auto snapshot = loader.load(pattern("words.txt"));
  EXPECT_EQ(snapshot->word_count, 2u);
  ASSERT_EQ(snapshot->warnings.size(), 1u);
  EXPECT_NE(snapshot->warnings[0].find("skipped 2 line(s)"), std::string::npos);
  EXPECT_NE(snapshot->warnings[0].find("first at line 2"), std::string::npos);
}

TEST_F(DictionaryLoaderTest, WordsContainingMaskCharacterAreDropped) {
  write_file("words.txt", "f*ck\nclean\n");

  DictionaryLoader loader;
  auto snapshot = loader.load(pattern("words.txt"));
  EXPECT_EQ(snapshot->word_count, 1u);
  EXPECT_TRUE(has_warning_containing(*snapshot, "mask character"));

  LoaderOptions options;
  options.mask_char = U'#';
  DictionaryLoader hash_loader(options);
  EXPECT_EQ(hash_loader.load(pattern("words.txt"))->word_count, 2u);
}

TEST_F(DictionaryLoaderTest, CasedMaskDropsWordsContainingItsFoldedForm) {
  write_file("words.txt", "x\nbox\nclean\n");

  LoaderOptions options;
  options.mask_char = U'X';
  DictionaryLoader loader(options);
  auto snapshot = loader.load(pattern("words.txt"));

  EXPECT_EQ(snapshot->word_count, 1u);
  EXPECT_EQ(snapshot->mask_char, U'X');
  EXPECT_TRUE(has_warning_containing(*snapshot, "skipped 2 word(s)"));
  EXPECT_FALSE(Dictionary::exists(*snapshot, "X"));
  EXPECT_EQ(Dictionary::filter(*snapshot, "X clean", U'X'), "X XXXXX");
}

TEST_F(DictionaryLoaderTest, SnapshotRecordsMaskCharacter) {
  write_file("words.txt", "word\n");

  DictionaryLoader default_loader;
  EXPECT_EQ(default_loader.load(pattern("words.txt"))->mask_char, U'*');

  LoaderOptions options;
  options.mask_char = U'\u2588';
  DictionaryLoader block_loader(options);
  EXPECT_EQ(block_loader.load(pattern("words.txt"))->mask_char, U'\u2588');
}

TEST_F(DictionaryLoaderTest, UnicodeWordsAreFolded) {
  write_file("ru.txt", "\xD0\x96\xD0\x90\xD0\x91\xD0\x90\n"); // ЖАБА

  DictionaryLoader loader;
  auto snapshot = loader.load(pattern("ru.txt"));
  EXPECT_TRUE(Dictionary::exists(*snapshot, "\xD0\xB6\xD0\xB0\xD0\xB1\xD0\xB0"));
}
