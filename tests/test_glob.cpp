#include <gtest/gtest.h>

#include "core/glob.hpp"

using namespace toolgate;

TEST(GlobTest, Literal) {
  EXPECT_TRUE(glob_match("git status", "git status"));
  EXPECT_FALSE(glob_match("git status", "git status -s"));
}

TEST(GlobTest, StarMatchesAnything) {
  EXPECT_TRUE(glob_match("git status*", "git status"));
  EXPECT_TRUE(glob_match("git status*", "git status --short"));
  EXPECT_TRUE(glob_match("rm -rf*", "rm -rf /"));
  // '*' crosses path separators
  EXPECT_TRUE(glob_match("/tmp/*", "/tmp/a/b/c.txt"));
  EXPECT_FALSE(glob_match("git status*", "git push"));
}

TEST(GlobTest, QuestionMark) {
  EXPECT_TRUE(glob_match("ls -?", "ls -l"));
  EXPECT_FALSE(glob_match("ls -?", "ls -la"));
}

TEST(GlobTest, CharacterClasses) {
  EXPECT_TRUE(glob_match("file[0-9].txt", "file7.txt"));
  EXPECT_FALSE(glob_match("file[0-9].txt", "fileA.txt"));
  EXPECT_TRUE(glob_match("file[!0-9].txt", "fileA.txt"));
  EXPECT_FALSE(glob_match("file[^0-9].txt", "file1.txt"));
  EXPECT_TRUE(glob_match("[abc]at", "bat"));
}

TEST(GlobTest, BracesAreLiteral) {
  EXPECT_FALSE(glob_match("*.{cpp,hpp}", "src/main.cpp"));
  EXPECT_TRUE(glob_match("*.{cpp,hpp}", "src/main.{cpp,hpp}"));
  EXPECT_TRUE(glob_match("echo {a,b}*", "echo {a,b} done"));
}

TEST(GlobTest, MatchAny) {
  std::vector<std::string> patterns = {"git status*", "git log*"};
  EXPECT_TRUE(glob_match_any(patterns, "git log --oneline"));
  EXPECT_FALSE(glob_match_any(patterns, "git push"));
  EXPECT_FALSE(glob_match_any({}, "anything"));
}
