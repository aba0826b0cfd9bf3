#include "storage/Trie.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

TEST(TrieTest, InsertThenLookup) {
  using namespace LX;
  Trie trie;
  trie.Insert("hello");
  EXPECT_TRUE(trie.IsValid("hello"));
  EXPECT_TRUE(trie.Contains("hello"));
  // prefixes exist but are not words
  EXPECT_TRUE(trie.Contains("hel"));
  EXPECT_FALSE(trie.IsValid("hel"));
  EXPECT_FALSE(trie.Contains("help"));
  EXPECT_FALSE(trie.IsValid("hellos"));
  EXPECT_TRUE(trie.Contains(""));
  EXPECT_FALSE(trie.IsValid(""));
}

TEST(TrieTest, FrequencyCountsInsertions) {
  using namespace LX;
  Trie trie;
  for (int i = 0; i < 5; i++) {
    trie.Insert("apple");
  }
  EXPECT_EQ(5, trie.Frequency("apple"));
  trie.Insert("app");
  // interior nodes count every insertion walking through them
  EXPECT_EQ(6, trie.Frequency("app"));
  EXPECT_EQ(6, trie.Frequency("a"));
  EXPECT_EQ(5, trie.Frequency("appl"));
  EXPECT_EQ(0, trie.Frequency("banana"));
  EXPECT_EQ(0, trie.Frequency(""));
}

TEST(TrieTest, LongestPrefix) {
  using namespace LX;
  Trie trie;
  trie.Insert("he");
  trie.Insert("hello");
  EXPECT_EQ("he", trie.LongestPrefix("help"));
  EXPECT_EQ("hello", trie.LongestPrefix("hello"));
  EXPECT_EQ("hello", trie.LongestPrefix("hellothere"));
  EXPECT_EQ("he", trie.LongestPrefix("hell"));
  EXPECT_EQ("", trie.LongestPrefix("h"));
  EXPECT_EQ("", trie.LongestPrefix("xyz"));
  EXPECT_EQ("", trie.LongestPrefix(""));
  trie.Insert("");
  EXPECT_EQ("", trie.LongestPrefix("xyz"));
  EXPECT_EQ("he", trie.LongestPrefix("hex"));
}

TEST(TrieTest, CompletionFollowsMostFrequentBranch) {
  using namespace LX;
  Trie trie;
  trie.Insert("cat");
  trie.Insert("car");
  trie.Insert("car");
  trie.Insert("car");
  EXPECT_EQ("r", trie.Completion("ca").value());
  EXPECT_EQ("ar", trie.Completion("c").value());
  EXPECT_EQ("car", trie.Completion("").value());
  // already a word
  EXPECT_FALSE(trie.Completion("car").has_value());
  EXPECT_FALSE(trie.Completion("cow").has_value());
  // nothing below "car" yet
  EXPECT_FALSE(trie.CompletionForced("car").has_value());
  trie.Insert("cart");
  trie.Insert("cartoon");
  EXPECT_FALSE(trie.Completion("car").has_value());
  ASSERT_TRUE(trie.CompletionForced("car").has_value());
  // stops at the first word on the way down
  EXPECT_EQ("t", trie.CompletionForced("car").value());
  EXPECT_EQ("oon", trie.CompletionForced("cart").value());
}

TEST(TrieTest, CompletionTieKeepsFirstChild) {
  using namespace LX;
  Trie trie;
  trie.Insert("ab");
  trie.Insert("ac");
  EXPECT_EQ("b", trie.Completion("a").value());
  trie.Insert("ac");
  EXPECT_EQ("c", trie.Completion("a").value());
  trie.Insert("ab");
  // b reaches 2 again but does not displace c
  EXPECT_EQ("c", trie.Completion("a").value());
  trie.Insert("ab");
  EXPECT_EQ("b", trie.Completion("a").value());
}

TEST(TrieTest, RemovePrunesDeadBranch) {
  using namespace LX;
  Trie trie;
  trie.Insert("hello");
  trie.Remove("hello");
  EXPECT_FALSE(trie.IsValid("hello"));
  EXPECT_FALSE(trie.Contains("hello"));
  EXPECT_FALSE(trie.Contains("h"));
  EXPECT_TRUE(trie.Words().empty());
  EXPECT_EQ("", trie.ToString());
}

TEST(TrieTest, RemoveKeepsSharedNodes) {
  using namespace LX;
  Trie trie;
  trie.Insert("he");
  trie.Insert("hello");
  trie.Insert("help");

  trie.Remove("hello");
  EXPECT_FALSE(trie.Contains("hello"));
  EXPECT_FALSE(trie.Contains("hell"));
  EXPECT_TRUE(trie.IsValid("help"));
  EXPECT_TRUE(trie.IsValid("he"));

  // removing an interior word leaves its descendants alone
  trie.Remove("he");
  EXPECT_FALSE(trie.IsValid("he"));
  EXPECT_TRUE(trie.Contains("he"));
  EXPECT_TRUE(trie.IsValid("help"));
  EXPECT_EQ(std::vector<std::string>{"help"}, trie.Words());
}

TEST(TrieTest, RemoveIgnoresMissingOrPartialWords) {
  using namespace LX;
  Trie trie;
  trie.Insert("hello");
  trie.Remove("hel");
  trie.Remove("help");
  trie.Remove("hellos");
  trie.Remove("");
  EXPECT_TRUE(trie.IsValid("hello"));
  EXPECT_EQ("hello", trie.ToString());
}

TEST(TrieTest, RemoveTwiceIsRemoveOnce) {
  using namespace LX;
  Trie trie;
  trie.Insert("car");
  trie.Insert("cat");
  trie.Remove("car");
  auto words = trie.Words();
  auto dump = trie.ToString();
  trie.Remove("car");
  EXPECT_EQ(words, trie.Words());
  EXPECT_EQ(dump, trie.ToString());
  EXPECT_EQ(std::vector<std::string>{"cat"}, words);
}

TEST(TrieTest, RemoveRefreshesMostFrequent) {
  using namespace LX;
  Trie trie;
  trie.Insert("cat");
  trie.Insert("cab");
  trie.Insert("cab");
  trie.Insert("car");
  trie.Insert("car");
  trie.Insert("car");
  EXPECT_EQ("r", trie.Completion("ca").value());
  trie.Remove("car");
  EXPECT_EQ("b", trie.Completion("ca").value());
  trie.Remove("cab");
  EXPECT_EQ("t", trie.Completion("ca").value());
  trie.Remove("cat");
  EXPECT_FALSE(trie.Completion("ca").has_value());
  EXPECT_FALSE(trie.Completion("").has_value());
}

TEST(TrieTest, RemoveRefreshKeepsFirstChildToReachMax) {
  using namespace LX;
  Trie trie;
  trie.Insert("xa");
  trie.Insert("xb");
  trie.Insert("xb");
  trie.Insert("xa");
  trie.Insert("xc");
  trie.Insert("xc");
  trie.Insert("xc");
  EXPECT_EQ("c", trie.Completion("x").value());
  // a and b both have 2, b got there first although a was inserted first
  trie.Remove("xc");
  EXPECT_EQ("b", trie.Completion("x").value());
}

TEST(TrieTest, RemoveKeepsFrequencies) {
  using namespace LX;
  Trie trie;
  trie.Insert("car");
  trie.Insert("cart");
  trie.Remove("car");
  EXPECT_EQ(2, trie.Frequency("car"));
  EXPECT_EQ(1, trie.Frequency("cart"));
}

TEST(TrieTest, WordsDepthFirstInInsertionOrder) {
  using namespace LX;
  Trie trie;
  trie.Insert("dog");
  trie.Insert("car");
  trie.Insert("cat");
  trie.Insert("ca");
  trie.Insert("door");
  // a node's own word comes before its children
  std::vector<std::string> expected{"dog", "door", "ca", "car", "cat"};
  EXPECT_EQ(expected, trie.Words());
  EXPECT_EQ((std::vector<std::string>{"ca", "car", "cat"}),
            trie.WordsWithPrefix("ca"));
  EXPECT_EQ((std::vector<std::string>{"car"}), trie.WordsWithPrefix("car"));
  EXPECT_TRUE(trie.WordsWithPrefix("x").empty());
  EXPECT_EQ(trie.Words(), trie.WordsWithPrefix(""));
}

TEST(TrieTest, WordsWithPrefixMatchesCompletionExample) {
  using namespace LX;
  Trie trie;
  trie.Insert("cat");
  trie.Insert("car");
  trie.Insert("car");
  trie.Insert("car");
  EXPECT_EQ((std::vector<std::string>{"cat", "car"}),
            trie.WordsWithPrefix("ca"));
}

TEST(TrieTest, ToStringIsBreadthFirst) {
  using namespace LX;
  Trie trie;
  trie.Insert("ab");
  trie.Insert("ac");
  EXPECT_EQ("abc", trie.ToString());
  trie.Insert("bd");
  EXPECT_EQ("abbcd", trie.ToString());
}

TEST(TrieTest, ClearEqualsFreshTrie) {
  using namespace LX;
  Trie trie;
  trie.Insert("");
  trie.Insert("cat");
  trie.Insert("car");
  trie.Clear();
  Trie fresh;
  for (auto word : {"", "c", "ca", "cat", "car"}) {
    EXPECT_EQ(fresh.Contains(word), trie.Contains(word));
    EXPECT_EQ(fresh.IsValid(word), trie.IsValid(word));
    EXPECT_EQ(fresh.Frequency(word), trie.Frequency(word));
    EXPECT_EQ(fresh.LongestPrefix(word), trie.LongestPrefix(word));
    EXPECT_EQ(fresh.Completion(word), trie.Completion(word));
    EXPECT_EQ(fresh.CompletionForced(word), trie.CompletionForced(word));
  }
  EXPECT_EQ(fresh.Words(), trie.Words());
  EXPECT_EQ(fresh.ToString(), trie.ToString());
  // still usable afterwards
  trie.Insert("dog");
  EXPECT_EQ("dog", trie.Completion("").value());
}

TEST(TrieTest, EmptyWord) {
  using namespace LX;
  Trie trie;
  trie.Insert("");
  EXPECT_TRUE(trie.IsValid(""));
  EXPECT_EQ(std::vector<std::string>{""}, trie.Words());
  EXPECT_EQ(0, trie.Frequency(""));
  // root is a word and has no children
  EXPECT_FALSE(trie.Completion("").has_value());
  EXPECT_FALSE(trie.CompletionForced("").has_value());

  trie.Insert("go");
  EXPECT_FALSE(trie.Completion("").has_value());
  EXPECT_EQ("go", trie.CompletionForced("").value());
  EXPECT_EQ((std::vector<std::string>{"", "go"}), trie.Words());

  trie.Remove("");
  EXPECT_FALSE(trie.IsValid(""));
  EXPECT_TRUE(trie.IsValid("go"));
  EXPECT_EQ("go", trie.Completion("").value());
}

TEST(TrieTest, NullInput) {
  using namespace LX;
  Trie trie;
  trie.Insert(nullptr);
  EXPECT_FALSE(trie.IsValid(""));
  EXPECT_TRUE(trie.Words().empty());

  trie.Insert("cat");
  const char *absent = nullptr;
  trie.Remove(absent);
  EXPECT_TRUE(trie.IsValid("cat"));
  EXPECT_FALSE(trie.Contains(absent));
  EXPECT_FALSE(trie.IsValid(absent));
  EXPECT_EQ(0, trie.Frequency(absent));
  EXPECT_EQ("", trie.LongestPrefix(absent));
  EXPECT_FALSE(trie.Completion(absent).has_value());
  EXPECT_FALSE(trie.CompletionForced(absent).has_value());
  EXPECT_TRUE(trie.WordsWithPrefix(absent).empty());
  EXPECT_TRUE(trie.WordsWithPrefix(Slice{}).empty());
}

TEST(TrieTest, ArbitraryBytes) {
  using namespace LX;
  Trie trie;
  std::string word{"a\0b", 3};
  trie.Insert(word);
  EXPECT_TRUE(trie.IsValid(word));
  EXPECT_FALSE(trie.IsValid("a"));
  EXPECT_TRUE(trie.Contains(std::string{"a\0", 2}));
  EXPECT_EQ(std::string("\0b", 2), trie.Completion("a").value());
  trie.Insert("\xc3\xa9t\xc3\xa9");
  EXPECT_TRUE(trie.IsValid("\xc3\xa9t\xc3\xa9"));
  EXPECT_EQ(std::vector<std::string>{"\xc3\xa9t\xc3\xa9"},
            trie.WordsWithPrefix("\xc3"));
}

TEST(TrieTest, ManyWords) {
  using namespace LX;
  Trie trie;
  for (int i = 0; i < 1000; i++) {
    trie.Insert(std::to_string(i));
  }
  for (int i = 0; i < 1000; i++) {
    EXPECT_TRUE(trie.IsValid(std::to_string(i)));
  }
  EXPECT_EQ(1000, trie.Words().size());
  for (int i = 0; i < 1000; i += 2) {
    trie.Remove(std::to_string(i));
  }
  for (int i = 0; i < 1000; i++) {
    EXPECT_EQ(i % 2 == 1, trie.IsValid(std::to_string(i)));
  }
  EXPECT_EQ(500, trie.Words().size());
  // "10" was removed but still leads to "101"
  EXPECT_TRUE(trie.Contains("10"));
  EXPECT_FALSE(trie.Contains("100"));
}
