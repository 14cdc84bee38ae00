#include "corpus.hpp"
#include "test_util.hpp"

#include <map>
#include <set>

class CorpusTest : public TempDirTest {};

TEST_F(CorpusTest, IndexesNestedDirectories) {
  write_file("top", "%\nt1\n%\nt2\n%\n");
  write_file("a/b/deep", "%\nd1\n%\n");
  auto c = Corpus::build(dir_.string(), categories_for(AllowedCategories::Decorous));
  EXPECT_EQ(c.file_count(), 2u);
  EXPECT_EQ(c.total_quotes(), 3u);
}

TEST_F(CorpusTest, ReadQuoteSeeksEachTime) {
  write_file("f", "%\nfirst\n%\nsecond\n%\nthird\n%\n");
  auto c = Corpus::build(dir_.string(), categories_for(AllowedCategories::Decorous));
  EXPECT_EQ(c.read_quote(0, 2), "third\n");
  EXPECT_EQ(c.read_quote(0, 0), "first\n");
  EXPECT_EQ(c.read_quote(0, 1), "second\n");
  EXPECT_EQ(c.read_quote(0, 1), "second\n");
  EXPECT_THROW(c.read_quote(0, 3), std::out_of_range);
}

TEST_F(CorpusTest, ReadQuoteDecodesRot13Files) {
  write_file("enc", "$SerrOFQ$\n%\nUryyb, jbeyq!\n%\n");
  auto c = Corpus::build(dir_.string(), categories_for(AllowedCategories::Decorous));
  ASSERT_EQ(c.quote_count(0), 2u);
  EXPECT_EQ(c.read_quote(0, 1), "Hello, world!\n");
}

TEST_F(CorpusTest, PlainFilesAreNotDecoded) {
  write_file("plain", "$FreeBSD$\n$SerrOFQ$\n%\nUryyb\n%\n");
  auto c = Corpus::build(dir_.string(), categories_for(AllowedCategories::Decorous));
  EXPECT_EQ(c.read_quote(0, 1), "Uryyb\n");
}

TEST_F(CorpusTest, OffensiveSelectionOnlyServesOffensiveFiles) {
  write_file("a", "%\ndecorous\n%\n");
  write_file("a-o", "%\noffensive\n%\n");
  auto c = Corpus::build(dir_.string(), categories_for(AllowedCategories::Offensive));
  ASSERT_EQ(c.file_count(), 1u);
  std::mt19937_64 rng(7);
  for (int i = 0; i < 200; ++i) EXPECT_EQ(c.random_quote(rng), "offensive\n");
}

TEST_F(CorpusTest, DefaultSelectionSkipsOffensiveFiles) {
  write_file("a", "%\ndecorous\n%\n");
  write_file("a-o", "%\noffensive\n%\n");
  auto c = Corpus::build(dir_.string(), categories_for(AllowedCategories::Decorous));
  std::mt19937_64 rng(7);
  for (int i = 0; i < 200; ++i) EXPECT_EQ(c.random_quote(rng), "decorous\n");
}

TEST_F(CorpusTest, AllSelectionServesBoth) {
  write_file("a", "%\ndecorous\n%\n");
  write_file("a-o", "%\noffensive\n%\n");
  auto c = Corpus::build(dir_.string(), categories_for(AllowedCategories::All));
  std::mt19937_64 rng(11);
  std::set<std::string> seen;
  for (int i = 0; i < 500; ++i) seen.insert(c.random_quote(rng));
  EXPECT_EQ(seen, (std::set<std::string>{ "decorous\n", "offensive\n" }));
}

TEST_F(CorpusTest, EveryQuoteEquallyLikely) {
  write_file("single", "%\nA\n%\n");
  std::string many = "%\n";
  for (int i = 0; i < 99; ++i) many += "B" + std::to_string(i) + "\n%\n";
  write_file("many", many);

  auto c = Corpus::build(dir_.string(), categories_for(AllowedCategories::Decorous));
  ASSERT_EQ(c.total_quotes(), 100u);

  const int draws = 200000;
  std::mt19937_64 rng(12345);
  std::map<std::string, int> counts;
  for (int i = 0; i < draws; ++i) counts[c.random_quote(rng)]++;

  ASSERT_EQ(counts.size(), 100u);
  const double expected = draws / 100.0;
  for (auto& kv : counts) {
    EXPECT_NEAR(kv.second, expected, expected * 0.2) << kv.first;
  }
}

TEST_F(CorpusTest, SameSeedSameSequence) {
  write_file("f", "%\n1\n%\n2\n%\n3\n%\n4\n%\n");
  auto c = Corpus::build(dir_.string(), categories_for(AllowedCategories::Decorous));
  std::mt19937_64 r1(99), r2(99);
  for (int i = 0; i < 50; ++i) EXPECT_EQ(c.random_quote(r1), c.random_quote(r2));
}

TEST_F(CorpusTest, NoEligibleFilesFails) {
  write_file("only-o", "%\nrude\n%\n");
  EXPECT_THROW(Corpus::build(dir_.string(), categories_for(AllowedCategories::Decorous)),
               std::runtime_error);
}

TEST_F(CorpusTest, FilesWithoutQuotesAreExcluded) {
  write_file("empty", "");
  write_file("header-only", "just a header with no delimiter\n");
  EXPECT_THROW(Corpus::build(dir_.string(), categories_for(AllowedCategories::All)),
               std::runtime_error);

  write_file("real", "%\nq\n%\n");
  auto c = Corpus::build(dir_.string(), categories_for(AllowedCategories::All));
  EXPECT_EQ(c.file_count(), 1u);
  EXPECT_EQ(c.file_path(0), (dir_ / "real").string());
}

TEST_F(CorpusTest, EmptyDirectoryFails) {
  EXPECT_THROW(Corpus::build(dir_.string(), categories_for(AllowedCategories::All)),
               std::runtime_error);
}

TEST_F(CorpusTest, MissingRootFails) {
  EXPECT_THROW(Corpus::build((dir_ / "missing").string(), categories_for(AllowedCategories::All)),
               std::runtime_error);
}

TEST(CategoriesTest, SelectorMapsToCategorySets) {
  EXPECT_EQ(categories_for(AllowedCategories::Decorous),
            std::vector<QuoteCategory>{ QuoteCategory::Decorous });
  EXPECT_EQ(categories_for(AllowedCategories::Offensive),
            std::vector<QuoteCategory>{ QuoteCategory::Offensive });
  EXPECT_EQ(categories_for(AllowedCategories::All).size(), 2u);
  EXPECT_EQ(parse_categories("ALL"), AllowedCategories::All);
  EXPECT_THROW(parse_categories("rude"), std::runtime_error);
}
