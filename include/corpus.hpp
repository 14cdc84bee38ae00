#pragma once
#include "indexer.hpp"
#include <random>
#include <string>
#include <vector>

enum class AllowedCategories { Decorous, Offensive, All };

std::vector<QuoteCategory> categories_for(AllowedCategories allowed);
AllowedCategories parse_categories(const std::string& name);  // throws on unknown name

class Corpus {
public:
  // Walks root recursively and indexes every regular file. Any I/O error aborts.
  // Throws std::runtime_error when no file survives the category/emptiness filter.
  static Corpus build(const std::string& root, const std::vector<QuoteCategory>& allowed);

  // Adopts already indexed files; same filtering and failure rules as build().
  Corpus(std::vector<IndexedFile> files, const std::vector<QuoteCategory>& allowed);

  Corpus(Corpus&&) = default;
  Corpus& operator=(Corpus&&) = default;

  // File chosen with weight = its span count, then a span uniformly within it,
  // so every quote in the corpus is equally likely.
  std::string random_quote(std::mt19937_64& rng);

  // Seeks the file's handle and reads the span; rot13 files come back decoded.
  std::string read_quote(size_t file_index, size_t span_index);

  size_t file_count() const { return files_.size(); }
  size_t quote_count(size_t file_index) const { return files_.at(file_index).spans.size(); }
  size_t total_quotes() const;
  const std::string& file_path(size_t file_index) const { return files_.at(file_index).path; }

private:
  std::vector<IndexedFile> files_;
  std::discrete_distribution<size_t> file_weights_;
};
