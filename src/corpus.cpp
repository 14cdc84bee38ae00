#include "corpus.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

std::vector<QuoteCategory> categories_for(AllowedCategories allowed) {
  switch (allowed) {
    case AllowedCategories::Decorous:  return { QuoteCategory::Decorous };
    case AllowedCategories::Offensive: return { QuoteCategory::Offensive };
    case AllowedCategories::All:       return { QuoteCategory::Decorous, QuoteCategory::Offensive };
  }
  return { QuoteCategory::Decorous };
}

AllowedCategories parse_categories(const std::string& name) {
  std::string n = name;
  std::transform(n.begin(), n.end(), n.begin(), ::tolower);
  if (n == "decorous") return AllowedCategories::Decorous;
  if (n == "offensive") return AllowedCategories::Offensive;
  if (n == "all") return AllowedCategories::All;
  throw std::runtime_error("unknown quote category: " + name);
}

Corpus Corpus::build(const std::string& root, const std::vector<QuoteCategory>& allowed) {
  std::vector<IndexedFile> files;
  for (auto& p : fs::recursive_directory_iterator(root)) {
    if (!p.is_regular_file()) continue;
    files.push_back(index_file(p.path().string()));
  }
  return Corpus(std::move(files), allowed);
}

Corpus::Corpus(std::vector<IndexedFile> files, const std::vector<QuoteCategory>& allowed) {
  for (auto& f : files) {
    bool ok = std::find(allowed.begin(), allowed.end(), f.category) != allowed.end();
    if (!ok) {
      log_info("corpus", "File \"", f.path, "\" is not in allowed categories");
      continue;
    }
    if (f.spans.empty()) {
      log_info("corpus", "File \"", f.path, "\" contains no quotes");
      continue;
    }
    log_info("corpus", "Indexed file \"", f.path, "\" containing ", f.spans.size(), " entries");
    files_.push_back(std::move(f));
  }
  if (files_.empty())
    throw std::runtime_error("corpus: no eligible quote files");

  std::vector<double> weights;
  weights.reserve(files_.size());
  for (auto& f : files_) weights.push_back((double)f.spans.size());
  file_weights_ = std::discrete_distribution<size_t>(weights.begin(), weights.end());
}

size_t Corpus::total_quotes() const {
  size_t n = 0;
  for (auto& f : files_) n += f.spans.size();
  return n;
}

std::string Corpus::random_quote(std::mt19937_64& rng) {
  size_t file_index = file_weights_(rng);
  std::uniform_int_distribution<size_t> pick(0, files_[file_index].spans.size() - 1);
  return read_quote(file_index, pick(rng));
}

std::string Corpus::read_quote(size_t file_index, size_t span_index) {
  IndexedFile& f = files_.at(file_index);
  const QuoteSpan& span = f.spans.at(span_index);

  std::ifstream& in = *f.handle;
  in.clear();
  in.seekg((std::streamoff)span.offset);
  if (!in) throw std::runtime_error("corpus: seek failed in " + f.path);

  std::string s;
  s.resize(span.length);
  in.read(s.data(), (std::streamsize)s.size());
  if (in.gcount() != (std::streamsize)s.size())
    throw std::runtime_error("corpus: short read in " + f.path);

  if (f.encoding == FileEncoding::Rot13) rot13(s);
  return s;
}
