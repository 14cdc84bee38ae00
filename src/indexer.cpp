#include "indexer.hpp"
#include <re2/re2.h>
#include <cstdint>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

const char QUOTE_DELIMITER = '%';
const char* const ROT13_MARKER = "$SerrOFQ$";
const char* const PLAIN_MARKER = "$FreeBSD$";
const char* const OFFENSIVE_SUFFIX = "-o";

static RE2::Options literal_options() {
  RE2::Options o;
  o.set_literal(true);
  o.set_log_errors(false);
  return o;
}

// compiled once; RE2 is safe to share between threads
static const RE2& rot13_marker_re() {
  static const RE2 re(ROT13_MARKER, literal_options());
  return re;
}

static const RE2& plain_marker_re() {
  static const RE2 re(PLAIN_MARKER, literal_options());
  return re;
}

QuoteCategory category_for_path(const std::string& path) {
  std::string name = fs::path(path).filename().string();
  std::string suffix(OFFENSIVE_SUFFIX);
  if (name.size() >= suffix.size() &&
      name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0)
    return QuoteCategory::Offensive;
  return QuoteCategory::Decorous;
}

QuoteSpan make_span(uint64_t offset, uint64_t length, const std::string& path) {
  if (length > UINT32_MAX) throw std::runtime_error("indexer: quote too large in " + path);
  return QuoteSpan{ offset, (uint32_t)length };
}

IndexedFile index_file(const std::string& path) {
  auto in = std::make_unique<std::ifstream>(path, std::ios::binary);
  if (!*in) throw std::runtime_error("indexer: failed to open " + path);

  std::string data;
  {
    std::ostringstream ss;
    ss << in->rdbuf();
    if (in->bad()) throw std::runtime_error("indexer: failed to read " + path);
    data = ss.str();
  }
  // the same handle serves every later seek + read
  in->clear();

  const RE2& rot13_re = rot13_marker_re();
  const RE2& plain_re = plain_marker_re();

  IndexedFile f;
  f.path = path;
  f.category = category_for_path(path);

  bool encoding_found = false;
  size_t last_boundary = 0;
  size_t line_start = 0;
  while (line_start < data.size()) {
    size_t nl = data.find('\n', line_start);
    size_t line_end = (nl == std::string::npos) ? data.size() : nl + 1;
    re2::StringPiece line(data.data() + line_start, line_end - line_start);

    if (!encoding_found) {
      if (RE2::PartialMatch(line, rot13_re)) {
        f.encoding = FileEncoding::Rot13;
        encoding_found = true;
      } else if (RE2::PartialMatch(line, plain_re)) {
        f.encoding = FileEncoding::Plain;
        encoding_found = true;
      }
    }

    if (data[line_start] == QUOTE_DELIMITER) {
      size_t len = line_start - last_boundary;
      if (len > 0) f.spans.push_back(make_span(last_boundary, len, path));
      last_boundary = line_end;
    }
    line_start = line_end;
  }

  f.spans.shrink_to_fit();
  f.handle = std::move(in);
  return f;
}

void rot13(std::string& text) {
  for (auto& c : text) {
    if ((c >= 'A' && c <= 'M') || (c >= 'a' && c <= 'm')) c = (char)(c + 13);
    else if ((c >= 'N' && c <= 'Z') || (c >= 'n' && c <= 'z')) c = (char)(c - 13);
  }
}
