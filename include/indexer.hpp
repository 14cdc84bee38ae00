#pragma once
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

enum class FileEncoding { Plain, Rot13 };

enum class QuoteCategory { Decorous, Offensive };

// Byte range of one quote inside its file; never includes a delimiter line.
struct QuoteSpan {
  uint64_t offset;
  uint32_t length;
};

struct IndexedFile {
  std::string path;
  std::unique_ptr<std::ifstream> handle;   // kept open for the corpus lifetime
  std::vector<QuoteSpan> spans;           // file order
  FileEncoding encoding = FileEncoding::Plain;
  QuoteCategory category = QuoteCategory::Decorous;
};

extern const char QUOTE_DELIMITER;       // '%'
extern const char* const ROT13_MARKER;   // "$SerrOFQ$"
extern const char* const PLAIN_MARKER;   // "$FreeBSD$"
extern const char* const OFFENSIVE_SUFFIX;  // "-o"

// Scan one quote file. Throws std::runtime_error if it cannot be opened or read.
// A quote is only recorded once a delimiter line closes it: the first quote
// runs from offset 0, and text after the last delimiter is never served.
IndexedFile index_file(const std::string& path);

QuoteCategory category_for_path(const std::string& path);

// Throws std::runtime_error if length does not fit a QuoteSpan.
QuoteSpan make_span(uint64_t offset, uint64_t length, const std::string& path);

// In-place rot13 over ASCII letters; other bytes are untouched.
void rot13(std::string& text);
