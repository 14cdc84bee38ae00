#pragma once
#include "corpus.hpp"
#include <cstdint>
#include <optional>
#include <string>

// "data" beside the running executable; "./data" if that cannot be resolved.
std::string default_data_dir();

struct Args {
  std::string config_path;
  std::string root_path = default_data_dir();
  std::string host = "127.0.0.1";
  uint16_t port = 17;
  AllowedCategories categories = AllowedCategories::Decorous;
  int verbosity = 0;
  bool quiet = false;
  std::string log_file;
  std::string user = "nobody";
  std::optional<uint64_t> seed;
  size_t threads = 0;   // 0 = one per hardware thread
};

// Exits with usage on malformed input. A --config file is applied first and
// command-line values override it.
Args parse_cli(int argc, char** argv);

struct ClientArgs {
  std::string host;
  uint16_t port = 17;
  bool tcp = false;
};

ClientArgs parse_client_cli(int argc, char** argv);
