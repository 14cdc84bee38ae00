#include "cli.hpp"
#include "config.hpp"
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <stdexcept>

static const char* USAGE =
"qotd-server [-d DIR] [-i HOST] [-p PORT] [-c decorous|offensive|all] [-a] [-o]\n"
"            [-v...] [-q] [-l LOG_FILE] [-u USER] [--seed N] [--threads N] [--config FILE]\n"
"\n"
"Quote files are plain text; lines beginning with '%' delimit quotes. Files whose\n"
"name ends in \"-o\" are offensive. A file containing \"$SerrOFQ$\" before any\n"
"\"$FreeBSD$\" is rot13 encoded.\n";

static const char* CLIENT_USAGE = "qotd HOST [PORT] [--tcp]\n";

std::string default_data_dir() {
  std::error_code ec;
  auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (ec || exe.empty()) return "./data";
  return (exe.parent_path() / "data").string();
}

[[noreturn]] static void usage(const char* text) {
  std::cerr << text;
  std::exit(1);
}

static uint64_t to_number(const std::string& flag, const std::string& v, uint64_t max) {
  try {
    size_t used = 0;
    if (v.empty() || v[0] == '-') throw std::invalid_argument(v);
    unsigned long long n = std::stoull(v, &used);
    if (used != v.size() || n > max) throw std::out_of_range(v);
    return n;
  } catch (const std::exception&) {
    std::cerr << "Invalid value for " << flag << ": " << v << "\n";
    std::exit(1);
  }
}

Args parse_cli(int argc, char** argv) {
  Args a;

  // the config file is the base layer, flags override it
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0) {
      if (i + 1 >= argc) { std::cerr << "Missing value after --config\n"; std::exit(1); }
      a.config_path = argv[i + 1];
    }
  }
  if (!a.config_path.empty()) {
    try {
      load_config_file(a.config_path, a);
    } catch (const std::exception& e) {
      std::cerr << e.what() << "\n";
      std::exit(1);
    }
  }

  bool all = false, offensive = false, have_categories = false;
  AllowedCategories categories = a.categories;

  int i = 1;
  while (i < argc) {
    std::string f = argv[i++];
    auto next = [&](std::string& dst){
      if (i >= argc) { std::cerr << "Missing value after " << f << "\n"; std::exit(1); }
      dst = argv[i++];
    };
    std::string v;
    if (f == "--config") next(v);
    else if (f == "-d" || f == "--dir") next(a.root_path);
    else if (f == "-i" || f == "--host") next(a.host);
    else if (f == "-p" || f == "--port") { next(v); a.port = (uint16_t)to_number(f, v, 65535); }
    else if (f == "-c" || f == "--categories") {
      next(v);
      try {
        categories = parse_categories(v);
      } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        std::exit(1);
      }
      have_categories = true;
    }
    else if (f == "-a" || f == "--all") all = true;
    else if (f == "-o" || f == "--offensive") offensive = true;
    else if (f == "-q" || f == "--quiet") a.quiet = true;
    else if (f == "--verbose") a.verbosity++;
    else if (f.size() > 1 && f[0] == '-' && f[1] == 'v' && f.find_first_not_of('v', 1) == std::string::npos)
      a.verbosity += (int)f.size() - 1;   // -v, -vv, -vvv
    else if (f == "-l" || f == "--log-file") next(a.log_file);
    else if (f == "-u" || f == "--user") next(a.user);
    else if (f == "--seed") { next(v); a.seed = to_number(f, v, UINT64_MAX); }
    else if (f == "--threads") { next(v); a.threads = (size_t)to_number(f, v, 4096); }
    else if (f == "-h" || f == "--help") { std::cout << USAGE; std::exit(0); }
    else { std::cerr << "Unknown flag: " << f << "\n"; usage(USAGE); }
  }

  if (have_categories) a.categories = categories;
  else if (all) a.categories = AllowedCategories::All;
  else if (offensive) a.categories = AllowedCategories::Offensive;
  return a;
}

ClientArgs parse_client_cli(int argc, char** argv) {
  ClientArgs a;
  int positional = 0;
  for (int i = 1; i < argc; ++i) {
    std::string f = argv[i];
    if (f == "--tcp") a.tcp = true;
    else if (f == "-h" || f == "--help") { std::cout << CLIENT_USAGE; std::exit(0); }
    else if (!f.empty() && f[0] == '-') { std::cerr << "Unknown flag: " << f << "\n"; usage(CLIENT_USAGE); }
    else if (positional == 0) { a.host = f; positional++; }
    else if (positional == 1) { a.port = (uint16_t)to_number("PORT", f, 65535); positional++; }
    else usage(CLIENT_USAGE);
  }
  if (a.host.empty()) usage(CLIENT_USAGE);
  return a;
}
