#include "cli.hpp"
#include "corpus.hpp"
#include "log.hpp"
#include "privileges.hpp"
#include "server.hpp"

#include <iostream>
#include <random>

static int run(const Args& args) {
  auto quotes = Corpus::build(args.root_path, categories_for(args.categories));
  log_info("main", "Loaded ", quotes.total_quotes(), " quotes from ",
           quotes.file_count(), " files");

  uint64_t seed;
  if (args.seed) {
    seed = *args.seed;
  } else {
    std::random_device rd;
    seed = (uint64_t)rd() << 32 | rd();
  }

  Server server(args.threads);
  server.bind(args.host, args.port);
  drop_privileges(args.user);
  server.serve(std::move(quotes), seed);
  return 0;
}

int main(int argc, char** argv) {
  auto args = parse_cli(argc, argv);

  LogLevel level = level_from_verbosity(args.verbosity, args.quiet);
  log_set_level(level);
  try {
    if (!args.log_file.empty())
      log_set_file(args.log_file, level > LogLevel::Info ? level : LogLevel::Info);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  try {
    return run(args);
  } catch (const std::exception& e) {
    log_error("main", "Server exited with fatal error: ", e.what());
    return 1;
  }
}
