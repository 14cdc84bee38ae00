#include "config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

void load_config_file(const std::string& path, Args& a) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("config: cannot open " + path);

  json j;
  try {
    j = json::parse(in);
  } catch (const json::exception& e) {
    throw std::runtime_error("config: " + path + ": " + e.what());
  }
  if (!j.is_object()) throw std::runtime_error("config: " + path + ": expected a JSON object");

  try {
    if (j.contains("dir"))      a.root_path = j["dir"].get<std::string>();
    if (j.contains("host"))     a.host = j["host"].get<std::string>();
    if (j.contains("port")) {
      auto port = j["port"].get<int64_t>();
      if (port < 0 || port > 65535) throw std::runtime_error("config: " + path + ": port out of range");
      a.port = (uint16_t)port;
    }
    if (j.contains("categories")) a.categories = parse_categories(j["categories"].get<std::string>());
    if (j.contains("log_file")) a.log_file = j["log_file"].get<std::string>();
    if (j.contains("user"))     a.user = j["user"].get<std::string>();
    if (j.contains("seed"))     a.seed = j["seed"].get<uint64_t>();
    if (j.contains("threads"))  a.threads = j["threads"].get<size_t>();
  } catch (const json::exception& e) {
    throw std::runtime_error("config: " + path + ": " + e.what());
  }
}
