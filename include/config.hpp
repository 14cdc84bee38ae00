#pragma once
#include "cli.hpp"
#include <string>

// Reads a JSON object and copies the keys it recognises into args.
// Throws std::runtime_error on unreadable files, bad JSON or bad values.
void load_config_file(const std::string& path, Args& args);
