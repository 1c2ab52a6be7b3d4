#pragma once

#include "prism/chain_runner.h"
#include "prism/json_mini.h"

#include <filesystem>
#include <string>

namespace prism {

// PRISM_ROOT if set, else the nearest ancestor of the executable (or cwd)
// containing a plugins/ directory, else cwd.
std::filesystem::path resolve_root(const char* argv0);
void set_env_if_missing(const char* key, const std::string& value);
std::string slurp(const std::string& path);

// Pretty-printed json-c rendering to stdout.
void print_json(json_object* obj);

json_object* strings_to_json(const std::vector<std::string>& items);
json_object* validation_to_json(const ChainValidation& v);

} // namespace prism
