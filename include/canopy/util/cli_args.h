#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace canopy::util {

// Malformed command line (bad or missing flag value). Callers print usage and
// exit with status 2.
class UsageError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// `--key value` lookups over argv[1..argc). The first occurrence of `key` wins.
//
// A `key` given as the last argument has no value and throws UsageError, as
// does a numeric value that does not parse completely ("12abc", "", "abc") or
// is out of range.
std::optional<std::string> find_arg_value(int argc, char** argv, const std::string& key);

int get_int_arg(int argc, char** argv, const std::string& key, int def);
float get_float_arg(int argc, char** argv, const std::string& key, float def);
std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def);

bool has_flag(int argc, char** argv, const std::string& flag);

} // namespace canopy::util
