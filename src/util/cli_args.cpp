#include "canopy/util/cli_args.h"

namespace canopy::util {

namespace {

[[noreturn]] void throw_invalid(const std::string& key, const std::string& value) {
  throw UsageError("Invalid value for " + key + ": '" + value + "'");
}

} // namespace

std::optional<std::string> find_arg_value(int argc, char** argv, const std::string& key) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] != key) continue;
    if (i + 1 >= argc) throw UsageError("Missing value for " + key);
    return std::string(argv[i + 1]);
  }
  return std::nullopt;
}

int get_int_arg(int argc, char** argv, const std::string& key, int def) {
  const auto v = find_arg_value(argc, argv, key);
  if (!v) return def;
  std::size_t pos = 0;
  int out = 0;
  try {
    out = std::stoi(*v, &pos);
  } catch (const std::logic_error&) {
    // std::invalid_argument and std::out_of_range
    throw_invalid(key, *v);
  }
  if (pos != v->size()) throw_invalid(key, *v);
  return out;
}

float get_float_arg(int argc, char** argv, const std::string& key, float def) {
  const auto v = find_arg_value(argc, argv, key);
  if (!v) return def;
  std::size_t pos = 0;
  float out = 0.0f;
  try {
    out = std::stof(*v, &pos);
  } catch (const std::logic_error&) {
    throw_invalid(key, *v);
  }
  if (pos != v->size()) throw_invalid(key, *v);
  return out;
}

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  const auto v = find_arg_value(argc, argv, key);
  return v ? *v : def;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

} // namespace canopy::util
