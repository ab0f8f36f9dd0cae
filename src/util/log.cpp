#include "canopy/util/log.h"

#include <cctype>
#include <iostream>
#include <mutex>

namespace canopy::log {
namespace {
std::mutex g_mu;
Level g_level = Level::Info;

const char* label(Level l) {
  switch (l) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    default: return "";
  }
}

void emit(Level l, const std::string& msg) {
  std::lock_guard<std::mutex> lock(g_mu);
  if (g_level == Level::Off || l < g_level) return;
  std::cerr << "[" << label(l) << "] " << msg << "\n";
}

} // namespace

void set_level(Level lvl) {
  std::lock_guard<std::mutex> lock(g_mu);
  g_level = lvl;
}

Level level() {
  std::lock_guard<std::mutex> lock(g_mu);
  return g_level;
}

bool parse_level(const std::string& s, Level& out) {
  std::string v = s;
  for (char& ch : v) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  if (v == "debug") {
    out = Level::Debug;
  } else if (v == "info") {
    out = Level::Info;
  } else if (v == "warn" || v == "warning") {
    out = Level::Warn;
  } else if (v == "error") {
    out = Level::Error;
  } else if (v == "off" || v == "none") {
    out = Level::Off;
  } else {
    return false;
  }
  return true;
}

void debug(const std::string& msg) { emit(Level::Debug, msg); }
void info(const std::string& msg) { emit(Level::Info, msg); }
void warn(const std::string& msg) { emit(Level::Warn, msg); }
void error(const std::string& msg) { emit(Level::Error, msg); }

} // namespace canopy::log
