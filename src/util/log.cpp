#include "agripv/util/log.h"

#include <atomic>
#include <iostream>
#include <mutex>

#include "agripv/util/strings.h"

namespace agripv::log {
namespace {

std::mutex g_emit_mu;
std::atomic<Level> g_threshold{Level::Info};

const char* tag(Level l) {
  switch (l) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    case Level::Off: break;
  }
  return "";
}

void write_line(Level l, const std::string& msg) {
  const Level threshold = g_threshold.load();
  if (threshold == Level::Off || l < threshold) return;
  std::lock_guard<std::mutex> lock(g_emit_mu);
  std::cerr << "[" << tag(l) << "] " << msg << "\n";
}

} // namespace

void set_level(Level lvl) { g_threshold.store(lvl); }
Level level() { return g_threshold.load(); }

bool parse_level(std::string_view s, Level* out) {
  const std::string v = to_lower(std::string(s));
  Level parsed;
  if (v == "debug") {
    parsed = Level::Debug;
  } else if (v == "info") {
    parsed = Level::Info;
  } else if (v == "warn" || v == "warning") {
    parsed = Level::Warn;
  } else if (v == "error") {
    parsed = Level::Error;
  } else if (v == "off" || v == "none") {
    parsed = Level::Off;
  } else {
    return false;
  }
  if (out) *out = parsed;
  return true;
}

void debug(const std::string& msg) { write_line(Level::Debug, msg); }
void info(const std::string& msg) { write_line(Level::Info, msg); }
void warn(const std::string& msg) { write_line(Level::Warn, msg); }
void error(const std::string& msg) { write_line(Level::Error, msg); }

} // namespace agripv::log
