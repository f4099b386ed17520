#include "log.hpp"
#include <filesystem>
#include <fstream>
#include <mutex>
#include <cstdarg>
#include <cstdio>
#include <iostream>

static std::mutex g_m;
static std::ofstream g_file;
static LogLevel g_min = LogLevel::Info;

static const char* tagFor(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::Debug: return "D";
    case LogLevel::Info:  return "I";
    case LogLevel::Warn:  return "W";
    default:              return "E";
  }
}

void Log::init(const std::string& dir) {
  std::scoped_lock lk(g_m);
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    std::cerr << "[W] could not create log dir " << dir << ": " << ec.message() << "\n";
    return;
  }
  if (g_file.is_open()) g_file.close();
  g_file.open(dir + "/log.txt", std::ios::app);
}

void Log::setMinLevel(LogLevel lvl) {
  std::scoped_lock lk(g_m);
  g_min = lvl;
}

void Log::write(LogLevel lvl, const char* fmt, ...) {
  std::scoped_lock lk(g_m);
  if (static_cast<int>(lvl) < static_cast<int>(g_min)) return;
  const char* tag = tagFor(lvl);
  char buf[1024];
  va_list ap; va_start(ap, fmt);
  vsnprintf(buf, sizeof(buf), fmt, ap);
  va_end(ap);
  // errors go to stderr so --json output on stdout stays parseable
  std::ostream& out = (lvl == LogLevel::Error) ? std::cerr : std::cout;
  out << "[" << tag << "] " << buf << "\n";
  if (g_file.is_open()) g_file << "[" << tag << "] " << buf << "\n";
}
