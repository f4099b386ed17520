#pragma once
#include <string>
enum class LogLevel { Debug, Info, Warn, Error };
namespace Log {
  void init(const std::string& dir = "./logs");
  void setMinLevel(LogLevel lvl);
  void write(LogLevel lvl, const char* fmt, ...);
}
