#pragma once

#include <string>

namespace rctx {
namespace util {

class Config {
public:
  // Construct with sensible defaults.
  Config() = default;

  // Load from a simple "key=value" file (unknown keys ignored).
  // Returns true if file read successfully (even if some keys are unknown).
  bool loadFromFile(const std::string& path);

  // Pools
  int poolThreads      = 1;    // user work pool
  int schedulerThreads = 3;    // rescheduling pool

  // Demo retry loop
  int maxAttempts  = 5;
  int backoffMs    = 1000;
  int workMs       = 1000;
  int succeedAfter = 3;        // work fails until it has run more than this many times

  // Logging
  std::string logLevel = "info";
  bool        logJson  = false;
  std::string logFile;         // empty -> stdout

private:
  static bool parseLineKV(const std::string& line, std::string& k, std::string& v);
  static std::string trim(const std::string& s);
  static bool parseBool(const std::string& s);
};

} // namespace util
} // namespace rctx
