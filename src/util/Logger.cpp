#include "rctx/util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace rctx::util {

// Fields pushed by Logger::Scoped on this thread, oldest first.
static thread_local std::vector<Field> t_ctx;

const char* levelName(LogLevel l) {
  switch (l) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
  }
  return "INFO";
}

LogLevel parseLevel(const std::string& s) {
  std::string x = s;
  for (auto& c : x) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (x == "trace") return LogLevel::Trace;
  if (x == "debug") return LogLevel::Debug;
  if (x == "info")  return LogLevel::Info;
  if (x == "warn")  return LogLevel::Warn;
  if (x == "error") return LogLevel::Error;
  return LogLevel::Info;
}

Logger& logger() {
  static Logger L;
  return L;
}

Logger::Logger() {}

Logger::~Logger() {
  std::lock_guard<std::mutex> lk(mx_);
  if (file_ && file_ != stdout) std::fclose(static_cast<FILE*>(file_));
}

void Logger::setLevel(LogLevel lvl) { lvl_.store(lvl, std::memory_order_relaxed); }
void Logger::setFormatJson(bool json) { json_.store(json, std::memory_order_relaxed); }

void Logger::setFile(const std::string& path) {
  std::lock_guard<std::mutex> lk(mx_);
  if (file_ && file_ != stdout) std::fclose(static_cast<FILE*>(file_));
  file_ = path.empty() ? stdout : static_cast<void*>(std::fopen(path.c_str(), "a"));
  if (!file_) file_ = stdout;
}

LogLevel Logger::level() const { return lvl_.load(std::memory_order_relaxed); }

void Logger::log(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields) {
  if (!enabled(lvl)) return;
  writeLine(lvl, msg, fields);
}

static std::string nowIso() {
  using namespace std::chrono;
  auto tp = system_clock::now();
  auto t = system_clock::to_time_t(tp);
  auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
  std::tm tm;
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

// Scoped fields, innermost value per key, in first-pushed order.
static std::vector<Field> visibleContext() {
  std::vector<Field> out;
  for (auto it = t_ctx.rbegin(); it != t_ctx.rend(); ++it) {
    auto seen = std::find_if(out.begin(), out.end(), [&](const Field& f) { return f.k == it->k; });
    if (seen == out.end()) out.push_back(*it);
  }
  std::reverse(out.begin(), out.end());
  return out;
}

void Logger::writeLine(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields) {
  const auto ctx = visibleContext();
  std::string line;

  if (json_.load(std::memory_order_relaxed)) {
    rapidjson::StringBuffer sb;
    rapidjson::Writer<rapidjson::StringBuffer> w(sb);
    w.StartObject();
    w.Key("ts");  w.String(nowIso().c_str());
    w.Key("lvl"); w.String(levelName(lvl));
    w.Key("msg"); w.String(msg.c_str(), static_cast<rapidjson::SizeType>(msg.size()));
    for (auto& kv : ctx) {
      w.Key(kv.k.c_str(), static_cast<rapidjson::SizeType>(kv.k.size()));
      w.String(kv.v.c_str(), static_cast<rapidjson::SizeType>(kv.v.size()));
    }
    for (auto& kv : fields) {
      w.Key(kv.k.c_str(), static_cast<rapidjson::SizeType>(kv.k.size()));
      w.String(kv.v.c_str(), static_cast<rapidjson::SizeType>(kv.v.size()));
    }
    w.EndObject();
    line.assign(sb.GetString(), sb.GetSize());
  } else {
    std::ostringstream oss;
    oss << '[' << nowIso() << "] " << std::left << std::setw(5) << levelName(lvl) << ' ' << msg;
    for (auto& kv : ctx) oss << ' ' << kv.k << '=' << kv.v;
    for (auto& kv : fields) oss << ' ' << kv.k << '=' << kv.v;
    line = oss.str();
  }
  line.push_back('\n');

  std::lock_guard<std::mutex> lk(mx_);
  FILE* f = static_cast<FILE*>(file_ ? file_ : stdout);
  std::fwrite(line.data(), 1, line.size(), f);
  std::fflush(f);
}

Logger::Scoped::Scoped(const std::vector<Field>& add) : mark_(t_ctx.size()) {
  t_ctx.insert(t_ctx.end(), add.begin(), add.end());
}

Logger::Scoped::~Scoped() {
  t_ctx.resize(mark_);
}

} // namespace rctx::util
