#pragma once
#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <chrono>
#include <optional>
#include <queue>
#include <thread>
#include <condition_variable>

enum class LogLevel { DEBUG, INFO, WARNING, ERROR, CRITICAL };

struct LogEntry {
  std::chrono::system_clock::time_point timestamp;
  LogLevel level;
  std::string message;
  std::string file;
  int line;
};

// Process-wide asynchronous file logger. Calls made before Initialize() or
// after Shutdown() are dropped. Initialize() on a running logger only updates
// the level and stderr echo; the log file stays as first opened.
class Logger {
  static std::unique_ptr<Logger> instance_;
  static std::mutex instance_mutex_;
  std::ofstream log_file_;
  std::mutex log_mutex_;
  std::queue<LogEntry> log_queue_;
  std::thread worker_thread_;
  std::condition_variable cv_;
  bool running_ = false;
  bool echo_stderr_ = false;
  LogLevel min_level_ = LogLevel::INFO;
  Logger() = default;
  void WorkerFunction();
  void WriteLogEntry(const LogEntry&, bool echo_stderr);
public:
  static void Initialize(const std::string& path, LogLevel min_level = LogLevel::INFO, bool echo_stderr = false);
  static void Shutdown();
  static bool IsInitialized();
  static std::string LevelToString(LogLevel);
  // Accepts DEBUG, INFO, WARN/WARNING, ERROR, CRIT/CRITICAL in any case.
  static std::optional<LogLevel> ParseLevel(const std::string& name);
  static std::string FormatLogEntry(const LogEntry&);
  static void Log(LogLevel level, const std::string& message, const std::string& file = std::string(), int line = 0);
  static void Debug(const std::string& m) { Log(LogLevel::DEBUG, m); }
  static void Info(const std::string& m) { Log(LogLevel::INFO, m); }
  static void Warning(const std::string& m) { Log(LogLevel::WARNING, m); }
  static void Error(const std::string& m) { Log(LogLevel::ERROR, m); }
  static void Critical(const std::string& m) { Log(LogLevel::CRITICAL, m); }
  ~Logger();
};
