#pragma once
#include <string>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <queue>
#include <nlohmann/json.hpp>

// Append-only JSONL event stream, written by a background thread.
class StructuredLogger {
public:
  static StructuredLogger& Instance();
  // Opens (appends to) file_path and starts the writer. No-op while running.
  void Initialize(const std::string& file_path);
  // Enqueue a pre-built JSON line (one object, no trailing newline needed)
  void LogJsonLine(const std::string& json_line);
  // Adds "ts" (unix ms) and "event" to `fields` and enqueues it. Never throws
  // on invalid UTF-8 in `fields`.
  void LogEvent(const std::string& event, nlohmann::json fields);
  // Drains the queue and stops the writer.
  void Shutdown();
private:
  StructuredLogger();
  ~StructuredLogger();
  void Worker();
  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<std::string> queue_;
  std::thread worker_;
  bool running_ = false;
  std::string file_path_;
};
