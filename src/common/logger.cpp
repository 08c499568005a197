#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>

std::unique_ptr<Logger> Logger::instance_;
std::mutex Logger::instance_mutex_;

static std::string NowToString(const std::chrono::system_clock::time_point& tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_buf;
  localtime_r(&t, &tm_buf);
  char buf[64];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
  return std::string(buf);
}

void Logger::Initialize(const std::string& path, LogLevel min_level, bool echo_stderr) {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  if (instance_ && instance_->running_) {
    // min_level_ is guarded by instance_mutex_, echo_stderr_ by log_mutex_
    instance_->min_level_ = min_level;
    std::lock_guard<std::mutex> qlock(instance_->log_mutex_);
    instance_->echo_stderr_ = echo_stderr;
    return;
  }
  instance_.reset(new Logger());
  instance_->min_level_ = min_level;
  instance_->echo_stderr_ = echo_stderr;
  if (!path.empty()) instance_->log_file_.open(path, std::ios::out | std::ios::app);
  instance_->running_ = true;
  instance_->worker_thread_ = std::thread(&Logger::WorkerFunction, instance_.get());
}

void Logger::Shutdown() {
  std::unique_ptr<Logger> inst;
  {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    inst = std::move(instance_);
  }
  if (!inst) return;
  {
    std::lock_guard<std::mutex> lock(inst->log_mutex_);
    inst->running_ = false;
  }
  inst->cv_.notify_all();
  if (inst->worker_thread_.joinable()) inst->worker_thread_.join();
  if (inst->log_file_.is_open()) inst->log_file_.close();
}

bool Logger::IsInitialized() {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  return instance_ != nullptr;
}

Logger::~Logger() {
  {
    std::lock_guard<std::mutex> lock(log_mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (worker_thread_.joinable()) worker_thread_.join();
}

void Logger::WorkerFunction() {
  while (true) {
    std::unique_lock<std::mutex> lock(log_mutex_);
    cv_.wait(lock, [&]{ return !log_queue_.empty() || !running_; });
    if (!running_ && log_queue_.empty()) break;
    auto entry = log_queue_.front();
    log_queue_.pop();
    const bool echo = echo_stderr_;
    lock.unlock();
    WriteLogEntry(entry, echo);
  }
}

std::string Logger::LevelToString(LogLevel l) {
  switch (l) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO: return "INFO";
    case LogLevel::WARNING: return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::CRITICAL: return "CRIT";
  }
  return "UNK";
}

std::optional<LogLevel> Logger::ParseLevel(const std::string& name) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
  if (s == "DEBUG") return LogLevel::DEBUG;
  if (s == "INFO") return LogLevel::INFO;
  if (s == "WARN" || s == "WARNING") return LogLevel::WARNING;
  if (s == "ERROR") return LogLevel::ERROR;
  if (s == "CRIT" || s == "CRITICAL") return LogLevel::CRITICAL;
  return std::nullopt;
}

std::string Logger::FormatLogEntry(const LogEntry& e) {
  std::ostringstream oss;
  oss << NowToString(e.timestamp) << " [" << LevelToString(e.level) << "]";
  if (!e.file.empty()) oss << " " << e.file << ":" << e.line;
  oss << " - " << e.message << '\n';
  return oss.str();
}

void Logger::WriteLogEntry(const LogEntry& e, bool echo_stderr) {
  std::string line = FormatLogEntry(e);
  if (log_file_.is_open()) {
    log_file_ << line;
    log_file_.flush();
  }
  if (echo_stderr && e.level >= LogLevel::WARNING) std::cerr << line;
}

void Logger::Log(LogLevel level, const std::string& message, const std::string& file, int line) {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  if (!instance_) return;
  if (level < instance_->min_level_) return;
  LogEntry e{std::chrono::system_clock::now(), level, message, file, line};
  {
    std::lock_guard<std::mutex> qlock(instance_->log_mutex_);
    instance_->log_queue_.push(e);
  }
  instance_->cv_.notify_one();
}
