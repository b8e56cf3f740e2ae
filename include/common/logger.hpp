#pragma once
#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <chrono>
#include <queue>
#include <thread>
#include <condition_variable>

enum class LogLevel { DEBUG, INFO, WARNING, ERROR, CRITICAL };

// Case-insensitive; accepts WARN for WARNING. Throws std::invalid_argument otherwise.
LogLevel ParseLogLevel(const std::string& name);

struct LogEntry {
  std::chrono::system_clock::time_point timestamp;
  LogLevel level;
  std::string message;
  std::string file;
  int line;
};

struct LoggerOptions {
  std::string path = "refrate.log";
  LogLevel min_level = LogLevel::INFO;
  bool mirror_to_stderr = false;
};

// Asynchronous file logger. Every call is a no-op until Initialize.
class Logger {
  static std::unique_ptr<Logger> instance_;
  static std::mutex instance_mutex_;
  std::ofstream log_file_;
  std::mutex log_mutex_;
  std::queue<LogEntry> log_queue_;
  std::thread worker_thread_;
  std::condition_variable cv_;
  bool running_ = false;
  LoggerOptions options_;
  Logger() = default;
  void WorkerFunction();
  void WriteLogEntry(const LogEntry&);
  static std::string FormatLogEntry(const LogEntry&);
  static const char* LevelToString(LogLevel);
public:
  static void Initialize(const LoggerOptions& options);
  static void Initialize(const std::string& path, LogLevel min_level = LogLevel::INFO);
  static bool IsInitialized();
  static void Shutdown();
  static void Log(LogLevel level, const std::string& message, const std::string& file, int line);
  static void Debug(const std::string& m, const std::string& f = "", int l = 0);
  static void Info(const std::string& m, const std::string& f = "", int l = 0);
  static void Warning(const std::string& m, const std::string& f = "", int l = 0);
  static void Error(const std::string& m, const std::string& f = "", int l = 0);
  static void Critical(const std::string& m, const std::string& f = "", int l = 0);
  ~Logger();
};

