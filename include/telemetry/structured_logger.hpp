#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <mutex>
#include <condition_variable>
#include <fstream>
#include <thread>
#include <queue>

// Batched JSON-lines audit writer. Lines are dropped until Initialize.
class StructuredLogger {
public:
  static StructuredLogger& Instance();
  // Opens (appends to) file_path; throws std::runtime_error if it cannot be opened.
  void Initialize(const std::string& file_path);
  // Enqueue a pre-built JSON line (one object, no trailing newline needed)
  void LogJsonLine(const std::string& json_line);
  // {"ts": <unix seconds>, "event": event, ...fields}
  void LogEvent(const std::string& event, const nlohmann::json& fields);
  bool IsRunning();
  // Flushes queued lines and stops the worker
  void Shutdown();
private:
  StructuredLogger();
  ~StructuredLogger();
  void Worker();
  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<std::string> queue_;
  std::thread worker_;
  std::ofstream out_;
  bool running_ = false;
};
