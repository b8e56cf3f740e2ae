#include "telemetry/structured_logger.hpp"
#include <chrono>
#include <stdexcept>

StructuredLogger& StructuredLogger::Instance() {
  static StructuredLogger inst;
  return inst;
}

StructuredLogger::StructuredLogger() {}
StructuredLogger::~StructuredLogger() { Shutdown(); }

void StructuredLogger::Initialize(const std::string& file_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) return;
  out_.open(file_path, std::ios::app | std::ios::out);
  if (!out_.is_open()) throw std::runtime_error("cannot open audit log: " + file_path);
  running_ = true;
  worker_ = std::thread(&StructuredLogger::Worker, this);
}

bool StructuredLogger::IsRunning() {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

void StructuredLogger::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
  if (out_.is_open()) out_.close();
}

void StructuredLogger::LogJsonLine(const std::string& json_line) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;
    queue_.push(json_line);
  }
  cv_.notify_one();
}

void StructuredLogger::LogEvent(const std::string& event, const nlohmann::json& fields) {
  auto secs = std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
  nlohmann::json line{{"ts", secs}, {"event", event}};
  if (fields.is_object()) {
    for (auto it = fields.begin(); it != fields.end(); ++it) line[it.key()] = it.value();
  }
  LogJsonLine(line.dump());
}

void StructuredLogger::Worker() {
  std::string batch;
  batch.reserve(8192);
  while (true) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, std::chrono::milliseconds(80), [&]{ return !queue_.empty() || !running_; });
    if (!running_ && queue_.empty()) break;
    while (!queue_.empty()) {
      batch.append(queue_.front());
      batch.push_back('\n');
      queue_.pop();
      if (batch.size() > 4096) break;
    }
    lock.unlock();
    if (!batch.empty()) {
      out_ << batch;
      out_.flush();
      batch.clear();
    }
  }
}
