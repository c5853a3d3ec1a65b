/* @file Logger.cpp
 * @brief CSV packet log written from a worker thread
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <utility>

// UartDec headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"

using namespace uartdec::core;

namespace {

  // RFC 4180 quoting, only when needed
  std::string csvField(const std::string& s) {
    if (s.find_first_of(",\"\r\n") == std::string::npos)
      return s;
    std::string out = "\"";
    for (char c : s) {
      if (c == '"')
        out += '"';
      out += c;
    }
    out += '"';
    return out;
  }

} // namespace

Logger::Logger(std::string csvPath, std::size_t capacity)
    : path_(std::move(csvPath)), capacity_(capacity) {}

Logger::~Logger() {
  if (!running_)
    return;
  buffer_->close();
  if (worker_.joinable())
    worker_.join();
  running_ = false;
}

void Logger::startNewRun() {
  if (running_)
    throw std::runtime_error("[Logger] run already in progress");

  csvFile_.open(path_, std::ios::out | std::ios::trunc);
  if (!csvFile_)
    throw std::runtime_error("[Logger] cannot open packet log: " + path_);
  csvFile_ << "start,end,line,type,value\n";

  buffer_ = std::make_unique<RingBuffer<LogEvent>>(capacity_);
  running_ = true;
  worker_ = std::thread(&Logger::drain, this);
}

void Logger::log(const LogEvent& event) {
  if (!running_)
    throw std::runtime_error("[Logger] log() outside of a run");
  buffer_->push(event);
}

void Logger::finishRun() {
  if (!running_)
    return;

  buffer_->close();
  if (worker_.joinable())
    worker_.join();
  running_ = false;

  csvFile_.flush();
  const bool ok = static_cast<bool>(csvFile_);
  csvFile_.close();
  if (!ok)
    throw std::runtime_error("[Logger] write to packet log failed: " + path_);
}

void Logger::drain() {
  while (auto ev = buffer_->pop()) {
    csvFile_ << ev->start << ',' << ev->end << ',' << csvField(ev->line) << ','
             << csvField(ev->type) << ',' << csvField(ev->value) << '\n';
  }
}
