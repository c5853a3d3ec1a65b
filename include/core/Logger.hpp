#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV packet logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <thread>

namespace uartdec {
  namespace core {

    /// One CSV row: `start,end,line,type,value`.
    struct LogEvent {
      std::int64_t start{ 0 };
      std::int64_t end{ 0 };
      std::string line;
      std::string type;
      std::string value;
    };

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    class Logger {

    public:
      explicit Logger(std::string csvPath, std::size_t capacity = 1024);
      ~Logger(); ///< finishes a run still in progress

      // --- public API ---
      void startNewRun();              ///< open file + launch worker thread
      void log(const LogEvent& event); ///< enqueue event (blocks only when the ring is full)
      void finishRun();                ///< flush + join worker thread

      bool running() const { return running_; }
      const std::string& path() const { return path_; }

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void drain(); ///< worker body

      std::string path_;
      std::size_t capacity_;
      std::ofstream csvFile_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
    };

  } // namespace core
} // namespace uartdec
