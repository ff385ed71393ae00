#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace radflow {
  namespace io {
    class FileLogger;
  } // namespace io

  namespace core {

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    enum class LogLevel { Trace, Info, Warn, Error };

    const char* toString(LogLevel level);

    struct LogEvent {
      std::chrono::system_clock::time_point when{ std::chrono::system_clock::now() };
      LogLevel level{ LogLevel::Info };
      std::string component;
      std::string message;
    };

    /// Formats one event as `timestamp,level,component,"message"\n`.
    std::string formatCsv(const LogEvent& event);

    /**
 * @class Logger
 * @brief Non-blocking event sink shared by every subsystem.
 *
 *  * `log()` pushes into a bounded ring; the worker drains it to the CSV file.
 *  * Before `startNewRun()` (or after `finishRun()`) events go straight to
 *    std::clog when echo is on and are dropped otherwise.
 */
    class Logger {

    public:
      explicit Logger(std::size_t capacity = 4096);
      ~Logger();

      // --- public API ---
      void startNewRun(const std::string& path); ///< open file + launch worker thread
      void log(const LogEvent& event);           ///< enqueue event (non-blocking)
      void finishRun();                          ///< flush + join worker thread

      void trace(std::string_view component, std::string message);
      void info(std::string_view component, std::string message);
      void warn(std::string_view component, std::string message);
      void error(std::string_view component, std::string message);

      void setEcho(bool echo) { echo_ = echo; }
      void setMinLevel(LogLevel level) { minLevel_ = level; }

      std::uint64_t dropped() const;

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void drain();
      void write(const LogEvent& event);

      std::unique_ptr<io::FileLogger> file_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::mutex wakeMtx_;
      std::condition_variable wake_;
      std::atomic<bool> running_{ false };
      std::atomic<bool> echo_{ false };
      std::atomic<LogLevel> minLevel_{ LogLevel::Trace };
    };

  } // namespace core
} // namespace radflow
