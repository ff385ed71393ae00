/* @file Logger.cpp
 * @brief async CSV logger - producers push into a RingBuffer, one worker drains to disk
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

// radflow headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"
#include "io/FileLogger.hpp"

namespace radflow {
  namespace core {

    const char* toString(LogLevel level) {
      switch (level) {
      case LogLevel::Trace:
        return "TRACE";
      case LogLevel::Info:
        return "INFO";
      case LogLevel::Warn:
        return "WARN";
      case LogLevel::Error:
        return "ERROR";
      }
      return "UNKNOWN";
    }

    std::string formatCsv(const LogEvent& event) {
      using namespace std::chrono;
      const auto t = system_clock::to_time_t(event.when);
      const auto ms = duration_cast<milliseconds>(event.when.time_since_epoch()) % 1000;
      std::tm tm{};
      localtime_r(&t, &tm);

      std::ostringstream out;
      out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
          << ms.count() << ',' << toString(event.level) << ',' << event.component << ",\"";
      for (char c : event.message) {
        if (c == '"')
          out << "\"\"";
        else if (c == '\n' || c == '\r')
          out << ' ';
        else
          out << c;
      }
      out << "\"\n";
      return out.str();
    }

    Logger::Logger(std::size_t capacity)
        : file_(std::make_unique<io::FileLogger>()),
          buffer_(std::make_unique<RingBuffer<LogEvent>>(capacity)) {}

    Logger::~Logger() { finishRun(); }

    void Logger::startNewRun(const std::string& path) {
      if (running_)
        return;
      if (!path.empty() && !file_->open(path)) {
        std::cerr << "[Logger] could not open " << path << ", logging to console only\n";
      }
      running_ = true;
      worker_ = std::thread([this] { drain(); });
    }

    void Logger::log(const LogEvent& event) {
      if (event.level < minLevel_.load())
        return;
      if (!running_) {
        if (echo_)
          std::clog << formatCsv(event);
        return;
      }
      buffer_->tryPush(event);
      wake_.notify_one();
    }

    void Logger::finishRun() {
      if (!running_.exchange(false))
        return;
      wake_.notify_one();
      if (worker_.joinable())
        worker_.join();
      // whatever raced in after the worker's last pass
      while (auto ev = buffer_->tryPop())
        write(*ev);
      file_->close();
    }

    void Logger::trace(std::string_view component, std::string message) {
      log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Trace, std::string(component),
                    std::move(message) });
    }

    void Logger::info(std::string_view component, std::string message) {
      log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Info, std::string(component),
                    std::move(message) });
    }

    void Logger::warn(std::string_view component, std::string message) {
      log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Warn, std::string(component),
                    std::move(message) });
    }

    void Logger::error(std::string_view component, std::string message) {
      log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Error, std::string(component),
                    std::move(message) });
    }

    std::uint64_t Logger::dropped() const { return buffer_->dropped(); }

    void Logger::drain() {
      while (true) {
        {
          std::unique_lock<std::mutex> lock(wakeMtx_);
          wake_.wait_for(lock, std::chrono::milliseconds{ 200 },
                         [this] { return !running_ || buffer_->size() > 0; });
        }
        while (auto ev = buffer_->tryPop())
          write(*ev);
        file_->flush();
        if (!running_)
          break;
      }
    }

    void Logger::write(const LogEvent& event) {
      const std::string line = formatCsv(event);
      if (file_->isOpen())
        file_->write(line);
      if (echo_)
        std::clog << line;
    }

  } // namespace core
} // namespace radflow
