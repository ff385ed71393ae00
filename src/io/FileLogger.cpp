/* @file FileLogger.cpp
 * @brief buffered append-only writer behind the async Logger
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <iostream>
#include <utility>

// radflow headers
#include "io/FileLogger.hpp"

using namespace radflow::io;

FileLogger::~FileLogger() { close(); }

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), buffer_(std::move(other.buffer_)) {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    buffer_ = std::move(other.buffer_);
  }
  return *this;
}

bool FileLogger::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "a");
  if (fp_ == nullptr) {
    std::cerr << "Error " << errno << " from fopen(" << path << "): " << strerror(errno) << "\n";
    return false;
  }
  buffer_.reserve(kChunk);
  return true;
}

void FileLogger::write(const std::string& csv) {
  if (fp_ == nullptr)
    return;
  buffer_.insert(buffer_.end(), csv.begin(), csv.end());
  if (buffer_.size() >= kChunk) {
    flush();
  }
}

bool FileLogger::flush() {
  if (fp_ == nullptr)
    return false;

  std::size_t total = 0;
  while (total < buffer_.size()) {
    std::size_t n = std::min(kChunk, buffer_.size() - total);
    std::size_t written = std::fwrite(buffer_.data() + total, 1, n, fp_);
    if (written == 0) {
      std::cerr << "Error " << errno << " from fwrite: " << strerror(errno) << "\n";
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(total));
      return false;
    }
    total += written;
  }
  buffer_.clear();
  return std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (fp_ == nullptr)
    return;
  flush();
  std::fclose(fp_);
  fp_ = nullptr;
}
