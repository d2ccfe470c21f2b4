/* @file FileLogger.cpp
 * @brief chunked fwrite buffer behind the CSV run log
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "io/FileLogger.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <utility>

using namespace hvload::io;

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
  if (!fp_) {
    std::cerr << "[FileLogger] cannot open " << path << ": " << strerror(errno) << "\n";
    return false;
  }
  buffer_.reserve(kChunk);
  return true;
}

bool FileLogger::write(const std::string& line) {
  if (!fp_)
    return false;
  buffer_.insert(buffer_.end(), line.begin(), line.end());
  if (buffer_.size() >= kChunk)
    return flush();
  return true;
}

bool FileLogger::flush() {
  if (!fp_)
    return false;
  if (!buffer_.empty()) {
    std::size_t n = std::fwrite(buffer_.data(), 1, buffer_.size(), fp_);
    if (n != buffer_.size()) {
      std::cerr << "[FileLogger] short write: " << strerror(errno) << "\n";
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(n));
      return false;
    }
    buffer_.clear();
  }
  return std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (!fp_)
    return;
  if (!flush())
    std::cerr << "[FileLogger] data lost on close\n";
  std::fclose(fp_);
  fp_ = nullptr;
  buffer_.clear();
}
