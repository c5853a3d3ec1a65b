/* @file DumpWriter.cpp
 * @brief buffered fwrite of binary dump rows
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// UartDec headers
#include "io/DumpWriter.hpp"

using namespace uartdec::io;

DumpWriter::~DumpWriter() {
  if (!close())
    std::cerr << "Error: dump file lost buffered bytes on close\n";
}

DumpWriter::DumpWriter(DumpWriter&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), buffer_(std::move(other.buffer_)),
      written_(std::exchange(other.written_, 0)) {}

DumpWriter& DumpWriter::operator=(DumpWriter&& other) noexcept {
  if (this != &other) {
    if (!close())
      std::cerr << "Error: dump file lost buffered bytes on close\n";
    fp_ = std::exchange(other.fp_, nullptr);
    buffer_ = std::move(other.buffer_);
    written_ = std::exchange(other.written_, 0);
  }
  return *this;
}

bool DumpWriter::open(const std::string& path) {
  if (!close())
    return false;

  fp_ = std::fopen(path.c_str(), "wb");
  if (fp_ == nullptr) {
    std::cerr << "Error " << errno << " from fopen: " << strerror(errno) << "\n";
    return false;
  }
  buffer_.clear();
  buffer_.reserve(kChunkSize);
  written_ = 0;
  return true;
}

bool DumpWriter::write(const std::vector<std::uint8_t>& bytes) {
  if (fp_ == nullptr)
    return false;

  buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
  written_ += bytes.size();
  if (buffer_.size() >= kChunkSize)
    return flush();
  return true;
}

bool DumpWriter::flush() {
  if (fp_ == nullptr)
    return false;

  if (!buffer_.empty()) {
    const std::size_t n = std::fwrite(buffer_.data(), 1, buffer_.size(), fp_);
    if (n != buffer_.size()) {
      std::cerr << "Error " << errno << " from fwrite: " << strerror(errno) << "\n";
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(n));
      return false;
    }
    buffer_.clear();
  }
  return std::fflush(fp_) == 0;
}

bool DumpWriter::close() {
  if (fp_ == nullptr)
    return true;

  const bool flushed = flush();
  const bool closed = std::fclose(fp_) == 0;
  fp_ = nullptr;
  buffer_.clear();
  return flushed && closed;
}
