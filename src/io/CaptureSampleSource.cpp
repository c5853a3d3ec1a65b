/* @file CaptureSampleSource.cpp
 * @brief packed logic capture + combined edge/skip wait
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cerrno>
#include <cstring> // for strerror
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <utility>

// UartDec headers
#include "io/CaptureSampleSource.hpp"

using namespace uartdec::io;
using uartdec::decoder::index;
using uartdec::decoder::kLineCount;
using uartdec::decoder::kLines;
using uartdec::decoder::Line;

namespace {

  std::optional<unsigned> checkedBit(std::optional<unsigned> bit) {
    if (bit && *bit > 7)
      throw std::invalid_argument("[CaptureSampleSource] channel bit index must be 0..7");
    return bit;
  }

} // namespace

CaptureSampleSource::CaptureSampleSource(std::optional<unsigned> rxBit,
                                         std::optional<unsigned> txBit)
    : bits_{ { checkedBit(rxBit), checkedBit(txBit) } } {}

CaptureSampleSource::CaptureSampleSource(std::vector<std::uint8_t> samples,
                                         std::optional<unsigned> rxBit,
                                         std::optional<unsigned> txBit)
    : samples_(std::move(samples)), bits_{ { checkedBit(rxBit), checkedBit(txBit) } } {}

bool CaptureSampleSource::open(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "Error " << errno << " from open: " << strerror(errno) << "\n";
    return false;
  }

  std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(in)),
                                 std::istreambuf_iterator<char>());
  if (in.bad()) {
    std::cerr << "Error " << errno << " from read: " << strerror(errno) << "\n";
    return false;
  }

  samples_ = std::move(data);
  cur_ = 0;
  return true;
}

bool CaptureSampleSource::hasLine(Line line) const { return bits_[index(line)].has_value(); }

// -------------------------------------------------------------------
// CaptureSampleSource::wait
// Advances to the earliest sample satisfying any condition and flags
// every condition satisfied there. std::nullopt once past the end.
// -------------------------------------------------------------------
std::optional<WaitResult> CaptureSampleSource::wait(const std::vector<WaitSpec>& conditions) {
  if (conditions.empty() || conditions.size() > kLineCount)
    throw std::invalid_argument("[CaptureSampleSource] expected 1..2 wait conditions");

  const auto end = static_cast<std::int64_t>(samples_.size());
  std::int64_t best = end; // exclusive bound while searching

  // skips are O(1), resolve them first so edge scans stop early
  for (const auto& c : conditions) {
    if (const auto* skip = std::get_if<Skip>(&c.condition)) {
      if (skip->samples < 0)
        throw std::invalid_argument("[CaptureSampleSource] negative skip");
      best = std::min(best, cur_ + skip->samples);
    } else if (!hasLine(c.line)) {
      throw std::invalid_argument(std::string("[CaptureSampleSource] edge wait on absent line ") +
                                  decoder::toString(c.line));
    }
  }

  for (const auto& c : conditions) {
    const auto* edge = std::get_if<Edge>(&c.condition);
    if (edge == nullptr)
      continue;
    for (std::int64_t i = cur_ + 1; i < best; ++i) {
      if (isEdge(c.line, i, *edge)) {
        best = i;
        break;
      }
    }
  }

  if (best >= end) {
    cur_ = end;
    return std::nullopt;
  }

  const std::int64_t from = cur_;
  cur_ = best;
  WaitResult result;
  result.sampleNum = cur_;
  for (auto line : kLines)
    result.values[index(line)] = hasLine(line) && level(line, cur_);
  for (std::size_t k = 0; k < conditions.size(); ++k)
    result.matched.set(k, satisfied(conditions[k], from, cur_));
  return result;
}

bool CaptureSampleSource::level(Line line, std::int64_t i) const {
  return ((samples_[static_cast<std::size_t>(i)] >> *bits_[index(line)]) & 0x1U) != 0;
}

bool CaptureSampleSource::isEdge(Line line, std::int64_t i, Edge edge) const {
  if (i <= 0)
    return false;
  const bool prev = level(line, i - 1);
  const bool now = level(line, i);
  return edge == Edge::Rising ? (!prev && now) : (prev && !now);
}

bool CaptureSampleSource::satisfied(const WaitSpec& spec, std::int64_t from,
                                    std::int64_t i) const {
  if (const auto* edge = std::get_if<Edge>(&spec.condition))
    return i > from && isEdge(spec.line, i, *edge);
  return from + std::get<Skip>(spec.condition).samples == i;
}
