/* @file TimingPredictor.cpp
 * @brief sample-point prediction for the per-line frame automaton
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

// UartDec headers
#include "decoder/TimingPredictor.hpp"

using namespace uartdec::decoder;

TimingPredictor::TimingPredictor(DecoderConfig config, double bitWidth)
    : config_(std::move(config)), bitWidth_(bitWidth) {
  if (!(bitWidth_ > 0.0))
    throw std::invalid_argument("[TimingPredictor] bit width must be positive");
}

unsigned TimingPredictor::bitNumber(const LineState& st) const {
  switch (st.state) {
  case FrameState::GetStartBit:
    return 0;
  case FrameState::GetDataBits:
    return 1 + st.curDataBit;
  case FrameState::GetParityBit:
    return 1 + config_.dataBits;
  case FrameState::GetStopBits:
    return 1 + config_.dataBits + (config_.parity == Parity::None ? 0 : 1);
  case FrameState::WaitForStartBit:
    break;
  }
  throw std::logic_error("[TimingPredictor] idle line has no pending bit slot");
}

double TimingPredictor::samplePoint(const LineState& st, unsigned bitnum) const {
  // samples inside a bit are 0..bitWidth-1, their middle is (bitWidth-1)/2
  return static_cast<double>(st.frameStartSample) + (bitWidth_ - 1.0) / 2.0 +
         static_cast<double>(bitnum) * bitWidth_;
}

uartdec::io::WaitSpec TimingPredictor::waitCondition(Line line, const LineState& st,
                                                     std::int64_t now) const {
  if (st.state == FrameState::WaitForStartBit)
    return { line, config_.inverted(line) ? io::Edge::Rising : io::Edge::Falling };

  const auto want = static_cast<std::int64_t>(std::ceil(samplePoint(st, bitNumber(st))));
  // only reachable with bitWidth < 1: sample right away rather than go back
  return { line, io::Skip{ std::max<std::int64_t>(want - now, 0) } };
}
