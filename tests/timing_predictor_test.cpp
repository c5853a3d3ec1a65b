// UartDec headers
#include "decoder/TimingPredictor.hpp"

// GTest headers
#include <gtest/gtest.h>

// STL headers
#include <stdexcept>
#include <variant>

using namespace uartdec::decoder;
using uartdec::io::Edge;
using uartdec::io::Skip;

namespace {

  LineState inState(FrameState s, std::int64_t frameStart, unsigned curDataBit = 0) {
    LineState st;
    st.state = s;
    st.frameStartSample = frameStart;
    st.curDataBit = curDataBit;
    return st;
  }

  std::int64_t skipOf(const uartdec::io::WaitSpec& spec) {
    return std::get<Skip>(spec.condition).samples;
  }

} // namespace

TEST(timing_predictor, idle_line_waits_for_falling_edge) {
  DecoderConfig cfg;
  TimingPredictor p(cfg, 10.0);

  const auto spec = p.waitCondition(Line::TX, LineState{}, 0);
  EXPECT_EQ(spec.line, Line::TX);
  ASSERT_TRUE(std::holds_alternative<Edge>(spec.condition));
  EXPECT_EQ(std::get<Edge>(spec.condition), Edge::Falling);
}

TEST(timing_predictor, inverted_idle_line_waits_for_rising_edge) {
  DecoderConfig cfg;
  cfg.invert[index(Line::RX)] = true;
  TimingPredictor p(cfg, 10.0);

  EXPECT_EQ(std::get<Edge>(p.waitCondition(Line::RX, LineState{}, 0).condition), Edge::Rising);
  EXPECT_EQ(std::get<Edge>(p.waitCondition(Line::TX, LineState{}, 0).condition), Edge::Falling);
}

TEST(timing_predictor, bit_numbers_follow_the_frame_layout) {
  DecoderConfig cfg;
  cfg.dataBits = 7;
  TimingPredictor none(cfg, 10.0);
  EXPECT_EQ(none.bitNumber(inState(FrameState::GetStartBit, 0)), 0U);
  EXPECT_EQ(none.bitNumber(inState(FrameState::GetDataBits, 0, 0)), 1U);
  EXPECT_EQ(none.bitNumber(inState(FrameState::GetDataBits, 0, 6)), 7U);
  EXPECT_EQ(none.bitNumber(inState(FrameState::GetStopBits, 0)), 8U);

  cfg.parity = Parity::Odd;
  TimingPredictor odd(cfg, 10.0);
  EXPECT_EQ(odd.bitNumber(inState(FrameState::GetParityBit, 0)), 8U);
  EXPECT_EQ(odd.bitNumber(inState(FrameState::GetStopBits, 0)), 9U);

  EXPECT_THROW(odd.bitNumber(LineState{}), std::logic_error);
}

TEST(timing_predictor, skips_to_the_rounded_up_bit_centre) {
  DecoderConfig cfg;
  TimingPredictor p(cfg, 10.0);

  // frame starts at 20: start bit centre 24.5 -> 25, first data bit 35
  const auto start = inState(FrameState::GetStartBit, 20);
  EXPECT_DOUBLE_EQ(p.samplePoint(start, 0), 24.5);
  EXPECT_EQ(skipOf(p.waitCondition(Line::RX, start, 20)), 5);

  const auto data0 = inState(FrameState::GetDataBits, 20, 0);
  EXPECT_EQ(skipOf(p.waitCondition(Line::RX, data0, 25)), 10);

  // stop bit of 8N1 is slot 9: 20 + 4.5 + 90 -> 115
  const auto stop = inState(FrameState::GetStopBits, 20);
  EXPECT_EQ(skipOf(p.waitCondition(Line::RX, stop, 105)), 10);
}

TEST(timing_predictor, fractional_bit_width_never_samples_early) {
  DecoderConfig cfg;
  cfg.baudrate = 115200;
  // 1 MHz / 115200 baud
  const double bw = 1000000.0 / 115200.0;
  TimingPredictor p(cfg, bw);

  for (unsigned k = 0; k < 8; ++k) {
    const auto st = inState(FrameState::GetDataBits, 100, k);
    const double exact = p.samplePoint(st, 1 + k);
    const auto want = 100 + skipOf(p.waitCondition(Line::RX, st, 100));
    EXPECT_GE(static_cast<double>(want), exact);
    EXPECT_LT(static_cast<double>(want), exact + 1.0);
  }
}

TEST(timing_predictor, past_sample_points_clamp_to_zero_skip) {
  DecoderConfig cfg;
  TimingPredictor p(cfg, 0.5);

  const auto start = inState(FrameState::GetStartBit, 10);
  // centre is 9.75 -> 10, but the source is already at 12
  EXPECT_EQ(skipOf(p.waitCondition(Line::RX, start, 12)), 0);
}

TEST(timing_predictor, rejects_non_positive_bit_width) {
  EXPECT_THROW(TimingPredictor(DecoderConfig{}, 0.0), std::invalid_argument);
}
