#pragma once
/** @file  TimingPredictor.hpp
 *  @brief Computes where the next bit of a line has to be sampled.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>

#include "decoder/DecoderConfig.hpp"
#include "decoder/LineState.hpp"
#include "io/SampleSource.hpp"

namespace uartdec::decoder {

  /**
 * @class TimingPredictor
 * @brief Turns a line's automaton state into the wait condition for the
 *        next sample of interest.
 *
 *  * Idle lines wait for the start edge (falling, rising when inverted).
 *  * Everything else skips to the rounded-up centre of the pending bit slot,
 *    so the sample point never lands before the true bit centre.
 */
  class TimingPredictor {
  public:
    /// @param bitWidth  samples per bit; only known once the sample rate is.
    TimingPredictor(DecoderConfig config, double bitWidth);

    /// Bit slot the line is waiting for: 0 = start, 1..n = data, then
    /// parity (if any), then the first stop bit. Not defined for idle lines.
    unsigned bitNumber(const LineState& st) const;

    /// Fractional absolute sample at the centre of slot \p bitnum.
    double samplePoint(const LineState& st, unsigned bitnum) const;

    /// Condition to hand to SampleSource::wait() for \p line.
    io::WaitSpec waitCondition(Line line, const LineState& st, std::int64_t now) const;

    double bitWidth() const { return bitWidth_; }

  private:
    DecoderConfig config_;
    double bitWidth_;
  };

} // namespace uartdec::decoder
