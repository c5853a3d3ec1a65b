#pragma once
/** @file  FrameStateMachine.hpp
 *  @brief Per-line UART frame automaton (start, data, parity, stop).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>

#include "decoder/DecoderConfig.hpp"
#include "decoder/LineState.hpp"
#include "io/OutputSink.hpp"

namespace uartdec::decoder {

  /**
 * @class FrameStateMachine
 * @brief Feeds one sample into a line's LineState and emits whatever that
 *        sample completes.
 *
 *  * Holds no per-line data itself: the same instance serves RX and TX,
 *    each call works on the LineState passed in.
 *  * Frame errors (bad start/stop bit) and parity errors are reported to
 *    the sink, never thrown.
 */
  class FrameStateMachine {
  public:
    FrameStateMachine(DecoderConfig config, double bitWidth, io::OutputSink& sink);

    /// Process the sample \p signal (raw line level) taken at \p samplenum.
    void inspect(Line line, LineState& st, bool signal, std::int64_t samplenum);

  private:
    //---state handlers---------------------------------------------------
    void waitForStartBit(LineState& st, std::int64_t samplenum);
    void getStartBit(Line line, LineState& st, int signal, std::int64_t samplenum);
    void getDataBits(Line line, LineState& st, int signal, std::int64_t samplenum);
    void getParityBit(Line line, LineState& st, int signal, std::int64_t samplenum);
    void getStopBits(Line line, LineState& st, int signal, std::int64_t samplenum);

    //---emission helpers-------------------------------------------------
    io::Span bitSpan(std::int64_t samplenum) const;
    io::Span dataSpan(const LineState& st, std::int64_t samplenum) const;
    void putBitPacket(std::int64_t samplenum, io::Packet packet);
    void putBitAnnotation(std::int64_t samplenum, io::Annotation annotation);

    DecoderConfig config_;
    double bitWidth_;
    io::OutputSink& sink_;
  };

} // namespace uartdec::decoder
