#pragma once
/** @file  UartDecoder.hpp
 *  @brief Two-line UART decode loop driving predictor + frame automaton.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

// UartDec headers
#include "core/ErrorMonitor.hpp" // fatal startup errors are escalated through the monitor
#include "decoder/DecoderConfig.hpp"
#include "decoder/LineState.hpp"
#include "io/OutputSink.hpp"
#include "io/SampleSource.hpp"

namespace uartdec {
  namespace decoder {

    /// Thrown by decode() when the sample rate was never announced.
    class SamplerateError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /// Thrown by decode() when the source carries neither RX nor TX.
    class ChannelError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /**
 * @class UartDecoder
 * @brief Owns the two LineState records and runs the wait/dispatch loop.
 *
 *  * Single-threaded: the only blocking point is SampleSource::wait().
 *  * Configuration is fixed at construction; `reset()` only clears line
 *    state and the sample rate.
 */
    class UartDecoder {
    public:
      UartDecoder(DecoderConfig config, io::OutputSink& sink,
                  std::shared_ptr<core::ErrorMonitor> errorMonitor);
      ~UartDecoder() = default;

      //---public API-------------------------------------------------------
      void reset(); ///< both lines back to WAIT FOR START BIT, sample rate forgotten

      /// "samplerate known" notification; derives the bit width.
      void setSamplerate(std::uint64_t samplerate);

      /// Runs until \p source reports the end of the session.
      /// Throws SamplerateError / ChannelError before touching the source.
      void decode(io::SampleSource& source);

      std::optional<double> bitWidth() const { return bitWidth_; }
      const LineState& lineState(Line line) const { return lines_[index(line)]; }
      const DecoderConfig& config() const { return config_; }

      //---non-copyable-----------------------------------------------------
      UartDecoder(const UartDecoder&) = delete;
      UartDecoder& operator=(const UartDecoder&) = delete;

    private:
      template <typename Error> [[noreturn]] void fail(const std::string& message);

      const DecoderConfig config_;
      io::OutputSink& sink_;
      std::shared_ptr<core::ErrorMonitor> errorMonitor_;
      std::optional<std::uint64_t> samplerate_{};
      std::optional<double> bitWidth_{}; ///< samples per bit
      std::array<LineState, kLineCount> lines_{};
    };

  } // namespace decoder
} // namespace uartdec
