#pragma once
/** @file  LineState.hpp
 *  @brief Per-line frame automaton state.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <vector>

// UartDec headers
#include "io/OutputSink.hpp"

namespace uartdec::decoder {

  /// Frame automaton states, cyclic: one pass per frame.
  enum class FrameState : std::uint8_t {
    WaitForStartBit,
    GetStartBit,
    GetDataBits,
    GetParityBit,
    GetStopBits,
  };

  inline const char* toString(FrameState s) {
    switch (s) {
    case FrameState::WaitForStartBit:
      return "WAIT FOR START BIT";
    case FrameState::GetStartBit:
      return "GET START BIT";
    case FrameState::GetDataBits:
      return "GET DATA BITS";
    case FrameState::GetParityBit:
      return "GET PARITY BIT";
    case FrameState::GetStopBits:
      return "GET STOP BITS";
    default:
      return "Unknown";
    }
  }

  /**
 * @struct LineState
 * @brief Everything the automaton remembers about one line.
 *
 *  * Only the FrameStateMachine writes it, and only for its own line.
 *  * Bit values are -1 until first observed.
 */
  struct LineState {
    FrameState state{ FrameState::WaitForStartBit };
    std::int64_t frameStartSample{ -1 };      ///< sample of the start-bit edge
    std::optional<std::int64_t> startSample{}; ///< sample point of the first data bit
    unsigned curDataBit{ 0 };                 ///< 0..dataBits
    std::uint16_t dataValue{ 0 };
    std::vector<io::DataBit> dataBitLog{};     ///< bits of the byte in progress
    int startBit{ -1 };
    int parityBit{ -1 };
    int stopBit{ -1 };
  };

} // namespace uartdec::decoder
