#pragma once
/** @file  Line.hpp
 *  @brief Identifiers for the two half-duplex UART lines.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <cstddef>
#include <cstdint>

namespace uartdec {
  namespace decoder {

    /// RX/TX line id. The numeric value is the `rxtx` field of every packet.
    enum class Line : std::uint8_t { RX, TX, Count };
    static_assert(static_cast<std::uint8_t>(Line::Count) == 2,
                  "Line count changed please update code that depends on it");

    inline constexpr std::size_t kLineCount = static_cast<std::size_t>(Line::Count);
    inline constexpr std::array<Line, kLineCount> kLines{ { Line::RX, Line::TX } };

    inline constexpr std::size_t index(Line l) { return static_cast<std::size_t>(l); }

    inline const char* toString(Line l) {
      switch (l) {
      case Line::RX:
        return "RX";
      case Line::TX:
        return "TX";
      default:
        return "Unknown";
      }
    }

  } // namespace decoder
} // namespace uartdec
