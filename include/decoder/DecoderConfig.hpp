#pragma once
/** @file  DecoderConfig.hpp
 *  @brief Immutable option set for one UART decode run.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <cstdint>

// 3rd-party headers
#include <nlohmann/json_fwd.hpp>

// UartDec headers
#include "decoder/Line.hpp"

namespace uartdec::decoder {

  enum class Parity { None, Odd, Even, Zero, One };
  enum class BitOrder { LsbFirst, MsbFirst };
  enum class DisplayFormat { Ascii, Dec, Hex, Oct, Bin };

  const char* toString(Parity p);
  const char* toString(BitOrder o);
  const char* toString(DisplayFormat f);

  /**
 * @struct DecoderConfig
 * @brief Everything the predictor and the state machine need to know about
 *        the frame shape.
 *
 *  * Built once (defaults or `fromJson`), validated, then passed by value to
 *    the decoder. Nothing mutates it after decode start.
 *  * `parityCheck` is carried for completeness; validation runs whenever
 *    `parity != Parity::None`.
 */
  struct DecoderConfig {
    std::uint32_t baudrate{ 115200 };
    unsigned dataBits{ 8 }; ///< 5..9
    Parity parity{ Parity::None };
    bool parityCheck{ true };
    double stopBits{ 1.0 }; ///< 0.5, 1.0, 1.5 or 2.0; only the first is sampled
    BitOrder bitOrder{ BitOrder::LsbFirst };
    DisplayFormat format{ DisplayFormat::Hex };
    std::array<bool, kLineCount> invert{ { false, false } };

    bool inverted(Line l) const { return invert[index(l)]; }

    /// Number of bytes in the big-endian binary dump of one data value.
    unsigned byteWidth() const { return (dataBits + 7) / 8; }

    /// Throws `std::invalid_argument` if any field is outside its value set.
    void validate() const;

    /// Parse the option object (keys as in the decoder's option table).
    /// Missing keys keep their defaults. Throws `std::invalid_argument`.
    static DecoderConfig fromJson(const nlohmann::json& j);
  };

} // namespace uartdec::decoder
