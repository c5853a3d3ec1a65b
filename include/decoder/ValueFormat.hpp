#pragma once
/** @file  ValueFormat.hpp
 *  @brief Text and binary renderings of a decoded data value.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <string>
#include <vector>

#include "decoder/DecoderConfig.hpp"

namespace uartdec::decoder {

  /**
 * @brief Display text for \p v as shown in the data annotation.
 *
 *  * `Ascii`: printable 32..126 as the character, otherwise `[XX]`
 *    (`[XXX]` for 9-bit frames).
 *  * `Dec`: plain decimal.
 *  * `Hex`/`Oct`/`Bin`: zero-padded to the digits needed for \p dataBits.
 */
  std::string formatValue(DisplayFormat format, unsigned dataBits, std::uint16_t v);

  /// \p v as \p width big-endian bytes (binary dump payload).
  std::vector<std::uint8_t> toBigEndian(std::uint16_t v, unsigned width);

} // namespace uartdec::decoder
