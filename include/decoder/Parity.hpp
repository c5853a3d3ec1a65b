#pragma once
/** @file  Parity.hpp
 *  @brief Parity-bit validation for odd/even/zero/one parity.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>

#include "decoder/DecoderConfig.hpp"

namespace uartdec::decoder {

  /// True if \p parityBit is correct for \p data under \p mode.
  /// `Parity::None` is not a checkable mode and throws `std::invalid_argument`.
  bool parityOk(Parity mode, int parityBit, std::uint16_t data);

  /// The parity bit a transmitter would have sent for \p data.
  int expectedParityBit(Parity mode, std::uint16_t data);

} // namespace uartdec::decoder
