/* @file Parity.cpp
 * @brief parity rule used by the GET PARITY BIT state
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <bit>
#include <stdexcept>

// UartDec headers
#include "decoder/Parity.hpp"

namespace uartdec::decoder {

  bool parityOk(Parity mode, int parityBit, std::uint16_t data) {
    // zero/one parity ignore the data entirely
    switch (mode) {
    case Parity::Zero:
      return parityBit == 0;
    case Parity::One:
      return parityBit == 1;
    case Parity::Odd:
    case Parity::Even:
      break;
    case Parity::None:
      throw std::invalid_argument("[Parity] 'none' parity cannot be checked");
    }

    // the parity bit itself counts towards the number of ones
    const int ones = std::popcount(data) + parityBit;
    if (mode == Parity::Odd)
      return (ones % 2) == 1;
    return (ones % 2) == 0;
  }

  int expectedParityBit(Parity mode, std::uint16_t data) {
    const int odd = std::popcount(data) & 1;
    switch (mode) {
    case Parity::Zero:
      return 0;
    case Parity::One:
      return 1;
    case Parity::Odd:
      return odd ^ 1;
    case Parity::Even:
      return odd;
    case Parity::None:
      break;
    }
    throw std::invalid_argument("[Parity] 'none' parity has no expected bit");
  }

} // namespace uartdec::decoder
