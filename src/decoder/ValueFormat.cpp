/* @file ValueFormat.cpp
 * @brief display formatting of data values (ascii/dec/hex/oct/bin) + dump bytes
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <bit>
#include <cstdio>

// UartDec headers
#include "decoder/ValueFormat.hpp"

namespace uartdec::decoder {

  namespace {

    std::string printfPadded(const char* fmt, int digits, unsigned v) {
      char buf[32];
      const int n = std::snprintf(buf, sizeof(buf), fmt, digits, v);
      return std::string(buf, n > 0 ? static_cast<std::size_t>(n) : 0U);
    }

    int digitsFor(unsigned dataBits, unsigned bitsPerDigit) {
      return static_cast<int>((dataBits + bitsPerDigit - 1) / bitsPerDigit);
    }

  } // namespace

  std::string formatValue(DisplayFormat format, unsigned dataBits, std::uint16_t v) {
    switch (format) {
    case DisplayFormat::Ascii:
      if (v >= 32 && v <= 126)
        return std::string(1, static_cast<char>(v));
      return "[" + printfPadded("%0*X", dataBits <= 8 ? 2 : 3, v) + "]";

    case DisplayFormat::Dec:
      return std::to_string(v);

    case DisplayFormat::Hex:
      return printfPadded("%0*X", digitsFor(dataBits, 4), v);

    case DisplayFormat::Oct:
      return printfPadded("%0*o", digitsFor(dataBits, 3), v);

    case DisplayFormat::Bin: {
      // no printf conversion for binary
      std::string out;
      const unsigned width = std::max<unsigned>(dataBits, std::bit_width(v));
      out.reserve(width);
      for (unsigned i = width; i-- > 0;)
        out.push_back(((v >> i) & 1U) ? '1' : '0');
      return out;
    }
    }
    return std::to_string(v);
  }

  std::vector<std::uint8_t> toBigEndian(std::uint16_t v, unsigned width) {
    std::vector<std::uint8_t> bytes(width, 0);
    unsigned value = v;
    for (unsigned i = width; i-- > 0;) {
      bytes[i] = static_cast<std::uint8_t>(value & 0xFFU);
      value >>= 8;
    }
    return bytes;
  }

} // namespace uartdec::decoder
