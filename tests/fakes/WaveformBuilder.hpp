#pragma once
/** @file  WaveformBuilder.hpp
 *  @brief Synthesises UART line levels and packs them into capture bytes.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "decoder/DecoderConfig.hpp"

namespace uartdec {
  namespace test {

    /**
 * @class LineWaveform
 * @brief Per-sample levels of one line. All builder calls take *logical*
 *        levels (mark = 1); `inverted` flips what ends up on the wire.
 */
    class LineWaveform {
    public:
      explicit LineWaveform(unsigned samplesPerBit, bool inverted = false)
          : spb_(samplesPerBit), inverted_(inverted) {}

      LineWaveform& hold(int level, std::size_t samples) {
        levels_.insert(levels_.end(), samples, (level != 0) != inverted_);
        return *this;
      }

      LineWaveform& idle(std::size_t samples) { return hold(1, samples); }

      LineWaveform& bit(int level) { return hold(level, spb_); }

      LineWaveform& frame(std::uint16_t value, unsigned dataBits,
                          decoder::BitOrder order = decoder::BitOrder::LsbFirst,
                          std::optional<int> parityBit = std::nullopt, int stopBit = 1) {
        bit(0);
        for (unsigned i = 0; i < dataBits; ++i) {
          const unsigned pos = order == decoder::BitOrder::LsbFirst ? i : dataBits - 1 - i;
          bit((value >> pos) & 1U);
        }
        if (parityBit)
          bit(*parityBit);
        return bit(stopBit);
      }

      std::size_t size() const { return levels_.size(); }

      /// Wire level; past the end the line idles.
      bool levelAt(std::size_t i) const { return i < levels_.size() ? levels_[i] : !inverted_; }

    private:
      unsigned spb_;
      bool inverted_;
      std::vector<bool> levels_;
    };

    /// RX on bit 0, TX on bit 1. Shorter lines are padded with idle.
    inline std::vector<std::uint8_t> pack(const LineWaveform* rx, const LineWaveform* tx,
                                          std::size_t tail = 0) {
      const std::size_t n =
          std::max(rx ? rx->size() : std::size_t{ 0 }, tx ? tx->size() : std::size_t{ 0 }) + tail;
      std::vector<std::uint8_t> out(n, 0);
      for (std::size_t i = 0; i < n; ++i) {
        if (rx && rx->levelAt(i))
          out[i] |= 0x01;
        if (tx && tx->levelAt(i))
          out[i] |= 0x02;
      }
      return out;
    }

  } // namespace test
} // namespace uartdec
