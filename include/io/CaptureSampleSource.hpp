#pragma once
/** @file  CaptureSampleSource.hpp
 *  @brief Replays a packed logic capture through the SampleSource interface.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "io/SampleSource.hpp"

namespace uartdec {
  namespace io {

    /**
 * @class CaptureSampleSource
 * @brief In-memory capture: one byte per sample, one bit per logic channel.
 *
 *  * RX and TX are mapped to bit indices (0..7); an unmapped line is absent.
 *  * `wait()` walks forward from the current sample; edges are only
 *    searched strictly after it, a zero skip matches it.
 *  * *Non-copyable*, but move-constructible.
 */
    class CaptureSampleSource : public SampleSource {

    public:
      //---ctr / dtr--------------------------------------------
      CaptureSampleSource(std::optional<unsigned> rxBit, std::optional<unsigned> txBit);
      CaptureSampleSource(std::vector<std::uint8_t> samples, std::optional<unsigned> rxBit,
                          std::optional<unsigned> txBit);
      ~CaptureSampleSource() override = default;

      //---public API-------------------------------------------
      bool open(const std::string& path); ///< load a raw capture file, false on I/O error
      std::size_t size() const { return samples_.size(); }

      bool hasLine(decoder::Line line) const override;
      std::optional<WaitResult> wait(const std::vector<WaitSpec>& conditions) override;
      std::int64_t sampleNum() const override { return cur_; }

      //---non-copyable-----------------------------------------
      CaptureSampleSource(const CaptureSampleSource&) = delete;
      CaptureSampleSource& operator=(const CaptureSampleSource&) = delete;

      //---mv and mv assign-------------------------------------
      CaptureSampleSource(CaptureSampleSource&&) = default;
      CaptureSampleSource& operator=(CaptureSampleSource&&) = default;

    private:
      bool level(decoder::Line line, std::int64_t i) const;
      bool isEdge(decoder::Line line, std::int64_t i, Edge edge) const;
      bool satisfied(const WaitSpec& spec, std::int64_t from, std::int64_t i) const;

      std::vector<std::uint8_t> samples_{};
      std::array<std::optional<unsigned>, decoder::kLineCount> bits_{};
      std::int64_t cur_{ 0 }; ///< absolute sample number
    };

  } // namespace io
} // namespace uartdec
