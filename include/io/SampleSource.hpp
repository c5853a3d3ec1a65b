#pragma once
/** @file  SampleSource.hpp
 *  @brief Abstract logic-sample provider with a combined "wait for any" call.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <bitset>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

// UartDec headers
#include "decoder/Line.hpp"

namespace uartdec {
  namespace io {

    enum class Edge { Rising, Falling };

    /// Satisfied `samples` samples after the current one (0 = now).
    struct Skip {
      std::int64_t samples{ 0 };
    };

    /// One wait condition. Edges refer to `line`; skips ignore it.
    struct WaitSpec {
      decoder::Line line{ decoder::Line::RX };
      std::variant<Edge, Skip> condition{ Edge::Falling };
    };

    struct WaitResult {
      std::int64_t sampleNum{ 0 };                          ///< sample the wait woke at
      std::array<bool, decoder::kLineCount> values{};       ///< both lines at sampleNum
      std::bitset<decoder::kLineCount> matched{};           ///< by condition position
    };

    /**
 * @class SampleSource
 * @brief Owns the absolute sample counter and advances it on `wait()`.
 *
 *  * At most one condition per line, so a result never needs more than
 *    `kLineCount` match flags.
 *  * `wait()` returns std::nullopt once no condition can be met any more
 *    (end of capture or the session was cancelled).
 */
    class SampleSource {
    public:
      virtual ~SampleSource() = default;

      virtual bool hasLine(decoder::Line line) const = 0;
      virtual std::optional<WaitResult> wait(const std::vector<WaitSpec>& conditions) = 0;
      virtual std::int64_t sampleNum() const = 0;
    };

  } // namespace io
} // namespace uartdec
