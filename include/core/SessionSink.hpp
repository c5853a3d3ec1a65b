#pragma once
/** @file  SessionSink.hpp
 *  @brief OutputSink that fans decoder output out to console, CSV log and dump files.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <array>
#include <cstddef>
#include <ostream>

#include "io/OutputSink.hpp"

namespace uartdec {
  namespace io {
    class DumpWriter;
  } // namespace io

  namespace core {

    class Logger;

    /**
 * @class SessionSink
 * @brief Non-owning fan-out; every target is optional (nullptr = disabled).
 *
 *  * annotations → one text line per annotation on \p annotations
 *  * packets     → one CSV row per packet through \p packetLog
 *  * binary rows → the DumpWriter of the matching row
 */
    class SessionSink : public io::OutputSink {
    public:
      using Dumps = std::array<io::DumpWriter*, static_cast<std::size_t>(io::BinaryRow::Count)>;

      SessionSink(std::ostream* annotations, Logger* packetLog, Dumps dumps);

      void putPacket(const io::Span& span, const io::Packet& packet) override;
      void putAnnotation(const io::Span& span, const io::Annotation& annotation) override;
      void putBinary(const io::Span& span, const io::BinaryChunk& chunk) override;

    private:
      std::ostream* annotations_;
      Logger* packetLog_;
      Dumps dumps_;
    };

  } // namespace core
} // namespace uartdec
