#pragma once
/** @file  OutputSink.hpp
 *  @brief Consumer interface for decoded packets, annotations and binary dumps.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <string>
#include <vector>

// UartDec headers
#include "decoder/Line.hpp"

namespace uartdec {
  namespace io {

    /// Sample span [start, end) every output item is stamped with.
    struct Span {
      std::int64_t start{ 0 };
      std::int64_t end{ 0 };

      bool operator==(const Span&) const = default;
    };

    /// One data bit with the samples it covers.
    struct DataBit {
      int value{ 0 };
      std::int64_t start{ 0 };
      std::int64_t end{ 0 };

      bool operator==(const DataBit&) const = default;
    };

    enum class PacketType {
      StartBit,
      Data,
      ParityBit,
      StopBit,
      InvalidStartBit,
      InvalidStopBit,
      ParityError,
    };

    inline const char* toString(PacketType t) {
      switch (t) {
      case PacketType::StartBit:
        return "STARTBIT";
      case PacketType::Data:
        return "DATA";
      case PacketType::ParityBit:
        return "PARITYBIT";
      case PacketType::StopBit:
        return "STOPBIT";
      case PacketType::InvalidStartBit:
        return "INVALID STARTBIT";
      case PacketType::InvalidStopBit:
        return "INVALID STOPBIT";
      case PacketType::ParityError:
        return "PARITY ERROR";
      default:
        return "Unknown";
      }
    }

    /**
 * @struct Packet
 * @brief Structured decoder output. Which payload fields are meaningful
 *        depends on `type`.
 *
 *  * bit packets (start/parity/stop and their invalid variants): `bit`
 *  * `Data`: `data` + `bits`
 *  * `ParityError`: `expectedParity` + `bit` (actual)
 */
    struct Packet {
      PacketType type{ PacketType::StartBit };
      decoder::Line line{ decoder::Line::RX };
      int bit{ -1 };
      std::uint16_t data{ 0 };
      std::vector<DataBit> bits{};
      int expectedParity{ -1 };
    };

    /// Annotation classes; the concrete id is `base + line`.
    enum class AnnotationClass : int {
      Data = 0,
      StartBit = 2,
      ParityOk = 4,
      ParityError = 6,
      StopBit = 8,
      Warning = 10,
      DataBits = 12,
    };

    inline constexpr int annotationId(AnnotationClass c, decoder::Line l) {
      return static_cast<int>(c) + static_cast<int>(decoder::index(l));
    }

    /// Display row an annotation class id is grouped under.
    inline const char* annotationRowName(int classId) {
      const bool rx = (classId % 2) == 0;
      switch (classId & ~1) {
      case 0:
      case 2:
      case 4:
      case 6:
      case 8:
        return rx ? "rx-data" : "tx-data";
      case 10:
        return rx ? "rx-warnings" : "tx-warnings";
      case 12:
        return rx ? "rx-data-bits" : "tx-data-bits";
      default:
        return "unknown";
      }
    }

    struct Annotation {
      int classId{ 0 };
      std::vector<std::string> labels{}; ///< longest first
    };

    /// Binary dump rows: one per line plus the interleaved RX/TX dump.
    enum class BinaryRow : int { RX = 0, TX = 1, RxTx = 2, Count };

    struct BinaryChunk {
      BinaryRow row{ BinaryRow::RX };
      std::vector<std::uint8_t> bytes{};
    };

    /**
 * @class OutputSink
 * @brief Three independent output channels of the decoder.
 *
 *  * Called synchronously from the decode loop; implementations must not
 *    re-enter the decoder.
 */
    class OutputSink {
    public:
      virtual ~OutputSink() = default;

      virtual void putPacket(const Span& span, const Packet& packet) = 0;
      virtual void putAnnotation(const Span& span, const Annotation& annotation) = 0;
      virtual void putBinary(const Span& span, const BinaryChunk& chunk) = 0;
    };

  } // namespace io
} // namespace uartdec
