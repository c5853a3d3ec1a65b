#pragma once
/** @file  RecordingSink.hpp
 *  @brief OutputSink that keeps everything it is given, for assertions.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>
#include <cstddef>
#include <vector>

#include "io/OutputSink.hpp"

namespace uartdec {
  namespace test {

    /**
 * @class RecordingSink
 * @brief Stores packets, annotations and binary chunks in arrival order.
 */
    class RecordingSink : public uartdec::io::OutputSink {
    public:
      template <typename T> struct Item {
        io::Span span;
        T value;
      };

      std::vector<Item<io::Packet>> packets;
      std::vector<Item<io::Annotation>> annotations;
      std::vector<Item<io::BinaryChunk>> binary;

      void putPacket(const io::Span& span, const io::Packet& packet) override {
        packets.push_back({ span, packet });
      }

      void putAnnotation(const io::Span& span, const io::Annotation& annotation) override {
        annotations.push_back({ span, annotation });
      }

      void putBinary(const io::Span& span, const io::BinaryChunk& chunk) override {
        binary.push_back({ span, chunk });
      }

      std::vector<io::PacketType> packetTypes(decoder::Line line) const {
        std::vector<io::PacketType> out;
        for (const auto& p : packets) {
          if (p.value.line == line)
            out.push_back(p.value.type);
        }
        return out;
      }

      std::size_t countPackets(io::PacketType type) const {
        return static_cast<std::size_t>(std::count_if(
            packets.begin(), packets.end(), [type](const auto& p) { return p.value.type == type; }));
      }

      std::size_t countAnnotations(int classId) const {
        return static_cast<std::size_t>(
            std::count_if(annotations.begin(), annotations.end(),
                          [classId](const auto& a) { return a.value.classId == classId; }));
      }

      const io::Packet* firstPacket(io::PacketType type) const {
        for (const auto& p : packets) {
          if (p.value.type == type)
            return &p.value;
        }
        return nullptr;
      }

      void clear() {
        packets.clear();
        annotations.clear();
        binary.clear();
      }
    };

  } // namespace test
} // namespace uartdec
