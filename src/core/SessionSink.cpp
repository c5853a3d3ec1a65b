/* @file SessionSink.cpp
 * @brief decoder output -> stdout / CSV packet log / dump files
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>

// UartDec headers
#include "core/Logger.hpp"
#include "core/SessionSink.hpp"
#include "io/DumpWriter.hpp"

using namespace uartdec::core;
using uartdec::io::PacketType;

namespace {

  std::string packetValue(const uartdec::io::Packet& p) {
    switch (p.type) {
    case PacketType::Data: {
      std::string out = std::to_string(p.data) + ";bits=";
      for (const auto& b : p.bits)
        out += b.value ? '1' : '0';
      return out;
    }
    case PacketType::ParityError:
      return "expected=" + std::to_string(p.expectedParity) + ";actual=" + std::to_string(p.bit);
    default:
      return std::to_string(p.bit);
    }
  }

} // namespace

SessionSink::SessionSink(std::ostream* annotations, Logger* packetLog, Dumps dumps)
    : annotations_(annotations), packetLog_(packetLog), dumps_(dumps) {}

void SessionSink::putPacket(const io::Span& span, const io::Packet& packet) {
  if (packetLog_ == nullptr)
    return;
  packetLog_->log({ span.start, span.end, decoder::toString(packet.line), io::toString(packet.type),
                    packetValue(packet) });
}

void SessionSink::putAnnotation(const io::Span& span, const io::Annotation& annotation) {
  if (annotations_ == nullptr || annotation.labels.empty())
    return;
  *annotations_ << span.start << '-' << span.end << ' '
                << io::annotationRowName(annotation.classId) << ": " << annotation.labels.front()
                << '\n';
}

void SessionSink::putBinary(const io::Span&, const io::BinaryChunk& chunk) {
  auto* dump = dumps_.at(static_cast<std::size_t>(chunk.row));
  if (dump == nullptr)
    return;
  if (!dump->write(chunk.bytes))
    throw std::runtime_error("[SessionSink] binary dump write failed");
}
