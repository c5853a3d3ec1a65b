/* @file FrameStateMachine.cpp
 * @brief UART frame automaton: one handler per state, exhaustive dispatch
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cmath>
#include <utility>

// UartDec headers
#include "decoder/FrameStateMachine.hpp"
#include "decoder/Parity.hpp"
#include "decoder/ValueFormat.hpp"

using namespace uartdec::decoder;
using uartdec::io::Annotation;
using uartdec::io::AnnotationClass;
using uartdec::io::annotationId;
using uartdec::io::BinaryChunk;
using uartdec::io::BinaryRow;
using uartdec::io::Packet;
using uartdec::io::PacketType;
using uartdec::io::Span;

FrameStateMachine::FrameStateMachine(DecoderConfig config, double bitWidth, io::OutputSink& sink)
    : config_(std::move(config)), bitWidth_(bitWidth), sink_(sink) {}

void FrameStateMachine::inspect(Line line, LineState& st, bool signal, std::int64_t samplenum) {
  if (config_.inverted(line))
    signal = !signal;
  const int bit = signal ? 1 : 0;

  switch (st.state) {
  case FrameState::WaitForStartBit:
    waitForStartBit(st, samplenum);
    break;
  case FrameState::GetStartBit:
    getStartBit(line, st, bit, samplenum);
    break;
  case FrameState::GetDataBits:
    getDataBits(line, st, bit, samplenum);
    break;
  case FrameState::GetParityBit:
    getParityBit(line, st, bit, samplenum);
    break;
  case FrameState::GetStopBits:
    getStopBits(line, st, bit, samplenum);
    break;
  }
}

void FrameStateMachine::waitForStartBit(LineState& st, std::int64_t samplenum) {
  st.frameStartSample = samplenum;
  st.state = FrameState::GetStartBit;
}

void FrameStateMachine::getStartBit(Line line, LineState& st, int signal, std::int64_t samplenum) {
  st.startBit = signal;

  // start bit must be 0, otherwise the edge was a glitch: back to idle
  if (st.startBit != 0) {
    putBitPacket(samplenum, { PacketType::InvalidStartBit, line, st.startBit });
    putBitAnnotation(samplenum, { annotationId(AnnotationClass::Warning, line),
                                  { "Frame error", "Frame err", "FE" } });
    st.state = FrameState::WaitForStartBit;
    return;
  }

  st.curDataBit = 0;
  st.dataValue = 0;
  st.startSample.reset();
  st.dataBitLog.clear();

  putBitPacket(samplenum, { PacketType::StartBit, line, st.startBit });
  putBitAnnotation(samplenum,
                   { annotationId(AnnotationClass::StartBit, line), { "Start bit", "Start", "S" } });

  st.state = FrameState::GetDataBits;
}

void FrameStateMachine::getDataBits(Line line, LineState& st, int signal, std::int64_t samplenum) {
  if (!st.startSample)
    st.startSample = samplenum;

  const auto bit = static_cast<unsigned>(signal);
  unsigned value = st.dataValue;
  if (config_.bitOrder == BitOrder::LsbFirst)
    value = (value >> 1) | (bit << (config_.dataBits - 1));
  else
    value = (value << 1) | bit;
  st.dataValue = static_cast<std::uint16_t>(value & ((1U << config_.dataBits) - 1));

  putBitAnnotation(samplenum,
                   { annotationId(AnnotationClass::DataBits, line), { std::to_string(signal) } });

  const auto halfbit = static_cast<std::int64_t>(bitWidth_ / 2.0);
  st.dataBitLog.push_back({ signal, samplenum - halfbit, samplenum + halfbit });

  if (++st.curDataBit < config_.dataBits)
    return;

  // full data group
  const Span span = dataSpan(st, samplenum);
  Packet data{ PacketType::Data, line };
  data.data = st.dataValue;
  data.bits = st.dataBitLog;
  sink_.putPacket(span, data);

  sink_.putAnnotation(span, { annotationId(AnnotationClass::Data, line),
                              { formatValue(config_.format, config_.dataBits, st.dataValue) } });

  auto bytes = toBigEndian(st.dataValue, config_.byteWidth());
  sink_.putBinary(span, { static_cast<BinaryRow>(index(line)), bytes });
  sink_.putBinary(span, { BinaryRow::RxTx, std::move(bytes) });

  st.dataBitLog.clear();

  st.state = config_.parity == Parity::None ? FrameState::GetStopBits : FrameState::GetParityBit;
}

void FrameStateMachine::getParityBit(Line line, LineState& st, int signal,
                                     std::int64_t samplenum) {
  st.parityBit = signal;

  if (parityOk(config_.parity, st.parityBit, st.dataValue)) {
    putBitPacket(samplenum, { PacketType::ParityBit, line, st.parityBit });
    putBitAnnotation(samplenum, { annotationId(AnnotationClass::ParityOk, line),
                                  { "Parity bit", "Parity", "P" } });
  } else {
    Packet err{ PacketType::ParityError, line, st.parityBit };
    err.expectedParity = expectedParityBit(config_.parity, st.dataValue);
    putBitPacket(samplenum, std::move(err));
    putBitAnnotation(samplenum, { annotationId(AnnotationClass::ParityError, line),
                                  { "Parity error", "Parity err", "PE" } });
  }

  st.state = FrameState::GetStopBits;
}

// Only the first stop bit is sampled.
void FrameStateMachine::getStopBits(Line line, LineState& st, int signal, std::int64_t samplenum) {
  st.stopBit = signal;

  // reported, but the frame still completes
  if (st.stopBit != 1) {
    putBitPacket(samplenum, { PacketType::InvalidStopBit, line, st.stopBit });
    putBitAnnotation(samplenum, { annotationId(AnnotationClass::Warning, line),
                                  { "Frame error", "Frame err", "FE" } });
  }

  putBitPacket(samplenum, { PacketType::StopBit, line, st.stopBit });
  putBitAnnotation(samplenum,
                   { annotationId(AnnotationClass::StopBit, line), { "Stop bit", "Stop", "T" } });

  st.state = FrameState::WaitForStartBit;
}

Span FrameStateMachine::bitSpan(std::int64_t samplenum) const {
  const double halfbit = bitWidth_ / 2.0;
  return { samplenum - static_cast<std::int64_t>(std::floor(halfbit)),
           samplenum + static_cast<std::int64_t>(std::ceil(halfbit)) };
}

Span FrameStateMachine::dataSpan(const LineState& st, std::int64_t samplenum) const {
  const double halfbit = bitWidth_ / 2.0;
  return { st.startSample.value_or(samplenum) - static_cast<std::int64_t>(std::floor(halfbit)),
           samplenum + static_cast<std::int64_t>(std::ceil(halfbit)) };
}

void FrameStateMachine::putBitPacket(std::int64_t samplenum, Packet packet) {
  sink_.putPacket(bitSpan(samplenum), packet);
}

void FrameStateMachine::putBitAnnotation(std::int64_t samplenum, Annotation annotation) {
  sink_.putAnnotation(bitSpan(samplenum), annotation);
}
