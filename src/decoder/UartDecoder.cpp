/* @file UartDecoder.cpp
 * @brief wait/dispatch loop over the RX and TX frame automatons
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <string>
#include <utility>
#include <vector>

// UartDec headers
#include "decoder/FrameStateMachine.hpp"
#include "decoder/TimingPredictor.hpp"
#include "decoder/UartDecoder.hpp"

using namespace uartdec::decoder;

template <typename Error> void UartDecoder::fail(const std::string& message) {
  errorMonitor_->notifyFailure(message);
  throw Error(message);
}

UartDecoder::UartDecoder(DecoderConfig config, io::OutputSink& sink,
                         std::shared_ptr<core::ErrorMonitor> errorMonitor)
    : config_(std::move(config)), sink_(sink), errorMonitor_(std::move(errorMonitor)) {
  assert(errorMonitor_ && "[UartDecoder] error monitor is nullptr");
  try {
    config_.validate();
  } catch (const std::invalid_argument& e) {
    fail<std::invalid_argument>(e.what());
  }
}

void UartDecoder::reset() {
  samplerate_.reset();
  bitWidth_.reset();
  lines_.fill(LineState{});
}

void UartDecoder::setSamplerate(std::uint64_t samplerate) {
  if (samplerate == 0)
    throw std::invalid_argument("[UartDecoder] samplerate must be positive");
  samplerate_ = samplerate;
  bitWidth_ = static_cast<double>(samplerate) / static_cast<double>(config_.baudrate);
}

void UartDecoder::decode(io::SampleSource& source) {
  if (!bitWidth_)
    fail<SamplerateError>("[UartDecoder] cannot decode without samplerate");

  std::array<bool, kLineCount> hasLine{};
  for (auto line : kLines)
    hasLine[index(line)] = source.hasLine(line);
  if (!hasLine[index(Line::RX)] && !hasLine[index(Line::TX)])
    fail<ChannelError>("[UartDecoder] either TX or RX (or both) lines required");

  const TimingPredictor predictor(config_, *bitWidth_);
  FrameStateMachine fsm(config_, *bitWidth_, sink_);

  std::vector<io::WaitSpec> conditions;
  conditions.reserve(kLineCount);
  std::array<std::optional<std::size_t>, kLineCount> condIndex{};

  while (true) {
    conditions.clear();
    for (auto line : kLines) {
      if (!hasLine[index(line)])
        continue;
      condIndex[index(line)] = conditions.size();
      conditions.push_back(predictor.waitCondition(line, lines_[index(line)], source.sampleNum()));
    }

    const auto result = source.wait(conditions);
    if (!result)
      break; // source exhausted or session cancelled

    for (auto line : kLines) {
      const auto& idx = condIndex[index(line)];
      if (idx && result->matched.test(*idx))
        fsm.inspect(line, lines_[index(line)], result->values[index(line)], result->sampleNum);
    }
  }
}
