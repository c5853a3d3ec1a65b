/* @file SessionConfig.cpp
 * @brief session JSON schema validation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

// 3rd-party headers
#include <nlohmann/json.hpp>

// UartDec headers
#include "core/SessionConfig.hpp"

using nlohmann::json;
using namespace uartdec::core;

namespace {

  [[noreturn]] void reject(const std::string& key, const std::string& why) {
    throw std::invalid_argument("[SessionConfig] '" + key + "' " + why);
  }

  std::optional<unsigned> channelBit(const json& channels, const char* key) {
    auto it = channels.find(key);
    if (it == channels.end() || it->is_null())
      return std::nullopt;
    if (!it->is_number_integer() || it->get<std::int64_t>() < 0 || it->get<std::int64_t>() > 7)
      reject(std::string("channels.") + key, "must be a bit index 0..7");
    return it->get<unsigned>();
  }

  std::optional<std::string> optionalPath(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
      return std::nullopt;
    if (!it->is_string())
      reject(key, "must be a string");
    return it->get<std::string>();
  }

} // namespace

SessionConfig SessionConfig::fromJson(const json& j) {
  if (!j.is_object())
    throw std::invalid_argument("[SessionConfig] top level must be a JSON object");

  SessionConfig cfg;

  auto rate = j.find("samplerate");
  if (rate == j.end())
    reject("samplerate", "is required");
  if (!rate->is_number_integer() || rate->get<std::int64_t>() <= 0)
    reject("samplerate", "must be a positive integer");
  cfg.samplerate = rate->get<std::uint64_t>();

  auto capture = j.find("capture");
  if (capture == j.end() || !capture->is_string())
    reject("capture", "is required and must be a path");
  cfg.capturePath = capture->get<std::string>();

  if (auto channels = j.find("channels"); channels != j.end() && !channels->is_null()) {
    if (!channels->is_object())
      reject("channels", "must be an object");
    cfg.rxChannel = channelBit(*channels, "rx");
    cfg.txChannel = channelBit(*channels, "tx");
  }

  if (auto dec = j.find("decoder"); dec != j.end() && !dec->is_null())
    cfg.decoder = decoder::DecoderConfig::fromJson(*dec);

  cfg.packetLogPath = optionalPath(j, "packet_log");
  cfg.dumpDir = optionalPath(j, "dump_dir");

  if (auto ann = j.find("annotations"); ann != j.end()) {
    if (!ann->is_boolean())
      reject("annotations", "must be true or false");
    cfg.printAnnotations = ann->get<bool>();
  }

  return cfg;
}
