/* @file DecoderConfig.cpp
 * @brief option parsing + validation against the enumerated value sets
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <array>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

// 3rd-party headers
#include <nlohmann/json.hpp>

// UartDec headers
#include "decoder/DecoderConfig.hpp"

using nlohmann::json;

namespace uartdec::decoder {

  namespace {

    template <typename E> using Choice = std::pair<const char*, E>;

    constexpr std::array<Choice<Parity>, 5> kParityChoices{ { { "none", Parity::None },
                                                             { "odd", Parity::Odd },
                                                             { "even", Parity::Even },
                                                             { "zero", Parity::Zero },
                                                             { "one", Parity::One } } };

    constexpr std::array<Choice<BitOrder>, 2> kBitOrderChoices{
      { { "lsb-first", BitOrder::LsbFirst }, { "msb-first", BitOrder::MsbFirst } }
    };

    constexpr std::array<Choice<DisplayFormat>, 5> kFormatChoices{
      { { "ascii", DisplayFormat::Ascii },
        { "dec", DisplayFormat::Dec },
        { "hex", DisplayFormat::Hex },
        { "oct", DisplayFormat::Oct },
        { "bin", DisplayFormat::Bin } }
    };

    constexpr std::array<Choice<bool>, 2> kYesNoChoices{ { { "yes", true }, { "no", false } } };

    constexpr std::array<double, 4> kStopBitChoices{ { 0.5, 1.0, 1.5, 2.0 } };

    [[noreturn]] void reject(const std::string& key, const std::string& why) {
      throw std::invalid_argument("[DecoderConfig] option '" + key + "' " + why);
    }

    template <typename T> T optionOr(const json& j, const std::string& key, T fallback) {
      auto it = j.find(key);
      if (it == j.end() || it->is_null())
        return fallback;
      try {
        return it->get<T>();
      } catch (const json::exception&) {
        reject(key, "has the wrong type");
      }
    }

    // fractional numbers are rejected rather than truncated
    template <typename T> T integerOr(const json& j, const std::string& key, T fallback) {
      auto it = j.find(key);
      if (it == j.end() || it->is_null())
        return fallback;
      if (!it->is_number_integer())
        reject(key, "must be an integer");
      return it->get<T>();
    }

    template <typename E, std::size_t N>
    E choiceOr(const json& j, const std::string& key, const std::array<Choice<E>, N>& table,
               E fallback) {
      auto it = j.find(key);
      if (it == j.end() || it->is_null())
        return fallback;
      if (!it->is_string())
        reject(key, "must be a string");

      const auto value = it->get<std::string>();
      for (const auto& [name, e] : table) {
        if (value == name)
          return e;
      }
      reject(key, "has unsupported value '" + value + "'");
    }

    template <typename E, std::size_t N>
    const char* nameOf(E e, const std::array<Choice<E>, N>& table) {
      for (const auto& [name, v] : table) {
        if (v == e)
          return name;
      }
      return "unknown";
    }

  } // namespace

  const char* toString(Parity p) { return nameOf(p, kParityChoices); }
  const char* toString(BitOrder o) { return nameOf(o, kBitOrderChoices); }
  const char* toString(DisplayFormat f) { return nameOf(f, kFormatChoices); }

  void DecoderConfig::validate() const {
    if (baudrate == 0)
      reject("baudrate", "must be positive");
    if (dataBits < 5 || dataBits > 9)
      reject("num_data_bits", "must be in 5..9");
    if (std::find(kStopBitChoices.begin(), kStopBitChoices.end(), stopBits) ==
        kStopBitChoices.end())
      reject("num_stop_bits", "must be one of 0.5, 1.0, 1.5, 2.0");
  }

  DecoderConfig DecoderConfig::fromJson(const json& j) {
    if (!j.is_object())
      throw std::invalid_argument("[DecoderConfig] decoder options must be a JSON object");

    DecoderConfig cfg;

    const auto baud = integerOr<std::int64_t>(j, "baudrate", cfg.baudrate);
    if (baud <= 0 || baud > std::numeric_limits<std::uint32_t>::max())
      reject("baudrate", "must be a positive 32-bit integer");
    cfg.baudrate = static_cast<std::uint32_t>(baud);

    const auto bits = integerOr<int>(j, "num_data_bits", static_cast<int>(cfg.dataBits));
    if (bits < 5 || bits > 9)
      reject("num_data_bits", "must be in 5..9");
    cfg.dataBits = static_cast<unsigned>(bits);

    cfg.parity = choiceOr(j, "parity_type", kParityChoices, cfg.parity);
    cfg.parityCheck = choiceOr(j, "parity_check", kYesNoChoices, cfg.parityCheck);
    cfg.stopBits = optionOr<double>(j, "num_stop_bits", cfg.stopBits);
    cfg.bitOrder = choiceOr(j, "bit_order", kBitOrderChoices, cfg.bitOrder);
    cfg.format = choiceOr(j, "format", kFormatChoices, cfg.format);
    cfg.invert[index(Line::RX)] = choiceOr(j, "invert_rx", kYesNoChoices, false);
    cfg.invert[index(Line::TX)] = choiceOr(j, "invert_tx", kYesNoChoices, false);

    cfg.validate();
    return cfg;
  }

} // namespace uartdec::decoder
