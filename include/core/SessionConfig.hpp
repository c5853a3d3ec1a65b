#pragma once
/** @file  SessionConfig.hpp
 *  @brief Schema of the session JSON (capture, channels, outputs, decoder).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "decoder/DecoderConfig.hpp"

namespace uartdec::core {

  struct SessionConfig {
    std::uint64_t samplerate{ 0 };
    std::string capturePath{};
    std::optional<unsigned> rxChannel{}; ///< bit index in the packed capture byte
    std::optional<unsigned> txChannel{};
    decoder::DecoderConfig decoder{};
    std::optional<std::string> packetLogPath{};
    std::optional<std::string> dumpDir{};
    bool printAnnotations{ true };

    /// Throws `std::invalid_argument` on a missing or malformed key.
    static SessionConfig fromJson(const nlohmann::json& j);
  };

} // namespace uartdec::core
