#pragma once

/** @file  SessionCoordinator.hpp
 *  @brief Public API for uartdec::core::SessionCoordinator.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <array>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include "core/ErrorMonitor.hpp"
#include "core/SessionConfig.hpp"

namespace uartdec {
  namespace io {
    class CaptureSampleSource;
    class DumpWriter;
  } // namespace io

  namespace core {

    class Logger;

    /**
 * @class SessionCoordinator
 * @brief Drives one decode session: config → capture → decoder → outputs.
 *
 *  * Registers itself as the ErrorMonitor's escalation target; any fatal
 *    fault moves it to `ERROR`.
 *  * One run per instance.
 */
    class SessionCoordinator {

    public:
      enum class State { BOOT, INIT, IDLE, RUNNING, FINISHED, ERROR };

      SessionCoordinator(std::string configPath, std::ostream& annotationsOut,
                         std::shared_ptr<ErrorMonitor> errorMonitor);
      ~SessionCoordinator();

      // ---- Public API ----
      void initialize(); ///< load config, open capture + output files
      void run();        ///< decode the whole capture
      void handleError(const std::string& reason);

      State state() const { return currentState_; }
      const std::optional<SessionConfig>& config() const { return config_; }

      SessionCoordinator(const SessionCoordinator&) = delete;
      SessionCoordinator& operator=(const SessionCoordinator&) = delete;

    private:
      void transitionTo(State next);
      void openOutputs();
      void closeOutputs();

      std::string configPath_;
      std::ostream& out_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::optional<SessionConfig> config_{};
      std::unique_ptr<io::CaptureSampleSource> source_;
      std::unique_ptr<Logger> packetLog_;
      std::array<std::unique_ptr<io::DumpWriter>, 3> dumps_;

      State currentState_{ State::BOOT };
    };

    const char* toString(SessionCoordinator::State s);

  } // namespace core
} // namespace uartdec
