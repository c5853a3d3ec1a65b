/* @file SessionCoordinator.cpp
 * @brief session FSM: BOOT -> INIT -> IDLE -> RUNNING -> FINISHED (or ERROR)
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>

// 3rd-party headers
#include <nlohmann/json.hpp>

// UartDec headers
#include "core/ConfigLoader.hpp"
#include "core/Logger.hpp"
#include "core/SessionCoordinator.hpp"
#include "core/SessionSink.hpp"
#include "decoder/UartDecoder.hpp"
#include "io/CaptureSampleSource.hpp"
#include "io/DumpWriter.hpp"

namespace fs = std::filesystem;

namespace uartdec {
  namespace core {

    namespace {
      constexpr std::array<const char*, 3> kDumpFiles{ { "rx.bin", "tx.bin", "rxtx.bin" } };
    } // namespace

    const char* toString(SessionCoordinator::State s) {
      switch (s) {
      case SessionCoordinator::State::BOOT:
        return "BOOT";
      case SessionCoordinator::State::INIT:
        return "INIT";
      case SessionCoordinator::State::IDLE:
        return "IDLE";
      case SessionCoordinator::State::RUNNING:
        return "RUNNING";
      case SessionCoordinator::State::FINISHED:
        return "FINISHED";
      case SessionCoordinator::State::ERROR:
        return "ERROR";
      default:
        return "Unknown";
      }
    }

    SessionCoordinator::SessionCoordinator(std::string configPath, std::ostream& annotationsOut,
                                           std::shared_ptr<ErrorMonitor> errorMonitor)
        : configPath_(std::move(configPath)), out_(annotationsOut),
          errorMonitor_(std::move(errorMonitor)) {
      assert(errorMonitor_ && "[SessionCoordinator] error monitor is nullptr");
      errorMonitor_->registerEscalation([this](const std::string& reason) { handleError(reason); });
    }

    SessionCoordinator::~SessionCoordinator() {
      // the monitor may outlive us
      errorMonitor_->registerEscalation(nullptr);
    }

    void SessionCoordinator::initialize() {
      if (currentState_ != State::BOOT)
        throw std::logic_error("[SessionCoordinator] initialize() called twice");
      transitionTo(State::INIT);

      try {
        config_ = SessionConfig::fromJson(ConfigLoader(configPath_).load());

        source_ = std::make_unique<io::CaptureSampleSource>(config_->rxChannel, config_->txChannel);
        if (!source_->open(config_->capturePath))
          throw std::runtime_error("[SessionCoordinator] cannot read capture: " +
                                   config_->capturePath);

        openOutputs();
      } catch (const std::exception& e) {
        errorMonitor_->notifyFailure(e.what());
        throw;
      }

      transitionTo(State::IDLE);
    }

    void SessionCoordinator::run() {
      if (currentState_ != State::IDLE)
        throw std::logic_error("[SessionCoordinator] run() requires an initialized session");
      transitionTo(State::RUNNING);

      try {
        SessionSink sink(config_->printAnnotations ? &out_ : nullptr, packetLog_.get(),
                         { { dumps_[0].get(), dumps_[1].get(), dumps_[2].get() } });
        if (packetLog_)
          packetLog_->startNewRun();

        decoder::UartDecoder decoder(config_->decoder, sink, errorMonitor_);
        decoder.setSamplerate(config_->samplerate);
        decoder.decode(*source_);

        closeOutputs();
      } catch (const std::exception& e) {
        errorMonitor_->notifyFailure(e.what());
        throw;
      }

      transitionTo(State::FINISHED);
    }

    void SessionCoordinator::handleError(const std::string& reason) {
      std::cerr << "[SessionCoordinator] " << reason << '\n';
      transitionTo(State::ERROR);
    }

    void SessionCoordinator::transitionTo(State next) { currentState_ = next; }

    void SessionCoordinator::openOutputs() {
      if (config_->packetLogPath)
        packetLog_ = std::make_unique<Logger>(*config_->packetLogPath);

      if (!config_->dumpDir)
        return;

      const fs::path dir(*config_->dumpDir);
      std::error_code ec;
      fs::create_directories(dir, ec);
      if (ec)
        throw std::runtime_error("[SessionCoordinator] cannot create dump dir " + dir.string() +
                                 ": " + ec.message());

      for (std::size_t row = 0; row < dumps_.size(); ++row) {
        auto dump = std::make_unique<io::DumpWriter>();
        const auto path = (dir / kDumpFiles[row]).string();
        if (!dump->open(path))
          throw std::runtime_error("[SessionCoordinator] cannot open dump file " + path);
        dumps_[row] = std::move(dump);
      }
    }

    void SessionCoordinator::closeOutputs() {
      if (packetLog_)
        packetLog_->finishRun();

      for (auto& dump : dumps_) {
        if (dump && !dump->close())
          throw std::runtime_error("[SessionCoordinator] failed to finish dump file");
      }
    }

  } // namespace core
} // namespace uartdec
