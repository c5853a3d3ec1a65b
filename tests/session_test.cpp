// UartDec-Prod headers
#include "core/ErrorMonitor.hpp"
#include "core/SessionCoordinator.hpp"
#include "decoder/UartDecoder.hpp"

// UartDec-Fake headers
#include "WaveformBuilder.hpp"

// 3rd-party headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

// STL headers
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace uartdec::test {

  using core::ErrorMonitor;
  using core::SessionCoordinator;
  using ::testing::HasSubstr;
  using ::testing::Not;
  namespace fs = std::filesystem;

  class SessionTest : public ::testing::Test {
  protected:
    void SetUp() override {
      dir = fs::temp_directory_path() /
            ("uartdec_session_" +
             std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
             ::testing::UnitTest::GetInstance()->current_test_info()->name());
      fs::create_directories(dir);
      monitor = std::make_shared<ErrorMonitor>();
    }

    void TearDown() override { fs::remove_all(dir); }

    fs::path writeCapture(const std::vector<std::uint8_t>& bytes) {
      const auto path = dir / "capture.bin";
      std::ofstream out(path, std::ios::binary);
      out.write(reinterpret_cast<const char*>(bytes.data()),
                static_cast<std::streamsize>(bytes.size()));
      return path;
    }

    fs::path writeConfig(const nlohmann::json& j) {
      const auto path = dir / "session.json";
      std::ofstream out(path);
      out << j.dump(2);
      return path;
    }

    static std::string readText(const fs::path& p) {
      std::ifstream in(p);
      std::stringstream ss;
      ss << in.rdbuf();
      return ss.str();
    }

    static std::vector<std::uint8_t> readBytes(const fs::path& p) {
      std::ifstream in(p, std::ios::binary);
      return { std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>() };
    }

    fs::path dir;
    std::shared_ptr<ErrorMonitor> monitor;
    std::ostringstream annotations;
  };

  TEST_F(SessionTest, decodes_capture_into_every_output) {
    LineWaveform rx(10);
    rx.idle(20).frame(0x41, 8).idle(30);
    LineWaveform tx(10);
    tx.idle(150).frame(0x4B, 8).idle(30);
    const auto capture = writeCapture(pack(&rx, &tx));

    const auto config = writeConfig({
        { "samplerate", 96000 },
        { "capture", capture.string() },
        { "channels", { { "rx", 0 }, { "tx", 1 } } },
        { "decoder", { { "baudrate", 9600 } } },
        { "packet_log", (dir / "packets.csv").string() },
        { "dump_dir", (dir / "dumps").string() },
    });

    SessionCoordinator session(config.string(), annotations, monitor);
    EXPECT_EQ(session.state(), SessionCoordinator::State::BOOT);
    session.initialize();
    EXPECT_EQ(session.state(), SessionCoordinator::State::IDLE);
    session.run();
    EXPECT_EQ(session.state(), SessionCoordinator::State::FINISHED);
    EXPECT_EQ(monitor->failureCount(), 0U);

    const auto text = annotations.str();
    EXPECT_THAT(text, HasSubstr("20-30 rx-data: Start bit\n"));
    EXPECT_THAT(text, HasSubstr("30-110 rx-data: 41\n"));
    EXPECT_THAT(text, HasSubstr("30-40 rx-data-bits: 1\n"));
    EXPECT_THAT(text, HasSubstr("110-120 rx-data: Stop bit\n"));
    EXPECT_THAT(text, HasSubstr("160-240 tx-data: 4B\n"));
    EXPECT_THAT(text, Not(HasSubstr("warnings")));

    const auto csv = readText(dir / "packets.csv");
    EXPECT_THAT(csv, ::testing::StartsWith("start,end,line,type,value\n"));
    EXPECT_THAT(csv, HasSubstr("20,30,RX,STARTBIT,0\n"));
    EXPECT_THAT(csv, HasSubstr("30,110,RX,DATA,65;bits=10000010\n"));
    EXPECT_THAT(csv, HasSubstr("110,120,RX,STOPBIT,1\n"));
    EXPECT_THAT(csv, HasSubstr("160,240,TX,DATA,75;bits=11010010\n"));

    EXPECT_EQ(readBytes(dir / "dumps" / "rx.bin"), (std::vector<std::uint8_t>{ 0x41 }));
    EXPECT_EQ(readBytes(dir / "dumps" / "tx.bin"), (std::vector<std::uint8_t>{ 0x4B }));
    EXPECT_EQ(readBytes(dir / "dumps" / "rxtx.bin"), (std::vector<std::uint8_t>{ 0x41, 0x4B }));
  }

  TEST_F(SessionTest, annotations_can_be_silenced) {
    LineWaveform rx(10);
    rx.idle(20).frame(0x55, 8).idle(20);
    const auto capture = writeCapture(pack(&rx, nullptr));

    const auto config = writeConfig({
        { "samplerate", 96000 },
        { "capture", capture.string() },
        { "channels", { { "rx", 0 } } },
        { "decoder", { { "baudrate", 9600 } } },
        { "annotations", false },
    });

    SessionCoordinator session(config.string(), annotations, monitor);
    session.initialize();
    session.run();
    EXPECT_EQ(session.state(), SessionCoordinator::State::FINISHED);
    EXPECT_TRUE(annotations.str().empty());
  }

  TEST_F(SessionTest, missing_capture_escalates_to_error_state) {
    const auto config = writeConfig({
        { "samplerate", 96000 },
        { "capture", (dir / "absent.bin").string() },
        { "channels", { { "rx", 0 } } },
    });

    SessionCoordinator session(config.string(), annotations, monitor);
    EXPECT_THROW(session.initialize(), std::runtime_error);
    EXPECT_EQ(session.state(), SessionCoordinator::State::ERROR);
    EXPECT_EQ(monitor->failureCount(), 1U);
    EXPECT_THROW(session.run(), std::logic_error);
  }

  TEST_F(SessionTest, malformed_config_escalates_to_error_state) {
    const auto config = writeConfig({ { "samplerate", "fast" }, { "capture", "x.bin" } });

    SessionCoordinator session(config.string(), annotations, monitor);
    EXPECT_THROW(session.initialize(), std::invalid_argument);
    EXPECT_EQ(session.state(), SessionCoordinator::State::ERROR);
  }

  TEST_F(SessionTest, no_mapped_line_fails_the_run) {
    const auto capture = writeCapture(std::vector<std::uint8_t>(100, 0xFF));
    const auto config = writeConfig({ { "samplerate", 96000 }, { "capture", capture.string() } });

    SessionCoordinator session(config.string(), annotations, monitor);
    session.initialize();
    EXPECT_THROW(session.run(), decoder::ChannelError);
    EXPECT_EQ(session.state(), SessionCoordinator::State::ERROR);
    EXPECT_EQ(monitor->failureCount(), 1U);
  }

} // namespace uartdec::test
