#pragma once
/** @file  MockErrorMonitor.hpp
 *  @brief gmock double for the fault aggregator.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <gmock/gmock.h>

#include "core/ErrorMonitor.hpp"

namespace uartdec {
  namespace test {

    class MockErrorMonitor : public uartdec::core::ErrorMonitor {
    public:
      MOCK_METHOD(void, notifyFailure, (const std::string&), (override));
    };

  } // namespace test
} // namespace uartdec
