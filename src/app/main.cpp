/* @file main.cpp
 * @brief uartdec CLI: decode one capture described by a session JSON
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <iostream>
#include <memory>

// UartDec headers
#include "core/ErrorMonitor.hpp"
#include "core/SessionCoordinator.hpp"

int main(int argc, char** argv) {
  if (argc != 2) {
    std::cerr << "usage: " << (argc > 0 ? argv[0] : "uartdec") << " <session.json>\n";
    return 2;
  }

  auto errorMonitor = std::make_shared<uartdec::core::ErrorMonitor>();
  uartdec::core::SessionCoordinator session(argv[1], std::cout, errorMonitor);

  try {
    session.initialize();
    session.run();
  } catch (const std::exception& e) {
    // faults escalated through the monitor were already printed
    if (session.state() != uartdec::core::SessionCoordinator::State::ERROR)
      std::cerr << "uartdec: " << e.what() << '\n';
    return 1;
  }
  return 0;
}
