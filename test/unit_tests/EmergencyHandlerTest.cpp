#include "EmergencyHandler.hpp"
#include "FakeConsole.hpp"
#include "TestHeaders.hpp"

using namespace tabmux;

TEST_CASE("EmergencyHandler restores the registered console",
          "[EmergencyHandler]") {
  FakeConsole console;
  console.setup();

  SECTION("Nothing registered") {
    REQUIRE(!EmergencyHandler::isInstalled());
    EmergencyHandler::restoreConsole();
    REQUIRE(console.emergencyRestoreCount == 0);
  }

  SECTION("Registered") {
    EmergencyHandler::install(&console);
    REQUIRE(EmergencyHandler::isInstalled());
    EmergencyHandler::restoreConsole();
    REQUIRE(console.emergencyRestoreCount == 1);
    REQUIRE(!console.isSetup);

    // A second crash path does not restore twice
    EmergencyHandler::restoreConsole();
    REQUIRE(console.emergencyRestoreCount == 1);

    EmergencyHandler::uninstall();
    REQUIRE(!EmergencyHandler::isInstalled());
  }

  SECTION("Unregistered") {
    EmergencyHandler::install(&console);
    EmergencyHandler::uninstall();
    EmergencyHandler::uninstall();
    EmergencyHandler::restoreConsole();
    REQUIRE(console.emergencyRestoreCount == 0);
    REQUIRE(console.isSetup);
  }
}

TEST_CASE("EmergencyHandler child table", "[EmergencyHandler]") {
  // Never signalled here, these pids are only bookkeeping
  const pid_t first = 900001;
  const pid_t second = 900002;
  REQUIRE(!EmergencyHandler::isTracked(first));

  EmergencyHandler::trackChild(first);
  EmergencyHandler::trackChild(second);
  REQUIRE(EmergencyHandler::isTracked(first));
  REQUIRE(EmergencyHandler::isTracked(second));

  EmergencyHandler::untrackChild(first);
  REQUIRE(!EmergencyHandler::isTracked(first));
  REQUIRE(EmergencyHandler::isTracked(second));

  // Untracking twice is harmless
  EmergencyHandler::untrackChild(first);
  EmergencyHandler::untrackChild(second);
  REQUIRE(!EmergencyHandler::isTracked(second));
}
