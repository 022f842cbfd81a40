#include <atomic>
#include <csignal>
#include <cstdio>
#include <string>

#include "config.hpp"
#include "elevator_simulator.hpp"
#include "platform_linux.hpp"
#include "status_text.hpp"
#include "uart_bridge.hpp"

using namespace elevator_link;

static std::atomic<bool> s_stop{false};

static void HandleStopSignal(int) { s_stop.store(true); }

int main(int argc, char **argv) {
  LinuxPlatform platform(LOG_TAG_SIMULATOR);

  if (argc > 1 && (std::string(argv[1]) == "-h" ||
                   std::string(argv[1]) == "help")) {
    std::printf("Usage: %s [device] [start_floor]\n", argv[0]);
    std::printf("  device       serial port (default %s)\n",
                UART_DEFAULT_DEVICE);
    std::printf("  start_floor  e.g. 1F, 3, B1F (default %d)\n",
                config::ScenarioDefaults::kStartFloor);
    return 0;
  }

  std::string device = argc > 1 ? argv[1] : UART_DEFAULT_DEVICE;

  ScenarioConfig scenario;
  if (argc > 2) {
    auto floor = ParseFloor(argv[2]);
    if (!floor) {
      platform.Log(LogLevel::Error,
                   std::string("Invalid start floor: ") + argv[2]);
      return 1;
    }
    scenario.start_floor = *floor;
  }

  PosixUartBridge link(device);
  LinkError err = link.Init();
  if (err != LinkError::Ok) {
    platform.Log(LogLevel::Error, "Failed to open " + device + ": " +
                                      LinkErrorName(err));
    return 1;
  }
  platform.Log(LogLevel::Info,
               "Serial " + device + " " +
                   std::to_string(config::SerialConfig::kBaudRate) + "bps 8E1");

  std::signal(SIGINT, HandleStopSignal);
  std::signal(SIGTERM, HandleStopSignal);

  ElevatorSimulator simulator(platform, link, scenario);
  err = simulator.Run(s_stop);

  return err == LinkError::Ok ? 0 : 1;
}
