#include <atomic>
#include <csignal>
#include <cstdio>
#include <string>

#include "config.hpp"
#include "elevator_monitor.hpp"
#include "platform_linux.hpp"
#include "status_text.hpp"
#include "uart_bridge.hpp"

using namespace elevator_link;

static std::atomic<bool> s_stop{false};

static void HandleStopSignal(int) { s_stop.store(true); }

/**
 * Вывод событий в консоль и журнал последних событий.
 */
class ConsoleRenderer : public ElevatorRenderer {
 public:
  explicit ConsoleRenderer(const LinkPlatform &platform)
      : platform_(platform), log_(platform) {}

  void OnElevatorEvent(const ElevatorEvent &event,
                       const ElevatorState &state) override {
    log_.OnElevatorEvent(event, state);
    platform_.Log(LogLevel::Info, FormatState(state));
  }

  [[nodiscard]] const EventLog &GetEventLog() const noexcept { return log_; }

 private:
  const LinkPlatform &platform_;
  EventLog log_;
};

int main(int argc, char **argv) {
  LinuxPlatform platform(LOG_TAG_MONITOR);

  if (argc > 1 && (std::string(argv[1]) == "-h" ||
                   std::string(argv[1]) == "help")) {
    std::printf("Usage: %s [device]\n", argv[0]);
    std::printf("  device  serial port (default %s)\n", UART_DEFAULT_DEVICE);
    return 0;
  }

  std::string device = argc > 1 ? argv[1] : UART_DEFAULT_DEVICE;

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

  ConsoleRenderer renderer(platform);
  MonitorOptions options;
  options.dump_raw = DEBUG_DUMP_RX != 0;

  ElevatorMonitor monitor(platform, link, &renderer, options);
  err = monitor.Run(s_stop);

  platform.Log(LogLevel::Info, "Last state: " + FormatState(monitor.GetState()));
  for (const auto &line : renderer.GetEventLog().Lines()) {
    platform.Log(LogLevel::Info, line);
  }

  return err == LinkError::Ok ? 0 : 1;
}
