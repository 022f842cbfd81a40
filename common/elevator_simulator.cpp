#include "elevator_simulator.hpp"

#include <string>
#include <utility>

#include "status_text.hpp"

namespace elevator_link {

ElevatorSimulator::ElevatorSimulator(LinkPlatform& platform, EnqLinkBase& link,
                                     ScenarioConfig config, bool log_frames)
    : platform_(platform),
      link_(link),
      sequencer_(std::move(config)),
      log_frames_(log_frames) {}

LinkError ElevatorSimulator::Tick() {
  auto frame = sequencer_.Update(platform_.GetTimeMs());
  if (!frame) {
    return LinkError::Ok;
  }

  LinkError err = link_.SendFrame(*frame);
  if (err != LinkError::Ok) {
    return err;
  }
  sent_frames_++;

  if (log_frames_) {
    auto bytes = link_.LastTx();
    platform_.Log(LogLevel::Info, "TX HEX: " + FormatHex(bytes) +
                                      " ASCII: " + FormatAscii(bytes));
  }
  return LinkError::Ok;
}

LinkError ElevatorSimulator::Run(const std::atomic<bool>& stop) {
  platform_.Log(LogLevel::Info, "Simulation started from " +
                                    FormatFloor(sequencer_.GetCurrentFloor()));

  while (!stop.load()) {
    LinkError err = Tick();
    if (err != LinkError::Ok) {
      platform_.Log(LogLevel::Error,
                    std::string("Link error: ") + LinkErrorName(err));
      return err;
    }

    // Спим до следующего события, но не дольше kMaxSleepMs
    uint32_t wait = sequencer_.MsUntilNextEvent(platform_.GetTimeMs());
    if (wait > config::SimulatorConfig::kMaxSleepMs) {
      wait = config::SimulatorConfig::kMaxSleepMs;
    }
    if (wait > 0) {
      platform_.DelayMs(wait);
    }
  }

  platform_.Log(LogLevel::Info,
                "Simulation stopped after " + std::to_string(sent_frames_) +
                    " frames");
  return LinkError::Ok;
}

}  // namespace elevator_link
