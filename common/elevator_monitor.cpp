#include "elevator_monitor.hpp"

#include <cstdio>
#include <string>

#include "status_text.hpp"

namespace elevator_link {

ElevatorMonitor::ElevatorMonitor(LinkPlatform& platform, EnqLinkBase& link,
                                 ElevatorRenderer* renderer,
                                 MonitorOptions options)
    : platform_(platform),
      link_(link),
      renderer_(renderer),
      options_(options),
      tracker_(this) {}

void ElevatorMonitor::OnElevatorEvent(const ElevatorEvent& event,
                                      const ElevatorState& state) {
  platform_.Log(LogLevel::Info, FormatEvent(event));
  if (renderer_ != nullptr) {
    renderer_->OnElevatorEvent(event, state);
  }
}

void ElevatorMonitor::ReportRejections() {
  const enq::FramerStats& stats = link_.GetRxStats();

  uint32_t checksum = stats.checksum_errors - reported_stats_.checksum_errors;
  uint32_t malformed = stats.malformed_frames - reported_stats_.malformed_frames;
  if (checksum > 0 || malformed > 0) {
    char buf[96];
    std::snprintf(buf, sizeof(buf),
                  "Rejected windows: checksum=%lu malformed=%lu (resync)",
                  static_cast<unsigned long>(checksum),
                  static_cast<unsigned long>(malformed));
    platform_.Log(LogLevel::Warning, buf);
  }
  reported_stats_ = stats;
}

void ElevatorMonitor::CheckIdle(uint32_t now_ms) {
  if (now_ms - last_activity_ms_ < options_.idle_warning_ms) {
    return;
  }
  platform_.Log(LogLevel::Warning, "Waiting... (no data)");
  last_activity_ms_ = now_ms;
}

LinkError ElevatorMonitor::Poll() {
  LinkError err = link_.PumpRx(
      [this](const enq::EnqFrame& frame) { tracker_.Apply(frame); });
  if (err != LinkError::Ok) {
    return err;
  }

  uint32_t now = platform_.GetTimeMs();
  auto rx = link_.LastRx();

  if (rx.empty()) {
    CheckIdle(now);
  } else {
    last_activity_ms_ = now;
    if (options_.dump_raw) {
      std::string line = "RX (" + std::to_string(rx.size()) +
                         " bytes) HEX: " + FormatHex(rx) +
                         " ASCII: " + FormatAscii(rx);
      platform_.Log(LogLevel::Info, line);
    }
  }

  ReportRejections();
  return LinkError::Ok;
}

LinkError ElevatorMonitor::Run(const std::atomic<bool>& stop) {
  platform_.Log(LogLevel::Info, "Monitoring started");
  last_activity_ms_ = platform_.GetTimeMs();

  LinkError result = LinkError::Ok;
  while (!stop.load()) {
    result = Poll();
    if (result != LinkError::Ok) {
      std::string msg = std::string("Link error: ") + LinkErrorName(result);
      platform_.Log(LogLevel::Error, msg);
      break;
    }
    if (link_.LastRx().empty()) {
      platform_.DelayMs(options_.poll_interval_ms);
    }
  }

  link_.CloseRx();

  const enq::FramerStats& stats = link_.GetRxStats();
  char buf[160];
  std::snprintf(buf, sizeof(buf),
                "Monitoring stopped: frames=%lu noise=%lu checksum=%lu "
                "malformed=%lu dropped=%lu",
                static_cast<unsigned long>(stats.frames),
                static_cast<unsigned long>(stats.noise_bytes),
                static_cast<unsigned long>(stats.checksum_errors),
                static_cast<unsigned long>(stats.malformed_frames),
                static_cast<unsigned long>(stats.dropped_on_close));
  platform_.Log(LogLevel::Info, buf);

  return result;
}

}  // namespace elevator_link
