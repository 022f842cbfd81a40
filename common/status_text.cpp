#include "status_text.hpp"

#include <cstdio>
#include <utility>

namespace elevator_link {

// ═══════════════════════════════════════════════════════════════════════════
// Форматирование
// ═══════════════════════════════════════════════════════════════════════════

std::string FormatFloor(int16_t floor) {
  char buf[16];
  int32_t value = floor;
  if (value < 0) {
    std::snprintf(buf, sizeof(buf), "B%ldF", static_cast<long>(-value));
  } else {
    std::snprintf(buf, sizeof(buf), "%ldF", static_cast<long>(value));
  }
  return buf;
}

std::optional<int16_t> ParseFloor(std::string_view text) {
  bool basement = false;
  if (!text.empty() && (text.front() == 'B' || text.front() == 'b')) {
    basement = true;
    text.remove_prefix(1);
  } else if (!text.empty() && text.front() == '-') {
    basement = true;
    text.remove_prefix(1);
  }
  if (!text.empty() && (text.back() == 'F' || text.back() == 'f')) {
    text.remove_suffix(1);
  }
  if (text.empty() || text.size() > 5) return std::nullopt;

  int32_t value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') return std::nullopt;
    value = value * 10 + (c - '0');
  }
  if (basement) {
    // B0F не бывает
    if (value == 0) return std::nullopt;
    value = -value;
  }
  if (value < INT16_MIN || value > INT16_MAX) return std::nullopt;
  return static_cast<int16_t>(value);
}

std::string FormatEvent(const ElevatorEvent& event) {
  switch (event.kind) {
    case ElevatorEventKind::MotionStarted: {
      std::string from = event.from_floor ? FormatFloor(*event.from_floor) : "?";
      return "Moving: " + from + " -> " + FormatFloor(event.floor);
    }
    case ElevatorEventKind::Arrival:
      return "Arrived: " + FormatFloor(event.floor);
    case ElevatorEventKind::LoadChanged:
      return "Load: " + std::to_string(event.load_kg) + "kg";
  }
  return "Unknown event";
}

std::string FormatState(const ElevatorState& state) {
  std::string floor =
      state.current_floor ? FormatFloor(*state.current_floor) : "--";
  std::string destination =
      state.destination_floor ? FormatFloor(*state.destination_floor) : "--";
  std::string load =
      state.load_kg ? std::to_string(*state.load_kg) + "kg" : "--";
  return "Floor: " + floor + " | Destination: " + destination +
         " | Load: " + load;
}

std::string FormatHex(std::span<const uint8_t> bytes) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

std::string FormatAscii(std::span<const uint8_t> bytes) {
  std::string out;
  out.reserve(bytes.size());
  for (uint8_t b : bytes) {
    out.push_back((b >= 32 && b <= 126) ? static_cast<char>(b) : '.');
  }
  return out;
}

std::string FormatUptime(uint32_t ms) {
  uint32_t total_s = ms / 1000;
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02lu:%02lu:%02lu",
                static_cast<unsigned long>((total_s / 3600) % 100),
                static_cast<unsigned long>((total_s / 60) % 60),
                static_cast<unsigned long>(total_s % 60));
  return buf;
}

// ═══════════════════════════════════════════════════════════════════════════
// EventLog - реализация
// ═══════════════════════════════════════════════════════════════════════════

void EventLog::OnElevatorEvent(const ElevatorEvent& event,
                               const ElevatorState& state) {
  (void)state;
  Add(FormatEvent(event));
}

void EventLog::Add(std::string_view text) {
  if (capacity_ == 0) return;

  std::string line = "[" + FormatUptime(platform_.GetTimeMs()) + "] ";
  line.append(text);
  lines_.push_back(std::move(line));

  while (lines_.size() > capacity_) {
    lines_.pop_front();
  }
}

}  // namespace elevator_link
