#include "scenario_sequencer.hpp"

#include <utility>

namespace elevator_link {

ScenarioSequencer::ScenarioSequencer(ScenarioConfig config)
    : config_(std::move(config)), current_floor_(config_.start_floor) {}

void ScenarioSequencer::Restart(int16_t start_floor) noexcept {
  phase_ = ScenarioPhase::SendCurrentFloor;
  sent_in_phase_ = 0;
  next_due_ms_ = 0;
  started_ = false;
  cycle_ = 0;
  current_floor_ = start_floor;
}

std::optional<int16_t> ScenarioSequencer::GetDestination() const noexcept {
  if (config_.destinations.empty()) return std::nullopt;
  int16_t floor = config_.destinations[cycle_ % config_.destinations.size()];
  // 0 на линии означает «назначения нет»
  if (floor == 0) return std::nullopt;
  return floor;
}

uint16_t ScenarioSequencer::GetLoadKg() const noexcept {
  if (config_.loads_kg.empty()) return 0;
  return config_.loads_kg[cycle_ % config_.loads_kg.size()];
}

bool ScenarioSequencer::IsSendPhase(ScenarioPhase phase) noexcept {
  switch (phase) {
    case ScenarioPhase::SendCurrentFloor:
    case ScenarioPhase::SendDestination:
    case ScenarioPhase::SendArrivalClear:
    case ScenarioPhase::SendLoadChange:
      return true;
    default:
      return false;
  }
}

void ScenarioSequencer::AdvancePhase() noexcept {
  sent_in_phase_ = 0;

  switch (phase_) {
    case ScenarioPhase::SendCurrentFloor:
      phase_ = ScenarioPhase::WaitAfterFloor;
      next_due_ms_ += config_.short_wait_ms;
      break;
    case ScenarioPhase::WaitAfterFloor:
      phase_ = ScenarioPhase::SendDestination;
      break;
    case ScenarioPhase::SendDestination:
      phase_ = ScenarioPhase::WaitAfterDestination;
      next_due_ms_ += config_.short_wait_ms;
      break;
    case ScenarioPhase::WaitAfterDestination:
      phase_ = ScenarioPhase::SendArrivalClear;
      break;
    case ScenarioPhase::SendArrivalClear:
      phase_ = ScenarioPhase::SendLoadChange;
      break;
    case ScenarioPhase::SendLoadChange:
      phase_ = ScenarioPhase::WaitEndOfCycle;
      next_due_ms_ += config_.cycle_wait_ms;
      break;
    case ScenarioPhase::WaitEndOfCycle: {
      // Лифт приехал: назначение цикла становится текущим этажом
      if (auto destination = GetDestination()) {
        current_floor_ = *destination;
      }
      cycle_++;
      phase_ = ScenarioPhase::SendCurrentFloor;
      break;
    }
  }
}

enq::EnqFrame ScenarioSequencer::MakeFrame() const noexcept {
  switch (phase_) {
    case ScenarioPhase::SendDestination:
      return enq::Protocol::MakeDestinationFrame(config_.station,
                                                 GetDestination());
    case ScenarioPhase::SendArrivalClear:
      return enq::Protocol::MakeDestinationFrame(config_.station, std::nullopt);
    case ScenarioPhase::SendLoadChange:
      return enq::Protocol::MakeLoadFrame(config_.station, GetLoadKg());
    case ScenarioPhase::SendCurrentFloor:
    default:
      return enq::Protocol::MakeCurrentFloorFrame(config_.station,
                                                  current_floor_);
  }
}

std::optional<enq::EnqFrame> ScenarioSequencer::Update(uint32_t now_ms) {
  // Первый вызов задаёт начало сценария
  if (!started_) {
    started_ = true;
    next_due_ms_ = now_ms;
  }

  // Один проход по всем фазам: защита от цикла при нулевых таймингах
  for (size_t i = 0; i <= kScenarioPhaseCount; i++) {
    if (static_cast<int32_t>(now_ms - next_due_ms_) < 0) {
      return std::nullopt;
    }

    if (IsSendPhase(phase_) && sent_in_phase_ < config_.sends_per_phase) {
      enq::EnqFrame frame = MakeFrame();
      sent_in_phase_++;
      next_due_ms_ += config_.send_interval_ms;
      return frame;
    }

    AdvancePhase();
  }

  return std::nullopt;
}

uint32_t ScenarioSequencer::MsUntilNextEvent(uint32_t now_ms) const noexcept {
  if (!started_) return 0;

  int32_t remaining = static_cast<int32_t>(next_due_ms_ - now_ms);
  return remaining > 0 ? static_cast<uint32_t>(remaining) : 0;
}

}  // namespace elevator_link
