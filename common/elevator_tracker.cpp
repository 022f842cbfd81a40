#include "elevator_tracker.hpp"

namespace elevator_link {

ElevatorReduction ReduceElevatorState(const ElevatorState& state,
                                      const enq::EnqFrame& frame) noexcept {
  ElevatorReduction out{state, std::nullopt};
  ElevatorState& next = out.state;

  switch (frame.Kind()) {
    case enq::DataNumber::CurrentFloor: {
      int16_t floor = enq::DecodeFloor(frame.data_value);
      next.current_floor = floor;
      if (next.destination_floor && *next.destination_floor == floor) {
        out.event = ElevatorEvent{ElevatorEventKind::Arrival, std::nullopt,
                                  floor, 0};
        next.destination_floor.reset();
      }
      break;
    }

    case enq::DataNumber::DestinationFloor: {
      auto destination = enq::DecodeDestination(frame.data_value);
      if (!destination) {
        // Назначение снято, событие не нужно
        next.destination_floor.reset();
        break;
      }
      // Повтор назначения или назначение на текущий этаж: события нет
      if (next.destination_floor == destination ||
          next.current_floor == destination) {
        break;
      }
      next.destination_floor = destination;
      out.event = ElevatorEvent{ElevatorEventKind::MotionStarted,
                                next.current_floor, *destination, 0};
      break;
    }

    case enq::DataNumber::Load: {
      // Каждый кадр загрузки порождает событие, даже с прежним значением
      uint16_t load = enq::DecodeLoad(frame.data_value);
      next.load_kg = load;
      out.event =
          ElevatorEvent{ElevatorEventKind::LoadChanged, std::nullopt, 0, load};
      break;
    }

    default:
      // Неизвестный номер данных: совместимость с расширениями протокола
      return out;
  }

  if (out.event) {
    next.last_event = out.event;
  }
  return out;
}

std::optional<ElevatorEvent> ElevatorTracker::Apply(
    const enq::EnqFrame& frame) {
  switch (frame.Kind()) {
    case enq::DataNumber::CurrentFloor:
    case enq::DataNumber::DestinationFloor:
    case enq::DataNumber::Load:
      break;
    default:
      ignored_frames_++;
      return std::nullopt;
  }

  ElevatorReduction result = ReduceElevatorState(state_, frame);
  state_ = result.state;

  if (result.event && renderer_ != nullptr) {
    renderer_->OnElevatorEvent(*result.event, state_);
  }
  return result.event;
}

}  // namespace elevator_link
