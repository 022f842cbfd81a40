#pragma once

#include <cstdint>
#include <optional>

#include "enq_protocol.hpp"

namespace elevator_link {

/**
 * @brief Вид события лифта
 */
enum class ElevatorEventKind : uint8_t {
  MotionStarted = 0,  ///< Появилось новое назначение
  Arrival,            ///< Текущий этаж совпал с назначением
  LoadChanged         ///< Изменилась нагрузка
};

/**
 * @brief Событие, выведенное из потока кадров
 *
 * MotionStarted: from_floor (если текущий этаж известен) → floor.
 * Arrival: floor, этаж прибытия.
 * LoadChanged: load_kg, новая нагрузка.
 */
struct ElevatorEvent {
  ElevatorEventKind kind{ElevatorEventKind::MotionStarted};
  std::optional<int16_t> from_floor;
  int16_t floor{0};
  uint16_t load_kg{0};

  bool operator==(const ElevatorEvent&) const = default;
};

/**
 * @brief Состояние лифта
 *
 * Пустые optional означают «ещё не получено» (или «назначения нет»).
 */
struct ElevatorState {
  std::optional<int16_t> current_floor;
  std::optional<int16_t> destination_floor;
  std::optional<uint16_t> load_kg;
  std::optional<ElevatorEvent> last_event;

  bool operator==(const ElevatorState&) const = default;
};

/**
 * @brief Результат одного шага редукции
 */
struct ElevatorReduction {
  ElevatorState state;
  std::optional<ElevatorEvent> event;
};

/**
 * @brief Чистый шаг редукции: (состояние, кадр) → (новое состояние, событие)
 *
 * Без таймеров и скрытого состояния: одинаковые входы дают одинаковый
 * результат. Неизвестный номер данных не меняет состояние.
 */
[[nodiscard]] ElevatorReduction ReduceElevatorState(
    const ElevatorState& state, const enq::EnqFrame& frame) noexcept;

/**
 * @brief Получатель событий (отрисовка, журнал)
 *
 * Вызывается синхронно, в порядке прихода кадров.
 */
class ElevatorRenderer {
 public:
  virtual ~ElevatorRenderer() = default;

  /**
   * @brief Новое событие
   * @param event Событие
   * @param state Состояние после применения кадра
   */
  virtual void OnElevatorEvent(const ElevatorEvent& event,
                               const ElevatorState& state) = 0;
};

/**
 * @brief Трекер состояния лифта (сторона приёмника)
 *
 * Единственный владелец ElevatorState. Принимает по одному проверенному
 * кадру и передаёт события получателю.
 *
 * @example
 * @code
 * ElevatorTracker tracker(&renderer);
 * framer.Feed(bytes, [&](const enq::EnqFrame& f) { tracker.Apply(f); });
 * @endcode
 */
class ElevatorTracker {
 public:
  explicit ElevatorTracker(ElevatorRenderer* renderer = nullptr) noexcept
      : renderer_(renderer) {}

  /**
   * @brief Применить кадр
   * @param frame Проверенный кадр
   * @return Событие, если кадр его породил
   */
  std::optional<ElevatorEvent> Apply(const enq::EnqFrame& frame);

  [[nodiscard]] const ElevatorState& GetState() const noexcept {
    return state_;
  }

  /** Кадры с неизвестным номером данных (проигнорированы). */
  [[nodiscard]] uint32_t GetIgnoredFrames() const noexcept {
    return ignored_frames_;
  }

  void SetRenderer(ElevatorRenderer* renderer) noexcept {
    renderer_ = renderer;
  }

  void Reset() noexcept {
    state_ = ElevatorState{};
    ignored_frames_ = 0;
  }

 private:
  ElevatorState state_;
  ElevatorRenderer* renderer_;
  uint32_t ignored_frames_{0};
};

}  // namespace elevator_link
