#pragma once

#include <atomic>
#include <cstdint>

#include "enq_link_base.hpp"
#include "link_platform.hpp"
#include "scenario_sequencer.hpp"

namespace elevator_link {

/**
 * @brief Симулятор лифта (сторона передатчика)
 *
 * Берёт кадры из ScenarioSequencer по времени платформы и отправляет их в
 * канал. Каждый кадр отправляется целиком до следующего шага.
 */
class ElevatorSimulator {
 public:
  ElevatorSimulator(LinkPlatform& platform, EnqLinkBase& link,
                    ScenarioConfig config, bool log_frames = true);

  ElevatorSimulator(const ElevatorSimulator&) = delete;
  ElevatorSimulator& operator=(const ElevatorSimulator&) = delete;

  /**
   * @brief Отправить кадр, если по сценарию он положен сейчас
   * @return Ошибка транспорта или LinkError::Ok
   */
  [[nodiscard]] LinkError Tick();

  /**
   * @brief Цикл до сигнала остановки или ошибки транспорта
   * @param stop Флаг остановки
   * @return LinkError::Ok при штатной остановке
   */
  [[nodiscard]] LinkError Run(const std::atomic<bool>& stop);

  [[nodiscard]] const ScenarioSequencer& GetSequencer() const noexcept {
    return sequencer_;
  }

  [[nodiscard]] uint32_t GetSentFrames() const noexcept { return sent_frames_; }

 private:
  LinkPlatform& platform_;
  EnqLinkBase& link_;
  ScenarioSequencer sequencer_;
  bool log_frames_;
  uint32_t sent_frames_{0};
};

}  // namespace elevator_link
