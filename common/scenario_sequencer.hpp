#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <vector>

#include "config.hpp"
#include "enq_protocol.hpp"

namespace elevator_link {

/**
 * @brief Фаза сценария симулятора
 */
enum class ScenarioPhase : uint8_t {
  SendCurrentFloor = 0,  ///< Текущий этаж (×5, 1 с)
  WaitAfterFloor,        ///< Пауза 3 с
  SendDestination,       ///< Этаж назначения (×5, 1 с)
  WaitAfterDestination,  ///< Пауза 3 с
  SendArrivalClear,      ///< Назначение = 0, «прибыл» (×5, 1 с)
  SendLoadChange,        ///< Нагрузка (×5, 1 с)
  WaitEndOfCycle         ///< Пауза 5 с, затем следующий цикл
};

inline constexpr size_t kScenarioPhaseCount = 7;

/**
 * @brief Параметры сценария
 *
 * destinations и loads задают сценарий по циклам (по кругу). Пустой список
 * назначений означает «назначения нет»; пустой список нагрузок означает 0 кг,
 * один элемент задаёт постоянную нагрузку.
 */
struct ScenarioConfig {
  uint16_t station{config::EnqConfig::kStation};
  int16_t start_floor{config::ScenarioDefaults::kStartFloor};
  std::vector<int16_t> destinations{
      std::begin(config::ScenarioDefaults::kDestinations),
      std::end(config::ScenarioDefaults::kDestinations)};
  std::vector<uint16_t> loads_kg{std::begin(config::ScenarioDefaults::kLoadsKg),
                                 std::end(config::ScenarioDefaults::kLoadsKg)};
  uint8_t sends_per_phase{config::ScenarioTiming::kSendsPerPhase};
  uint32_t send_interval_ms{config::ScenarioTiming::kSendIntervalMs};
  uint32_t short_wait_ms{config::ScenarioTiming::kShortWaitMs};
  uint32_t cycle_wait_ms{config::ScenarioTiming::kCycleWaitMs};
};

/**
 * @brief Сценарий лифта - детерминированный автомат по времени
 *
 * Фазы идут по кругу в фиксированном порядке. Фаза отправки из N кадров с
 * интервалом T выдаёт кадр при входе и далее каждые T, заканчивается через
 * N·T. Сроки сдвигаются на номинальный интервал, поэтому последовательность
 * кадров не зависит от того, насколько точно вызывается Update().
 *
 * @example
 * @code
 * ScenarioSequencer seq(ScenarioConfig{});
 * if (auto frame = seq.Update(platform.GetTimeMs())) {
 *   link.SendFrame(*frame);
 * }
 * @endcode
 */
class ScenarioSequencer {
 public:
  explicit ScenarioSequencer(ScenarioConfig config);

  /**
   * @brief Продвинуть автомат к моменту now_ms
   * @param now_ms Текущее время в миллисекундах (монотонное)
   * @return Кадр, который нужно отправить сейчас (не более одного за вызов)
   */
  [[nodiscard]] std::optional<enq::EnqFrame> Update(uint32_t now_ms);

  /**
   * @brief Сколько ждать до следующего события автомата
   * @return 0, если событие уже наступило или автомат ещё не запущен
   */
  [[nodiscard]] uint32_t MsUntilNextEvent(uint32_t now_ms) const noexcept;

  /**
   * @brief Начать сценарий заново с заданного этажа
   *
   * Первый Update() после перезапуска выдаёт первый кадр SendCurrentFloor.
   */
  void Restart(int16_t start_floor) noexcept;

  [[nodiscard]] ScenarioPhase GetPhase() const noexcept { return phase_; }
  [[nodiscard]] uint32_t GetCycle() const noexcept { return cycle_; }
  [[nodiscard]] int16_t GetCurrentFloor() const noexcept {
    return current_floor_;
  }
  /** Назначение текущего цикла (std::nullopt, если назначения нет). */
  [[nodiscard]] std::optional<int16_t> GetDestination() const noexcept;
  [[nodiscard]] uint16_t GetLoadKg() const noexcept;
  [[nodiscard]] const ScenarioConfig& GetConfig() const noexcept {
    return config_;
  }

 private:
  ScenarioConfig config_;
  ScenarioPhase phase_{ScenarioPhase::SendCurrentFloor};
  uint8_t sent_in_phase_{0};
  uint32_t next_due_ms_{0};
  bool started_{false};
  uint32_t cycle_{0};
  int16_t current_floor_;

  [[nodiscard]] static bool IsSendPhase(ScenarioPhase phase) noexcept;
  void AdvancePhase() noexcept;
  [[nodiscard]] enq::EnqFrame MakeFrame() const noexcept;
};

}  // namespace elevator_link
