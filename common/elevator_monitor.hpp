#pragma once

#include <atomic>
#include <cstdint>

#include "config.hpp"
#include "enq_framer.hpp"
#include "enq_link_base.hpp"
#include "elevator_tracker.hpp"
#include "link_platform.hpp"

namespace elevator_link {

/**
 * @brief Параметры монитора
 */
struct MonitorOptions {
  bool dump_raw{false};  ///< Логировать принятые байты (HEX/ASCII)
  uint32_t poll_interval_ms{config::MonitorConfig::kPollIntervalMs};
  uint32_t idle_warning_ms{config::MonitorConfig::kIdleWarningMs};
};

/**
 * @brief Монитор лифта (сторона приёмника)
 *
 * Цикл чтения: байты из канала → выделение кадров → трекер → получатель
 * событий. Каждый кадр применяется синхронно до следующего чтения, поэтому
 * состояние лифта не требует блокировок.
 */
class ElevatorMonitor : private ElevatorRenderer {
 public:
  /**
   * @param platform Время и логирование
   * @param link Канал приёма (должен быть инициализирован)
   * @param renderer Внешний получатель событий (может быть nullptr)
   * @param options Параметры
   */
  ElevatorMonitor(LinkPlatform& platform, EnqLinkBase& link,
                  ElevatorRenderer* renderer, MonitorOptions options = {});

  ElevatorMonitor(const ElevatorMonitor&) = delete;
  ElevatorMonitor& operator=(const ElevatorMonitor&) = delete;

  /**
   * @brief Одно чтение из канала
   * @return Ошибка транспорта или LinkError::Ok
   */
  [[nodiscard]] LinkError Poll();

  /**
   * @brief Цикл чтения до сигнала остановки или ошибки транспорта
   * @param stop Флаг остановки (выставляется из обработчика сигнала)
   * @return LinkError::Ok при штатной остановке
   */
  [[nodiscard]] LinkError Run(const std::atomic<bool>& stop);

  [[nodiscard]] const ElevatorState& GetState() const noexcept {
    return tracker_.GetState();
  }

  [[nodiscard]] const ElevatorTracker& GetTracker() const noexcept {
    return tracker_;
  }

 private:
  LinkPlatform& platform_;
  EnqLinkBase& link_;
  ElevatorRenderer* renderer_;
  MonitorOptions options_;
  ElevatorTracker tracker_;
  uint32_t last_activity_ms_{0};
  enq::FramerStats reported_stats_{};

  void OnElevatorEvent(const ElevatorEvent& event,
                       const ElevatorState& state) override;
  void ReportRejections();
  void CheckIdle(uint32_t now_ms);
};

}  // namespace elevator_link
