#pragma once

#include <cstddef>
#include <cstdint>

#include "config_common.hpp"

namespace elevator_link::config {

/**
 * @brief Конфигурация протокола ENQ
 */
struct EnqConfig {
  static constexpr uint16_t kStation = 1;  ///< Номер станции (лифта)
};

/**
 * @brief Конфигурация последовательного порта
 */
struct SerialConfig {
  static constexpr uint32_t kBaudRate = UART_BAUD_RATE;  ///< Скорость, бит/с
  static constexpr uint8_t kDataBits = 8;      ///< Биты данных
  static constexpr bool kParityEven = true;    ///< Чётность: even
  static constexpr uint8_t kStopBits = 1;      ///< Стоп-биты
  static constexpr size_t kReadChunk = 64;     ///< Максимум байт за одно чтение
};

/**
 * @brief Тайминги сценария симулятора
 */
struct ScenarioTiming {
  static constexpr uint8_t kSendsPerPhase = 5;  ///< Кадров в фазе отправки
  static constexpr uint32_t kSendIntervalMs =
      1000;  ///< Интервал между кадрами в фазе
  static constexpr uint32_t kShortWaitMs =
      3000;  ///< Пауза после текущего этажа и после назначения
  static constexpr uint32_t kCycleWaitMs = 5000;  ///< Пауза в конце цикла
};

/**
 * @brief Сценарий по умолчанию: 1F → 3F → B1F → 2F
 */
struct ScenarioDefaults {
  static constexpr int16_t kStartFloor = SIMULATOR_START_FLOOR;
  static constexpr int16_t kDestinations[] = {3, -1, 2};
  static constexpr uint16_t kLoadsKg[] = {850, 1200, 650};
};

/**
 * @brief Конфигурация монитора (приёмник)
 */
struct MonitorConfig {
  static constexpr uint32_t kPollIntervalMs =
      MONITOR_POLL_INTERVAL_MS;  ///< Пауза, если данных нет
  static constexpr uint32_t kIdleWarningMs =
      MONITOR_IDLE_WARNING_MS;  ///< Сообщение «нет данных» не чаще этого интервала
  static constexpr size_t kEventLogCapacity = 8;  ///< Строк в журнале событий
};

/**
 * @brief Конфигурация симулятора (передатчик)
 */
struct SimulatorConfig {
  static constexpr uint32_t kMaxSleepMs =
      100;  ///< Максимальный сон, чтобы вовремя увидеть сигнал остановки
};

}  // namespace elevator_link::config
