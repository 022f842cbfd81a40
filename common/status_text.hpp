#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "config.hpp"
#include "elevator_tracker.hpp"
#include "link_platform.hpp"

namespace elevator_link {

// ═══════════════════════════════════════════════════════════════════════════
// Форматирование
// ═══════════════════════════════════════════════════════════════════════════

/** Этаж: 3 → "3F", -1 → "B1F". */
[[nodiscard]] std::string FormatFloor(int16_t floor);

/**
 * Обратное к FormatFloor: "3F", "3", "B1F", "B1", "-1".
 * @return std::nullopt для некорректной строки
 */
[[nodiscard]] std::optional<int16_t> ParseFloor(std::string_view text);

/**
 * Строка события для журнала:
 * "Moving: 1F -> 3F", "Arrived: 3F", "Load: 1200kg".
 */
[[nodiscard]] std::string FormatEvent(const ElevatorEvent& event);

/** Сводка: "Floor: 1F | Destination: 3F | Load: 850kg" ("--" если неизвестно). */
[[nodiscard]] std::string FormatState(const ElevatorState& state);

/** HEX-дамп без разделителей, верхний регистр: "0530303031...". */
[[nodiscard]] std::string FormatHex(std::span<const uint8_t> bytes);

/** ASCII-дамп: непечатаемые байты заменяются на '.'. */
[[nodiscard]] std::string FormatAscii(std::span<const uint8_t> bytes);

/** Время с момента старта: "HH:MM:SS". */
[[nodiscard]] std::string FormatUptime(uint32_t ms);

// ═══════════════════════════════════════════════════════════════════════════
// Журнал событий
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Журнал последних событий («лог приёма ENQ»)
 *
 * Хранит не более capacity строк вида "[00:00:15] Arrived: 3F", старые
 * строки вытесняются. Подключается к трекеру как получатель событий.
 */
class EventLog : public ElevatorRenderer {
 public:
  explicit EventLog(const LinkPlatform& platform,
                    size_t capacity = config::MonitorConfig::kEventLogCapacity)
      : platform_(platform), capacity_(capacity) {}

  void OnElevatorEvent(const ElevatorEvent& event,
                       const ElevatorState& state) override;

  /** Добавить произвольную строку с отметкой времени. */
  void Add(std::string_view text);

  [[nodiscard]] const std::deque<std::string>& Lines() const noexcept {
    return lines_;
  }

  [[nodiscard]] size_t Capacity() const noexcept { return capacity_; }

  void Clear() noexcept { lines_.clear(); }

 private:
  const LinkPlatform& platform_;
  size_t capacity_;
  std::deque<std::string> lines_;
};

}  // namespace elevator_link
