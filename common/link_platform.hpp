#pragma once

#include <cstdint>
#include <string_view>

namespace elevator_link {

/**
 * @brief Уровни логирования
 */
enum class LogLevel : uint8_t { Info = 0, Warning, Error };

/**
 * @brief Абстрактный интерфейс платформы для монитора и симулятора
 *
 * Предоставляет платформенные сервисы: время, логирование, задержки.
 * Последовательный порт обслуживает EnqLinkBase.
 *
 * Реализация предоставляется целевой платформой (Linux) или тестами.
 */
class LinkPlatform {
 public:
  virtual ~LinkPlatform() = default;

  // ─────────────────────────────────────────────────────────────────────────
  // Время
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * @brief Текущее время в миллисекундах
   * @return Монотонное время с момента старта
   */
  [[nodiscard]] virtual uint32_t GetTimeMs() const noexcept = 0;

  /**
   * @brief Заснуть на заданное время
   * @param ms Длительность в миллисекундах
   */
  virtual void DelayMs(uint32_t ms) = 0;

  // ─────────────────────────────────────────────────────────────────────────
  // Логирование
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * @brief Вывод лог-сообщения
   * @param level Уровень важности
   * @param msg Текст сообщения (UTF-8)
   */
  virtual void Log(LogLevel level, std::string_view msg) const = 0;
};

}  // namespace elevator_link
