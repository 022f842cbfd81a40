#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <variant>

namespace elevator_link::enq {

// ═══════════════════════════════════════════════════════════════════════════
// Константы протокола
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr uint8_t FRAME_MARKER = 0x05;  // ENQ
inline constexpr size_t FRAME_SIZE = 16;

// marker(1) + station(4) + command(1) + data_number(4) + data_value(4) + sum(2)
inline constexpr size_t STATION_OFFSET = 1;
inline constexpr size_t STATION_DIGITS = 4;
inline constexpr size_t COMMAND_OFFSET = 5;
inline constexpr size_t DATA_NUMBER_OFFSET = 6;
inline constexpr size_t DATA_NUMBER_DIGITS = 4;
inline constexpr size_t DATA_VALUE_OFFSET = 10;
inline constexpr size_t DATA_VALUE_DIGITS = 4;
inline constexpr size_t CHECKSUM_OFFSET = 14;
inline constexpr size_t CHECKSUM_DIGITS = 2;

// Контрольная сумма считается по байтам между маркером и полем суммы
inline constexpr size_t CHECKSUM_SPAN = CHECKSUM_OFFSET - STATION_OFFSET;

inline constexpr uint16_t MAX_DECIMAL_FIELD = 9999;

// ═══════════════════════════════════════════════════════════════════════════
// Коды команд и номера данных
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Код команды (один байт на линии).
 * Перечисление открыто: любой байт декодируется и кодируется обратно без
 * изменений, даже если у него нет имени.
 */
enum class Command : uint8_t {
  Write = 0x57  // 'W', уведомление/запись
};

/** Номер данных: определяет смысл поля data_value. */
enum class DataNumber : uint16_t {
  CurrentFloor = 1,
  DestinationFloor = 2,
  Load = 3
};

// ═══════════════════════════════════════════════════════════════════════════
// Ошибки парсинга
// ═══════════════════════════════════════════════════════════════════════════

enum class ParseError {
  InsufficientData,
  MalformedFrame,
  ChecksumMismatch,
  BufferTooSmall,
  InvalidField
};

// ═══════════════════════════════════════════════════════════════════════════
// Result type (альтернатива std::expected для C++23)
// ═══════════════════════════════════════════════════════════════════════════

template <typename T>
using Result = std::variant<T, ParseError>;

template <typename T>
[[nodiscard]] inline bool IsOk(const Result<T>& r) noexcept {
  return std::holds_alternative<T>(r);
}

template <typename T>
[[nodiscard]] inline bool IsError(const Result<T>& r) noexcept {
  return std::holds_alternative<ParseError>(r);
}

template <typename T>
[[nodiscard]] inline const T& GetValue(const Result<T>& r) noexcept {
  return std::get<T>(r);
}

template <typename T>
[[nodiscard]] inline ParseError GetError(const Result<T>& r) noexcept {
  return std::get<ParseError>(r);
}

// ═══════════════════════════════════════════════════════════════════════════
// Структуры данных
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Кадр ENQ (16 байт на линии).
 * Контрольная сумма не хранится: она вычисляется при сборке и проверяется
 * при разборе.
 */
struct EnqFrame {
  uint16_t station{0};               // 0..9999, 4 десятичные цифры
  Command command{Command::Write};   // 1 байт
  uint16_t data_number{0};           // 0..9999, 4 десятичные цифры
  uint16_t data_value{0};            // 4 hex-цифры, смысл зависит от номера

  [[nodiscard]] DataNumber Kind() const noexcept {
    return static_cast<DataNumber>(data_number);
  }

  bool operator==(const EnqFrame&) const = default;
};

// ═══════════════════════════════════════════════════════════════════════════
// Значения этажей и нагрузки
// ═══════════════════════════════════════════════════════════════════════════

// Этаж передаётся как int16 в дополнительном коде: 0xFFFF = B1F, 0x0003 = 3F.
[[nodiscard]] constexpr uint16_t EncodeFloor(int16_t floor) noexcept {
  return static_cast<uint16_t>(floor);
}

[[nodiscard]] constexpr int16_t DecodeFloor(uint16_t value) noexcept {
  return static_cast<int16_t>(value);
}

[[nodiscard]] constexpr bool IsBasementFloor(int16_t floor) noexcept {
  return floor < 0;
}

// Для этажа назначения 0x0000 означает «назначения нет».
[[nodiscard]] constexpr uint16_t EncodeDestination(
    std::optional<int16_t> floor) noexcept {
  return floor.has_value() ? EncodeFloor(*floor) : 0;
}

[[nodiscard]] constexpr std::optional<int16_t> DecodeDestination(
    uint16_t value) noexcept {
  if (value == 0) return std::nullopt;
  return DecodeFloor(value);
}

// Нагрузка в килограммах, без знака.
[[nodiscard]] constexpr uint16_t EncodeLoad(uint16_t load_kg) noexcept {
  return load_kg;
}

[[nodiscard]] constexpr uint16_t DecodeLoad(uint16_t value) noexcept {
  return value;
}

// ═══════════════════════════════════════════════════════════════════════════
// Основной API протокола
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Сериализация и десериализация кадров ENQ.
 * Не хранит состояния: все методы статические.
 */
class Protocol {
 public:
  // ─────────────────────────────────────────────────────────────────────────
  // Сборка кадров
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * Построить кадр ENQ.
   * @param buffer Буфер для записи (минимум FRAME_SIZE байт)
   * @param frame Поля кадра
   * @return Размер кадра (FRAME_SIZE) или ошибка
   */
  [[nodiscard]] static Result<size_t> BuildFrame(
      std::span<uint8_t> buffer, const EnqFrame& frame) noexcept;

  [[nodiscard]] static EnqFrame MakeCurrentFloorFrame(uint16_t station,
                                                      int16_t floor) noexcept;

  [[nodiscard]] static EnqFrame MakeDestinationFrame(
      uint16_t station, std::optional<int16_t> floor) noexcept;

  [[nodiscard]] static EnqFrame MakeLoadFrame(uint16_t station,
                                              uint16_t load_kg) noexcept;

  // ─────────────────────────────────────────────────────────────────────────
  // Парсинг кадров
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * Распарсить кадр ENQ, начинающийся с buffer[0].
   * Лишние байты после FRAME_SIZE игнорируются.
   * @param buffer Буфер с данными
   * @return Кадр или ошибка (InsufficientData, MalformedFrame,
   * ChecksumMismatch)
   */
  [[nodiscard]] static Result<EnqFrame> ParseFrame(
      std::span<const uint8_t> buffer) noexcept;

  // ─────────────────────────────────────────────────────────────────────────
  // Утилиты
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * Вычислить контрольную сумму: 8-битная сумма байтов по модулю 256.
   * @param data Байты между маркером и полем суммы (CHECKSUM_SPAN)
   * @return Контрольная сумма
   */
  [[nodiscard]] static uint8_t CalculateChecksum(
      std::span<const uint8_t> data) noexcept;

  /**
   * Найти маркер начала кадра (0x05) в буфере.
   * @param buffer Буфер для поиска
   * @return Индекс маркера или -1 если не найден
   */
  [[nodiscard]] static int FindFrameStart(
      std::span<const uint8_t> buffer) noexcept;
};

}  // namespace elevator_link::enq
