#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "enq_protocol.hpp"

namespace elevator_link::enq {

// ═══════════════════════════════════════════════════════════════════════════
// Буфер приёма
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Буфер приёма с управлением позицией.
 * Данные всегда лежат с начала массива, потреблённые байты сдвигаются.
 */
class RxBuffer {
 public:
  static constexpr size_t CAPACITY = 1024;

  RxBuffer() = default;

  /**
   * Получить span для записи новых данных.
   * @return Доступное пространство для записи
   */
  [[nodiscard]] std::span<uint8_t> Available() noexcept {
    return std::span(data_.data() + pos_, CAPACITY - pos_);
  }

  /**
   * Получить span текущих данных.
   * @return Данные в буфере
   */
  [[nodiscard]] std::span<const uint8_t> Data() const noexcept {
    return std::span(data_.data(), pos_);
  }

  /**
   * Продвинуть позицию записи на n байт.
   * @param n Количество записанных байт
   */
  void Advance(size_t n) noexcept {
    pos_ += n;
    if (pos_ > CAPACITY) pos_ = CAPACITY;
  }

  /**
   * Скопировать байты в свободное место буфера.
   * @return Сколько байт поместилось
   */
  size_t Append(std::span<const uint8_t> bytes) noexcept;

  /**
   * Потребить n байт из начала буфера.
   * @param n Количество байт для удаления
   */
  void Consume(size_t n) noexcept;

  /**
   * Пропустить один байт (ложный маркер или битый кадр).
   */
  void SkipOne() noexcept;

  void Reset() noexcept { pos_ = 0; }


  [[nodiscard]] size_t Position() const noexcept { return pos_; }

 private:
  std::array<uint8_t, CAPACITY> data_{};
  size_t pos_{0};
};

// ═══════════════════════════════════════════════════════════════════════════
// Статистика приёма
// ═══════════════════════════════════════════════════════════════════════════

struct FramerStats {
  uint32_t frames{0};            // принятые кадры
  uint32_t noise_bytes{0};       // байты до маркера, отброшенные при поиске
  uint32_t checksum_errors{0};   // окна с неверной суммой
  uint32_t malformed_frames{0};  // окна с неверными символами
  uint32_t dropped_on_close{0};  // неполный хвост при Close()

  [[nodiscard]] uint32_t Rejected() const noexcept {
    return checksum_errors + malformed_frames;
  }
};

// ═══════════════════════════════════════════════════════════════════════════
// Выделение кадров из потока байт
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Выделяет кадры ENQ из произвольного потока байт.
 *
 * Байты приходят кусками любой длины (Push/Feed). Перед маркером всё
 * отбрасывается как шум. Кадр разбирается, только когда от маркера накоплено
 * FRAME_SIZE байт; при ошибке разбора буфер сдвигается ровно на один байт,
 * чтобы не потерять валидный кадр сразу за битым.
 *
 * Ошибки входных данных наружу не передаются, только в статистику.
 *
 * @example
 * @code
 * EnqFramer framer;
 * framer.Feed(chunk, [&](const EnqFrame& frame) { tracker.Apply(frame); });
 * @endcode
 */
class EnqFramer {
 public:
  EnqFramer() = default;

  /**
   * Добавить байты в буфер приёма.
   * @param bytes Очередной кусок потока
   * @return Сколько байт принято (меньше size(), если буфер заполнен; 0 после
   * Close())
   */
  size_t Push(std::span<const uint8_t> bytes) noexcept;

  /**
   * Извлечь следующий валидный кадр из буфера.
   * @return Кадр или std::nullopt, если нужно больше данных
   */
  [[nodiscard]] std::optional<EnqFrame> Next() noexcept;

  /**
   * Добавить байты и сразу выдать все готовые кадры.
   * Кусок может быть больше ёмкости буфера.
   * @param bytes Очередной кусок потока
   * @param on_frame Вызывается для каждого кадра в порядке приёма
   * @return Число выданных кадров
   */
  template <std::invocable<const EnqFrame&> Callback>
  size_t Feed(std::span<const uint8_t> bytes, Callback&& on_frame) {
    size_t emitted = 0;
    while (!bytes.empty() && !closed_) {
      size_t accepted = Push(bytes);
      bytes = bytes.subspan(accepted);
      while (auto frame = Next()) {
        on_frame(*frame);
        emitted++;
      }
      if (accepted == 0) break;
    }
    return emitted;
  }

  /**
   * Сигнал «данных больше не будет».
   * Неполный хвост отбрасывается, дальнейший ввод игнорируется.
   */
  void Close() noexcept;

  [[nodiscard]] bool IsClosed() const noexcept { return closed_; }

  /** Сбросить буфер, статистику и признак закрытия. */
  void Reset() noexcept;

  [[nodiscard]] const FramerStats& GetStats() const noexcept { return stats_; }

  /** Число байт, ожидающих продолжения кадра. */
  [[nodiscard]] size_t Pending() const noexcept {
    return rx_buffer_.Position();
  }

 private:
  RxBuffer rx_buffer_;
  FramerStats stats_;
  bool closed_{false};

  /**
   * Выровнять буфер: отбросить шум до маркера.
   * @return true если буфер начинается с маркера
   */
  bool Align() noexcept;
};

}  // namespace elevator_link::enq
