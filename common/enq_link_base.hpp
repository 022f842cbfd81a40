#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>

#include "config.hpp"
#include "enq_framer.hpp"
#include "enq_protocol.hpp"

namespace elevator_link {

// ═══════════════════════════════════════════════════════════════════════════
// Типы данных
// ═══════════════════════════════════════════════════════════════════════════

/** Ошибки канала связи. */
enum class LinkError : uint8_t {
  Ok = 0,
  OpenFailed,
  ConfigFailed,
  WriteFailure,
  ReadFailure,
  EncodeFailure
};

/** Название ошибки для логов. */
[[nodiscard]] const char* LinkErrorName(LinkError error) noexcept;

// ═══════════════════════════════════════════════════════════════════════════
// Концепты
// ═══════════════════════════════════════════════════════════════════════════

/** Непрерывный буфер байт для чтения/записи (data(), size()). */
template <typename T>
concept Bufferable = requires(T &t) {
  { t.data() } -> std::convertible_to<const uint8_t *>;
  { t.size() } -> std::convertible_to<size_t>;
};

// ═══════════════════════════════════════════════════════════════════════════
// Базовый класс канала ENQ
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Базовый класс канала ENQ (лифт → монитор).
 * Наследники реализуют Init(), Write(), ReadAvailable() под конкретный
 * транспорт. Кодирование кадров и выделение их из потока реализованы в базе.
 */
class EnqLinkBase {
 public:
  virtual ~EnqLinkBase() = default;

  /**
   * Открыть и настроить транспорт.
   * @return LinkError::Ok при успехе
   */
  [[nodiscard]] virtual LinkError Init() = 0;

  // ─────────────────────────────────────────────────────────────────────────
  // Шаблонные методы для работы с контейнерами
  // ─────────────────────────────────────────────────────────────────────────

  /** Запись из контейнера (std::vector, std::array, std::span и т.п.). */
  template <Bufferable Container>
  int Write(const Container &data) {
    return Write(data.data(), data.size());
  }

  /** Чтение в контейнер. size() задаёт макс. число байт для чтения. */
  template <Bufferable Container>
  int ReadAvailable(Container &buf) {
    return ReadAvailable(buf.data(), buf.size());
  }

  // ─────────────────────────────────────────────────────────────────────────
  // Передача (симулятор)
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * Закодировать и отправить кадр.
   * @param frame Поля кадра
   * @return LinkError::Ok при успехе
   */
  [[nodiscard]] LinkError SendFrame(const enq::EnqFrame &frame);

  /** Байты последнего кадра, отправленного SendFrame() (для TX-дампа). */
  [[nodiscard]] std::span<const uint8_t> LastTx() const noexcept {
    return std::span(tx_frame_.data(), last_tx_size_);
  }

  // ─────────────────────────────────────────────────────────────────────────
  // Приём (монитор)
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * Прочитать доступные байты и выдать все готовые кадры.
   * @param on_frame Вызывается для каждого валидного кадра
   * @return LinkError::ReadFailure при ошибке транспорта
   */
  template <std::invocable<const enq::EnqFrame &> Callback>
  [[nodiscard]] LinkError PumpRx(Callback &&on_frame) {
    last_rx_size_ = 0;
    int n = ReadAvailable(rx_chunk_);
    if (n < 0) {
      return LinkError::ReadFailure;
    }
    last_rx_size_ = static_cast<size_t>(n);
    framer_.Feed(LastRx(), on_frame);
    return LinkError::Ok;
  }

  /** Байты, прочитанные последним PumpRx() (для HEX/ASCII-дампа). */
  [[nodiscard]] std::span<const uint8_t> LastRx() const noexcept {
    return std::span(rx_chunk_.data(), last_rx_size_);
  }

  /** Данных больше не будет: сбросить неполный кадр в приёмнике. */
  void CloseRx() noexcept { framer_.Close(); }

  [[nodiscard]] const enq::FramerStats &GetRxStats() const noexcept {
    return framer_.GetStats();
  }

 protected:
  /**
   * Записать в транспорт (платформенная реализация).
   * @param data Данные для записи
   * @param len Длина данных
   * @return 0 при успехе, -1 при ошибке
   */
  virtual int Write(const uint8_t *data, size_t len) = 0;

  /**
   * Прочитать доступные байты (неблокирующий, платформенная реализация).
   * @param buf Буфер для чтения
   * @param max_len Максимальное количество байт
   * @return Число прочитанных байт, 0 если нет данных, -1 при ошибке
   */
  virtual int ReadAvailable(uint8_t *buf, size_t max_len) = 0;

  EnqLinkBase() = default;

 private:
  enq::EnqFramer framer_;
  std::array<uint8_t, enq::FRAME_SIZE> tx_frame_{};
  size_t last_tx_size_{0};
  std::array<uint8_t, config::SerialConfig::kReadChunk> rx_chunk_{};
  size_t last_rx_size_{0};
};

}  // namespace elevator_link
