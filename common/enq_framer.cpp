#include "enq_framer.hpp"

#include <cstring>

namespace elevator_link::enq {

// ═══════════════════════════════════════════════════════════════════════════
// RxBuffer - реализация
// ═══════════════════════════════════════════════════════════════════════════

size_t RxBuffer::Append(std::span<const uint8_t> bytes) noexcept {
  auto available = Available();
  size_t n = bytes.size() < available.size() ? bytes.size() : available.size();
  if (n > 0) {
    std::memcpy(available.data(), bytes.data(), n);
    Advance(n);
  }
  return n;
}

void RxBuffer::Consume(size_t n) noexcept {
  if (n == 0 || n > pos_) return;

  std::memmove(data_.data(), data_.data() + n, pos_ - n);
  pos_ -= n;
}

void RxBuffer::SkipOne() noexcept {
  if (pos_ > 0) {
    Consume(1);
  }
}

// ═══════════════════════════════════════════════════════════════════════════
// EnqFramer - реализация
// ═══════════════════════════════════════════════════════════════════════════

size_t EnqFramer::Push(std::span<const uint8_t> bytes) noexcept {
  if (closed_) {
    return 0;
  }
  return rx_buffer_.Append(bytes);
}

bool EnqFramer::Align() noexcept {
  int start = Protocol::FindFrameStart(rx_buffer_.Data());

  if (start < 0) {
    // Маркера нет: ни один из этих байт не может начать кадр
    stats_.noise_bytes += static_cast<uint32_t>(rx_buffer_.Position());
    rx_buffer_.Reset();
    return false;
  }

  if (start > 0) {
    stats_.noise_bytes += static_cast<uint32_t>(start);
    rx_buffer_.Consume(static_cast<size_t>(start));
  }

  return true;
}

std::optional<EnqFrame> EnqFramer::Next() noexcept {
  while (Align()) {
    auto data = rx_buffer_.Data();

    // Ждём полный кадр от маркера
    if (data.size() < FRAME_SIZE) {
      return std::nullopt;
    }

    auto result = Protocol::ParseFrame(data.first(FRAME_SIZE));

    if (IsOk(result)) {
      rx_buffer_.Consume(FRAME_SIZE);
      stats_.frames++;
      return GetValue(result);
    }

    if (GetError(result) == ParseError::ChecksumMismatch) {
      stats_.checksum_errors++;
    } else {
      stats_.malformed_frames++;
    }

    // Битый кадр или ложный маркер: сдвиг на 1 байт и повторный поиск
    rx_buffer_.SkipOne();
  }

  return std::nullopt;
}

void EnqFramer::Close() noexcept {
  stats_.dropped_on_close += static_cast<uint32_t>(rx_buffer_.Position());
  rx_buffer_.Reset();
  closed_ = true;
}

void EnqFramer::Reset() noexcept {
  rx_buffer_.Reset();
  stats_ = FramerStats{};
  closed_ = false;
}

}  // namespace elevator_link::enq
