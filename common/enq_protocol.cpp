#include "enq_protocol.hpp"

namespace elevator_link::enq {

namespace {

constexpr char kHexDigits[] = "0123456789ABCDEF";

// ─────────────────────────────────────────────────────────────────────────
// Запись полей в ASCII
// ─────────────────────────────────────────────────────────────────────────

void WriteDecimal(std::span<uint8_t> out, uint16_t value) noexcept {
  for (size_t i = out.size(); i > 0; i--) {
    out[i - 1] = static_cast<uint8_t>('0' + value % 10);
    value /= 10;
  }
}

void WriteHex(std::span<uint8_t> out, uint16_t value) noexcept {
  for (size_t i = out.size(); i > 0; i--) {
    out[i - 1] = static_cast<uint8_t>(kHexDigits[value & 0x0F]);
    value >>= 4;
  }
}

// ─────────────────────────────────────────────────────────────────────────
// Чтение полей из ASCII
// ─────────────────────────────────────────────────────────────────────────

std::optional<uint16_t> ReadDecimal(std::span<const uint8_t> in) noexcept {
  uint16_t value = 0;
  for (uint8_t c : in) {
    if (c < '0' || c > '9') return std::nullopt;
    value = static_cast<uint16_t>(value * 10 + (c - '0'));
  }
  return value;
}

// Только верхний регистр: иначе повторное кодирование не даст тех же байт
std::optional<uint16_t> ReadHex(std::span<const uint8_t> in) noexcept {
  uint16_t value = 0;
  for (uint8_t c : in) {
    uint8_t nibble;
    if (c >= '0' && c <= '9') {
      nibble = static_cast<uint8_t>(c - '0');
    } else if (c >= 'A' && c <= 'F') {
      nibble = static_cast<uint8_t>(c - 'A' + 10);
    } else {
      return std::nullopt;
    }
    value = static_cast<uint16_t>((value << 4) | nibble);
  }
  return value;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Protocol - основной API
// ═══════════════════════════════════════════════════════════════════════════

uint8_t Protocol::CalculateChecksum(std::span<const uint8_t> data) noexcept {
  uint8_t sum = 0;
  for (uint8_t b : data) {
    sum = static_cast<uint8_t>(sum + b);
  }
  return sum;
}

int Protocol::FindFrameStart(std::span<const uint8_t> buffer) noexcept {
  for (size_t i = 0; i < buffer.size(); i++) {
    if (buffer[i] == FRAME_MARKER) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

// ─────────────────────────────────────────────────────────────────────────
// Сборка кадров
// ─────────────────────────────────────────────────────────────────────────

Result<size_t> Protocol::BuildFrame(std::span<uint8_t> buffer,
                                    const EnqFrame& frame) noexcept {
  if (buffer.size() < FRAME_SIZE) {
    return ParseError::BufferTooSmall;
  }

  if (frame.station > MAX_DECIMAL_FIELD ||
      frame.data_number > MAX_DECIMAL_FIELD) {
    return ParseError::InvalidField;
  }

  buffer[0] = FRAME_MARKER;
  WriteDecimal(buffer.subspan(STATION_OFFSET, STATION_DIGITS), frame.station);
  buffer[COMMAND_OFFSET] = static_cast<uint8_t>(frame.command);
  WriteDecimal(buffer.subspan(DATA_NUMBER_OFFSET, DATA_NUMBER_DIGITS),
               frame.data_number);
  WriteHex(buffer.subspan(DATA_VALUE_OFFSET, DATA_VALUE_DIGITS),
           frame.data_value);

  uint8_t sum = CalculateChecksum(buffer.subspan(STATION_OFFSET, CHECKSUM_SPAN));
  WriteHex(buffer.subspan(CHECKSUM_OFFSET, CHECKSUM_DIGITS), sum);

  return FRAME_SIZE;
}

EnqFrame Protocol::MakeCurrentFloorFrame(uint16_t station,
                                         int16_t floor) noexcept {
  return EnqFrame{station, Command::Write,
                  static_cast<uint16_t>(DataNumber::CurrentFloor),
                  EncodeFloor(floor)};
}

EnqFrame Protocol::MakeDestinationFrame(
    uint16_t station, std::optional<int16_t> floor) noexcept {
  return EnqFrame{station, Command::Write,
                  static_cast<uint16_t>(DataNumber::DestinationFloor),
                  EncodeDestination(floor)};
}

EnqFrame Protocol::MakeLoadFrame(uint16_t station, uint16_t load_kg) noexcept {
  return EnqFrame{station, Command::Write,
                  static_cast<uint16_t>(DataNumber::Load), EncodeLoad(load_kg)};
}

// ─────────────────────────────────────────────────────────────────────────
// Парсинг кадров
// ─────────────────────────────────────────────────────────────────────────

Result<EnqFrame> Protocol::ParseFrame(std::span<const uint8_t> buffer) noexcept {
  if (buffer.size() < FRAME_SIZE) {
    return ParseError::InsufficientData;
  }

  if (buffer[0] != FRAME_MARKER) {
    return ParseError::MalformedFrame;
  }

  auto station = ReadDecimal(buffer.subspan(STATION_OFFSET, STATION_DIGITS));
  auto data_number =
      ReadDecimal(buffer.subspan(DATA_NUMBER_OFFSET, DATA_NUMBER_DIGITS));
  auto data_value =
      ReadHex(buffer.subspan(DATA_VALUE_OFFSET, DATA_VALUE_DIGITS));
  auto recv_sum = ReadHex(buffer.subspan(CHECKSUM_OFFSET, CHECKSUM_DIGITS));

  if (!station || !data_number || !data_value || !recv_sum) {
    return ParseError::MalformedFrame;
  }

  // Проверка контрольной суммы
  uint8_t calc_sum =
      CalculateChecksum(buffer.subspan(STATION_OFFSET, CHECKSUM_SPAN));
  if (*recv_sum != calc_sum) {
    return ParseError::ChecksumMismatch;
  }

  EnqFrame frame;
  frame.station = *station;
  frame.command = static_cast<Command>(buffer[COMMAND_OFFSET]);
  frame.data_number = *data_number;
  frame.data_value = *data_value;

  return frame;
}

}  // namespace elevator_link::enq
