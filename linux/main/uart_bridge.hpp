#pragma once

#include <termios.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

#include "enq_link_base.hpp"

namespace elevator_link {

/**
 * Канал ENQ поверх последовательного порта POSIX (termios).
 * 9600 bps, 8 бит данных, even parity, 1 стоп-бит, raw-режим, без блокировки.
 */
class PosixUartBridge : public EnqLinkBase {
 public:
  explicit PosixUartBridge(std::string device,
                           uint32_t baud = config::SerialConfig::kBaudRate)
      : device_(std::move(device)), baud_(baud) {}

  ~PosixUartBridge() override;

  PosixUartBridge(const PosixUartBridge &) = delete;
  PosixUartBridge &operator=(const PosixUartBridge &) = delete;

  [[nodiscard]] LinkError Init() override;

  [[nodiscard]] const std::string &Device() const noexcept { return device_; }

 protected:
  int Write(const uint8_t *data, size_t len) override;
  int ReadAvailable(uint8_t *buf, size_t max_len) override;

 private:
  std::string device_;
  uint32_t baud_;
  int fd_{-1};

  [[nodiscard]] static speed_t BaudToSpeed(uint32_t baud) noexcept;
};

}  // namespace elevator_link
