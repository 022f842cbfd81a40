#include "uart_bridge.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>

namespace elevator_link {

PosixUartBridge::~PosixUartBridge() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

speed_t PosixUartBridge::BaudToSpeed(uint32_t baud) noexcept {
  switch (baud) {
    case 1200U:
      return B1200;
    case 2400U:
      return B2400;
    case 4800U:
      return B4800;
    case 9600U:
      return B9600;
    case 19200U:
      return B19200;
    case 38400U:
      return B38400;
    case 57600U:
      return B57600;
    case 115200U:
      return B115200;
    default:
      return B9600;
  }
}

LinkError PosixUartBridge::Init() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }

  fd_ = ::open(device_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    return LinkError::OpenFailed;
  }

  termios tio{};
  if (::tcgetattr(fd_, &tio) != 0) {
    ::close(fd_);
    fd_ = -1;
    return LinkError::ConfigFailed;
  }

  // Raw-режим
  tio.c_iflag &= static_cast<tcflag_t>(~(IGNBRK | BRKINT | PARMRK | ISTRIP |
                                         INLCR | IGNCR | ICRNL | IXON | IXOFF |
                                         IXANY));
  tio.c_oflag &= static_cast<tcflag_t>(~OPOST);
  tio.c_lflag &= static_cast<tcflag_t>(~(ECHO | ECHONL | ICANON | ISIG | IEXTEN));

  // 8 бит, even parity, 1 стоп-бит
  static_assert(config::SerialConfig::kDataBits == 8, "ENQ uses 8 data bits");
  tio.c_cflag &= static_cast<tcflag_t>(~(CSIZE | PARENB | PARODD | CSTOPB));
  tio.c_cflag |= static_cast<tcflag_t>(CS8 | CLOCAL | CREAD);
  if (config::SerialConfig::kStopBits == 2) {
    tio.c_cflag |= CSTOPB;
  }
  if (config::SerialConfig::kParityEven) {
    tio.c_cflag |= PARENB;
    tio.c_iflag |= INPCK;
  }

  // Неблокирующее чтение: ожидание делает цикл монитора
  tio.c_cc[VMIN] = 0;
  tio.c_cc[VTIME] = 0;

  const speed_t speed = BaudToSpeed(baud_);
  if (::cfsetispeed(&tio, speed) != 0 || ::cfsetospeed(&tio, speed) != 0 ||
      ::tcsetattr(fd_, TCSANOW, &tio) != 0) {
    ::close(fd_);
    fd_ = -1;
    return LinkError::ConfigFailed;
  }

  // Отбросить то, что успело прийти до настройки порта
  if (::tcflush(fd_, TCIOFLUSH) != 0) {
    ::close(fd_);
    fd_ = -1;
    return LinkError::ConfigFailed;
  }
  return LinkError::Ok;
}

int PosixUartBridge::Write(const uint8_t *data, size_t len) {
  if (fd_ < 0 || data == nullptr) {
    return -1;
  }

  size_t offset = 0;
  while (offset < len) {
    ssize_t n = ::write(fd_, data + offset, len - offset);
    if (n > 0) {
      offset += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      // Выходной буфер полон: дождаться отправки
      if (::tcdrain(fd_) != 0 && errno != EINTR) {
        return -1;
      }
      continue;
    }
    return -1;
  }
  return 0;
}

int PosixUartBridge::ReadAvailable(uint8_t *buf, size_t max_len) {
  if (fd_ < 0) {
    return -1;
  }
  if (buf == nullptr || max_len == 0) {
    return 0;
  }

  while (true) {
    ssize_t n = ::read(fd_, buf, max_len);
    if (n >= 0) {
      return static_cast<int>(n);
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return 0;
    }
    return -1;
  }
}

}  // namespace elevator_link
