#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

#include "link_platform.hpp"

namespace elevator_link {

/**
 * @brief Платформа Linux: steady_clock, stdout/stderr, sleep_for
 */
class LinuxPlatform : public LinkPlatform {
 public:
  explicit LinuxPlatform(const char *tag) noexcept
      : tag_(tag), start_(std::chrono::steady_clock::now()) {}

  [[nodiscard]] uint32_t GetTimeMs() const noexcept override;
  void DelayMs(uint32_t ms) override;
  void Log(LogLevel level, std::string_view msg) const override;

 private:
  const char *tag_;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace elevator_link
