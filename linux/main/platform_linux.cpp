#include "platform_linux.hpp"

#include <cstdio>
#include <ctime>
#include <thread>

namespace elevator_link {

uint32_t LinuxPlatform::GetTimeMs() const noexcept {
  auto elapsed = std::chrono::steady_clock::now() - start_;
  return static_cast<uint32_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

void LinuxPlatform::DelayMs(uint32_t ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

void LinuxPlatform::Log(LogLevel level, std::string_view msg) const {
  // Настенное время для удобства сопоставления с журналом лифта
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  char ts[16];
  std::strftime(ts, sizeof(ts), "%H:%M:%S", &local);

  const char *prefix = "I";
  FILE *out = stdout;
  switch (level) {
    case LogLevel::Info:
      break;
    case LogLevel::Warning:
      prefix = "W";
      out = stderr;
      break;
    case LogLevel::Error:
      prefix = "E";
      out = stderr;
      break;
  }

  std::fprintf(out, "[%s] %s [%s] %.*s\n", ts, prefix, tag_,
               static_cast<int>(msg.size()), msg.data());
  std::fflush(out);
}

}  // namespace elevator_link
