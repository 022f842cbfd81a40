#include <gtest/gtest.h>

#include "config.hpp"
#include "elevator_monitor.hpp"
#include "scenario_sequencer.hpp"

using namespace elevator_link;

// ═══════════════════════════════════════════════════════════════════════════
// Overridable Defaults
// ═══════════════════════════════════════════════════════════════════════════

TEST(ConfigTest, ConstantsComeFromOverridableMacros) {
  EXPECT_EQ(config::SerialConfig::kBaudRate,
            static_cast<uint32_t>(UART_BAUD_RATE));
  EXPECT_EQ(config::MonitorConfig::kPollIntervalMs,
            static_cast<uint32_t>(MONITOR_POLL_INTERVAL_MS));
  EXPECT_EQ(config::MonitorConfig::kIdleWarningMs,
            static_cast<uint32_t>(MONITOR_IDLE_WARNING_MS));
  EXPECT_EQ(config::ScenarioDefaults::kStartFloor,
            static_cast<int16_t>(SIMULATOR_START_FLOOR));
}

TEST(ConfigTest, RuntimeDefaultsFollowConstants) {
  MonitorOptions options;
  EXPECT_EQ(options.poll_interval_ms, config::MonitorConfig::kPollIntervalMs);
  EXPECT_EQ(options.idle_warning_ms, config::MonitorConfig::kIdleWarningMs);

  ScenarioConfig scenario;
  EXPECT_EQ(scenario.start_floor, config::ScenarioDefaults::kStartFloor);
}

TEST(ConfigTest, SerialLineIs9600Even) {
  EXPECT_EQ(config::SerialConfig::kBaudRate, 9600u);
  EXPECT_EQ(config::SerialConfig::kDataBits, 8);
  EXPECT_TRUE(config::SerialConfig::kParityEven);
  EXPECT_EQ(config::SerialConfig::kStopBits, 1);
}
