#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "mock_platform.hpp"
#include "status_text.hpp"
#include "test_helpers.hpp"

using namespace elevator_link;
using namespace elevator_link::testing;

// ═══════════════════════════════════════════════════════════════════════════
// Floor Labels
// ═══════════════════════════════════════════════════════════════════════════

TEST(StatusTextTest, FormatFloor) {
  EXPECT_EQ(FormatFloor(1), "1F");
  EXPECT_EQ(FormatFloor(12), "12F");
  EXPECT_EQ(FormatFloor(0), "0F");
  EXPECT_EQ(FormatFloor(-1), "B1F") << "Basement floors use B prefix";
  EXPECT_EQ(FormatFloor(-32768), "B32768F");
}

TEST(StatusTextTest, ParseFloor) {
  ExpectOptionalEq<int16_t>(ParseFloor("3F"), 3);
  ExpectOptionalEq<int16_t>(ParseFloor("3"), 3);
  ExpectOptionalEq<int16_t>(ParseFloor("B1F"), -1);
  ExpectOptionalEq<int16_t>(ParseFloor("b2"), -2);
  ExpectOptionalEq<int16_t>(ParseFloor("-1"), -1);
  ExpectOptionalEq<int16_t>(ParseFloor("0"), 0);
}

TEST(StatusTextTest, ParseFloorRejectsInvalidText) {
  ExpectOptionalEmpty(ParseFloor(""));
  ExpectOptionalEmpty(ParseFloor("F"));
  ExpectOptionalEmpty(ParseFloor("B0F"));
  ExpectOptionalEmpty(ParseFloor("3X"));
  ExpectOptionalEmpty(ParseFloor("40000"));
  ExpectOptionalEmpty(ParseFloor("123456"));
}

TEST(StatusTextTest, FloorLabelsRoundTrip) {
  for (int16_t floor : {-5, -1, 1, 2, 99}) {
    ExpectOptionalEq(ParseFloor(FormatFloor(floor)), floor);
  }
}

// ═══════════════════════════════════════════════════════════════════════════
// Events and State
// ═══════════════════════════════════════════════════════════════════════════

TEST(StatusTextTest, FormatEvent) {
  EXPECT_EQ(FormatEvent({ElevatorEventKind::MotionStarted, 1, 3, 0}),
            "Moving: 1F -> 3F");
  EXPECT_EQ(FormatEvent({ElevatorEventKind::MotionStarted, std::nullopt, -1, 0}),
            "Moving: ? -> B1F");
  EXPECT_EQ(FormatEvent({ElevatorEventKind::Arrival, std::nullopt, 3, 0}),
            "Arrived: 3F");
  EXPECT_EQ(FormatEvent({ElevatorEventKind::LoadChanged, std::nullopt, 0, 1200}),
            "Load: 1200kg");
}

TEST(StatusTextTest, FormatState) {
  ElevatorState state;
  EXPECT_EQ(FormatState(state), "Floor: -- | Destination: -- | Load: --");

  state.current_floor = 1;
  state.destination_floor = 3;
  state.load_kg = 850;
  EXPECT_EQ(FormatState(state), "Floor: 1F | Destination: 3F | Load: 850kg");
}

// ═══════════════════════════════════════════════════════════════════════════
// Raw Dumps
// ═══════════════════════════════════════════════════════════════════════════

TEST(StatusTextTest, FormatHexAndAscii) {
  auto frame = Bytes("\x05" "0001W000100039C");

  EXPECT_EQ(FormatHex(frame), "05303030315730303031303030333943");
  EXPECT_EQ(FormatAscii(frame), ".0001W000100039C")
      << "Marker is not printable";

  std::vector<uint8_t> raw{0x00, 0x7F, 0xAB, 'A'};
  EXPECT_EQ(FormatHex(raw), "007FAB41");
  EXPECT_EQ(FormatAscii(raw), "...A");

  EXPECT_EQ(FormatHex({}), "");
}

TEST(StatusTextTest, FormatUptime) {
  EXPECT_EQ(FormatUptime(0), "00:00:00");
  EXPECT_EQ(FormatUptime(15999), "00:00:15");
  EXPECT_EQ(FormatUptime(3723000), "01:02:03");
}

// ═══════════════════════════════════════════════════════════════════════════
// Event Log
// ═══════════════════════════════════════════════════════════════════════════

TEST(EventLogTest, AddsTimestampedLines) {
  FakePlatform platform;
  EventLog log(platform);

  platform.SetTimeMs(15000);
  log.OnElevatorEvent({ElevatorEventKind::Arrival, std::nullopt, 3, 0},
                      ElevatorState{});

  ASSERT_EQ(log.Lines().size(), 1u);
  EXPECT_EQ(log.Lines().front(), "[00:00:15] Arrived: 3F");
}

TEST(EventLogTest, OldestLinesAreDropped) {
  FakePlatform platform;
  EventLog log(platform, 3);

  for (int i = 1; i <= 5; i++) {
    log.Add("line " + std::to_string(i));
  }

  ASSERT_EQ(log.Lines().size(), 3u);
  EXPECT_EQ(log.Lines().front(), "[00:00:00] line 3");
  EXPECT_EQ(log.Lines().back(), "[00:00:00] line 5");
  EXPECT_EQ(log.Capacity(), 3u);

  log.Clear();
  EXPECT_TRUE(log.Lines().empty());
}

TEST(EventLogTest, ZeroCapacityKeepsNothing) {
  FakePlatform platform;
  EventLog log(platform, 0);

  log.Add("ignored");
  EXPECT_TRUE(log.Lines().empty());
}

TEST(EventLogTest, WorksAsTrackerRenderer) {
  FakePlatform platform;
  EventLog log(platform);
  ElevatorTracker tracker(&log);

  tracker.Apply(enq::Protocol::MakeCurrentFloorFrame(1, 1));
  tracker.Apply(enq::Protocol::MakeDestinationFrame(1, 3));
  platform.AdvanceTimeMs(10000);
  tracker.Apply(enq::Protocol::MakeCurrentFloorFrame(1, 3));

  ASSERT_EQ(log.Lines().size(), 2u);
  EXPECT_EQ(log.Lines()[0], "[00:00:00] Moving: 1F -> 3F");
  EXPECT_EQ(log.Lines()[1], "[00:00:10] Arrived: 3F");
}
