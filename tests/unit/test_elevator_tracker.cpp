#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <optional>
#include <vector>

#include "elevator_tracker.hpp"
#include "enq_protocol.hpp"
#include "mock_platform.hpp"
#include "test_helpers.hpp"

using namespace elevator_link;
using namespace elevator_link::testing;
using ::testing::_;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::StrictMock;

namespace {

enq::EnqFrame Floor(int16_t floor) {
  return enq::Protocol::MakeCurrentFloorFrame(1, floor);
}

enq::EnqFrame Destination(std::optional<int16_t> floor) {
  return enq::Protocol::MakeDestinationFrame(1, floor);
}

enq::EnqFrame Load(uint16_t load_kg) {
  return enq::Protocol::MakeLoadFrame(1, load_kg);
}

ElevatorEvent Moving(std::optional<int16_t> from, int16_t to) {
  return ElevatorEvent{ElevatorEventKind::MotionStarted, from, to, 0};
}

ElevatorEvent Arrived(int16_t floor) {
  return ElevatorEvent{ElevatorEventKind::Arrival, std::nullopt, floor, 0};
}

ElevatorEvent LoadChanged(uint16_t load_kg) {
  return ElevatorEvent{ElevatorEventKind::LoadChanged, std::nullopt, 0,
                       load_kg};
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Basic State Updates
// ═══════════════════════════════════════════════════════════════════════════

TEST(ElevatorTrackerTest, InitiallyUnknown) {
  ElevatorTracker tracker;
  const auto& state = tracker.GetState();

  ExpectOptionalEmpty(state.current_floor);
  ExpectOptionalEmpty(state.destination_floor);
  ExpectOptionalEmpty(state.load_kg);
  ExpectOptionalEmpty(state.last_event);
}

TEST(ElevatorTrackerTest, CurrentFloorWithoutDestinationHasNoEvent) {
  ElevatorTracker tracker;

  ExpectOptionalEmpty(tracker.Apply(Floor(1)));
  ExpectOptionalEq<int16_t>(tracker.GetState().current_floor, 1);

  ExpectOptionalEmpty(tracker.Apply(Floor(-1)));
  ExpectOptionalEq<int16_t>(tracker.GetState().current_floor, -1);
}

TEST(ElevatorTrackerTest, NewDestinationStartsMotion) {
  ElevatorTracker tracker;
  tracker.Apply(Floor(1));

  auto event = tracker.Apply(Destination(3));

  ExpectOptionalEq(event, Moving(1, 3));
  ExpectOptionalEq<int16_t>(tracker.GetState().destination_floor, 3);
  ExpectOptionalEq(tracker.GetState().last_event, Moving(1, 3));
}

TEST(ElevatorTrackerTest, DestinationBeforeFloorHasUnknownOrigin) {
  ElevatorTracker tracker;

  auto event = tracker.Apply(Destination(-1));

  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->kind, ElevatorEventKind::MotionStarted);
  ExpectOptionalEmpty(event->from_floor);
  EXPECT_EQ(event->floor, -1);
}

TEST(ElevatorTrackerTest, RepeatedDestinationIsReportedOnce) {
  ElevatorTracker tracker;
  tracker.Apply(Floor(1));

  int motion_events = 0;
  for (int i = 0; i < 5; i++) {
    if (tracker.Apply(Destination(3))) motion_events++;
  }

  EXPECT_EQ(motion_events, 1) << "Same destination repeated 5 times";
}

TEST(ElevatorTrackerTest, DestinationEqualToCurrentFloorIsIgnored) {
  ElevatorTracker tracker;
  tracker.Apply(Floor(2));

  ExpectOptionalEmpty(tracker.Apply(Destination(2)));
  ExpectOptionalEmpty(tracker.GetState().destination_floor);
}

TEST(ElevatorTrackerTest, ChangedDestinationStartsNewMotion) {
  ElevatorTracker tracker;
  tracker.Apply(Floor(1));
  tracker.Apply(Destination(3));

  auto event = tracker.Apply(Destination(5));
  ExpectOptionalEq(event, Moving(1, 5));
}

// ═══════════════════════════════════════════════════════════════════════════
// Arrival Derivation
// ═══════════════════════════════════════════════════════════════════════════

TEST(ElevatorTrackerTest, ArrivalWhenFloorReachesDestination) {
  ElevatorTracker tracker;
  tracker.Apply(Floor(1));
  tracker.Apply(Destination(3));

  // Passing floor 2
  ExpectOptionalEmpty(tracker.Apply(Floor(2)));

  auto event = tracker.Apply(Floor(3));
  ExpectOptionalEq(event, Arrived(3));
  ExpectOptionalEmpty(tracker.GetState().destination_floor);

  // Arrival is reported once per destination
  ExpectOptionalEmpty(tracker.Apply(Floor(3)));
}

TEST(ElevatorTrackerTest, ArrivalAtBasement) {
  ElevatorTracker tracker;
  tracker.Apply(Floor(3));
  tracker.Apply(Destination(-1));

  ExpectOptionalEq(tracker.Apply(Floor(-1)), Arrived(-1));
}

TEST(ElevatorTrackerTest, ArrivalClearRemovesDestinationSilently) {
  ElevatorTracker tracker;
  tracker.Apply(Floor(1));
  tracker.Apply(Destination(3));

  ExpectOptionalEmpty(tracker.Apply(Destination(std::nullopt)));
  ExpectOptionalEmpty(tracker.GetState().destination_floor);

  // No pending destination, no arrival
  ExpectOptionalEmpty(tracker.Apply(Floor(3)));
}

// ═══════════════════════════════════════════════════════════════════════════
// Load Tracking
// ═══════════════════════════════════════════════════════════════════════════

TEST(ElevatorTrackerTest, EveryLoadFrameIsReported) {
  ElevatorTracker tracker;

  int load_events = 0;
  for (int i = 0; i < 5; i++) {
    auto event = tracker.Apply(Load(1870));
    ExpectOptionalEq(event, LoadChanged(1870));
    if (event) load_events++;
  }

  EXPECT_EQ(load_events, 5) << "Same load repeated 5 times";
  ExpectOptionalEq<uint16_t>(tracker.GetState().load_kg, 1870);
}

TEST(ElevatorTrackerTest, LoadUpdatesStoredValue) {
  ElevatorTracker tracker;

  ExpectOptionalEq(tracker.Apply(Load(850)), LoadChanged(850));
  ExpectOptionalEq(tracker.Apply(Load(1200)), LoadChanged(1200));
  ExpectOptionalEq<uint16_t>(tracker.GetState().load_kg, 1200);
}

TEST(ElevatorTrackerTest, LoadDoesNotAffectFloors) {
  ElevatorTracker tracker;
  tracker.Apply(Floor(1));
  tracker.Apply(Destination(3));
  tracker.Apply(Load(650));

  ExpectOptionalEq<int16_t>(tracker.GetState().current_floor, 1);
  ExpectOptionalEq<int16_t>(tracker.GetState().destination_floor, 3);
}

// ═══════════════════════════════════════════════════════════════════════════
// Unknown Frames
// ═══════════════════════════════════════════════════════════════════════════

TEST(ElevatorTrackerTest, UnknownDataNumberIsIgnored) {
  ElevatorTracker tracker;
  tracker.Apply(Floor(1));
  ElevatorState before = tracker.GetState();

  ExpectOptionalEmpty(tracker.Apply(MakeFrame(99, 0x1234)));
  ExpectOptionalEmpty(tracker.Apply(MakeFrame(0, 0x0001)));

  EXPECT_EQ(tracker.GetState(), before);
  EXPECT_EQ(tracker.GetIgnoredFrames(), 2u);
}

TEST(ElevatorTrackerTest, ResetClearsState) {
  ElevatorTracker tracker;
  tracker.Apply(Floor(1));
  tracker.Apply(MakeFrame(7, 0));

  tracker.Reset();

  EXPECT_EQ(tracker.GetState(), ElevatorState{});
  EXPECT_EQ(tracker.GetIgnoredFrames(), 0u);
}

// ═══════════════════════════════════════════════════════════════════════════
// Pure Reduction
// ═══════════════════════════════════════════════════════════════════════════

TEST(ElevatorReductionTest, SameInputsGiveSameOutputs) {
  ElevatorState state;
  state.current_floor = 1;
  state.destination_floor = 3;

  auto a = ReduceElevatorState(state, Floor(3));
  auto b = ReduceElevatorState(state, Floor(3));

  EXPECT_EQ(a.state, b.state);
  EXPECT_EQ(a.event, b.event);
  ExpectOptionalEq(a.event, Arrived(3));

  // Input state is not modified
  ExpectOptionalEq<int16_t>(state.destination_floor, 3);
}

TEST(ElevatorReductionTest, MatchesTrackerOnScenarioStream) {
  const std::vector<enq::EnqFrame> stream = {
      Floor(1),       Floor(1),    Destination(3), Destination(3),
      Floor(2),       Floor(3),    Destination(std::nullopt),
      Load(850),      Load(850),   Floor(3),       Destination(-1),
      Floor(-1),      Load(1200),  MakeFrame(42, 1)};

  ElevatorTracker tracker;
  ElevatorState state;
  std::vector<ElevatorEvent> reduced_events;
  std::vector<ElevatorEvent> tracker_events;

  for (const auto& frame : stream) {
    auto step = ReduceElevatorState(state, frame);
    state = step.state;
    if (step.event) reduced_events.push_back(*step.event);
    if (auto event = tracker.Apply(frame)) tracker_events.push_back(*event);
  }

  EXPECT_EQ(state, tracker.GetState());
  EXPECT_EQ(reduced_events, tracker_events);

  const std::vector<ElevatorEvent> expected = {
      Moving(1, 3),  Arrived(3),  LoadChanged(850), LoadChanged(850),
      Moving(3, -1), Arrived(-1), LoadChanged(1200)};
  EXPECT_EQ(tracker_events, expected);
}

// ═══════════════════════════════════════════════════════════════════════════
// Renderer Notification
// ═══════════════════════════════════════════════════════════════════════════

TEST(ElevatorTrackerTest, RendererReceivesEventsInOrder) {
  StrictMock<MockRenderer> renderer;
  ElevatorTracker tracker(&renderer);

  {
    InSequence seq;
    EXPECT_CALL(renderer, OnElevatorEvent(Moving(1, 3), _));
    EXPECT_CALL(renderer,
                OnElevatorEvent(Arrived(3), Field(&ElevatorState::current_floor,
                                                  std::optional<int16_t>(3))));
    EXPECT_CALL(renderer, OnElevatorEvent(LoadChanged(650), _)).Times(2);
  }

  tracker.Apply(Floor(1));
  tracker.Apply(Destination(3));
  tracker.Apply(Destination(3));
  tracker.Apply(Floor(3));
  tracker.Apply(Load(650));
  tracker.Apply(Load(650));
}

TEST(ElevatorTrackerTest, RendererCanBeAttachedLater) {
  StrictMock<MockRenderer> renderer;
  ElevatorTracker tracker;
  tracker.Apply(Load(100));

  tracker.SetRenderer(&renderer);
  EXPECT_CALL(renderer, OnElevatorEvent(LoadChanged(200), _)).Times(1);

  tracker.Apply(Load(200));
}
