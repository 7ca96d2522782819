#include <optional>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "tone_state_machine.hpp"

namespace dtmfdec::node {
namespace {

// Feeds one decision per character ('.' = no tone) and renders the events
// as e.g. "+1 -1" (press 1, release 1).
std::string run(ToneStateMachine& sm, const std::string& decisions) {
    std::vector<KeyEvent> events;
    std::uint64_t block = 0;
    for (char c : decisions) {
        std::optional<char> symbol;
        if (c != '.') symbol = c;
        sm.step(symbol, block++, events);
    }

    std::string out;
    for (const auto& ev : events) {
        if (!out.empty()) out += ' ';
        out += ev.type == KeyEventType::Pressed ? '+' : '-';
        out += ev.symbol;
    }
    return out;
}

TEST(ToneStateMachineTest, StartsIdle) {
    ToneStateMachine sm(3);
    EXPECT_EQ(sm.state(), ToneState::Idle);
    EXPECT_FALSE(sm.held_symbol().has_value());
    EXPECT_EQ(sm.hold_count(), 0);
    EXPECT_FALSE(sm.last_emitted().has_value());
}

TEST(ToneStateMachineTest, SilenceStaysIdle) {
    ToneStateMachine sm(3);
    EXPECT_EQ(run(sm, ".........."), "");
    EXPECT_EQ(sm.state(), ToneState::Idle);
}

TEST(ToneStateMachineTest, HoldsUntilThreshold) {
    ToneStateMachine sm(3);
    EXPECT_EQ(run(sm, "55"), "");
    EXPECT_EQ(sm.state(), ToneState::Holding);
    EXPECT_EQ(sm.held_symbol(), std::optional<char>('5'));
    EXPECT_EQ(sm.hold_count(), 2);

    EXPECT_EQ(run(sm, "5"), "+5");
    EXPECT_EQ(sm.state(), ToneState::Confirmed);
    EXPECT_EQ(sm.last_emitted(), std::optional<char>('5'));
}

TEST(ToneStateMachineTest, ShortSpikeIsDebounced) {
    ToneStateMachine sm(3);
    EXPECT_EQ(run(sm, "77......"), "");
    EXPECT_EQ(sm.state(), ToneState::Idle);
}

TEST(ToneStateMachineTest, LongHoldEmitsOnePressAndOneRelease) {
    for (int k = 0; k < 20; k += 4) {
        ToneStateMachine sm(3);
        std::string decisions(3 + k, '#');
        decisions += "...";
        EXPECT_EQ(run(sm, decisions), "+# -#") << "k=" << k;
        EXPECT_EQ(sm.state(), ToneState::Idle);
    }
}

TEST(ToneStateMachineTest, DirectSwitchReleasesBeforeNextPress) {
    ToneStateMachine sm(3);
    EXPECT_EQ(run(sm, "1111222..."), "+1 -1 +2 -2");
}

TEST(ToneStateMachineTest, SwitchToShortCandidateOnlyReleases) {
    ToneStateMachine sm(3);
    EXPECT_EQ(run(sm, "111122...."), "+1 -1");
}

TEST(ToneStateMachineTest, UnconfirmedCandidateIsReplaced) {
    ToneStateMachine sm(3);
    EXPECT_EQ(run(sm, "12"), "");
    EXPECT_EQ(sm.held_symbol(), std::optional<char>('2'));
    EXPECT_EQ(sm.hold_count(), 1);
    EXPECT_EQ(run(sm, "22"), "+2");
}

TEST(ToneStateMachineTest, GapRestartsTheCount) {
    ToneStateMachine sm(3);
    EXPECT_EQ(run(sm, "44.44.44"), "");
}

TEST(ToneStateMachineTest, SingleBlockHoldConfirmsImmediately) {
    ToneStateMachine sm(1);
    EXPECT_EQ(run(sm, "A.B"), "+A -A +B");
    EXPECT_EQ(sm.state(), ToneState::Confirmed);
}

TEST(ToneStateMachineTest, EventsCarryBlockIndex) {
    ToneStateMachine sm(2);
    std::vector<KeyEvent> events;
    sm.step('9', 10, events);
    sm.step('9', 11, events);
    sm.step(std::nullopt, 12, events);

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].type, KeyEventType::Pressed);
    EXPECT_EQ(events[0].block_index, 11u);
    EXPECT_EQ(events[1].type, KeyEventType::Released);
    EXPECT_EQ(events[1].block_index, 12u);
}

TEST(ToneStateMachineTest, ResetDropsHeldToneSilently) {
    ToneStateMachine sm(2);
    EXPECT_EQ(run(sm, "33"), "+3");
    sm.reset();
    EXPECT_EQ(sm.state(), ToneState::Idle);
    EXPECT_FALSE(sm.last_emitted().has_value());
    EXPECT_EQ(run(sm, "3"), "");
}

TEST(ToneStateMachineTest, FlushReleasesConfirmedKey) {
    ToneStateMachine sm(2);
    EXPECT_EQ(run(sm, "00"), "+0");

    std::vector<KeyEvent> events;
    sm.flush(7, events);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, KeyEventType::Released);
    EXPECT_EQ(events[0].symbol, '0');
    EXPECT_EQ(sm.state(), ToneState::Idle);

    events.clear();
    EXPECT_EQ(run(sm, "0"), "");
    sm.flush(8, events);
    EXPECT_TRUE(events.empty());
}

} // namespace
} // namespace dtmfdec::node
