// Copyright 2026 The walpush Authors
// SPDX-License-Identifier: Apache-2.0
#include <doctest.h>
#include <walpush.h>

#include "test_util.h"

using namespace walpush;
using namespace walpush::test;

namespace {

VolumeState dirty_at(Seq seq) {
    VolumeState s;
    s.id = "vol-test";
    return transition(s, FramesObserved{seq, static_cast<Checksum>(seq * 31)});
}

PushSession session_for(const VolumeState& s) {
    return PushSession{"push-1", s.captured_seq, s.captured_checksum};
}

} // namespace

TEST_CASE("volume: captured frames make a fresh volume dirty") {
    VolumeState s = dirty_at(4);
    CHECK(s.phase == VolumePhase::Dirty);
    CHECK(s.captured_seq == 4);
    CHECK(s.confirmed_seq == kNoSeq);
}

TEST_CASE("volume: a completed session confirms its target") {
    VolumeState s = dirty_at(4);
    s = transition(s, SessionStarted{session_for(s)});
    CHECK(s.phase == VolumePhase::Pushing);

    s = transition(s, SessionCompleted{});
    CHECK(s.phase == VolumePhase::Clean);
    CHECK(s.confirmed_seq == 4);
    CHECK(s.confirmed_checksum == s.captured_checksum);
}

TEST_CASE("volume: frames captured mid-session leave the volume dirty") {
    VolumeState s = dirty_at(4);
    s = transition(s, SessionStarted{session_for(s)});
    s = transition(s, FramesObserved{9, 1234});
    CHECK(s.phase == VolumePhase::Pushing);

    s = transition(s, SessionCompleted{});
    CHECK(s.phase == VolumePhase::Dirty);
    CHECK(s.confirmed_seq == 4);
    CHECK(s.captured_seq == 9);
}

TEST_CASE("volume: interrupted session resumes only after verification") {
    VolumeState s = dirty_at(4);
    s = transition(s, SessionStarted{session_for(s)});
    s = transition(s, SessionInterrupted{"network down"});
    CHECK(s.phase == VolumePhase::InterruptedPush);
    CHECK(s.session->status == SessionStatus::Interrupted);

    CHECK(error_code([&] { transition(s, SessionResumed{false}); }) ==
          ErrorCode::InvalidState);

    s = transition(s, SessionResumed{true});
    CHECK(s.phase == VolumePhase::Pushing);
    CHECK(s.session->status == SessionStatus::Active);
    CHECK(s.session->target_seq == 4);
}

TEST_CASE("volume: illegal transitions are InvalidState") {
    VolumeState fresh;
    CHECK(error_code([&] { transition(fresh, SessionCompleted{}); }) ==
          ErrorCode::InvalidState);
    CHECK(error_code([&] { transition(fresh, SessionStarted{}); }) ==
          ErrorCode::InvalidState);

    VolumeState s = dirty_at(4);
    CHECK(error_code([&] { transition(s, SessionInterrupted{"x"}); }) ==
          ErrorCode::InvalidState);
    CHECK(error_code([&] { transition(s, FramesObserved{2, 0}); }) ==
          ErrorCode::InvalidState);
}

TEST_CASE("volume: inconsistent is terminal") {
    VolumeState s = dirty_at(4);
    s = transition(s, InconsistencyDetected{"checksum mismatch"});
    CHECK(s.phase == VolumePhase::Inconsistent);
    CHECK(s.detail == "checksum mismatch");

    CHECK(error_code([&] { transition(s, FramesObserved{5, 0}); }) ==
          ErrorCode::VolumeInconsistent);
    CHECK(error_code([&] { transition(s, SessionStarted{session_for(s)}); }) ==
          ErrorCode::VolumeInconsistent);
    CHECK(error_code([&] { transition(s, InconsistencyDetected{"again"}); }) ==
          ErrorCode::VolumeInconsistent);
}

TEST_CASE("volume: phase names") {
    CHECK(std::string(to_string(VolumePhase::InterruptedPush)) == "InterruptedPush");
    CHECK(std::string(to_string(SessionStatus::Completed)) == "Completed");
    CHECK(std::string(to_string(ErrorCode::WalGap)) == "WalGap");
}
