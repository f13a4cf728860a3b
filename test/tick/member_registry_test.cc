#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/tick/member_registry.h"
#include <limits>
#include <vector>

using namespace Lockstep;
using ::testing::UnorderedElementsAre;
using ::testing::IsEmpty;

class MemberRegistryTest : public ::testing::Test {
protected:
    MemberId Add(SpeedFactor speed_factor) {
        return registry_.Register(speed_factor, std::make_shared<ReplyChannel>(kReplyChannelCapacity), now_);
    }

    MemberRegistry registry_;
    MemberRegistry::Clock::time_point now_ = MemberRegistry::Clock::now();
};

TEST_F(MemberRegistryTest, IdsAreMonotonicAndNeverReused) {
    EXPECT_EQ(Add(1), 0u);
    EXPECT_EQ(Add(1), 1u);
    EXPECT_TRUE(registry_.Unregister(1));
    EXPECT_TRUE(registry_.Unregister(0));
    EXPECT_TRUE(registry_.empty());

    EXPECT_EQ(Add(1), 2u);
    EXPECT_EQ(registry_.next_id(), 3u);
}

TEST_F(MemberRegistryTest, NewMemberStartsRunning) {
    MemberId id = Add(3);
    const MemberRecord* record = registry_.Find(id);
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->state, MemberState::RUNNING);
    EXPECT_EQ(record->speed_factor, 3u);
    EXPECT_EQ(record->last_tick, now_);
    EXPECT_NE(record->reply, nullptr);
}

TEST_F(MemberRegistryTest, ZeroSpeedFactorIsNormalized) {
    MemberId id = Add(0);
    EXPECT_EQ(registry_.Find(id)->speed_factor, 1u);
    EXPECT_EQ(NormalizeSpeedFactor(0), 1u);
    EXPECT_EQ(NormalizeSpeedFactor(5), 5u);
}

TEST_F(MemberRegistryTest, UnknownIdIsSilentNoop) {
    MemberId id = Add(1);
    EXPECT_FALSE(registry_.ChangeState(42, MemberState::FINISHED));
    EXPECT_FALSE(registry_.Unregister(42));
    EXPECT_EQ(registry_.size(), 1u);
    EXPECT_EQ(registry_.Find(id)->state, MemberState::RUNNING);
    EXPECT_EQ(registry_.Find(42), nullptr);
}

TEST_F(MemberRegistryTest, SettingSameStateIsNoop) {
    MemberId id = Add(1);
    EXPECT_TRUE(registry_.ChangeState(id, MemberState::HIDDEN));
    EXPECT_TRUE(registry_.ChangeState(id, MemberState::HIDDEN));
    EXPECT_EQ(registry_.Find(id)->state, MemberState::HIDDEN);
    EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(MemberRegistryTest, CollectDueBySpeedFactor) {
    MemberId every = Add(1);
    MemberId second = Add(2);
    MemberId third = Add(3);

    EXPECT_THAT(registry_.CollectDue(1), UnorderedElementsAre(every));
    EXPECT_THAT(registry_.CollectDue(2), UnorderedElementsAre(every, second));
    EXPECT_THAT(registry_.CollectDue(3), UnorderedElementsAre(every, third));
    EXPECT_THAT(registry_.CollectDue(6), UnorderedElementsAre(every, second, third));
}

TEST_F(MemberRegistryTest, DueComputationAcrossWrapAround) {
    MemberId every = Add(1);
    MemberId second = Add(2);
    MemberId third = Add(3);

    // 2^64 - 1 is odd and divisible by 3
    StepCount last = std::numeric_limits<StepCount>::max();
    EXPECT_THAT(registry_.CollectDue(last), UnorderedElementsAre(every, third));

    StepCount wrapped = last + 1;
    EXPECT_EQ(wrapped, 0u);
    EXPECT_THAT(registry_.CollectDue(wrapped), UnorderedElementsAre(every, second, third));
    EXPECT_THAT(registry_.CollectDue(wrapped + 1), UnorderedElementsAre(every));
}

TEST_F(MemberRegistryTest, GateNeedsEveryDueMemberReady) {
    MemberId a = Add(1);
    MemberId b = Add(1);
    std::vector<MemberId> due = registry_.CollectDue(1);

    EXPECT_FALSE(registry_.AllReady(due));
    registry_.ChangeState(a, MemberState::FINISHED);
    EXPECT_FALSE(registry_.AllReady(due));
    registry_.ChangeState(b, MemberState::HIDDEN);
    EXPECT_TRUE(registry_.AllReady(due));

    EXPECT_TRUE(registry_.AllReady({}));
    EXPECT_TRUE(registry_.AllReady({99}));
}

TEST_F(MemberRegistryTest, MarkTickedTransitions) {
    MemberId finished = Add(1);
    MemberId hidden = Add(1);
    MemberId running = Add(1);
    registry_.ChangeState(finished, MemberState::FINISHED);
    registry_.ChangeState(hidden, MemberState::HIDDEN);

    auto later = now_ + std::chrono::milliseconds(5);
    std::vector<TickDelivery> deliveries = registry_.MarkTicked({finished, hidden, running, 99}, later);

    ASSERT_EQ(deliveries.size(), 2u);
    EXPECT_EQ(deliveries[0].reply, registry_.Find(finished)->reply);
    EXPECT_FALSE(deliveries[0].hidden);
    EXPECT_EQ(deliveries[1].reply, registry_.Find(hidden)->reply);
    EXPECT_TRUE(deliveries[1].hidden);
    EXPECT_EQ(registry_.Find(finished)->state, MemberState::RUNNING);
    EXPECT_EQ(registry_.Find(finished)->last_tick, later);
    EXPECT_EQ(registry_.Find(hidden)->state, MemberState::HIDDEN);
    EXPECT_EQ(registry_.Find(hidden)->last_tick, later);
    EXPECT_EQ(registry_.Find(running)->state, MemberState::RUNNING);
    EXPECT_EQ(registry_.Find(running)->last_tick, now_);
}

TEST_F(MemberRegistryTest, LeavingHiddenDropsQueuedTicks) {
    MemberId observer = Add(1);
    registry_.ChangeState(observer, MemberState::HIDDEN);
    std::shared_ptr<ReplyChannel> reply = registry_.Find(observer)->reply;
    ASSERT_TRUE(reply->TrySend(TickReply::HiddenTick(1)));

    // Staying hidden keeps the queued tick
    EXPECT_TRUE(registry_.ChangeState(observer, MemberState::HIDDEN));
    TickReply queued;
    ASSERT_TRUE(reply->TryRecv(queued));
    EXPECT_EQ(queued.value, 1u);
    ASSERT_TRUE(reply->TrySend(TickReply::HiddenTick(2)));

    EXPECT_TRUE(registry_.ChangeState(observer, MemberState::FINISHED));
    EXPECT_FALSE(reply->TryRecv(queued));
    EXPECT_TRUE(reply->TrySend(TickReply::Tick(3)));
}

TEST_F(MemberRegistryTest, LeavingRunningKeepsQueuedReply) {
    MemberId id = Add(1);
    std::shared_ptr<ReplyChannel> reply = registry_.Find(id)->reply;
    ASSERT_TRUE(reply->TrySend(TickReply::SelfId(id)));

    EXPECT_TRUE(registry_.ChangeState(id, MemberState::FINISHED));
    TickReply queued;
    ASSERT_TRUE(reply->TryRecv(queued));
    EXPECT_EQ(queued.kind, TickReply::Kind::SELF_ID);
}

TEST(DueStepsTest, CountsInSpeedFactorArithmetic) {
    EXPECT_EQ(DueStepsUpTo(60, 1), 60u);
    EXPECT_EQ(DueStepsUpTo(60, 7), 8u);
    EXPECT_EQ(DueStepsUpTo(60, 0), 60u);
    EXPECT_EQ(DueStepsUpTo(60, 61), 0u);
    // Factors beyond 32 bits are not truncated
    EXPECT_EQ(DueStepsUpTo(60, SpeedFactor{1} << 32), 0u);
    EXPECT_EQ(DueStepsUpTo(60, std::numeric_limits<SpeedFactor>::max()), 0u);
}

TEST_F(MemberRegistryTest, CloseAllClosesReplyChannels) {
    MemberId a = Add(1);
    MemberId b = Add(2);
    registry_.CloseAll();
    EXPECT_TRUE(registry_.Find(a)->reply->IsClosed());
    EXPECT_TRUE(registry_.Find(b)->reply->IsClosed());
}

TEST(MemberStateTest, Names) {
    EXPECT_STREQ(MemberStateName(MemberState::RUNNING), "Running");
    EXPECT_STREQ(MemberStateName(MemberState::FINISHED), "Finished");
    EXPECT_STREQ(MemberStateName(MemberState::HIDDEN), "Hidden");
}
