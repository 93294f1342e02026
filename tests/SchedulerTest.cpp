// board timers

#include "Scheduler.h"

#include <gtest/gtest.h>

TEST(SchedulerTest, FiresWhenDue)
{
    Scheduler sched;
    int fired = 0;
    auto tmr = sched.createTimer(1000, [&fired]() { fired++; });
    EXPECT_EQ(tmr->expiresNs(), 1000);

    sched.timerTick(999);
    EXPECT_EQ(fired, 0);
    sched.timerTick(1);
    EXPECT_EQ(fired, 1);
    EXPECT_EQ(sched.nowNs(), 1000);

    // one-shot
    sched.timerTick(5000);
    EXPECT_EQ(fired, 1);
    EXPECT_EQ(sched.pending(), 0);
}


TEST(SchedulerTest, CallbacksRunInExpirationOrder)
{
    Scheduler sched;
    std::vector<int> order;
    auto t3 = sched.createTimer(300, [&order]() { order.push_back(3); });
    auto t1 = sched.createTimer(100, [&order]() { order.push_back(1); });
    auto t2 = sched.createTimer(200, [&order]() { order.push_back(2); });
    EXPECT_EQ(sched.pending(), 3);

    sched.timerTick(1000);
    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0], 1);
    EXPECT_EQ(order[1], 2);
    EXPECT_EQ(order[2], 3);
}


TEST(SchedulerTest, DroppingTheHandleCancels)
{
    Scheduler sched;
    int fired = 0;
    auto keep = sched.createTimer(100, [&fired]() { fired += 1; });
    auto drop = sched.createTimer(100, [&fired]() { fired += 10; });
    drop = nullptr;

    sched.timerTick(100);
    EXPECT_EQ(fired, 1);
}


TEST(SchedulerTest, CallbackMayRearm)
{
    Scheduler sched;
    int fired = 0;
    std::shared_ptr<Timer> tmr;
    std::function<void()> cb = [&]() {
        fired++;
        tmr = sched.createTimer(TIMER_US(1), cb);
    };
    tmr = sched.createTimer(TIMER_US(1), cb);

    for (int i=0; i < 10000; i++) {
        sched.timerTick(1);
    }
    EXPECT_EQ(fired, 10);
    EXPECT_EQ(sched.pending(), 1);
}


TEST(SchedulerTest, TimeScaling)
{
    EXPECT_EQ(TIMER_US(1), 1000);
    EXPECT_EQ(TIMER_MS(2), 2000000);
    EXPECT_EQ(TIMER_US(2.5), 2500);
}

// vim: ts=8:et:sw=4:smarttab
