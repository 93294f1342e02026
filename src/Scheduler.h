// Board time keeping.  The core counts clocks; the board around it needs to
// do things at points in simulated time, such as raising the INT line every
// so many microseconds or pulsing NMI.  A finite number of one-shot timers
// can be outstanding at any given time.

#ifndef _INCLUDE_SCHEDULER_H_
#define _INCLUDE_SCHEDULER_H_

#include "z80cycle.h"

// what a timer does when it comes due
using sched_callback_t = std::function<void()>;

class Scheduler;

// handle returned by Scheduler::createTimer().  dropping the last reference
// cancels the timer.
class Timer
{
    CANT_ASSIGN_OR_COPY_CLASS(Timer);

    friend class Scheduler;

public:
    // time_ns is the absolute simulated time the callback fires
    Timer(int64 time_ns, sched_callback_t cb) :
            m_expires_ns(time_ns), m_callback(std::move(cb)) { };

    int64 expiresNs() const noexcept { return m_expires_ns; }

private:
    int64             m_expires_ns;
    sched_callback_t  m_callback;
};


class Scheduler
{
public:
    Scheduler() = default;

    // fire fcn 'ns' nanoseconds of simulated time from now, e.g.
    //
    //   m_int_timer = m_sched.createTimer(TIMER_US(period),
    //                          std::bind(&FlatBus::intTimerFired, this));
    //
    // the caller keeps the handle as long as it wants the event.
    std::shared_ptr<Timer> createTimer(int64 ns, const sched_callback_t &fcn);

    // let 'ns' nanoseconds of simulated time go past; normally one clock
    inline void timerTick(int ns)
    {
        m_time_ns += ns;
        if (m_time_ns >= m_trigger_ns) {
            creditTimer();
        }
    }

    // simulated time since construction
    int64 nowNs() const noexcept { return m_time_ns; }

    // number of timers not yet retired, live or cancelled
    int pending() const noexcept { return static_cast<int>(m_timer.size()); }

private:
    // a runaway board model shows up as a growing timer list
    static const int MAX_TIMERS = 8;

    static const int64 MAX_TIME = (1LL << 62);

    // run the callbacks of every timer that has come due
    void creditTimer();

    // absolute time of the soonest timer
    int64 firstEvent() const noexcept;

    int64 m_time_ns    = 0LL;
    int64 m_trigger_ns = MAX_TIME;

    std::vector<std::shared_ptr<Timer>> m_timer;
};

// scale us/ms to ns, which is what createTimer() expects
constexpr int64 TIMER_US(double f) { return static_cast<int64>(   1000.0*f+0.5); }
constexpr int64 TIMER_MS(double f) { return static_cast<int64>(1000000.0*f+0.5); }

#endif // _INCLUDE_SCHEDULER_H_

// vim: ts=8:et:sw=4:smarttab
