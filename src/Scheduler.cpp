// Timers are one-shots.  A board device that wants a periodic event, like
// the interrupt source in FlatBus, creates a new timer from the callback of
// the previous one.
//
// When simulated time passes the soonest expiration, every timer is checked,
// as more than one may be due.  Due timers move to a retirement list first,
// and only then run their callbacks, because a callback is allowed to call
// createTimer().  A timer whose only owner is the scheduler has been
// cancelled and is quietly dropped.

#include "Scheduler.h"
#include "Ui.h"         // for UI_warn()

#include <algorithm>    // for std::sort

std::shared_ptr<Timer>
Scheduler::createTimer(int64 ns, const sched_callback_t &fcn)
{
    assert(ns >= 1);
    assert(ns <= 12E9);      // 12 seconds

    if (static_cast<int>(m_timer.size()) >= MAX_TIMERS) {
        UI_warn("%d board timers are outstanding", static_cast<int>(m_timer.size()));
    }

    auto tmr = std::make_shared<Timer>(m_time_ns + ns, fcn);
    m_timer.push_back(tmr);
    m_trigger_ns = firstEvent();

    return tmr;
}


int64
Scheduler::firstEvent() const noexcept
{
    int64 rv = MAX_TIME;
    for (auto &t : m_timer) {
        if (t->m_expires_ns < rv) {
            rv = t->m_expires_ns;
        }
    }
    return rv;
}


void
Scheduler::creditTimer()
{
    if (m_timer.empty()) {
        m_trigger_ns = MAX_TIME;
        return;
    }

    std::vector<std::shared_ptr<Timer>> retired;
    std::vector<std::shared_ptr<Timer>> active;
    for (auto &t : m_timer) {
        if (t.use_count() == 1) {
            continue;           // cancelled
        }
        if (t->m_expires_ns <= m_time_ns) {
            retired.push_back(t);
        } else {
            active.push_back(t);
        }
    }
    m_timer.swap(active);
    m_trigger_ns = firstEvent();

    // callbacks run in expiration order
    std::sort(begin(retired), end(retired),
              [](const std::shared_ptr<Timer> &a,
                 const std::shared_ptr<Timer> &b) {
                    return (a->m_expires_ns < b->m_expires_ns);
               });

    for (auto &t : retired) {
        (t->m_callback)();
    }
}

// vim: ts=8:et:sw=4:smarttab
