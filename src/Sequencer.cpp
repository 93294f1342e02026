// machine cycle / T state counter

#include "Sequencer.h"

void
Sequencer::reset() noexcept
{
    m_m = 1;
    m_t = 1;
    m_waits = 0;
}


bool
Sequencer::advance(next_t next) noexcept
{
    switch (next) {
        case NX_HOLD:
            m_waits++;
            return true;
        case NX_T:
            m_t++;
            break;
        case NX_M:
            m_m++;
            m_t = 1;
            break;
        case NX_M1:
        default:
            m_m = 1;
            m_t = 1;
            break;
    }
    m_waits = 0;
    return (m_m <= MAX_M) && (m_t <= MAX_T);
}

// vim: ts=8:et:sw=4:smarttab
