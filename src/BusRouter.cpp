// three segment internal data bus

#include "BusRouter.h"

BusRouter::BusRouter() :
    m_switches(0),
    m_committed(false),
    m_fault(false)
{
    beginPhase();
}


void
BusRouter::beginPhase() noexcept
{
    for (int s=0; s < NUM_SEGS; s++) {
        m_seg[s].src   = SRC_NONE;
        m_seg[s].value = 0xFF;
        m_net_val[s]   = 0xFF;
        m_net_src[s]   = SRC_NONE;
    }
    m_switches  = 0;
    m_committed = false;
}


void
BusRouter::propose(seg_t seg, src_t src, uint8 value) noexcept
{
    assert(seg < NUM_SEGS);
    assert(src != SRC_NONE);
    if (m_committed || (m_seg[seg].src != SRC_NONE)) {
        m_fault = true;     // late driver, or two drivers on one segment
        return;
    }
    m_seg[seg].src   = src;
    m_seg[seg].value = value;
}


void
BusRouter::commit() noexcept
{
    if (m_committed) {
        m_fault = true;
        return;
    }

    // segments are in a line, so a net is a run of segments joined by
    // closed switches.  switch i joins segment i and i+1.
    int first = 0;
    while (first < NUM_SEGS) {
        int last = first;
        while ((last+1 < NUM_SEGS) && (m_switches & (1 << last))) {
            last++;
        }

        src_t src   = SRC_NONE;
        uint8 value = 0xFF;     // an undriven net floats high
        for (int s=first; s <= last; s++) {
            if (m_seg[s].src == SRC_NONE) {
                continue;
            }
            if (src != SRC_NONE) {
                m_fault = true;     // contention
            }
            src   = m_seg[s].src;
            value = m_seg[s].value;
        }
        for (int s=first; s <= last; s++) {
            m_net_src[s] = src;
            m_net_val[s] = value;
        }

        first = last + 1;
    }

    m_committed = true;
}


uint8
BusRouter::read(seg_t seg) noexcept
{
    assert(seg < NUM_SEGS);
    if (!m_committed) {
        m_fault = true;     // consumer ran ahead of the second pass
        return 0xFF;
    }
    return m_net_val[seg];
}


int
BusRouter::pathBetween(seg_t a, seg_t b) noexcept
{
    const int lo = (a < b) ? a : b;
    const int hi = (a < b) ? b : a;
    int sw = 0;
    for (int s=lo; s < hi; s++) {
        sw |= (1 << s);
    }
    return sw;
}


uint8
BusRouter::route(src_t src, uint8 value, seg_t from, seg_t to) noexcept
{
    propose(from, src, value);
    connect(pathBetween(from, to));
    commit();
    return read(to);
}

// vim: ts=8:et:sw=4:smarttab
