#include "FlatBus.h"
#include "Ui.h"
#include "host.h"

#include <fstream>

FlatBus::FlatBus()
{
    m_mem.fill(0x00);
    m_in.fill(0xFF);
    m_out.fill(0xFF);
    m_wait_armed.fill(0);
}


FlatBus::~FlatBus()
{
    m_int_timer = nullptr;
}


void
FlatBus::load(uint16 addr, const std::vector<uint8> &bytes) noexcept
{
    uint16 a = addr;
    for (auto b : bytes) {
        m_mem[a++] = b;
    }
}


bool
FlatBus::loadImage(const std::string &path, int addr)
{
    assert(addr >= 0 && addr < MEMORY_SIZE);

    std::ifstream ifs(path.c_str(), std::ifstream::in | std::ifstream::binary);
    if (!ifs.good()) {
        UI_error("Couldn't open image file '%s'", path.c_str());
        return false;
    }

    std::vector<uint8> bytes;
    char c;
    while (ifs.get(c)) {
        bytes.push_back(static_cast<uint8>(c));
    }
    if (!ifs.eof()) {
        UI_error("Error reading image file '%s'", path.c_str());
        return false;
    }

    if (addr + static_cast<int>(bytes.size()) > MEMORY_SIZE) {
        UI_error("Image file '%s' is %d bytes; it doesn't fit at 0x%04X",
                 path.c_str(), static_cast<int>(bytes.size()), addr);
        return false;
    }

    load(static_cast<uint16>(addr), bytes);
    dbglog("loaded %d bytes from '%s' at 0x%04X\n",
           static_cast<int>(bytes.size()), path.c_str(), addr);
    return true;
}


void
FlatBus::startIntTimer(int period_us, int clock_ns)
{
    assert(clock_ns > 0);
    m_int_period_us = period_us;
    m_clock_ns      = clock_ns;
    m_int_timer     = nullptr;      // cancels any running one
    if (period_us > 0) {
        m_int_timer = m_sched.createTimer(TIMER_US(period_us),
                                          std::bind(&FlatBus::intTimerFired, this));
    }
}


void
FlatBus::intTimerFired()
{
    m_int = true;
    m_int_timer = m_sched.createTimer(TIMER_US(m_int_period_us),
                                      std::bind(&FlatBus::intTimerFired, this));
}


void
FlatBus::armWait(cycle_t kind, int n) noexcept
{
    assert(kind > CYC_NONE && kind < NUM_CYCLE_KINDS);
    assert(n >= 0);
    m_wait_armed[kind] = n;
}


FlatBus::cycle_t
FlatBus::cycleOf(const z80pins_t &pins) noexcept
{
    if (pins.bus_float || pins.rfsh) {
        return CYC_NONE;
    }
    if (pins.m1) {
        if (pins.iorq) { return CYC_INTACK; }
        if (pins.mreq) { return CYC_FETCH; }
        return CYC_NONE;
    }
    if (pins.mreq) {
        if (pins.rd) { return CYC_MEMRD; }
        if (pins.wr || pins.data_oe) { return CYC_MEMWR; }
        return CYC_NONE;
    }
    if (pins.iorq) {
        if (pins.rd) { return CYC_IORD; }
        if (pins.wr) { return CYC_IOWR; }
    }
    return CYC_NONE;
}


// The cpu samples WAIT at the fall of T2 and of each wait state, once its
// automatic wait states are used up.  Memory cycles show their strobes at
// the T1 fall, so the next fall is the first one sampled.  I/O cycles show
// IORQ at T2 and interrupt acknowledge at the T2 fall; both have one
// automatic wait still to go when the board first sees them.
void
FlatBus::busEdge(z80pins_t &pins, bool rising)
{
    if (rising) {
        m_sched.timerTick(m_clock_ns);
    } else if (m_wait_falls > 0) {
        if (--m_wait_falls == 0) {
            pins.wait = false;
        }
    }

    const cycle_t cyc = cycleOf(pins);
    if (cyc != m_cycle) {
        m_cycle = cyc;
        if (cyc != CYC_NONE) {
            // a new cycle has started
            const int n = m_wait_armed[cyc];
            if (n > 0) {
                m_wait_armed[cyc] = 0;
                const bool auto_wait = (cyc == CYC_IORD) || (cyc == CYC_IOWR)
                                    || (cyc == CYC_INTACK);
                m_wait_falls = n + ((auto_wait) ? 1 : 0);
                pins.wait = true;
            }
            if (cyc == CYC_IOWR) {
                m_out[pins.addr & 0xFF] = pins.data;
                m_out_log.push_back({ pins.addr, pins.data });
            }
            if (cyc == CYC_INTACK) {
                m_int_acks++;
                m_int = false;      // the device withdraws its request
            }
        }
    }

    switch (cyc) {
        case CYC_FETCH:
        case CYC_MEMRD:
            if (!pins.data_oe) {
                pins.data = m_mem[pins.addr];
            }
            break;
        case CYC_MEMWR:
            if (pins.wr) {
                m_mem[pins.addr] = pins.data;
            }
            break;
        case CYC_IORD:
            if (!pins.data_oe) {
                pins.data = m_in[pins.addr & 0xFF];
            }
            break;
        case CYC_INTACK:
            pins.data = m_int_vector;
            break;
        default:
            break;
    }

    pins.intr = m_int;
    pins.nmi  = m_nmi;
}

// vim: ts=8:et:sw=4:smarttab
