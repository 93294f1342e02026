// ----------------------------------------------------------------------------
// headers
// ----------------------------------------------------------------------------

#include "CoreCfgState.h"
#include "Ui.h"                 // for UI_error
#include "host.h"

// ------------------------------------------------------------------------
// public members
// ------------------------------------------------------------------------

// default constructor
CoreCfgState::CoreCfgState()
{
    m_reset_val.fill(0xFFFF);
}


// equality comparison
bool
CoreCfgState::operator==(const CoreCfgState &rhs) const
{
    assert(    m_initialized);
    assert(rhs.m_initialized);

    return (m_reset_val     == rhs.m_reset_val)     &&
           (m_image_path    == rhs.m_image_path)    &&
           (m_load_addr     == rhs.m_load_addr)     &&
           (m_clock_ns      == rhs.m_clock_ns)      &&
           (m_int_period_us == rhs.m_int_period_us) &&
           (m_int_vector    == rhs.m_int_vector)    &&
           (m_trace         == rhs.m_trace)         ;
}


bool
CoreCfgState::operator!=(const CoreCfgState &rhs) const
{
    return !(*this == rhs);
}


// establish a reasonable default state
void
CoreCfgState::setDefaults()
{
    m_reset_val.fill(0xFFFF);
    setImagePath("");
    setLoadAddr(0x0000);
    setClockPeriodNs(250);
    setIntPeriodUs(0);
    setIntVector(0xFF);
    setTraceEnabled(false);

    m_initialized = true;
}


const char *
CoreCfgState::resetRegName(reset_reg_t reg) noexcept
{
    static const char *names[NUM_RESET_REGS] = {
        "af",  "bc",  "de",  "hl",
        "af_alt", "bc_alt", "de_alt", "hl_alt",
        "ix",  "iy",  "sp"
    };
    assert(reg < NUM_RESET_REGS);
    return names[reg];
}


// read from configuration file
void
CoreCfgState::loadIni()
{
    setDefaults();

    // values the reset sequence doesn't define
    {
        const std::string subgroup("cpu/reset");
        for (int r=0; r < NUM_RESET_REGS; r++) {
            const reset_reg_t reg = static_cast<reset_reg_t>(r);
            int ival;
            host::configReadInt(subgroup, resetRegName(reg), &ival, 0xFFFF);
            if ((ival < 0) || (ival > 0xFFFF)) {
                UI_warn("The ini has a bad reset value for %s; using 0xFFFF",
                        resetRegName(reg));
                ival = 0xFFFF;
            }
            setResetValue(reg, static_cast<uint16>(ival));
        }
    }

    // what gets loaded into memory
    {
        const std::string subgroup("memory");
        std::string sval;
        const std::string none("");
        host::configReadStr(subgroup, "image", &sval, &none);
        setImagePath(sval);

        int ival;
        host::configReadInt(subgroup, "load_addr", &ival, 0x0000);
        setLoadAddr(ival);
    }

    // board timing
    {
        const std::string subgroup("board");
        int ival;

        host::configReadInt(subgroup, "clock_ns", &ival, 250);
        setClockPeriodNs(ival);

        host::configReadInt(subgroup, "int_period_us", &ival, 0);
        setIntPeriodUs(ival);

        host::configReadInt(subgroup, "int_vector", &ival, 0xFF);
        setIntVector(ival);
    }

    // get misc other config bits
    {
        const std::string subgroup("misc");
        bool bval;
        host::configReadBool(subgroup, "trace", &bval, false);
        setTraceEnabled(bval);
    }

    m_initialized = true;
}


// save to configuration file
void
CoreCfgState::saveIni() const
{
    assert(m_initialized);

    {
        const std::string subgroup("cpu/reset");
        for (int r=0; r < NUM_RESET_REGS; r++) {
            const reset_reg_t reg = static_cast<reset_reg_t>(r);
            host::configWriteHex(subgroup, resetRegName(reg), getResetValue(reg), 4);
        }
    }

    {
        const std::string subgroup("memory");
        host::configWriteStr(subgroup, "image", m_image_path);
        host::configWriteHex(subgroup, "load_addr", m_load_addr, 4);
    }

    {
        const std::string subgroup("board");
        host::configWriteInt(subgroup, "clock_ns",      m_clock_ns);
        host::configWriteInt(subgroup, "int_period_us", m_int_period_us);
        host::configWriteHex(subgroup, "int_vector",    m_int_vector, 2);
    }

    {
        const std::string subgroup("misc");
        host::configWriteBool(subgroup, "trace", m_trace);
    }
}


void
CoreCfgState::setResetValue(reset_reg_t reg, uint16 value) noexcept
{
    assert(reg < NUM_RESET_REGS);
    m_reset_val[reg] = value;
    m_initialized = true;
}


uint16
CoreCfgState::getResetValue(reset_reg_t reg) const noexcept
{
    assert(reg < NUM_RESET_REGS);
    return m_reset_val[reg];
}


void
CoreCfgState::setImagePath(const std::string &path)
{
    m_image_path = path;
    m_initialized = true;
}


const std::string &
CoreCfgState::getImagePath() const noexcept
{
    return m_image_path;
}


void
CoreCfgState::setLoadAddr(int addr) noexcept
{
    m_load_addr = addr;
    m_initialized = true;
}


int
CoreCfgState::getLoadAddr() const noexcept
{
    return m_load_addr;
}


void
CoreCfgState::setClockPeriodNs(int ns) noexcept
{
    m_clock_ns = ns;
    m_initialized = true;
}


int
CoreCfgState::getClockPeriodNs() const noexcept
{
    return m_clock_ns;
}


void
CoreCfgState::setIntPeriodUs(int us) noexcept
{
    m_int_period_us = us;
    m_initialized = true;
}


int
CoreCfgState::getIntPeriodUs() const noexcept
{
    return m_int_period_us;
}


void
CoreCfgState::setIntVector(int vec) noexcept
{
    m_int_vector = vec;
    m_initialized = true;
}


int
CoreCfgState::getIntVector() const noexcept
{
    return m_int_vector;
}


void
CoreCfgState::setTraceEnabled(bool trace) noexcept
{
    m_trace = trace;
    m_initialized = true;
}


bool
CoreCfgState::traceEnabled() const noexcept
{
    return m_trace;
}


// returns true if the current configuration is reasonable, and false if not.
// if returning false, this routine first calls UI_error() describing what
// is wrong.
bool
CoreCfgState::configOk(bool warn) const
{
    if (!m_initialized) {
        return false;
    }

    if ((m_load_addr < 0) || (m_load_addr > 0xFFFF)) {
        if (warn) {
            UI_error("Configuration problem: load address 0x%X is outside the address space",
                     m_load_addr);
        }
        return false;
    }

    // the Z80 datasheet minimum is 250 ns, but faster parts exist
    if ((m_clock_ns < 50) || (m_clock_ns > 100000)) {
        if (warn) {
            UI_error("Configuration problem: clock period of %d ns is unreasonable",
                     m_clock_ns);
        }
        return false;
    }

    // the scheduler can't look further ahead than 12 seconds
    if ((m_int_period_us < 0) || (m_int_period_us > 12000000)) {
        if (warn) {
            UI_error("Configuration problem: interrupt period of %d us is unreasonable",
                     m_int_period_us);
        }
        return false;
    }

    if ((m_int_vector < 0) || (m_int_vector > 0xFF)) {
        if (warn) {
            UI_error("Configuration problem: interrupt vector 0x%X isn't a byte",
                     m_int_vector);
        }
        return false;
    }

    return true;
}

// vim: ts=8:et:sw=4:smarttab
