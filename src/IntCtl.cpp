// interrupt arbitration

#include "IntCtl.h"

void
IntCtl::reset() noexcept
{
    m_iff1        = false;
    m_iff2        = false;
    m_mode        = 0;
    m_nmi_prev    = false;
    m_nmi_latched = false;
    m_ei_shadow   = false;
}


void
IntCtl::sampleNmi(bool level) noexcept
{
    if (level && !m_nmi_prev) {
        m_nmi_latched = true;
    }
    m_nmi_prev = level;
}


IntCtl::svc_t
IntCtl::arbitrate(bool int_level) noexcept
{
    const bool shadow = m_ei_shadow;
    m_ei_shadow = false;

    if (m_nmi_latched) {
        // IFF2 keeps the old state so RETN can bring it back
        m_nmi_latched = false;
        m_iff1 = false;
        return SVC_NMI;
    }

    if (int_level && m_iff1 && !shadow) {
        m_iff1 = m_iff2 = false;
        return SVC_INT;
    }

    return SVC_NONE;
}

// vim: ts=8:et:sw=4:smarttab
