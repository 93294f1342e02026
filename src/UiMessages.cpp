// The console front end has no dialogs; user messages go through the
// wxWidgets logging chain, which prints them on stderr for a wxAppConsole
// (and for the unit tests, which have no application object at all).

#include "Ui.h"

#include "wx/log.h"

#include <cstdarg>

// ============================================================================
// alert messages
// ============================================================================

// shared code
static std::string
UI_formatMsg(const char *fmt, va_list &args)
{
    char buff[1000];
    vsnprintf(&buff[0], sizeof(buff), fmt, args);
    return std::string(&buff[0]);
}


void
UI_error(const char *fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    const std::string msg = UI_formatMsg(fmt, args);
    va_end(args);
    wxLogError("%s", msg.c_str());
}


void
UI_warn(const char *fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    const std::string msg = UI_formatMsg(fmt, args);
    va_end(args);
    wxLogWarning("%s", msg.c_str());
}


void
UI_info(const char *fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    const std::string msg = UI_formatMsg(fmt, args);
    va_end(args);
    wxLogMessage("%s", msg.c_str());
}


// there is no status bar; progress is only visible with verbose logging
void
UI_setSimTime(uint64 tstates, float mhz)
{
    wxLogVerbose("%llu T-states, %.2f MHz", (unsigned long long)tstates,
                 static_cast<double>(mhz));
}

// vim: ts=8:et:sw=4:smarttab
