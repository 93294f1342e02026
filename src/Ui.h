// we don't want any of the core emulator to directly touch any of the
// front end includes or functions.
//
// in the cases where the core needs to talk to the user, we have a
// non-member function that the core can call, and that function is
// just a thunk into the front end.

#ifndef _INCLUDE_UI_H_
#define _INCLUDE_UI_H_

#include "z80cycle.h"

// =============================================================
// exported by UI
// =============================================================

// ---- general status notification ----

// send an error/warning to the user
void UI_error(const char *fmt, ...);
void UI_warn(const char *fmt, ...);
void UI_info(const char *fmt, ...);

// inform the UI how far along the simulation is in emulated time, and the
// effective clock rate
void UI_setSimTime(uint64 tstates, float mhz);

#endif // _INCLUDE_UI_H_

// vim: ts=8:et:sw=4:smarttab
