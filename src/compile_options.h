#ifndef _INCLUDE_COMPILE_OPTIONS_H_
#define _INCLUDE_COMPILE_OPTIONS_H_

// define these switches below to turn various features on and off.
// these should be fairly safe to enable or disable.

// ========================================================================
//  CpuZ80.cpp options
// ========================================================================

// define to 1 to keep a running count of how many times each decoded
// instruction class retires.  it costs a little speed.
#define HAVE_OP_HISTOGRAM 0

// define to 1 to have the core check the register file write budget and
// the bus segment exclusivity every half cycle.  turning it off makes the
// core a bit faster, but design faults then go unreported.
#define CHECK_DATAPATH_RULES 1

// ========================================================================
// z80run options
// ========================================================================

// default name of the ini file holding the core configuration
#define DEFAULT_INI_NAME "z80cycle.ini"

// default name of the debug log, used when tracing is requested
#define DEFAULT_LOG_NAME "z80cycle.log"

// ========================================================================
// miscellaneous
// ========================================================================

// size of the flat address space and of the I/O port space
#define MEMORY_SIZE 65536
#define NUM_IOPORTS 256

#endif // _INCLUDE_COMPILE_OPTIONS_H_

// vim: ts=8:et:sw=4:smarttab
