#ifndef SGATE_DEBUG_H
#define SGATE_DEBUG_H

#include "sglogger.h"

#include <sstream>

#define USRDBG(msg) { if (::sgate::log::IsEnabled(::sgate::log::LOG_DEBUG)) \
	{ std::ostringstream __logstrm; __logstrm << msg; ::sgate::log::dbg(__logstrm.str()); } }
#define USRERR(msg) { std::ostringstream __logstrm; __logstrm << msg; ::sgate::log::err(__logstrm.str()); }
#define USRINFO(msg) { std::ostringstream __logstrm; __logstrm << msg; ::sgate::log::misc(__logstrm.str()); }

#ifdef DEBUG

#include <cassert>

#define ASSERT(x) assert(x)
#define IFDEBUG(x) x
#define IFDEBUGELSE(x, y) x
#define LOG(msg) USRDBG(msg)
#define DBGQLOG(msg) USRDBG(msg)
#define ldbg(msg) USRDBG(__FUNCTION__ << ": " << msg)
#define dbgline ldbg("mark: " << __LINE__)
#define LOGSTARTFUNC ldbg("start")
#define LOGSTARTFUNCx(x) ldbg("start: " << x)

#else

#define ASSERT(x)
#define IFDEBUG(x)
#define IFDEBUGELSE(x, y) y
#define LOG(x)
#define DBGQLOG(x)
#define ldbg(x)
#define dbgline
#define LOGSTARTFUNC
#define LOGSTARTFUNCx(x)

#endif

#endif // SGATE_DEBUG_H
