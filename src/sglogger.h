#ifndef SGLOGGER_H
#define SGLOGGER_H

#include "sgtypes.h"

#include <atomic>

namespace sgate
{

namespace log
{

enum ETYPE
{
	LOG_FLUSH = 1,
	LOG_MORE = 2,
	LOG_DEBUG = 4,
	LOG_DEBUG_MORE = 8
};

// true when the file logs are open
extern std::atomic_bool logIsEnabled;

/**
 * Opens the log files in cfg::logdir, or attaches to stderr if no directory is configured.
 * @return Error description, empty on success
 */
mstring open();
void close(bool bReopen);
void flush();

bool IsEnabled(ETYPE what);

// error log, optionally naming the client which caused it
void err(string_view msg, string_view client = string_view());
// general messages of the daemon
void misc(string_view msg, char cLogType = 'M');
void dbg(string_view msg);

/**
 * Records one finished (or aborted) delivery in the transfer log
 */
void transfer(off_t bytesOut, string_view client, string_view path, string_view taskId, bool bAsError);

}

}

#endif // SGLOGGER_H
