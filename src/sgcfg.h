#ifndef SGCFG_H
#define SGCFG_H

#include "sgtypes.h"
#include "sgstrop.h"

#include <iosfwd>

extern "C"
{
struct timeval;
}

namespace sgate
{

namespace cfg
{

extern mstring logdir, bindaddr, pidfile, statedir, gatewayurl, bottoken, workertokens,
cafile, capath, logchannel, expiredtext, agentname;

extern int port, debug, foreground, nettimeout, chunksize, smallfilemb, linkexpiry,
cachecleaninterval, allocsweepinterval, bwlimitgb, bwflushinterval, maxreqsperip, reqwindow,
maxtrackedips, acquiretimeout, streamtimeout, maxmetaretries, maxstreamretries, maxfailovers,
retrybackoffms, maxfloodwait, sendwindow;

// derived values, set by PostProcConfig
extern int64_t channelId;
extern tStrVec workerTokenList;

/**
 * Applies one "Key: value" or "Key=value" setting.
 * @return false if the key is unknown or the value cannot be used
 */
bool SetOption(string_view line, bool bQuiet);
/**
 * Reads a configuration file with one setting per line, # starts a comment
 */
bool ReadConfigFile(cmstring& path, bool bReportErrors);
/**
 * Validates the combination of settings and calculates the derived values.
 * @return Error description, empty on success
 */
mstring PostProcConfig();
void dump_config(std::ostream& out);

const struct timeval* GetNetworkTimeout();
off_t GetSmallFileThreshold();
off_t GetBandwidthLimit();

}

}

#endif // SGCFG_H
