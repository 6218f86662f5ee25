#include "sgcfg.h"
#include "sglogger.h"
#include "sgstrop.h"
#include "debug.h"

#include <fstream>
#include <iostream>

#include <sys/time.h>
#include <strings.h>

using namespace std;

namespace sgate
{

namespace cfg
{

mstring logdir, bindaddr, pidfile, statedir, bottoken, workertokens, cafile, capath;
mstring gatewayurl("http://127.0.0.1:8081");
mstring logchannel("0");
mstring expiredtext("This download link has expired");
mstring agentname("StreamGate/" SGATE_VERSION);

int port(8080), debug(0), foreground(0), nettimeout(40), chunksize(512*1024), smallfilemb(300),
linkexpiry(86400), cachecleaninterval(1800), allocsweepinterval(60), bwlimitgb(100),
bwflushinterval(300), maxreqsperip(15), reqwindow(600), maxtrackedips(1000), acquiretimeout(30),
streamtimeout(3*3600), maxmetaretries(3), maxstreamretries(2), maxfailovers(3), retrybackoffms(2000),
maxfloodwait(30), sendwindow(1024*1024);

int64_t channelId = 0;
tStrVec workerTokenList;

struct MapNameToString
{
	const char *name; mstring *ptr;
};

struct MapNameToInt
{
	const char *name; int *ptr;
	const char *warn;
	int minval;
};

MapNameToString n2sTbl[] = {
		{ "LogDir", &logdir },
		{ "BindAddress", &bindaddr },
		{ "PidFile", &pidfile },
		{ "StateDir", &statedir },
		{ "GatewayUrl", &gatewayurl },
		{ "BotToken", &bottoken },
		{ "WorkerTokens", &workertokens },
		{ "CAfile", &cafile },
		{ "CApath", &capath },
		{ "LogChannel", &logchannel },
		{ "ExpiredLinkText", &expiredtext },
		{ "ServerName", &agentname }
};

MapNameToInt n2iTbl[] = {
		{ "Port", &port, nullptr, 0 },
		{ "Debug", &debug, nullptr, 0 },
		{ "ForeGround", &foreground, nullptr, 0 },
		{ "NetworkTimeout", &nettimeout, nullptr, 1 },
		{ "ChunkSize", &chunksize, nullptr, 4096 },
		{ "SmallFileThresholdMB", &smallfilemb, nullptr, 0 },
		{ "LinkExpirySeconds", &linkexpiry, nullptr, 0 },
		{ "CacheCleanInterval", &cachecleaninterval, nullptr, 1 },
		{ "AllocSweepInterval", &allocsweepinterval, nullptr, 1 },
		{ "BandwidthLimitGB", &bwlimitgb, nullptr, 0 },
		{ "BandwidthFlushInterval", &bwflushinterval, nullptr, 1 },
		{ "MaxRequestsPerIP", &maxreqsperip, nullptr, 0 },
		{ "RequestWindow", &reqwindow, nullptr, 1 },
		{ "MaxTrackedIPs", &maxtrackedips, nullptr, 2 },
		{ "AcquireTimeout", &acquiretimeout, nullptr, 1 },
		{ "StreamTimeout", &streamtimeout, nullptr, 1 },
		{ "MaxMetaRetries", &maxmetaretries, nullptr, 0 },
		{ "MaxStreamRetries", &maxstreamretries, nullptr, 0 },
		{ "MaxFailovers", &maxfailovers, nullptr, 0 },
		{ "RetryBackoffMs", &retrybackoffms, nullptr, 0 },
		{ "MaxFloodWait", &maxfloodwait, nullptr, 0 },
		{ "SendWindow", &sendwindow, nullptr, 4096 },
		// obsolete spelling from older sample configs
		{ "MaxLinkAge", &linkexpiry, "MaxLinkAge is deprecated, use LinkExpirySeconds", 0 }
};

static bool ParseOptionLine(string_view line, string_view& key, string_view& val)
{
	auto pos = line.find_first_of(":=");
	if (pos == stmiss)
		return false;
	key = trimmed(line.substr(0, pos));
	val = trimmed(line.substr(pos + 1));
	return !key.empty();
}

mstring* GetStringPtr(string_view key)
{
	for(auto& ent : n2sTbl)
		if (scaseequals(key, ent.name))
			return ent.ptr;
	return nullptr;
}

MapNameToInt* GetIntEntry(string_view key)
{
	for(auto& ent : n2iTbl)
		if (scaseequals(key, ent.name))
			return &ent;
	return nullptr;
}

bool SetOption(string_view line, bool bQuiet)
{
	string_view key, value;
	if (!ParseOptionLine(line, key, value))
	{
		if (!bQuiet)
			cerr << "Not a configuration directive: " << line << endl;
		return false;
	}

	if (auto ps = GetStringPtr(key))
	{
		ps->assign(value.data(), value.size());
		return true;
	}
	if (auto pi = GetIntEntry(key))
	{
		if (pi->warn && !bQuiet)
			cerr << "Warning, " << key << ": " << pi->warn << endl;
		int64_t n;
		if (!ParseInt64(value, n) || n < pi->minval || n > INT32_MAX)
		{
			if (!bQuiet)
				cerr << "Invalid number for " << key << ": " << value << endl;
			return false;
		}
		*pi->ptr = int(n);
		return true;
	}
	if (!bQuiet)
		cerr << "Unknown configuration directive: " << key << endl;
	return false;
}

bool ReadConfigFile(cmstring& path, bool bReportErrors)
{
	ifstream in(path);
	if (!in.is_open())
	{
		if (bReportErrors)
			cerr << "Error opening configuration file " << path << endl;
		return false;
	}
	mstring line;
	unsigned lineNr = 0;
	bool ret = true;
	while (getline(in, line))
	{
		++lineNr;
		string_view sv(line);
		auto cpos = sv.find('#');
		if (cpos != stmiss)
			sv = sv.substr(0, cpos);
		trimBoth(sv);
		if (sv.empty())
			continue;
		if (!SetOption(sv, !bReportErrors))
		{
			if (bReportErrors)
				cerr << "Error in " << path << ", line " << lineNr << endl;
			ret = false;
		}
	}
	return ret;
}

mstring PostProcConfig()
{
	if (!ParseInt64(trimmed(logchannel), channelId))
		return "LogChannel must be a numeric channel id";

	workerTokenList.clear();
	for (auto tok : tSplitWalk(workertokens, ", \t"sv))
		workerTokenList.emplace_back(tok);

	// the upstream serves power-of-two sized pieces of a 1 MiB block
	if (chunksize % 4096 || (1024 * 1024) % chunksize)
		return "ChunkSize must be a multiple of 4096 which divides 1048576";

	if (bottoken.empty())
		return "BotToken is not set";

	if (gatewayurl.empty())
		return "GatewayUrl is not set";

	if (!statedir.empty() && !endsWith(statedir, "/"))
		statedir += '/';

	return mstring();
}

void dump_config(std::ostream& out)
{
	for (const auto& ent: n2sTbl)
	{
		// keep the secrets out of the dumps
		if (ent.ptr == &bottoken || ent.ptr == &workertokens)
			out << ent.name << " = (" << (ent.ptr->empty() ? "unset" : "set") << ")\n";
		else
			out << ent.name << " = " << *ent.ptr << "\n";
	}
	for (const auto& ent: n2iTbl)
	{
		if (!ent.warn)
			out << ent.name << " = " << *ent.ptr << "\n";
	}
}

const struct timeval* GetNetworkTimeout()
{
	static struct timeval tv;
	tv.tv_sec = nettimeout;
	tv.tv_usec = 23;
	return &tv;
}

off_t GetSmallFileThreshold()
{
	return off_t(smallfilemb) * 1024 * 1024;
}

off_t GetBandwidthLimit()
{
	return off_t(bwlimitgb) * 1024 * 1024 * 1024;
}

}

}
