#include "sglogger.h"
#include "sgcfg.h"
#include "sgstrop.h"

#include <fstream>
#include <iostream>

using namespace std;

namespace sgate
{

namespace log
{

std::atomic_bool logIsEnabled(false);

static mutex mx;
static ofstream fErr, fTrans;
static bool bToStderr = true;

mstring open()
{
	lguard g(mx);
	if (cfg::logdir.empty())
	{
		bToStderr = true;
		return mstring();
	}
	auto base = cfg::logdir + "/streamgate";
	fErr.close();
	fTrans.close();
	fErr.open(base + ".err", ios::out | ios::app);
	fTrans.open(base + ".log", ios::out | ios::app);
	if (!fErr.is_open() || !fTrans.is_open())
		return "Cannot open " + base + ".err or " + base + ".log for writing";
	bToStderr = false;
	logIsEnabled = true;
	return mstring();
}

void close(bool bReopen)
{
	{
		lguard g(mx);
		if (!logIsEnabled)
			return;
		logIsEnabled = false;
		fErr.close();
		fTrans.close();
	}
	if (bReopen)
	{
		auto error = open();
		if (!error.empty())
			cerr << error << endl;
	}
}

void flush()
{
	lguard g(mx);
	if (bToStderr)
		cerr.flush();
	else
	{
		fErr.flush();
		fTrans.flush();
	}
}

bool IsEnabled(ETYPE what)
{
	return cfg::debug & what;
}

static void writeLine(ofstream& target, char cType, string_view msg, string_view client)
{
	char stamp[32];
	auto now = GetTime();
	struct tm tmp;
	auto len = strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", localtime_r(&now, &tmp));

	lguard g(mx);
	ostream& out = bToStderr ? static_cast<ostream&>(cerr) : target;
	out << string_view(stamp, len) << '|' << cType << '|';
	if (!client.empty())
		out << client << '|';
	out << msg << '\n';
	if (cfg::debug & LOG_FLUSH)
		out.flush();
}

void err(string_view msg, string_view client)
{
	writeLine(fErr, 'E', msg, client);
}

void misc(string_view msg, char cLogType)
{
	writeLine(fTrans, cLogType, msg, string_view());
}

void dbg(string_view msg)
{
	writeLine(fErr, 'D', msg, string_view());
}

void transfer(off_t bytesOut, string_view client, string_view path, string_view taskId, bool bAsError)
{
	auto line = ltos(bytesOut) + '|' + mstring(taskId) + '|' + mstring(path);
	writeLine(fTrans, bAsError ? 'E' : 'O', line, client);
}

}

}
