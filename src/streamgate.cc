#include "config.h"
#include "debug.h"
#include "sgcfg.h"
#include "sglogger.h"
#include "sgstrop.h"
#include "sg3rdparty.h"
#include "evabase.h"
#include "aevutil.h"
#include "sgres.h"
#include "connpool.h"
#include "conserver.h"

#include <iostream>
#include <list>
#include <memory>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <cstdio>

#include <signal.h>
#include <unistd.h>

using namespace std;

namespace sgate
{

static void usage(int nRetCode=0);
void term_handler(evutil_socket_t fd, short what, void *arg);
void log_handler(evutil_socket_t fd, short what, void *arg);
void noop_handler(evutil_socket_t fd, short what, void *arg);

std::unique_ptr<sgres> sharedResources;
lint_ptr<conserver> g_server;
int g_exitCode = EXIT_SUCCESS;

inline bool fork_away()
{
	return !daemon(0,0);
}

void parse_options(int argc, const char **argv)
{
	bool bExtraVerb=false;
	LPCSTR szCfgFile=nullptr;
	std::vector<LPCSTR> cmdvars;
	bool ignoreCfgErrors = false;
	bool dumpConfig = false;

	for (auto p=argv+1; p<argv+argc; p++)
	{
		if (!strncmp(*p, "--", 2))
			break;
		if (!strncmp(*p, "-h", 2))
			usage();
		if (!strncmp(*p, "-i", 2))
			ignoreCfgErrors = true;
		else if (!strncmp(*p, "-v", 2))
			bExtraVerb = true;
		else if (!strncmp(*p, "-d", 2))
			dumpConfig = true;
		else if (!strcmp(*p, "-c"))
		{
			++p;
			if (p < argv + argc)
				szCfgFile = *p;
			else
				usage(2);
		}
		else if(**p) // not empty
			cmdvars.emplace_back(*p);
	}

	if (szCfgFile && !cfg::ReadConfigFile(szCfgFile, !ignoreCfgErrors) && !ignoreCfgErrors)
		exit(EXIT_FAILURE);

	for (auto& keyval : cmdvars)
		if (!cfg::SetOption(keyval, false))
			usage(EXIT_FAILURE);

	auto err = cfg::PostProcConfig();
	if (!err.empty())
	{
		cerr << "Configuration error: " << err << endl;
		exit(EXIT_FAILURE);
	}

	if (bExtraVerb)
		cfg::debug |= (log::LOG_DEBUG|log::LOG_MORE);

	if (dumpConfig)
	{
		cfg::dump_config(cout);
		exit(EXIT_SUCCESS);
	}
}

struct sigMapping
{
	int snum;
	decltype(term_handler) &cb;
}
const sigMap[] =
{
{SIGTERM, term_handler},
{SIGINT, term_handler},
{SIGQUIT, term_handler},
{SIGUSR1, log_handler},
{SIGPIPE, noop_handler},
#ifdef SIGXFSZ
{SIGXFSZ, noop_handler},
#endif
};

std::list<unique_event> sigEvents;

static void usage(int retCode)
{
	auto& chan = retCode ? cerr : cout;
	chan << "Usage: streamgate [options] [ -c configfile ] <var=value ...>\n\n"
		"Options:\n"
		"-h: this help message\n"
		"-c: configuration file\n"
		"-i: ignore configuration loading errors\n"
		"-v: extra verbosity in logging\n"
		"-d: print the effective configuration and exit\n"
		"\n"
		"Most interesting variables:\n"
		"ForeGround: Don't detach (default: 0)\n"
		"Port: TCP port number (default: 8080)\n"
		"BotToken: credentials of the primary session\n"
		"WorkerTokens: comma separated credentials of the worker sessions\n"
		"LogChannel: numeric id of the channel which keeps the files\n"
		"GatewayUrl: base URL of the bot gateway\n"
		"LogDir: /directory/for/logfiles\n"
		"StateDir: /directory/for/the/bandwidth/records\n";
	chan.flush();
	exit(retCode);
}

void log_handler(evutil_socket_t, short, void*)
{
	log::close(true);
}

void noop_handler(evutil_socket_t, short, void*)
{
}

static void stop_serving()
{
	if (g_server)
		g_server->Shutdown();
	if (!sharedResources)
		return evabase::SignalStop();
	// upstream sessions are closed politely, then the loop can end
	sharedResources->GetPool().Stop([]() { evabase::SignalStop(); });
}

void term_handler(evutil_socket_t signum, short, void*)
{
	DBGQLOG("caught signal " << signum);
	switch (signum)
	{
	case (SIGTERM):
	case (SIGINT):
	case (SIGQUIT):
		if (evabase::GetGlobal().IsShuttingDown())
			return;
		log::misc("Shutting down on signal "s + ltos(signum));
		return stop_serving();
	default:
		return;
	}
}

void start_listening(bool primaryOk)
{
	if (!primaryOk)
	{
		cerr << "The primary upstream session could not be established, see the error log for details." << endl;
		log::err("Primary upstream session failed, exiting");
		g_exitCode = EXIT_FAILURE;
		return stop_serving();
	}
	g_server = conserver::Create(*sharedResources);
	auto nSockets = g_server->Setup();
	if (!nSockets)
	{
		cerr << "No listening socket(s) could be created/prepared. "
				"Check the network, check or unset the BindAddress directive." << endl;
		g_exitCode = EXIT_FAILURE;
		return stop_serving();
	}
	log::misc("Serving downloads on port "s + ltos(cfg::port) + ", "s + ltos(nSockets) + " listening socket(s)"s);
}

void daemon_init()
{
	auto lerr = log::open();
	if (!lerr.empty())
	{
		cerr << "Problem creating log files in " << cfg::logdir << ". " << lerr << ".\n";
		exit(EXIT_FAILURE);
	}

	for (auto& el: sigMap)
	{
		event_add(sigEvents
				  .emplace_back(event_new(evabase::base, el.snum, EV_SIGNAL|EV_PERSIST, el.cb, 0)).m_p,
				  nullptr);
	}

	if (!cfg::foreground && !fork_away())
	{
		cerr << "Failed to change to daemon mode: " << strerror(errno) << endl;
		exit(43);
	}
	// the child has a new event backend instance
	if (!cfg::foreground)
		event_reinit(evabase::base);

	if (!cfg::pidfile.empty())
	{
		auto* PID_FILE = fopen(cfg::pidfile.c_str(), "w");
		if (PID_FILE != nullptr)
		{
			fprintf(PID_FILE, "%d", getpid());
			fclose(PID_FILE);
		}
	}

	sharedResources.reset(sgres::Create());
	log::misc("Starting upstream sessions, "s + ltos(cfg::workerTokenList.size()) + " worker(s) configured"s);
	sharedResources->GetPool().Start(cfg::bottoken, cfg::workerTokenList, start_listening);
}

void daemon_deinit()
{
	if (!cfg::pidfile.empty())
		unlink(cfg::pidfile.c_str());
	g_server.reset();
	// saves the bandwidth records
	sharedResources.reset();
	sigEvents.clear();
	log::close(false);
}

}

int main(int argc, const char **argv)
{
	using namespace sgate;

	sg3rdparty_init();
	atexit(sg3rdparty_deinit);

	auto eBase = evabase::Create();

	parse_options(argc, argv);

	daemon_init();

	eBase->MainLoop();

	daemon_deinit();

	return g_exitCode;
}
