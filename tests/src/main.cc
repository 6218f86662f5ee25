#include "gtest/gtest.h"
#include "evabase.h"
#include "sgcfg.h"
#include "sg3rdparty.h"
#include "main.h"

#include <stdlib.h>
#include <iostream>
#include <locale.h>
#include <signal.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace sgate;

void pushEvents(int secTimeout, bool* abortVar)
{
	for(auto dateEnd = time(0) + secTimeout;
		time(0) < dateEnd
		&& (abortVar == nullptr || !*abortVar)
		&& ! evabase::GetGlobal().IsShuttingDown()
		;)
	{
		event_base_loop(evabase::base, EVLOOP_NONBLOCK | EVLOOP_ONCE);
	}
}

bool pushEventsUntil(int secTimeout, const std::function<bool()>& cond)
{
	for (auto dateEnd = time(0) + secTimeout; time(0) < dateEnd && !cond();)
		event_base_loop(evabase::base, EVLOOP_NONBLOCK | EVLOOP_ONCE);
	return cond();
}

int find_free_port()
{
	int fd = socket(AF_INET, SOCK_STREAM, 0);
	if (fd < 0)
		return -1;
	sockaddr_in addr {};
	addr.sin_family = AF_INET;
	addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
	addr.sin_port = 0;
	socklen_t len = sizeof(addr);
	int ret = -1;
	if (0 == ::bind(fd, (sockaddr*) &addr, sizeof(addr)) && 0 == getsockname(fd, (sockaddr*) &addr, &len))
		ret = ntohs(addr.sin_port);
	close(fd);
	return ret;
}

int main(int argc, char **argv)
{
	setlocale(LC_ALL, "C");
	// clients hang up while the server still writes, like in the daemon
	signal(SIGPIPE, SIG_IGN);
	sg3rdparty_init();
	auto p = sgate::evabase::Create();
	// quick retries, no persistence
	cfg::retrybackoffms = 10;
	cfg::statedir.clear();
	cfg::foreground = 1;

	::testing::InitGoogleTest(&argc, argv);
	auto r = RUN_ALL_TESTS();
	p->SignalStop();
	pushEvents(2, nullptr);
	sg3rdparty_deinit();
	return r;
}
