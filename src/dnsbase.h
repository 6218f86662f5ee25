#ifndef DNSBASE_H
#define DNSBASE_H

#include "sgtypes.h"
#include "sgstrop.h"

#include <functional>
#include <memory>
#include <vector>

extern "C"
{
struct ares_channeldata;
struct ares_addrinfo;
struct event;
}

namespace sgate
{

/**
 * Asynchronous name resolution through c-ares, driven by the libevent loop.
 */
class CDnsBase
{
public:
	/**
	 * @param error Empty on success
	 * @param numericHosts Resolved addresses in numeric form, usable as host argument for connections
	 */
	using tResultCb = std::function<void(mstring error, tStrVec numericHosts)>;

	// returns nullptr (and logs the reason) if the resolver cannot be set up
	static std::unique_ptr<CDnsBase> Create();
	~CDnsBase();

	void Resolve(cmstring& host, cmstring& port, tResultCb);

	// ares helpers
	ares_channeldata* get() const { return m_channel; }
	void sync();
	void dropEvents();
	void setupEvents();

private:
	ares_channeldata* m_channel = nullptr;
	CDnsBase(ares_channeldata* pBase) : m_channel(pBase) {}
	void shutdown();

	// activated when we want something from ares or ares from us
	event *m_aresSyncEvent = nullptr;
	std::vector<event*> m_aresEvents;
	static void cb_dns(void *arg, int status, int timeouts, ares_addrinfo *results);
};

}

#endif // DNSBASE_H
