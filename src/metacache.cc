#include "metacache.h"
#include "sgclock.h"
#include "sglogger.h"
#include "sgstrop.h"
#include "debug.h"

using namespace std;

namespace sgate
{

metacache::metacache(lint_ptr<IUpstreamSession> session, tBeatNotifier* cleanBeat)
	: m_session(move(session))
{
	if (cleanBeat)
		m_cleanSub = cleanBeat->AddListener([this]() { Clear(); });
}

metacache::~metacache()
{
	// the handles cancel the lookups, nobody is notified anymore
	m_inflight.clear();
}

TFinalAction metacache::Resolve(int64_t messageId, tResult cb)
{
	auto it = m_entries.find(messageId);
	if (it != m_entries.end())
	{
		cb(tUpstreamStatus(), it->second);
		return TFinalAction();
	}
	auto waiterId = ++m_nLastWaiter;
	auto& lookup = m_inflight[messageId];
	lookup.waiters.emplace_back(waiterId, move(cb));
	if (!lookup.handle)
	{
		LOG("metadata lookup for " << messageId);
		lookup.handle = m_session->Lookup(messageId, [this, messageId](const tUpstreamStatus& st,
											 const tRemoteFile& rf)
		{
			onLookupDone(messageId, st, rf);
		});
	}
	return TFinalAction([pin = as_lptr(this), messageId, waiterId]()
	{
		auto& inflight = pin->m_inflight;
		auto it = inflight.find(messageId);
		if (it == inflight.end())
			return;
		auto& ws = it->second.waiters;
		for (auto wit = ws.begin(); wit != ws.end(); ++wit)
		{
			if (wit->first != waiterId)
				continue;
			ws.erase(wit);
			break;
		}
		// nobody is interested anymore, the handle cancels the remote call
		if (ws.empty())
			inflight.erase(it);
	});
}

void metacache::onLookupDone(int64_t messageId, const tUpstreamStatus& st, const tRemoteFile& rf)
{
	auto it = m_inflight.find(messageId);
	if (it == m_inflight.end())
		return;
	// the session call has finished, nothing left to cancel
	it->second.handle.release();
	auto waiters = move(it->second.waiters);
	m_inflight.erase(it);

	if (st.ok())
		m_entries[messageId] = rf;
	else
		LOG("metadata lookup for " << messageId << " failed: " << st.ToString());

	for (auto& w : waiters)
		w.second(st, rf);
}

void metacache::Forget(int64_t messageId)
{
	m_entries.erase(messageId);
}

void metacache::Clear()
{
	if (m_entries.empty())
		return;
	if (log::IsEnabled(log::LOG_DEBUG))
		log::misc("Dropping "s + ltos(m_entries.size()) + " cached file descriptors", 'M');
	m_entries.clear();
}

}
