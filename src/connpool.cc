#include "connpool.h"
#include "metacache.h"
#include "evabase.h"
#include "sglogger.h"
#include "debug.h"

#include <memory>

using namespace std;

namespace sgate
{

mstring tUpstreamConn::GetLabel() const
{
	return (IsPrimary() ? "primary "s : "worker "s) + ltos(id) + (name.empty() ? ""s : " (" + name + ")");
}

connpool::connpool(tSessionFactory factory, tBeatNotifier* cleanBeat)
	: m_factory(move(factory)), m_cleanBeat(cleanBeat)
{
}

connpool::~connpool()
{
}

tConnPtr connpool::makeConn(lint_ptr<IUpstreamSession> session, const tSessionIdentity& ident,
							tUpstreamConn::ERole role)
{
	auto ret = make_lptr<tUpstreamConn>();
	ret->id = ident.id;
	ret->name = ident.name;
	ret->role = role;
	ret->cache = make_lptr<metacache>(session, m_cleanBeat);
	ret->session = move(session);
	return ret;
}

void connpool::Start(cmstring& primaryToken, const tStrVec& workerTokens, std::function<void(bool)> cb)
{
	auto session = m_factory(primaryToken, true);
	if (!session)
		return evabase::Post([cb]() { cb(false); });

	session->Start([this, session, workerTokens, cb](const tUpstreamStatus& st, const tSessionIdentity& ident)
	{
		if (!st.ok())
		{
			log::err("Primary upstream session failed: "s + st.ToString());
			return cb(false);
		}
		if (m_bStopped)
			return cb(false);
		{
			lguard g(m_mx);
			m_primary = makeConn(session, ident, tUpstreamConn::ERole::PRIMARY);
		}
		log::misc("Primary upstream session established as "s + m_primary->GetLabel());
		startWorkers(workerTokens, cb);
	});
}

void connpool::startWorkers(const tStrVec& tokens, std::function<void(bool)> cb)
{
	if (tokens.empty())
		return cb(true);

	struct tStartup
	{
		std::vector<tConnPtr> results;
		size_t pending;
	};
	auto state = make_shared<tStartup>();
	state->results.resize(tokens.size());
	state->pending = tokens.size();

	auto finish = [this, state, cb]()
	{
		if (--state->pending)
			return;
		if (m_bStopped)
			return cb(false);
		lguard g(m_mx);
		m_workers.clear();
		for (auto& c : state->results)
		{
			if (!c)
				continue;
			bool dupe = c->id == m_primary->id;
			for (const auto& w: m_workers)
				dupe |= w->id == c->id;
			if (dupe)
			{
				log::err("Worker session "s + c->GetLabel() + " duplicates another session, ignored"s);
				c->session->Stop([](){});
				continue;
			}
			m_workers.emplace_back(move(c));
		}
		m_nRoundRobin = 0;
		log::misc("Upstream pool ready with "s + ltos(m_workers.size()) + " of "s
				  + ltos(state->results.size()) + " worker sessions"s);
		cb(true);
	};

	for (size_t i = 0; i < tokens.size(); ++i)
	{
		auto session = m_factory(tokens[i], false);
		if (!session)
		{
			evabase::Post(finish);
			continue;
		}
		session->Start([this, i, session, state, finish](const tUpstreamStatus& st, const tSessionIdentity& ident)
		{
			if (st.ok())
				state->results[i] = makeConn(session, ident, tUpstreamConn::ERole::WORKER);
			else
				log::err("Worker session #"s + ltos(i + 1) + " failed, excluded: "s + st.ToString());
			finish();
		});
	}
}

tConnPtr connpool::pickNext(int64_t excludeId)
{
	lguard g(m_mx);
	std::vector<tConnPtr*> live;
	for (auto& w : m_workers)
	{
		if (w->id != excludeId && w->IsLive())
			live.emplace_back(&w);
	}
	if (!live.empty())
	{
		m_nRoundRobin = (m_nRoundRobin + 1) % live.size();
		return *live[m_nRoundRobin];
	}
	if (m_primary && m_primary->id != excludeId && m_primary->IsLive())
		return m_primary;
	return tConnPtr();
}

tConnPtr connpool::SelectForStreaming()
{
	auto ret = pickNext(0);
	if (!ret)
		throw tNoConnectionsAvailable("no upstream connection is available");
	return ret;
}

tConnPtr connpool::SelectAlternative(int64_t excludeId)
{
	return pickNext(excludeId);
}

tConnPtr connpool::GetPrimary()
{
	lguard g(m_mx);
	return m_primary;
}

tConnPtr connpool::Lookup(int64_t id)
{
	lguard g(m_mx);
	if (m_primary && m_primary->id == id)
		return m_primary;
	for (auto& w : m_workers)
	{
		if (w->id == id)
			return w;
	}
	return tConnPtr();
}

std::vector<int64_t> connpool::GetLiveIds()
{
	std::vector<int64_t> ret;
	lguard g(m_mx);
	if (m_primary && m_primary->IsLive())
		ret.emplace_back(m_primary->id);
	for (auto& w : m_workers)
	{
		if (w->IsLive())
			ret.emplace_back(w->id);
	}
	return ret;
}

size_t connpool::size()
{
	lguard g(m_mx);
	return m_workers.size() + (m_primary ? 1 : 0);
}

void connpool::Stop(tAction done)
{
	std::vector<tConnPtr> all;
	{
		lguard g(m_mx);
		m_bStopped = true;
		if (m_primary)
			all.emplace_back(move(m_primary));
		for (auto& w : m_workers)
			all.emplace_back(move(w));
		m_primary.reset();
		m_workers.clear();
		m_nRoundRobin = 0;
	}
	if (all.empty())
		return evabase::Post(move(done));

	auto pending = make_shared<size_t>(all.size());
	for (auto& c : all)
	{
		c->cache->Clear();
		c->session->Stop([pending, done]()
		{
			if (0 == --*pending)
				done();
		});
	}
	log::misc("Disconnecting "s + ltos(all.size()) + " upstream sessions"s);
}

}
