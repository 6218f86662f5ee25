#include "sgres.h"
#include "sgclock.h"
#include "sg3rdparty.h"
#include "dnsbase.h"
#include "evabase.h"
#include "sgcfg.h"
#include "connpool.h"
#include "allocator.h"
#include "admission.h"
#include "gwsession.h"
#include "debug.h"

#include <map>

using namespace std;

namespace sgate
{

const struct timeval idleTimeout { 30, 1 };

class SGATE_API sgresImpl : public sgres
{
	std::unique_ptr<tBeatNotifier> idleClock;
	std::map<int, std::unique_ptr<tBeatNotifier>> customClocks;
	tSslConfig m_ssl_setup;
	std::unique_ptr<CDnsBase> m_dnsBase;
	bool m_bDnsTried = false;

	std::unique_ptr<connpool> m_pool;
	std::unique_ptr<allocator> m_alloc;
	std::unique_ptr<admission> m_admission;
	aobservable::subscription m_sweepSub, m_shutdownSub;

public:
	sgresImpl(tSessionFactory factory)
	{
		idleClock = tBeatNotifier::Create(idleTimeout);
		if (!factory)
		{
			factory = [this](cmstring& token, bool isPrimary)
			{
				return MakeGatewaySession(*this, token, isPrimary);
			};
		}
		struct timeval tvClean { cfg::cachecleaninterval, 0 };
		m_pool.reset(new connpool(move(factory), &GetCustomBeat(BEAT_CACHE_CLEAN, tvClean)));
		m_alloc.reset(new allocator([this]() { return m_pool->GetLiveIds(); }, cfg::GetSmallFileThreshold()));
		m_admission.reset(new admission(this));

		struct timeval tvSweep { cfg::allocsweepinterval, 0 };
		m_sweepSub = GetCustomBeat(BEAT_ALLOC_SWEEP, tvSweep).AddListener([this]()
		{
			m_alloc->Sweep();
			if (log::IsEnabled(log::LOG_DEBUG))
				log::dbg(m_alloc->FormatStats());
		});

		m_shutdownSub = evabase::GetGlobal().subscribe([this]()
		{
			m_sweepSub.reset();
			m_dnsBase.reset();
			m_shutdownSub.reset();
		});
	}
	~sgresImpl()
	{
		// users of the clocks first
		m_sweepSub.reset();
		m_admission.reset();
		m_alloc.reset();
		m_pool.reset();
	}

	tBeatNotifier &GetIdleCheckBeat() override
	{
		return *idleClock;
	}
	tBeatNotifier &GetCustomBeat(EBeatId id, const struct timeval& interval) override
	{
		auto& ret = customClocks[id];
		if (!ret)
			ret = tBeatNotifier::Create(interval);
		return *ret;
	}

	tSslConfig &GetSslConfig() override
	{
		return m_ssl_setup;
	}

	CDnsBase* GetDnsBase() override
	{
		if (!m_dnsBase && !m_bDnsTried && !evabase::GetGlobal().IsShuttingDown())
		{
			m_bDnsTried = true;
			m_dnsBase = CDnsBase::Create();
		}
		return m_dnsBase.get();
	}

	connpool& GetPool() override
	{
		return *m_pool;
	}
	allocator& GetAllocator() override
	{
		return *m_alloc;
	}
	admission& GetAdmission() override
	{
		return *m_admission;
	}
};

sgres *sgres::Create(tSessionFactory factory)
{
	return new sgresImpl(move(factory));
}

}
