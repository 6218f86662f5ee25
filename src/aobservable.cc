#include "aobservable.h"
#include "evabase.h"
#include "debug.h"

#include <vector>

using namespace std;

namespace sgate
{

aobservable::subscription aobservable::subscribe(TNotifier listener)
{
	if (!listener)
		return subscription();
	auto id = ++m_nLastId;
	m_listeners.emplace(id, move(listener));
	return subscription([pin = as_lptr(this), id]()
	{
		pin->m_listeners.erase(id);
	});
}

bool aobservable::notify()
{
	if (m_bPending || m_listeners.empty())
		return false;
	m_bPending = true;
	evabase::Post([pin = as_lptr(this)]()
	{
		pin->deliver();
	});
	return true;
}

void aobservable::deliver()
{
	m_bPending = false;
	// listeners may subscribe or unsubscribe others while being called
	vector<unsigned> ids;
	ids.reserve(m_listeners.size());
	for (const auto& it : m_listeners)
		ids.emplace_back(it.first);
	for (auto id : ids)
	{
		auto it = m_listeners.find(id);
		if (it == m_listeners.end())
			continue;
		// keep the callable alive even if it removes itself
		auto act = it->second;
		act();
	}
}

}
