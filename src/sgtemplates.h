#ifndef SGTEMPLATES_H
#define SGTEMPLATES_H

#include "sut.h"

#include <functional>
#include <utility>

namespace sgate
{

using tAction = std::function<void()>;

/**
 * Owner of a plain handle (descriptor, C library object) which is freed with TFreeFunc.
 * Moves like unique_ptr, the "null" value is inval_default.
 */
template<typename T, void TFreeFunc(T), T inval_default>
struct auto_raii
{
	T m_p;

	auto_raii() : m_p(inval_default) {}
	explicit auto_raii(T xp) : m_p(xp) {}
	auto_raii(const auto_raii&) = delete;
	auto_raii(auto_raii&& other) : m_p(other.release()) {}
	~auto_raii() { reset(); }

	bool valid() const { return m_p != inval_default; }
	T get() const { return m_p; }
	T operator*() const { return m_p; }

	T release()
	{
		T ret = m_p;
		m_p = inval_default;
		return ret;
	}
	void reset()
	{
		reset(inval_default);
	}
	auto_raii& reset(T rawNew)
	{
		if (rawNew == m_p)
			return *this;
		T old = m_p;
		m_p = rawNew;
		if (old != inval_default)
			TFreeFunc(old);
		return *this;
	}
	auto_raii& reset(auto_raii&& other)
	{
		if (&other != this)
			reset(other.release());
		return *this;
	}
};

/**
 * Action which runs once, when the holder is destroyed or reset. Move-only.
 * release() drops the action without running it.
 */
struct TFinalAction
{
	SUTPRIVATE:
	tAction m_p;

public:
	TFinalAction() =default;
	explicit TFinalAction(tAction&& act) : m_p(std::move(act)) {}
	TFinalAction(const TFinalAction&) = delete;
	TFinalAction(TFinalAction&& other) : m_p(std::exchange(other.m_p, tAction())) {}
	~TFinalAction() { reset(); }

	TFinalAction& operator=(TFinalAction&& other)
	{
		return reset(std::move(other));
	}
	TFinalAction& reset(TFinalAction&& other)
	{
		if (&other != this)
		{
			reset();
			m_p = std::exchange(other.m_p, tAction());
		}
		return *this;
	}
	void reset()
	{
		// the action may end up destroying this holder
		auto act = std::exchange(m_p, tAction());
		if (act)
			act();
	}
	void release() { m_p = tAction(); }
	operator bool() const { return bool(m_p); }
};

}

#endif // SGTEMPLATES_H
