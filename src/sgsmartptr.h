#ifndef SGSMARTPTR_H_
#define SGSMARTPTR_H_

#include "sgtypes.h"

#include <utility>

namespace sgate {

/**
 * Base of an intrusively reference-counted class.
 * Not thread-safe, all users are expected to live on the event thread.
 */
struct tLintRefcounted
{
	virtual ~tLintRefcounted() =default;

	void __inc_ref() noexcept { ++m_nRefCount; }
	void __dec_ref()
	{
		if (0 == --m_nRefCount)
			delete this;
	}

private:
	size_t m_nRefCount = 0;
};

/**
 * Intrusive shared pointer for tLintRefcounted objects. Callbacks capture one
 * (see as_lptr) to keep their target alive until they have run.
 */
template<class T>
class lint_ptr
{
	T* m_ptr = nullptr;

	void swapIn(T* p) noexcept
	{
		auto old = std::exchange(m_ptr, p);
		if (old)
			old->__dec_ref();
	}

public:
	lint_ptr() =default;
	explicit lint_ptr(T* p) : m_ptr(p)
	{
		if (m_ptr)
			m_ptr->__inc_ref();
	}
	lint_ptr(const lint_ptr& other) : lint_ptr(other.m_ptr) {}
	lint_ptr(lint_ptr&& other) noexcept : m_ptr(std::exchange(other.m_ptr, nullptr)) {}
	~lint_ptr() { reset(); }

	lint_ptr& operator=(const lint_ptr& other)
	{
		reset(other.m_ptr);
		return *this;
	}
	lint_ptr& operator=(lint_ptr&& other) noexcept
	{
		if (this != &other)
			swapIn(std::exchange(other.m_ptr, nullptr));
		return *this;
	}

	void reset(T* p)
	{
		if (p == m_ptr)
			return;
		if (p)
			p->__inc_ref();
		swapIn(p);
	}
	void reset() noexcept { swapIn(nullptr); }

	T* get() const noexcept { return m_ptr; }
	T& operator*() const noexcept { return *m_ptr; }
	T* operator->() const noexcept { return m_ptr; }
	explicit operator bool() const noexcept { return m_ptr != nullptr; }
	bool operator==(const lint_ptr& other) const noexcept { return m_ptr == other.m_ptr; }
};

// additional reference to an object which is already managed
template<typename C>
inline lint_ptr<C> as_lptr(C* p)
{
	return lint_ptr<C>(p);
}

template<typename C, typename Torig>
inline lint_ptr<C> static_lptr_cast(const lint_ptr<Torig>& p)
{
	return lint_ptr<C>(static_cast<C*>(p.get()));
}

template<class C, typename... Args>
lint_ptr<C> make_lptr(Args&&... args)
{
	return lint_ptr<C>(new C(std::forward<Args>(args)...));
}

} // namespace sgate

#endif /* SGSMARTPTR_H_ */
