#ifndef AEVUTIL_H
#define AEVUTIL_H

#include "sgtypes.h"
#include "sgtemplates.h"

#include <cerrno>
#include <climits>
#include <new>
#include <type_traits>

#include <event2/event.h>
#include <event2/buffer.h>
#include <event2/bufferevent.h>

#include <unistd.h>

namespace sgate
{

inline evbuffer* besender(bufferevent* be) { return bufferevent_get_output(be); }
inline evbuffer* bereceiver(bufferevent* be) { return bufferevent_get_input(be); }
inline void send(evbuffer *dest, string_view sv) { if (evbuffer_add(dest, sv.data(), sv.length())) throw std::bad_alloc();}
inline void send(bufferevent *dest, string_view sv) { return send(besender(dest), sv); }

using unique_event = auto_raii<event*, event_free, nullptr>;
using unique_eb = auto_raii<evbuffer*, evbuffer_free, nullptr>;

/**
 * @brief be_free_close releases the bufferevent AND closes the socket.
 */
void be_free_close(bufferevent*);
/**
 * @brief be_flush_free_close pushes the remaining output, shuts down the sending side,
 * then releases the bufferevent and closes the socket when the peer is done.
 */
void be_flush_free_close(bufferevent*);

inline void justforceclose(int fd)
{
	while (0 != ::close(fd))
	{
		if (errno != EINTR)
			break;
	};
}
using unique_fd = auto_raii<int, justforceclose, -1>;

// for listener events which own their socket
void event_and_fd_free(event*);
using unique_fdevent = auto_raii<event*, event_and_fd_free, nullptr>;

using unique_bufferevent = auto_raii<bufferevent*, bufferevent_free, nullptr>;
using unique_bufferevent_flushclosing = auto_raii<bufferevent*, be_flush_free_close, nullptr>;

struct beconsum
{
	evbuffer *m_eb;
	beconsum(evbuffer* eb) : m_eb(eb) {}
	beconsum(bufferevent* eb) : m_eb(bufferevent_get_input(eb)) {}
	size_t size() { return evbuffer_get_length(m_eb); }
	beconsum& drop(size_t howMuch) { evbuffer_drain(m_eb, howMuch); return *this; }
	evbuffer* buf() { return m_eb; }
	const string_view linear(size_t len) { return string_view(
					(const char*) evbuffer_pullup(m_eb, len), len); }
	// make the whole thing contiguous
	const string_view linear() { return linear(size()); }
};

/**
 * Moves up to len bytes from the front of src to the end of tgt.
 * @return Number of moved bytes, or -1 on error
 */
inline ssize_t eb_move_range(evbuffer* src, evbuffer *tgt, size_t len)
{
	auto have = evbuffer_get_length(src);
	if (len > have)
		len = have;
	ssize_t done = 0;
	while (len > 0)
	{
		int limit = len > INT_MAX ? INT_MAX : int(len);
		auto n = evbuffer_remove_buffer(src, tgt, limit);
		if (n < 0)
			return -1;
		if (n == 0)
			break;
		done += n;
		len -= n;
	}
	return done;
}

/**
 * Formatting helper, appending to an evbuffer
 */
class ebstream
{
	evbuffer* m_eb;
	bool m_hex = false;
public:
	enum class imode : uint8_t { dec, hex };

	explicit ebstream(evbuffer* eb) : m_eb(eb) {}
	explicit ebstream(bufferevent* be) : m_eb(besender(be)) {}

	ebstream& operator<<(string_view sv) { send(m_eb, sv); return *this; }
	ebstream& operator<<(const char* sz) { return *this << string_view(sz); }
	ebstream& operator<<(const mstring& s) { return *this << string_view(s); }
	ebstream& operator<<(char c) { return *this << string_view(&c, 1); }
	ebstream& operator<<(imode m) { m_hex = m == imode::hex; return *this; }

	template<typename T, typename std::enable_if<std::is_integral<T>::value, int>::type = 0>
	ebstream& operator<<(T n)
	{
		if (evbuffer_add_printf(m_eb, m_hex ? "%llx" : "%lld", (long long) n) < 0)
			throw std::bad_alloc();
		return *this;
	}

	void clear() { evbuffer_drain(m_eb, evbuffer_get_length(m_eb)); }
	size_t size() const { return evbuffer_get_length(m_eb); }
	evbuffer* buf() { return m_eb; }
};

}
#endif // AEVUTIL_H
