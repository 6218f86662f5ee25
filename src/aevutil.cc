#include "aevutil.h"
#include "debug.h"

#include <sys/socket.h>

namespace sgate
{

void be_free_close(bufferevent* be)
{
	if (!be)
		return;
	auto fd = bufferevent_getfd(be);
	bufferevent_free(be);
	if (fd != -1)
		justforceclose(fd);
}

void event_and_fd_free(event* ev)
{
	if (!ev)
		return;
	auto fd = event_get_fd(ev);
	event_free(ev);
	if (fd != -1)
		justforceclose(fd);
}

namespace
{
// lingering phase of a closed client connection, see be_flush_free_close
void cbLingerWritten(bufferevent* be, void*)
{
	if (evbuffer_get_length(besender(be)))
		return;
	auto fd = bufferevent_getfd(be);
	if (fd != -1)
		::shutdown(fd, SHUT_WR);
}
void cbLingerRead(bufferevent* be, void*)
{
	auto in = bereceiver(be);
	evbuffer_drain(in, evbuffer_get_length(in));
}
void cbLingerEvent(bufferevent* be, short what, void*)
{
	if (what & (BEV_EVENT_EOF | BEV_EVENT_ERROR | BEV_EVENT_TIMEOUT))
	{
		LOG("linger end, event " << what);
		be_free_close(be);
	}
}
}

void be_flush_free_close(bufferevent* be)
{
	if (!be)
		return;
	// wake up only when everything is out
	bufferevent_setwatermark(be, EV_WRITE, 0, 0);
	bufferevent_setcb(be, cbLingerRead, cbLingerWritten, cbLingerEvent, nullptr);
	bufferevent_enable(be, EV_READ | EV_WRITE);
	if (evbuffer_get_length(besender(be)))
		bufferevent_flush(be, EV_WRITE, BEV_NORMAL);
	else
		cbLingerWritten(be, nullptr);
}

}
