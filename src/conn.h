#ifndef _CON_H
#define _CON_H

#include "sgtypes.h"
#include "sgsmartptr.h"
#include "aevutil.h"

#include <functional>

namespace sgate
{

class sgres;

/**
 * @brief Common functionality needed by the own jobs.
 */
class IConnBase : public tLintRefcounted
{
public:
	/**
	 * @brief Push the internal processing which is waiting for some notification.
	 * The processing runs later in the event loop, not from this call.
	 */
	virtual void poke(uint_fast32_t dbgId) =0;
	virtual cmstring& getClientName() =0;
};

// reported once when a client connection has finished
using tConnReleaser = std::function<void(IConnBase*)>;

/**
 * @brief StartServing prepares the request serving stream and attaches the request handler to it
 * @param fd File descriptor, call of this method takes responsibility for it
 * @param clientName Peer address
 * @param onTerminated Reported when the connection has finished
 */
lint_ptr<IConnBase> SGATE_API StartServing(unique_fd&& fd, std::string clientName, sgres&,
										   tConnReleaser onTerminated);

}

#endif
