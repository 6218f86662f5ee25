#ifndef CONSERVER_H_
#define CONSERVER_H_

#include "sgtypes.h"
#include "sgsmartptr.h"

namespace sgate
{
class sgres;

/**
 * Listening sockets and the set of active client connections.
 */
class SGATE_API conserver : public tLintRefcounted
{
public:
	virtual ~conserver() = default;
	/**
	 * Binds the configured addresses.
	 * @return Number of listening sockets
	 */
	virtual unsigned Setup() = 0;
	// closes the listeners and drops all client connections
	virtual void Shutdown() =0;
	virtual size_t GetConnectionCount() =0;
	static lint_ptr<conserver> Create(sgres& res);
};

}

#endif /*CONSERVER_H_*/
