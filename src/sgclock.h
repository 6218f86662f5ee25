#ifndef SGCLOCK_H
#define SGCLOCK_H

#include "aobservable.h"

#include <memory>

extern "C"
{
struct timeval;
}

namespace sgate
{

/**
 * Periodic notification for housekeeping (cache cleaning, allocator sweeps, state flushing).
 * The timer only runs while somebody listens.
 */
class tBeatNotifier
{
public:
	virtual ~tBeatNotifier() =default;
	virtual aobservable::subscription AddListener(const tAction&) WARN_UNUSED =0;
	static std::unique_ptr<tBeatNotifier> Create(const struct timeval& interval);
};

}

#endif // SGCLOCK_H
