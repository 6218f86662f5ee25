#ifndef BYTERANGE_H
#define BYTERANGE_H

#include "sgtypes.h"

namespace sgate
{

struct tByteRange
{
	off_t from = 0;
	// inclusive
	off_t until = -1;
	off_t length() const { return until - from + 1; }
};

enum class ERangeResult : uint8_t
{
	// no range requested, whole file
	FULL,
	PARTIAL,
	UNSATISFIABLE
};

/**
 * Evaluates a Range request header against the file size. Only single ranges are served:
 * "bytes=a-b", "bytes=a-" and the suffix form "bytes=-n".
 *
 * @param rangeHeader Header value, nullptr if absent
 * @param out Resulting byte range, also filled for FULL if the file is not empty
 */
ERangeResult SGATE_API ParseRange(const char* rangeHeader, off_t fileSize, tByteRange& out);

}

#endif // BYTERANGE_H
