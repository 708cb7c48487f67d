#ifndef RANGENEG_H
#define RANGENEG_H

#include "actypes.h"

namespace dlbr
{

//! Inclusive byte range [start, end]
struct tByteInterval
{
	off_t start = 0, end = -1;
	off_t length() const { return end - start + 1; }
	bool operator==(const tByteInterval& o) const { return start == o.start && end == o.end; }
};

struct tRangeVerdict
{
	enum EKind : char
	{
		FULL,
		PARTIAL,
		UNSATISFIABLE
	} kind = FULL;
	// valid for FULL and PARTIAL; empty for FULL content of an empty file
	tByteInterval iv;
};

/**
 * @brief Evaluate a Range request header against the content size.
 *
 * Only single byte ranges are supported. Headers with unknown units or broken
 * syntax are ignored, multiple ranges are rejected.
 *
 * @param rangeHeader Value of the Range header, nullptr if absent
 * @param totalSize Size of the whole content
 */
DLBR_API tRangeVerdict NegotiateRange(const char* rangeHeader, off_t totalSize);

}

#endif // RANGENEG_H
