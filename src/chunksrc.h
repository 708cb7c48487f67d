#ifndef CHUNKSRC_H
#define CHUNKSRC_H

#include "acsmartptr.h"
#include "actemplates.h"
#include "aevutil.h"

#include <functional>

namespace dlbr
{

enum class EFetchError
{
	NONE,
	// transient, worth another try
	REMOTE_UNAVAILABLE,
	// the remote side does not know the handle, fatal
	HANDLE_INVALID,
	// the stream ended before the expected length
	INTERRUPTED
};

//! Short machine readable name, as used in error responses
inline string_view GetFetchErrorName(EFetchError e)
{
	switch (e)
	{
	case EFetchError::NONE: return "none"sv;
	case EFetchError::REMOTE_UNAVAILABLE: return "remote_unavailable"sv;
	case EFetchError::HANDLE_INVALID: return "handle_invalid"sv;
	case EFetchError::INTERRUPTED: return "stream_interrupted"sv;
	}
	return "unknown"sv;
}

/**
 * One event from a chunk cursor: a non-empty chunk, the end of sequence (no data,
 * no error) or an error.
 */
struct tChunkEvent
{
	unique_eb data;
	EFetchError error = EFetchError::NONE;
	mstring message;

	bool IsEnd() const { return error == EFetchError::NONE && (!data.valid() || !evbuffer_get_length(data.get())); }
};

/**
 * Sequential reader of a remote byte range.
 */
class IChunkCursor : public tLintRefcounted
{
public:
	using tReceiver = std::function<void(tChunkEvent&&)>;
	/**
	 * @brief Request the next event. The receiver is called later from the event loop, never inline.
	 * Only one request may be pending at a time.
	 * @return Cancellation handle, destroying it withdraws the request and the receiver is not called
	 */
	virtual TFinalAction Next(tReceiver) =0;
};

/**
 * Source of remote file contents, delivered in chunks of a fixed granularity.
 */
class IChunkSource
{
public:
	virtual ~IChunkSource() =default;
	virtual off_t GetGranularity() const =0;
	/**
	 * @brief Open a cursor over [offset, offset + maxLength)
	 * @param offset Multiple of the granularity
	 */
	virtual lint_ptr<IChunkCursor> Fetch(cmstring& handle, off_t offset, off_t maxLength) =0;
};

}

#endif // CHUNKSRC_H
