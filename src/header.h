#ifndef _HEADER_H
#define _HEADER_H

#include "acbuf.h"

extern "C"
{
struct evbuffer;
}

namespace dlbr
{

//! Status line of a remote response
struct tRemoteStatus
{
	int code = 500;
	mstring msg;
	bool isRedirect() const { return code >= 300 && code < 400; }
};

/**
 * Minimal HTTP head parser and composer. Known headers are stored in a fixed
 * table, all other lines are ignored.
 */
class DLBR_API header
{
public:
	enum eHeadType : char
	{
		INVALID,
		HEAD,
		GET,
		// syntactically fine but not served here
		OTHER_METHOD,
		ANSWER
	};
	enum eHeadPos : char
	{
		CONNECTION,			// 0
		CONTENT_LENGTH,
		RANGE,
		CONTENT_RANGE,
		CONTENT_TYPE,
		TRANSFER_ENCODING,	// 5
		AUTHORIZATION,
		XFORWARDEDFOR,
		HOST,
		// unreachable entry and size reference
		HEADPOS_MAX
	};
	enum eProtoType : char
	{
		HTTP_10,
		HTTP_11
	};

	eHeadType type = INVALID;
	eProtoType proto = HTTP_11;
	mstring frontLine;

	char *h[HEADPOS_MAX] = {0};

	header() {};
	~header();
	header(const header &);
	header(header &&);
	header& operator=(const header&);
	header& operator=(header&&);

	void set(eHeadPos, string_view value);
	void set(eHeadPos, off_t nValue);
	void del(eHeadPos);

	//! For answers, the code and message from the status line
	tRemoteStatus getStatus() const;
	int getStatusCode() const { return getStatus().code; }
	//! For requests, the request target (second token of the front line)
	string_view getRequestUrl() const;

	void clear();

	tSS ToString() const;

	/**
	 * Parse a complete head from raw input.
	 *
	 * @param sv Raw input, may contain more data after the head
	 * @return Length of processed data, 0: incomplete, needs more data, <0: error, >0: length of the head including the terminating empty line
	 */
	int Load(string_view sv);
	/**
	 * Same as above but pulls the data from the front of an event buffer. The buffer is not drained.
	 */
	int Load(evbuffer* buf);

private:
	eHeadPos resolvePos(string_view key);
};

/**
 * @brief Parse a Content-Range value like "bytes 0-499/1234" or "bytes 0-499/*"
 * @param total Set to -1 if the total size is unknown
 * @return False for unsupported or malformed input
 */
bool ParseContentRange(string_view value, off_t& from, off_t& to, off_t& total);

}

#endif
