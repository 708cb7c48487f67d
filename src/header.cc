#include "header.h"
#include "meta.h"
#include "debug.h"

#include <event2/buffer.h>

#include <cstdlib>

using namespace std;

namespace dlbr
{

// heads larger than that are rejected as malformed
#define MAXHEADLEN 64000

static const string_view mapId2Headname[] =
{
	"Connection"sv,
	"Content-Length"sv,
	"Range"sv,
	"Content-Range"sv,
	"Content-Type"sv,
	"Transfer-Encoding"sv,
	"Authorization"sv,
	"X-Forwarded-For"sv,
	"Host"sv
};
static_assert(sizeof(mapId2Headname) / sizeof(mapId2Headname[0]) == header::HEADPOS_MAX,
		"header name table out of sync");

header::~header()
{
	for(auto& p:h)
		free(p);
}

void header::clear()
{
	for(auto& p: h)
	{
		free(p);
		p = nullptr;
	}
	frontLine.clear();
	type = INVALID;
	proto = HTTP_11;
}

header::header(const header &s) :
		type(s.type), proto(s.proto), frontLine(s.frontLine)
{
	for (unsigned i = 0; i < HEADPOS_MAX; i++)
		h[i] = s.h[i] ? strdup(s.h[i]) : nullptr;
}

header::header(header &&s) :
		type(s.type), proto(s.proto), frontLine(move(s.frontLine))
{
	for (unsigned i = 0; i < HEADPOS_MAX; i++)
		swap(h[i], s.h[i]);
}

header& header::operator=(const header& s)
{
	if (this == &s)
		return *this;
	type = s.type;
	proto = s.proto;
	frontLine = s.frontLine;
	for (unsigned i = 0; i < HEADPOS_MAX; ++i)
	{
		free(h[i]);
		h[i] = s.h[i] ? strdup(s.h[i]) : nullptr;
	}
	return *this;
}

header& header::operator=(header&& s)
{
	type = s.type;
	proto = s.proto;
	swap(frontLine, s.frontLine);
	for (unsigned i = 0; i < HEADPOS_MAX; ++i)
		swap(h[i], s.h[i]);
	return *this;
}

void header::del(eHeadPos i)
{
	free(h[i]);
	h[i] = nullptr;
}

void header::set(eHeadPos i, string_view value)
{
	auto p = (char*) realloc(h[i], value.size() + 1);
	if (!p)
		throw std::bad_alloc();
	memcpy(p, value.data(), value.size());
	p[value.size()] = '\0';
	h[i] = p;
}

void header::set(eHeadPos key, off_t nValue)
{
	set(key, offttos(nValue));
}

header::eHeadPos header::resolvePos(string_view key)
{
	for (unsigned i = 0; i < HEADPOS_MAX; ++i)
	{
		if (CaseEqual(key, mapId2Headname[i]))
			return eHeadPos(i);
	}
	return HEADPOS_MAX;
}

tRemoteStatus header::getStatus() const
{
	tRemoteStatus ret;
	if (type != ANSWER)
		return ret;
	tSplitWalk split(frontLine);
	// protocol token
	if (!split.Next() || !split.Next())
		return ret;
	auto code = atoofft(split.view(), -1);
	if (code < 100 || code > 999)
		return ret;
	ret.code = int(code);
	ret.msg = mstring(split.right());
	return ret;
}

string_view header::getRequestUrl() const
{
	if (type == INVALID || type == ANSWER)
		return string_view();
	tSplitWalk split(frontLine);
	if (!split.Next() || !split.Next())
		return string_view();
	return split.view();
}

tSS header::ToString() const
{
	tSS s;
	s << frontLine << svRN;
	for (unsigned i = 0; i < HEADPOS_MAX; ++i)
	{
		if (h[i])
			s << mapId2Headname[i] << ": "sv << h[i] << svRN;
	}
	s << svRN;
	return s;
}

static bool parseProto(string_view token, header::eProtoType& proto)
{
	if (token == "HTTP/1.1"sv)
		proto = header::HTTP_11;
	else if (token == "HTTP/1.0"sv)
		proto = header::HTTP_10;
	else
		return false;
	return true;
}

int header::Load(string_view input)
{
	clear();
	auto headEnd = input.find(svRN2);
	if (headEnd == stmiss)
		return input.size() > MAXHEADLEN ? -1 : 0;
	if (headEnd > MAXHEADLEN)
		return -1;
	auto totalLen = int(headEnd + svRN2.size());
	// keep the last line break for easier tokenizing
	string_view head(input.data(), headEnd + svRN.size());

	auto eol = head.find(svRN);
	frontLine = head.substr(0, eol);
	head.remove_prefix(eol + svRN.size());

	{
		tSplitWalk split(frontLine, " "sv);
		string_view tokens[4];
		unsigned n = 0;
		for (auto tok: split)
		{
			tokens[n++] = tok;
			if (n == 4)
				break;
		}
		if (n < 2)
			return -1;
		if (startsWith(tokens[0], "HTTP/"sv))
		{
			if (!parseProto(tokens[0], proto))
				return -1;
			type = ANSWER;
			// status message may contain spaces
		}
		else
		{
			if (n != 3 || !parseProto(tokens[2], proto) || tokens[1].empty())
				return -1;
			if (tokens[0] == "GET"sv)
				type = GET;
			else if (tokens[0] == "HEAD"sv)
				type = HEAD;
			else
			{
				for (auto c: tokens[0])
					if (!isupper((unsigned char) c))
						return -1;
				type = OTHER_METHOD;
			}
		}
	}

	eHeadPos lastPos = HEADPOS_MAX;
	while (!head.empty())
	{
		eol = head.find(svRN);
		auto line = head.substr(0, eol);
		head.remove_prefix(eol + svRN.size());

		// continuation of the previous line
		if (line[0] == ' ' || line[0] == '\t')
		{
			if (lastPos == HEADPOS_MAX)
				continue;
			trimBoth(line);
			mstring joined(h[lastPos]);
			joined += ' ';
			joined += line;
			set(lastPos, joined);
			continue;
		}
		auto sep = line.find(':');
		if (sep == stmiss || sep == 0)
			return -1;
		auto key = line.substr(0, sep);
		auto value = line.substr(sep + 1);
		trimBoth(value);
		lastPos = resolvePos(key);
		if (lastPos == HEADPOS_MAX)
			continue;
		set(lastPos, value);
	}
	return totalLen;
}

bool ParseContentRange(string_view value, off_t& from, off_t& to, off_t& total)
{
	trimBoth(value);
	if (!CaseStartsWith(value, "bytes"sv))
		return false;
	value.remove_prefix(5);
	trimFront(value);
	auto dash = value.find('-');
	auto slash = value.find('/');
	if (dash == stmiss || slash == stmiss || dash > slash)
		return false;
	from = atoofft(value.substr(0, dash), -1);
	to = atoofft(value.substr(dash + 1, slash - dash - 1), -1);
	auto sTotal = value.substr(slash + 1);
	trimBoth(sTotal);
	total = sTotal == "*"sv ? -1 : atoofft(sTotal, -2);
	if (from < 0 || to < from || total == -2)
		return false;
	return total == -1 || to < total;
}

int header::Load(evbuffer *buf)
{
	auto len = evbuffer_get_length(buf);
	if (!len)
		return 0;
	auto pos = evbuffer_search(buf, szRN szRN, svRN2.size(), nullptr);
	if (pos.pos < 0)
		return len > MAXHEADLEN ? -1 : 0;
	size_t headLen = pos.pos + svRN2.size();
	auto p = (const char*) evbuffer_pullup(buf, headLen);
	if (!p)
		return -1;
	return Load(string_view(p, headLen));
}

}
