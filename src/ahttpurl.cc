#include "ahttpurl.h"
#include "meta.h"

#include <algorithm>

namespace dlbr {

using namespace std;

mstring makeHostPortKey(const mstring & sHostname, uint16_t nPort)
{
	return sHostname + ":" + to_string(nPort);
}

// See RFC3986
bool tHttpUrl::SetHttpUrl(string_view sUrlRaw, bool unescape)
{
	clear();
	mstring url(sUrlRaw);
	trimBoth(url);
	if(url.empty())
		return false;

	tStrPos hStart(0);
	if (CaseStartsWith(url, "http://"sv))
		hStart = 7;
	else if (CaseStartsWith(url, "https://"sv))
	{
		hStart = 8;
		m_schema = EProtoType::HTTPS;
	}
	else if (url.find("://") != stmiss)
		return false; // other protocol or weird stuff
	else if (!isalnum((unsigned char) url[0]) && url[0] != '[')
		return false;

	// kill leading slashes in any case
	while(hStart < url.size() && url[hStart] == '/')
		hStart++;
	if (hStart >= url.size())
		return false;

	auto hEnd = url.find_first_of("/?", hStart);
	if (hEnd == stmiss)
	{
		hEnd = url.size();
		sPath = "/";
	}
	else if (url[hEnd] == '?')
		sPath = "/" + url.substr(hEnd);
	else
	{
		// collapse multiple leading slashes of the path
		auto pStart = url.find_first_not_of('/', hEnd);
		sPath = pStart == stmiss ? mstring("/") : "/" + url.substr(pStart);
	}
	if (unescape)
		sPath = UrlUnescape(sPath);

	sHost = url.substr(hStart, hEnd - hStart);
	if (sHost.empty() || sHost[0] == '_') // those are reserved
		return false;

	// credentials might be in there, strip them off
	auto pos = sHost.rfind('@');
	if(pos != stmiss)
	{
		sUserPass = UrlUnescape(sHost.substr(0, pos));
		sHost.erase(0, pos + 1);
	}

	bool bBracketed = !sHost.empty() && sHost[0] == '[';
	tStrPos portSep = stmiss;
	if (bBracketed)
	{
		auto closing = sHost.find(']');
		if (closing == stmiss)
			return false; // unmatched square bracket
		if (closing + 1 < sHost.size())
		{
			if (sHost[closing + 1] != ':')
				return false;
			portSep = closing + 1;
		}
	}
	else if (count(sHost.begin(), sHost.end(), ':') == 1)
		portSep = sHost.rfind(':');

	if (portSep != stmiss)
	{
		auto n = atoofft(string_view(sHost).substr(portSep + 1), -1);
		if (n <= 0 || n > MAX_VAL(uint16_t))
			return false;
		nPort = (uint16_t) n;
		sHost.erase(portSep);
	}
	if (bBracketed)
	{
		sHost.erase(0, 1);
		sHost.pop_back();
	}
	else
		sHost = UrlUnescape(sHost);

	// also detect obvious IPv6 misspelling ASAP
	return !sHost.empty() && sHost.find(":::"sv) == stmiss;
}

mstring tHttpUrl::ToURI(bool bUrlEscaped, bool hostOnly) const
{
	mstring s(GetProtoPrefix());
	bool isV6 = sHost.find(':') != stmiss;
	if (isV6)
		s += '[';
	s += sHost;
	if (isV6)
		s += ']';
	if (nPort)
		s += ":" + to_string(nPort);
	if (hostOnly)
		return s;
	if (bUrlEscaped)
		UrlEscapeAppend(sPath, s);
	else
		s += sPath;
	return s;
}

mstring tHttpUrl::GetHostPortProtoKey() const
{
	char sfx = 'a';
	sfx += (int) m_schema;
	return GetHostPortKey() + "_" + sfx;
}

}
