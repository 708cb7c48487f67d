#ifndef AHTTPURL_H
#define AHTTPURL_H

#include "actypes.h"

namespace dlbr
{

#define DEFAULT_PORT_HTTP 80
#define DEFAULT_PORT_HTTPS 443

mstring makeHostPortKey(const mstring & sHostname, uint16_t nPort);

/**
 * Decomposed absolute HTTP(S) URL. Path is kept unescaped, in the form which is
 * stored in the link table and used for composing upstream requests.
 */
class DLBR_API tHttpUrl
{
	uint16_t nPort = 0;

public:
	enum class EProtoType : uint16_t
	{
		HTTP,
		HTTPS
	} m_schema = EProtoType::HTTP;

	mstring sHost, sPath, sUserPass;

	bool SetHttpUrl(string_view uri, bool unescape = true);
	mstring ToURI(bool bEscaped, bool hostOnly = false) const;

	string_view GetProtoPrefix() const
	{
		return m_schema == EProtoType::HTTPS ? "https://"sv : "http://"sv;
	}

	bool operator==(const tHttpUrl &a) const
	{
		if (this == &a)
			return true;
		return a.sHost == sHost && a.nPort == nPort && a.sPath == sPath
				&& a.sUserPass == sUserPass && m_schema == a.m_schema;
	}

	void clear()
	{
		sHost.clear();
		nPort = 0;
		sPath.clear();
		sUserPass.clear();
		m_schema = EProtoType::HTTP;
	}
	uint16_t GetDefaultPortForProto() const
	{
		return m_schema == EProtoType::HTTPS ? DEFAULT_PORT_HTTPS : DEFAULT_PORT_HTTP;
	}
	uint16_t GetPort(uint16_t defVal) const { return nPort ? nPort : defVal; };
	uint16_t GetPort() const { return GetPort(GetDefaultPortForProto()); }

	tHttpUrl(cmstring &host, uint16_t port, bool ssl) :
		nPort(port), m_schema(ssl ? EProtoType::HTTPS : EProtoType::HTTP), sHost(host)
	{
	}
	tHttpUrl() =default;

	// special short version with only hostname and port number
	mstring GetHostPortKey() const { return makeHostPortKey(sHost, GetPort()); }
	// like above but also incorporates the schema, for connection reuse
	mstring GetHostPortProtoKey() const;
};

}

#endif // AHTTPURL_H
