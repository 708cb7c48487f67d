#include "linkreg.h"
#include "meta.h"
#include "acfg.h"
#include "debug.h"

#include <fstream>

#include <fcntl.h>

#include <openssl/rand.h>

using namespace std;

#define TOKEN_MAX_LEN 128
#define TOKEN_RAW_BYTES 12

namespace dlbr
{

cmstring DEFAULT_MIME_TYPE("application/octet-stream");

bool IsValidToken(string_view token)
{
	if (token.empty() || token.size() > TOKEN_MAX_LEN)
		return false;
	for (auto c: token)
	{
		if (!isalnum((unsigned char) c) && c != '-' && c != '_')
			return false;
	}
	return true;
}

tLinkLookup tLinkTable::Resolve(string_view token, time_t now)
{
	if (!IsValidToken(token))
		return tLinkLookup();
	tFileDescPtr found;
	{
		shared_lock<shared_mutex> g(m_mx);
		auto it = m_index.find(mstring(token));
		if (it == m_index.end())
			return tLinkLookup();
		found = it->second;
	}
	if (found->IsExpired(now))
		return tLinkLookup { ELinkState::EXPIRED, move(found) };
	return tLinkLookup { ELinkState::FOUND, move(found) };
}

bool tLinkTable::Insert(cmstring &token, tFileDesc desc)
{
	if (!IsValidToken(token) || desc.totalSize < 0)
		return false;
	if (desc.mimeType.empty())
		desc.mimeType = DEFAULT_MIME_TYPE;
	auto ptr = make_shared<const tFileDesc>(move(desc));
	unique_lock<shared_mutex> g(m_mx);
	return m_index.emplace(token, move(ptr)).second;
}

bool tLinkTable::Revoke(string_view token)
{
	unique_lock<shared_mutex> g(m_mx);
	return m_index.erase(mstring(token)) > 0;
}

unsigned tLinkTable::Purge(time_t now)
{
	unsigned ret = 0;
	unique_lock<shared_mutex> g(m_mx);
	for (auto it = m_index.begin(); it != m_index.end();)
	{
		if (it->second->IsExpired(now))
		{
			it = m_index.erase(it);
			++ret;
		}
		else
			++it;
	}
	return ret;
}

void tLinkTable::Replace(tRecords &&records)
{
	unique_lock<shared_mutex> g(m_mx);
	m_index.swap(records);
	g.unlock();
	// old descriptors are released outside of the lock
	records.clear();
}

size_t tLinkTable::size() const
{
	shared_lock<shared_mutex> g(m_mx);
	return m_index.size();
}

tLinkTableFile::tLinkTableFile(cmstring &path) : m_path(path), m_nextCheck(0)
{
}

tLinkLookup tLinkTableFile::Resolve(string_view token, time_t now)
{
	CheckReload(now);
	return m_table.Resolve(token, now);
}

void tLinkTableFile::Maintain(time_t now)
{
	CheckReload(now);
}

void tLinkTableFile::CheckReload(time_t now)
{
	if (now < m_nextCheck.load())
		return;
	// somebody else is on it, use the current state
	unique_lock<mutex> g(m_reloadMx, try_to_lock);
	if (!g.owns_lock())
		return;
	m_nextCheck = now + max(cfg::linkrescan, 0);

	Cstat st(m_path);
	if (!st)
	{
		if (!m_bReportedMissing)
		{
			log::err(tSS() << "Link table " << m_path << " is not accessible");
			m_bReportedMissing = true;
		}
		// keep serving what we know
		return;
	}
	m_bReportedMissing = false;
	if (m_bHaveFpr && st.fpr() == m_fpr)
		return;
	// remember the version we will read, a modification in between triggers another read later
	m_fpr = st.fpr();
	m_bHaveFpr = true;

	auto err = Reload(now);
	if (!err.empty())
		log::err(err);
}

mstring tLinkTableFile::Reload(time_t now)
{
	LOGSTARTFUNCx(m_path);
	tLinkTable::tRecords records;
	unsigned dupes = 0, expired = 0;
	auto err = LoadLinkRecords(m_path, [&](mstring&& token, tFileDesc&& desc)
	{
		if (desc.IsExpired(now))
			++expired;
		if (desc.mimeType.empty())
			desc.mimeType = DEFAULT_MIME_TYPE;
		// later records override earlier ones
		auto& slot = records[token];
		if (slot)
			++dupes;
		slot = make_shared<const tFileDesc>(move(desc));
	});
	if (!err.empty())
		return err;
	auto count = records.size();
	m_table.Replace(move(records));
	USRDBG("Link table loaded, " << count << " records, " << expired
			<< " expired, " << dupes << " duplicates");
	return se;
}

mstring FormatLinkRecord(string_view token, const tFileDesc &desc)
{
	tSS ret;
	ret << token << '\t' << desc.handle << '\t' << desc.totalSize << '\t' << desc.mimeType
			<< '\t' << desc.createdAt << '\t' << desc.expiresAt << '\t'
			<< UrlEscape(desc.fileName, false) << '\n';
	return ret.str();
}

static bool badFieldChars(string_view s)
{
	return s.find_first_of("\t\r\n"sv) != stmiss;
}

bool ParseLinkRecord(string_view line, mstring &token, tFileDesc &desc)
{
	trimBack(line, "\r\n"sv);
	string_view fields[7];
	unsigned n = 0;
	for (;;)
	{
		auto pos = line.find('\t');
		if (n == 6)
		{
			// name is last and cannot contain raw tabs
			if (pos != stmiss)
				return false;
			fields[n++] = line;
			break;
		}
		if (pos == stmiss)
			return false;
		fields[n++] = line.substr(0, pos);
		line.remove_prefix(pos + 1);
	}
	if (!IsValidToken(fields[0]) || fields[1].empty())
		return false;
	auto size = atoofft(fields[2], -1);
	auto created = atoofft(fields[4], -1);
	auto expires = atoofft(fields[5], -1);
	if (size < 0 || created < 0 || expires < 0)
		return false;
	mstring name;
	if (!UrlUnescapeAppend(fields[6], name))
		return false;

	token = fields[0];
	desc.handle = fields[1];
	desc.totalSize = size;
	desc.mimeType = fields[3];
	desc.fileName = move(name);
	desc.createdAt = created;
	desc.expiresAt = expires;
	return true;
}

mstring LoadLinkRecords(cmstring &path, const tLinkRecordSink& sink)
{
	ifstream in(path);
	if (!in.is_open())
		return tErrnoFmter("Cannot open link table " + path + ": ");
	mstring line, token;
	unsigned lineNo = 0;
	while (getline(in, line))
	{
		++lineNo;
		string_view check(line);
		trimBoth(check);
		if (check.empty() || check[0] == '#')
			continue;
		tFileDesc desc;
		if (!ParseLinkRecord(line, token, desc))
		{
			log::err(tSS() << "Invalid link record in " << path << ":" << lineNo << ", ignored");
			continue;
		}
		sink(move(token), move(desc));
	}
	if (in.bad())
		return tErrnoFmter("Error reading " + path + ": ");
	return se;
}

mstring AppendLinkRecord(cmstring &path, string_view token, const tFileDesc &desc)
{
	if (!IsValidToken(token) || desc.handle.empty() || badFieldChars(desc.handle) || badFieldChars(desc.mimeType))
		return "Invalid link data";
	auto rec = FormatLinkRecord(token, desc);
	mkbasedir(path);
	unique_fd fd(open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644));
	if (!fd.valid())
		return tErrnoFmter("Cannot open " + path + ": ");
	// a single write keeps the record intact for concurrent readers
	if (dumpall(fd.get(), rec) < 0)
		return tErrnoFmter("Cannot write " + path + ": ");
	return se;
}

mstring GenerateToken()
{
	uint8_t buf[TOKEN_RAW_BYTES];
	if (1 != RAND_bytes(buf, sizeof(buf)))
		return mstring();
	return BytesToHexString(buf, sizeof(buf));
}

mstring BuildLinkUrl(string_view baseUrl, string_view token, string_view fileName)
{
	trimBack(baseUrl, "/"sv);
	mstring ret(baseUrl);
	if (fileName.empty())
	{
		ret += '/';
		ret += token;
		return ret;
	}
	ret += "/dl/"sv;
	ret += token;
	ret += '/';
	UrlEscapeAppend(fileName, ret, false);
	return ret;
}

}
