#ifndef ASTROP_H_
#define ASTROP_H_

#include "actypes.h"

#include <strings.h>

namespace dlbr
{

#define SPACECHARSsv " \f\n\r\t\v"sv

inline void trimFront(mstring &s, string_view junk = SPACECHARSsv)
{
	auto pos = s.find_first_not_of(junk);
	if (pos == stmiss)
		s.clear();
	else if (pos > 0)
		s.erase(0, pos);
}

inline void trimBack(mstring &s, string_view junk = SPACECHARSsv)
{
	auto pos = s.find_last_not_of(junk);
	s.erase(pos == stmiss ? 0 : pos + 1);
}

inline void trimBoth(mstring &s, string_view junk = SPACECHARSsv)
{
	trimBack(s, junk);
	trimFront(s, junk);
}

inline void trimFront(string_view& s, string_view junk = SPACECHARSsv)
{
	auto pos = s.find_first_not_of(junk);
	s.remove_prefix(pos == stmiss ? s.length() : pos);
}

inline void trimBack(string_view& s, string_view junk = SPACECHARSsv)
{
	auto pos = s.find_last_not_of(junk);
	s.remove_suffix(pos == stmiss ? s.length() : s.length() - pos - 1);
}

inline void trimBoth(string_view& s, string_view junk = SPACECHARSsv)
{
	trimBack(s, junk);
	trimFront(s, junk);
}

inline bool startsWith(string_view where, string_view what)
{
	return where.size() >= what.size() && where.compare(0, what.size(), what) == 0;
}

inline bool endsWith(string_view where, string_view what)
{
	return where.size() >= what.size() && where.compare(where.size() - what.size(), what.size(), what) == 0;
}

inline bool CaseEqual(string_view a, string_view b)
{
	return a.size() == b.size() && 0 == strncasecmp(a.data(), b.data(), a.size());
}

inline bool CaseStartsWith(string_view where, string_view what)
{
	return where.size() >= what.size() && CaseEqual(where.substr(0, what.size()), what);
}

/**
 * Iterator-like tokenizer, returns the non-empty parts between separator characters.
 */
class tSplitWalk
{
	string_view m_input, m_seps, m_cur;
	tStrPos m_next = 0;
public:
	explicit tSplitWalk(string_view line, string_view separators = SPACECHARSsv)
	: m_input(line), m_seps(separators)
	{
	}
	bool Next()
	{
		auto start = m_input.find_first_not_of(m_seps, m_next);
		if (start == stmiss)
		{
			m_next = m_input.size();
			return false;
		}
		auto end = m_input.find_first_of(m_seps, start);
		if (end == stmiss)
			end = m_input.size();
		m_cur = m_input.substr(start, end - start);
		m_next = end;
		return true;
	}
	string_view view() const { return m_cur; }
	mstring str() const { return mstring(m_cur); }
	//! Remaining input after the current token, leading separators removed
	string_view right() const
	{
		auto rest = m_input.substr(m_next);
		trimFront(rest, m_seps);
		return rest;
	}

	struct iterator
	{
		tSplitWalk* walker;
		bool operator!=(const iterator& other) const { return walker != other.walker; }
		string_view operator*() const { return walker->view(); }
		iterator& operator++()
		{
			if (!walker->Next())
				walker = nullptr;
			return *this;
		}
	};
	iterator begin() { return Next() ? iterator { this } : end(); }
	iterator end() { return iterator { nullptr }; }
};

/**
 * Strict number parser, the whole trimmed input must be a decimal number.
 * @return The number, or nDefVal if invalid or out of range
 */
off_t atoofft(string_view s, off_t nDefVal);

/**
 * Like atoofft but accepts a K/M/G suffix (binary multipliers).
 */
off_t strsizeToOfft(string_view s, off_t nDefVal);

}

#endif /* ASTROP_H_ */
