#ifndef ACTEMPLATES_H
#define ACTEMPLATES_H

#include "actypes.h"

#include <functional>
#include <utility>

namespace dlbr
{

using tAction = std::function<void()>;

// unique_ptr semantics (almost) on a non-pointer type
template<typename T, void TFreeFunc(T), T inval_default>
struct auto_raii
{
	T m_p;
	auto_raii() : m_p(inval_default) {}
	explicit auto_raii(T xp) : m_p(xp) {}
	~auto_raii()
	{
		if (m_p != inval_default)
			TFreeFunc(m_p);
	}
	T release()
	{
		auto ret = m_p;
		m_p = inval_default;
		return ret;
	}
	T get() const { return m_p; }
	T operator*() const { return m_p; }
	auto_raii(const auto_raii&) = delete;
	auto_raii& operator=(const auto_raii&) = delete;
	auto_raii(auto_raii && other) : m_p(other.m_p)
	{
		other.m_p = inval_default;
	}
	auto_raii& operator=(auto_raii&& other) { return reset(std::move(other)); }
	auto_raii& reset(auto_raii &&other)
	{
		if (&other == this)
			return *this;
		if (m_p != other.m_p)
		{
			if(valid())
				TFreeFunc(m_p);
			m_p = other.m_p;
		}
		other.m_p = inval_default;
		return *this;
	}
	auto_raii& reset(T rawNew)
	{
		if (m_p == rawNew)
			return *this;
		if(valid())
			TFreeFunc(m_p);
		m_p = rawNew;
		return *this;
	}
	void swap(auto_raii &other) { std::swap(m_p, other.m_p); }
	void reset()
	{
		if (valid())
			TFreeFunc(m_p);
		m_p = inval_default;
	}
	bool valid() const { return inval_default != m_p;}
};

/**
 * @brief Single-owner function carrier.
 *
 * Runs the action ONCE when the carrier is destroyed or reset. Used for
 * cancellation handles and scoped cleanup.
 */
struct TFinalAction
{
SUTPRIVATE:
	tAction m_p;
public:
	TFinalAction() =default;
	explicit TFinalAction(tAction&& xp) : m_p(std::move(xp))
	{
	}
	~TFinalAction()
	{
		if (m_p)
			m_p();
	}
	TFinalAction(const TFinalAction&) = delete;
	TFinalAction& operator=(const TFinalAction&) = delete;
	TFinalAction(TFinalAction&& other)
	{
		m_p.swap(other.m_p);
	}
	TFinalAction& reset(TFinalAction &&other)
	{
		if (&other == this)
			return *this;
		reset();
		m_p.swap(other.m_p);
		return *this;
	}
	TFinalAction& operator=(TFinalAction &&other) { return reset(std::move(other)); }
	void reset()
	{
		// the action might destroy the holder of this object, detach first
		auto act = std::move(m_p);
		m_p = tAction();
		if (act)
			act();
	}
	/** Forget the action without running it */
	void release()
	{
		m_p = tAction();
	}
	explicit operator bool() const { return m_p.operator bool(); }
};

}

#endif // ACTEMPLATES_H
