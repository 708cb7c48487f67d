#ifndef ACSMARTPTR_H_
#define ACSMARTPTR_H_

#include "actypes.h"

#include <utility>

namespace dlbr {

/**
 * Basic base implementation of a reference-counted class
 */
struct tLintRefcounted
{
private:
	size_t m_nRefCount = 0;
public:
	inline void __inc_ref() noexcept
	{
		m_nRefCount++;
	}
	inline void __dec_ref()
	{
		if(--m_nRefCount == 0)
			delete this;
	}
	virtual ~tLintRefcounted() {}
	inline size_t __ref_cnt() { return m_nRefCount; }
};

/**
 * Lightweight intrusive smart pointer with ordinary reference counting.
 * Not thread-safe, objects are expected to live on the event thread.
 */
template<class T>
class lint_ptr
{
	T * m_ptr = nullptr;
public:
	lint_ptr() =default;
	explicit lint_ptr(T *rawPtr, bool initialyTakeRef = true) :
		m_ptr(rawPtr)
	{
		if(rawPtr && initialyTakeRef)
			rawPtr->__inc_ref();
	}
	lint_ptr(const lint_ptr<T> & orig) : m_ptr(orig.m_ptr)
	{
		if(m_ptr)
			m_ptr->__inc_ref();
	}
	lint_ptr(lint_ptr<T> && orig) noexcept : m_ptr(orig.m_ptr)
	{
		orig.m_ptr = nullptr;
	}
	inline ~lint_ptr()
	{
		if(m_ptr)
			m_ptr->__dec_ref();
	}
	T* get() const
	{
		return m_ptr;
	}
	inline void reset(T *rawPtr)
	{
		if(rawPtr == m_ptr)
			return;
		if(rawPtr)
			rawPtr->__inc_ref();
		auto old = m_ptr;
		m_ptr = rawPtr;
		if (old)
			old->__dec_ref();
	}
	inline void reset()
	{
		auto old = m_ptr;
		m_ptr = nullptr;
		if(old)
			old->__dec_ref();
	}
	inline void swap(lint_ptr<T>& other) noexcept
	{
		std::swap(m_ptr, other.m_ptr);
	}
	lint_ptr<T>& operator=(const lint_ptr<T> &other)
	{
		reset(other.m_ptr);
		return *this;
	}
	lint_ptr<T>& operator=(lint_ptr<T> &&other)
	{
		if(this != &other)
		{
			lint_ptr<T> temp(std::move(other));
			swap(temp);
		}
		return *this;
	}
	explicit inline operator bool() const noexcept
	{
		return m_ptr;
	}
	inline T& operator*() const noexcept
	{
		return *m_ptr;
	}
	inline T* operator->() const noexcept
	{
		return m_ptr;
	}
	inline bool operator<(const lint_ptr<T> &vs) const noexcept
	{
		return m_ptr < vs.m_ptr;
	}
	inline bool operator==(const lint_ptr<T> &vs) const noexcept
	{
		return m_ptr == vs.m_ptr;
	}
	bool operator==(const T* raw) const
	{
		return m_ptr == raw;
	}
	/**
	 * @brief release returns the pointer and makes this invalid while keeping the refcount
	 */
	T* release() noexcept WARN_UNUSED
	{
		auto ret = m_ptr;
		m_ptr = nullptr;
		return ret;
	}
};

template<typename C>
inline lint_ptr<C> as_lptr(C* a, bool initialyTakeRef = true)
{
	return lint_ptr<C>(a, initialyTakeRef);
}

template<typename C, typename Torig>
inline lint_ptr<C> static_lptr_cast(const lint_ptr<Torig>& a)
{
	return lint_ptr<C>(static_cast<C*>(a.get()));
}

template<class C, typename... Targs>
lint_ptr<C> make_lptr(Targs&&... args)
{
	return lint_ptr<C>(new C(std::forward<Targs>(args)...));
}

} // namespace dlbr

#endif /* ACSMARTPTR_H_ */
