#pragma once





#include <utility>
#include "Exception.hpp"





/** A wrapper that either holds a value or is empty.
Used as the return value of lookups that may legitimately find nothing (a device that was never seen,
a session that has no service name yet). */
template <typename T>
class Optional
{
public:
	Optional():
		mIsPresent(false),
		mValue()
	{
	}


	Optional(const T & aValue):
		mIsPresent(true),
		mValue(aValue)
	{
	}


	Optional(T && aValue):
		mIsPresent(true),
		mValue(std::move(aValue))
	{
	}


	Optional(const Optional<T> & aOther) = default;
	Optional(Optional<T> && aOther) = default;
	Optional<T> & operator = (const Optional<T> & aOther) = default;
	Optional<T> & operator = (Optional<T> && aOther) = default;


	bool operator == (const Optional<T> & aOther) const
	{
		return (
			(mIsPresent == aOther.mIsPresent) &&
			(
				!mIsPresent ||
				(mValue == aOther.mValue)
			)
		);
	}


	bool isPresent() const noexcept
	{
		return mIsPresent;
	}


	/** Returns a mutable reference to the stored value.
	Throws a LogicError when empty. */
	T & value()
	{
		if (!mIsPresent)
		{
			throw LogicError("Optional value not present");
		}
		return mValue;
	}


	/** Returns a const reference to the stored value.
	Throws a LogicError when empty. */
	const T & value() const
	{
		if (!mIsPresent)
		{
			throw LogicError("Optional value not present");
		}
		return mValue;
	}


	/** Returns the stored value if it is present, or the specified value if not present. */
	T valueOr(const T & aDefault) const
	{
		return mIsPresent ? mValue : aDefault;
	}


	/** Assigns the new value to the container */
	Optional<T> & operator = (const T & aValue)
	{
		mIsPresent = true;
		mValue = aValue;
		return *this;
	}


	/** Empties the container. */
	void reset()
	{
		mIsPresent = false;
		mValue = T();
	}


protected:

	/** Specifies whether the object is holding a valid value (false => empty). */
	bool mIsPresent;

	/** The value held by the object. Only valid if mIsPresent is true. */
	T mValue;
};
