#ifndef NARROW_HH
#define NARROW_HH

#include <cassert>
#include <type_traits>
#include <utility>

// Inspired by GSL narrow
//
// narrow_cast(): a searchable way to do narrowing casts of values
// narrow(): a checked version of narrow_cast(), asserts that the
//           numerical value remains unchanged

template<typename To, typename From>
constexpr To narrow_cast(From&& from) noexcept
{
	return static_cast<To>(std::forward<From>(from));
}

template<typename To, typename From> constexpr To narrow(From from) noexcept
{
	static_assert(std::is_arithmetic_v<From>);
	static_assert(std::is_arithmetic_v<To>);

	const To to = narrow_cast<To>(from);
	assert(static_cast<From>(to) == from);
	if constexpr (std::is_signed_v<From> != std::is_signed_v<To>) {
		assert((to < To{}) == (from < From{}));
	}
	return to;
}

#endif
