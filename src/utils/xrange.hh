#ifndef XRANGE_HH
#define XRANGE_HH

// Utility to iterate over a range of numbers, modeled after python's xrange():
//
//   for (auto i : xrange(NUM_SECTORS)) { ... }      // [0, N)
//   for (auto b : xrange(1u, NUM_BANKS)) { ... }    // [B, E)
//
// The induction variable gets the type of the bounds.

#include <cstddef>
#include <iterator>
#include <type_traits>

template<typename T> struct XRange
{
	struct Iter
	{
		using difference_type = ptrdiff_t;
		using value_type = T;
		using pointer    = T*;
		using reference  = T&;
		using iterator_category = std::forward_iterator_tag;

		[[nodiscard]] constexpr T operator*() const { return x; }
		constexpr Iter& operator++() { ++x; return *this; }
		constexpr Iter operator++(int) { auto copy = *this; ++x; return copy; }
		[[nodiscard]] constexpr bool operator==(const Iter&) const = default;

		T x;
	};

	[[nodiscard]] constexpr auto begin() const { return Iter{b}; }
	[[nodiscard]] constexpr auto end()   const { return Iter{e}; }

	T b, e;
};

template<typename T> [[nodiscard]] constexpr auto xrange(T e)
{
	return XRange<T>{T(0), e < T(0) ? T(0) : e};
}
template<typename T1, typename T2> [[nodiscard]] constexpr auto xrange(T1 b, T2 e)
{
	static_assert(std::is_signed_v<T1> == std::is_signed_v<T2>);
	using T = std::common_type_t<T1, T2>;
	return XRange<T>{b, e < b ? b : e};
}

#endif
