#ifndef STRINGOP_HH
#define STRINGOP_HH

#include <charconv>
#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace StringOp
{
	/** Convert a string to an unsigned integral type 'T'.
	  * - No leading/trailing whitespace and no sign is accepted.
	  * - The base is detected from the prefix: '0x'/'0X' hexadecimal,
	  *   otherwise decimal.
	  * - It's an error if the value cannot be represented by the type 'T'.
	  */
	template<std::unsigned_integral T> [[nodiscard]] std::optional<T> stringTo(std::string_view s);

	/** As stringTo(), but additionally accepts a 'K' or 'M' suffix
	  * (case insensitive) meaning respectively 1024 and 1024*1024.
	  * Used for sizes on the command line: "4M", "512k", "0x400000".
	  */
	[[nodiscard]] std::optional<uint32_t> stringToSize(std::string_view s);

	void trim(std::string_view& str, std::string_view chars);

	template<int BASE, std::unsigned_integral T>
	[[nodiscard]] std::optional<T> stringToBase(std::string_view s)
	{
		T result = {};
		const auto* b = s.data();
		const auto* e = s.data() + s.size();
		if (auto [p, ec] = std::from_chars(b, e, result, BASE);
		    (ec == std::errc()) && (p == e) && (b != e)) {
			return result;
		}
		return std::nullopt;
	}

	template<std::unsigned_integral T>
	[[nodiscard]] std::optional<T> stringTo(std::string_view s)
	{
		if (s.empty()) [[unlikely]] return {};
		if ((s.size() > 2) && (s[0] == '0') && ((s[1] == 'x') || (s[1] == 'X'))) {
			s.remove_prefix(2);
			return stringToBase<16, T>(s);
		}
		return stringToBase<10, T>(s);
	}
}

#endif
