#ifndef STRCAT_HH
#define STRCAT_HH

#include <charconv>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

// strCat() and strAppend()
//
// Concatenate a bunch of 'printable' objects into a std::string:
//      auto s = strCat("sector ", 12, " at 0x", hex_string<6>(addr));
// Strings and characters are copied verbatim, integral values are printed in
// decimal and booleans as "true"/"false". Use hex_string<N>() to print an
// integral as N upper-case hexadecimal digits (zero-padded).

template<size_t N> struct HexString
{
	uint64_t value;
};

template<size_t N, std::integral T>
[[nodiscard]] constexpr HexString<N> hex_string(T t)
{
	return {static_cast<uint64_t>(t)};
}

namespace strcat_impl {

inline void append(std::string& result, std::string_view s) { result.append(s); }
inline void append(std::string& result, const std::string& s) { result.append(s); }
inline void append(std::string& result, const char* s) { result.append(s); }
inline void append(std::string& result, char c) { result.push_back(c); }
inline void append(std::string& result, bool b) { result.append(b ? "true" : "false"); }

template<std::integral T>
inline void append(std::string& result, T t)
{
	char buf[24];
	auto [p, ec] = std::to_chars(buf, buf + sizeof(buf), t);
	result.append(buf, p);
}

inline void append(std::string& result, double d)
{
	char buf[32];
	auto [p, ec] = std::to_chars(buf, buf + sizeof(buf), d);
	result.append(buf, p);
}

template<size_t N>
inline void append(std::string& result, HexString<N> h)
{
	char buf[N];
	auto v = h.value;
	for (size_t i = N; i > 0; --i) {
		buf[i - 1] = "0123456789ABCDEF"[v & 15];
		v >>= 4;
	}
	result.append(buf, N);
}

} // namespace strcat_impl

template<typename... Ts>
void strAppend(std::string& result, Ts&& ...ts)
{
	(strcat_impl::append(result, std::forward<Ts>(ts)), ...);
}

template<typename... Ts>
[[nodiscard]] std::string strCat(Ts&& ...ts)
{
	std::string result;
	strAppend(result, std::forward<Ts>(ts)...);
	return result;
}

#endif
