#include "StringOp.hh"

namespace StringOp {

std::optional<uint32_t> stringToSize(std::string_view s)
{
	uint32_t multiplier = 1;
	if (!s.empty()) {
		switch (s.back()) {
		case 'k': case 'K': multiplier = 1024;        s.remove_suffix(1); break;
		case 'm': case 'M': multiplier = 1024 * 1024; s.remove_suffix(1); break;
		default: break;
		}
	}
	auto value = stringTo<uint32_t>(s);
	if (!value) return {};
	if (*value > std::numeric_limits<uint32_t>::max() / multiplier) return {};
	return *value * multiplier;
}

void trim(std::string_view& str, std::string_view chars)
{
	auto first = str.find_first_not_of(chars);
	if (first == std::string_view::npos) {
		str = {};
		return;
	}
	auto last = str.find_last_not_of(chars);
	str = str.substr(first, last - first + 1);
}

} // namespace StringOp
