#include "RomHeader.hh"
#include "FlashkitException.hh"

#include "strCat.hh"

#include <optional>
#include <string_view>

namespace flashkit {

[[nodiscard]] static bool isNameChar(char c)
{
	if (('A' <= c) && (c <= 'Z')) return true;
	if (('a' <= c) && (c <= 'z')) return true;
	if (('0' <= c) && (c <= '9')) return true;
	return std::string_view(" !()_-.[]|&'`").find(c) != std::string_view::npos;
}

static std::optional<std::string> parseName(std::span<const uint8_t> field)
{
	std::string_view raw(reinterpret_cast<const char*>(field.data()), field.size());
	// field is padded with spaces or NULs
	if (auto nul = raw.find('\0'); nul != std::string_view::npos) {
		raw = raw.substr(0, nul);
	}
	while (!raw.empty() && (raw.back() == ' ')) raw.remove_suffix(1);
	if (raw.empty()) return {};

	std::string result(raw);
	for (auto& c : result) {
		if ((c == '/') || (c == ':')) c = '-';
		if (!isNameChar(c)) return {};
	}
	return result;
}

static char parseRegion(std::span<const uint8_t> header)
{
	uint8_t val = header[RomHeader::REGION];
	uint8_t next = header[RomHeader::REGION + 1];
	if ((val != next) && (next != ' ') && (next != 0)) return 'W';

	switch (val) {
	case 'F': case 'C':
		return 'W';
	case 'U': case 'W': case '4': case 4:
		return 'U';
	case 'J': case 'B': case '1': case 1:
		return 'J';
	case 'E': case 'A': case '8': case 8:
		return 'E';
	default:
		return 'X';
	}
}

RomHeader RomHeader::parse(std::span<const uint8_t> header)
{
	if (header.size() < SIZE) {
		throw InvalidArgumentException("ROM header too short: ", header.size(), " bytes");
	}
	auto name = parseName(header.subspan(DOMESTIC_NAME, NAME_LENGTH));
	if (!name) name = parseName(header.subspan(OVERSEAS_NAME, NAME_LENGTH));
	return {name ? std::move(*name) : std::string("Unknown"), parseRegion(header)};
}

std::string RomHeader::displayName() const
{
	return strCat(name, " (", region, ')');
}

} // namespace flashkit
