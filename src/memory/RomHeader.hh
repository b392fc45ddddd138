#ifndef ROMHEADER_HH
#define ROMHEADER_HH

#include <cstdint>
#include <span>
#include <string>
#include <utility>

namespace flashkit {

/** The information of the 512-byte Mega Drive ROM header that is used to
  * name dump files.
  */
class RomHeader
{
public:
	static constexpr size_t SIZE = 0x200;
	static constexpr size_t DOMESTIC_NAME = 0x120;
	static constexpr size_t OVERSEAS_NAME = 0x150;
	static constexpr size_t NAME_LENGTH   = 48;
	static constexpr size_t REGION        = 0x1F0;

	/** Throws InvalidArgumentException when 'header' is shorter than SIZE. */
	[[nodiscard]] static RomHeader parse(std::span<const uint8_t> header);

	[[nodiscard]] const std::string& getName() const { return name; }
	[[nodiscard]] char getRegion() const { return region; }

	/** E.g. "SONIC THE HEDGEHOG (W)" */
	[[nodiscard]] std::string displayName() const;

private:
	RomHeader(std::string name_, char region_)
		: name(std::move(name_)), region(region_) {}

private:
	std::string name;
	char region;
};

} // namespace flashkit

#endif
