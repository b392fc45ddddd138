#include "catch.hpp"
#include "RomHeader.hh"
#include "FlashkitException.hh"

#include <cstring>
#include <string_view>
#include <vector>

using namespace flashkit;

static std::vector<uint8_t> makeHeader(std::string_view domestic, std::string_view overseas,
                                       std::string_view region)
{
	std::vector<uint8_t> result(RomHeader::SIZE, ' ');
	std::memcpy(&result[RomHeader::DOMESTIC_NAME], domestic.data(), domestic.size());
	std::memcpy(&result[RomHeader::OVERSEAS_NAME], overseas.data(), overseas.size());
	std::memcpy(&result[RomHeader::REGION], region.data(), region.size());
	return result;
}

TEST_CASE("RomHeader: name")
{
	SECTION("domestic name wins") {
		auto h = RomHeader::parse(makeHeader("PUYO PUYO", "DR ROBOTNIK", "J"));
		CHECK(h.getName() == "PUYO PUYO");
	}
	SECTION("overseas name as fallback") {
		auto h = RomHeader::parse(makeHeader("", "DR ROBOTNIK", "U"));
		CHECK(h.getName() == "DR ROBOTNIK");
	}
	SECTION("invalid characters reject a name") {
		auto h = RomHeader::parse(makeHeader("\x82\xA8\x82\xE6", "STREETS OF RAGE", "U"));
		CHECK(h.getName() == "STREETS OF RAGE");
	}
	SECTION("path separators are replaced") {
		auto h = RomHeader::parse(makeHeader("A/B:C", "", "E"));
		CHECK(h.getName() == "A-B-C");
	}
	SECTION("NUL terminates") {
		auto header = makeHeader("SHINOBI", "", "J");
		header[RomHeader::DOMESTIC_NAME + 7] = 0;
		header[RomHeader::DOMESTIC_NAME + 8] = '#';
		CHECK(RomHeader::parse(header).getName() == "SHINOBI");
	}
	SECTION("no usable name") {
		auto header = makeHeader("", "", "J");
		header[RomHeader::OVERSEAS_NAME] = '*';
		CHECK(RomHeader::parse(header).getName() == "Unknown");
	}
}

TEST_CASE("RomHeader: region")
{
	auto region = [](std::string_view r) {
		return RomHeader::parse(makeHeader("X", "", r)).getRegion();
	};
	CHECK(region("J") == 'J');
	CHECK(region("U") == 'U');
	CHECK(region("E") == 'E');
	CHECK(region("JUE") == 'W');
	CHECK(region("F") == 'W');
	CHECK(region("4") == 'U');
	CHECK(region("1") == 'J');
	CHECK(region("8") == 'E');
	CHECK(region("Z") == 'X');
	CHECK(RomHeader::parse(makeHeader("GOLDEN AXE", "", "JU")).displayName() == "GOLDEN AXE (W)");
}

TEST_CASE("RomHeader: too short")
{
	std::vector<uint8_t> header(0x1FF, ' ');
	CHECK_THROWS_AS(RomHeader::parse(header), InvalidArgumentException);
}
