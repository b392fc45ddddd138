#include "catch.hpp"
#include "StringOp.hh"

#include <cstdint>
#include <string_view>

using namespace StringOp;

static void checkTrim(std::string_view s, std::string_view expected)
{
	trim(s, " \t");
	CHECK(s == expected);
}

TEST_CASE("StringOp: stringTo")
{
	CHECK(stringTo<unsigned>("0") == 0u);
	CHECK(stringTo<unsigned>("1234") == 1234u);
	CHECK(stringTo<unsigned>("0x1F") == 0x1Fu);
	CHECK(stringTo<unsigned>("0XAbC") == 0xABCu);
	CHECK(stringTo<uint8_t>("255") == uint8_t(255));

	CHECK(!stringTo<uint8_t>("256"));
	CHECK(!stringTo<unsigned>(""));
	CHECK(!stringTo<unsigned>("0x"));
	CHECK(!stringTo<unsigned>(" 12"));
	CHECK(!stringTo<unsigned>("12 "));
	CHECK(!stringTo<unsigned>("-1"));
	CHECK(!stringTo<unsigned>("12abc"));
}

TEST_CASE("StringOp: stringToSize")
{
	CHECK(stringToSize("4096") == 4096u);
	CHECK(stringToSize("4k") == 4096u);
	CHECK(stringToSize("512K") == 0x80000u);
	CHECK(stringToSize("4M") == 0x400000u);
	CHECK(stringToSize("0x10k") == 0x4000u);

	CHECK(!stringToSize(""));
	CHECK(!stringToSize("k"));
	CHECK(!stringToSize("4G"));
	CHECK(!stringToSize("8192M")); // overflows 32 bits
}

TEST_CASE("StringOp: trim")
{
	checkTrim("", "");
	checkTrim("  ", "");
	checkTrim("abc", "abc");
	checkTrim(" \tabc def\t ", "abc def");
}
