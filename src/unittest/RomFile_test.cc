#include "catch.hpp"
#include "RomFile.hh"
#include "FileException.hh"

#include <zlib.h>

#include <cstring>
#include <filesystem>
#include <string_view>
#include <vector>

using namespace flashkit;

static std::vector<uint8_t> toBytes(std::string_view s)
{
	return {s.begin(), s.end()};
}

// gzip stream as written by 'gzip', produced with zlib's deflate
static std::vector<uint8_t> gzip(std::span<const uint8_t> data)
{
	z_stream s;
	memset(&s, 0, sizeof(s));
	REQUIRE(deflateInit2(&s, Z_BEST_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) == Z_OK);
	std::vector<uint8_t> result(deflateBound(&s, uLong(data.size())) + 32);
	s.next_in = const_cast<Bytef*>(data.data());
	s.avail_in = uInt(data.size());
	s.next_out = result.data();
	s.avail_out = uInt(result.size());
	REQUIRE(deflate(&s, Z_FINISH) == Z_STREAM_END);
	result.resize(s.total_out);
	deflateEnd(&s);
	return result;
}

TEST_CASE("RomFile: crc32")
{
	CHECK(RomFile::crc32({}) == 0);
	CHECK(RomFile::crc32(toBytes("123456789")) == 0xCBF43926);
}

TEST_CASE("RomFile: gunzip")
{
	std::vector<uint8_t> data(100000);
	for (size_t i = 0; i < data.size(); ++i) data[i] = uint8_t(i % 251);
	auto compressed = gzip(data);
	CHECK(RomFile::isGzip(compressed));
	CHECK(!RomFile::isGzip(data));
	CHECK(RomFile::gunzip(compressed) == data);

	CHECK_THROWS_AS(RomFile::gunzip(data), FileException);
	compressed.resize(compressed.size() / 2);
	CHECK_THROWS_AS(RomFile::gunzip(compressed), FileException);
}

TEST_CASE("RomFile: load and save")
{
	auto dir = std::filesystem::temp_directory_path();
	auto plain = (dir / "flashkit_romfile.bin").string();
	auto packed = (dir / "flashkit_romfile.bin.gz").string();

	auto data = toBytes("SEGA MEGA DRIVE (C)SEGA 1990.JAN");
	RomFile::save(plain, data);
	CHECK(RomFile::load(plain) == data);

	// compressed images are unpacked transparently
	RomFile::save(packed, gzip(data));
	CHECK(RomFile::load(packed) == data);

	std::filesystem::remove(plain);
	std::filesystem::remove(packed);
	CHECK_THROWS_AS(RomFile::load(plain), FileException);
}
