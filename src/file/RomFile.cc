#include "RomFile.hh"
#include "FileException.hh"
#include "FileOperations.hh"
#include "ZlibInflate.hh"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <zlib.h>

namespace flashkit::RomFile {

static constexpr uint8_t HEAD_CRC    = 0x02; // bit 1 set: header CRC present
static constexpr uint8_t EXTRA_FIELD = 0x04; // bit 2 set: extra field present
static constexpr uint8_t ORIG_NAME   = 0x08; // bit 3 set: original file name present
static constexpr uint8_t COMMENT     = 0x10; // bit 4 set: file comment present
static constexpr uint8_t RESERVED    = 0xE0; // bits 5..7: reserved

[[nodiscard]] static bool skipHeader(ZlibInflate& zlib)
{
	if (zlib.get16LE() != 0x8B1F) {
		return false;
	}

	uint8_t method = zlib.getByte();
	uint8_t flags = zlib.getByte();
	if (method != Z_DEFLATED || (flags & RESERVED) != 0) {
		return false;
	}

	// Discard time, xflags and OS code:
	zlib.skip(6);

	if ((flags & EXTRA_FIELD) != 0) {
		zlib.skip(zlib.get16LE());
	}
	if ((flags & ORIG_NAME) != 0) {
		(void)zlib.getCString();
	}
	if ((flags & COMMENT) != 0) {
		(void)zlib.getCString();
	}
	if ((flags & HEAD_CRC) != 0) {
		zlib.skip(2);
	}
	return true;
}

bool isGzip(std::span<const uint8_t> data)
{
	return (data.size() >= 2) && (data[0] == 0x1F) && (data[1] == 0x8B);
}

std::vector<uint8_t> gunzip(std::span<const uint8_t> data)
{
	ZlibInflate zlib(data);
	if (!skipHeader(zlib)) {
		throw FileException("Not a gzip header");
	}
	return zlib.inflate();
}

std::vector<uint8_t> load(const std::string& filename)
{
	auto file = FileOperations::openFile(filename, "rb");
	std::vector<uint8_t> result;
	uint8_t buf[65536];
	while (true) {
		auto n = fread(buf, 1, sizeof(buf), file.get());
		result.insert(result.end(), buf, buf + n);
		if (n < sizeof(buf)) break;
	}
	if (ferror(file.get())) {
		throw FileException("Error reading file \"", filename, "\"");
	}
	if (isGzip(result)) {
		return gunzip(result);
	}
	return result;
}

void save(const std::string& filename, std::span<const uint8_t> data)
{
	auto file = FileOperations::openFile(filename, "wb");
	if (fwrite(data.data(), 1, data.size(), file.get()) != data.size()) {
		throw FileException("Error writing file \"", filename, "\": ", strerror(errno));
	}
	if (fflush(file.get()) != 0) {
		throw FileException("Error writing file \"", filename, "\": ", strerror(errno));
	}
}

uint32_t crc32(std::span<const uint8_t> data)
{
	uLong crc = ::crc32(0L, Z_NULL, 0);
	// zlib takes uInt lengths
	while (!data.empty()) {
		auto len = std::min<size_t>(data.size(), 1u << 30);
		crc = ::crc32(crc, data.data(), uInt(len));
		data = data.subspan(len);
	}
	return uint32_t(crc);
}

} // namespace flashkit::RomFile
