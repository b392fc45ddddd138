#ifndef ROMFILE_HH
#define ROMFILE_HH

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace flashkit::RomFile {

	/** Read a whole ROM or RAM image. Gzip compressed files are
	  * decompressed transparently. Throws FileException.
	  */
	[[nodiscard]] std::vector<uint8_t> load(const std::string& filename);

	/** Write 'data' as a flat binary file. Throws FileException. */
	void save(const std::string& filename, std::span<const uint8_t> data);

	/** Decompress an in-memory gzip file. Throws FileException. */
	[[nodiscard]] std::vector<uint8_t> gunzip(std::span<const uint8_t> data);

	[[nodiscard]] bool isGzip(std::span<const uint8_t> data);

	[[nodiscard]] uint32_t crc32(std::span<const uint8_t> data);

} // namespace flashkit::RomFile

#endif
