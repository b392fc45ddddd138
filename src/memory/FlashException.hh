#ifndef FLASHEXCEPTION_HH
#define FLASHEXCEPTION_HH

#include "FlashkitException.hh"

#include <cstdint>

namespace flashkit {

/** Common base for the completion-polling timeouts of the flash driver. */
class FlashTimeoutException : public FlashkitException
{
public:
	FlashTimeoutException(const char* what, uint32_t address_)
		: FlashkitException("Flash ", what, " timeout at 0x", hex_string<6>(address_))
		, address(address_) {}

	[[nodiscard]] uint32_t getAddress() const { return address; }

private:
	uint32_t address;
};

class EraseTimeoutException final : public FlashTimeoutException
{
public:
	explicit EraseTimeoutException(uint32_t address_)
		: FlashTimeoutException("erase", address_) {}
};

class WordWriteTimeoutException final : public FlashTimeoutException
{
public:
	explicit WordWriteTimeoutException(uint32_t address_)
		: FlashTimeoutException("write", address_) {}
};

class BufferWriteTimeoutException final : public FlashTimeoutException
{
public:
	explicit BufferWriteTimeoutException(uint32_t address_)
		: FlashTimeoutException("buffer write", address_) {}
};

/** Readback after programming differs from what was written.
  * The offset is relative to the start of the image (ROM or RAM).
  */
class VerifyMismatchException final : public FlashkitException
{
public:
	VerifyMismatchException(uint32_t offset_, uint8_t expected_, uint8_t actual_)
		: FlashkitException("Verify error at 0x", hex_string<6>(offset_),
		                    ": wrote ", hex_string<2>(expected_),
		                    ", read ", hex_string<2>(actual_))
		, offset(offset_), expected(expected_), actual(actual_) {}

	[[nodiscard]] uint32_t getOffset() const { return offset; }
	[[nodiscard]] uint8_t getExpected() const { return expected; }
	[[nodiscard]] uint8_t getActual() const { return actual; }

private:
	uint32_t offset;
	uint8_t expected;
	uint8_t actual;
};

/** A RAM operation was requested on a cartridge without (detected) RAM. */
class RamUnavailableException final : public FlashkitException
{
public:
	RamUnavailableException()
		: FlashkitException("RAM is not detected") {}
};

} // namespace flashkit

#endif
