#ifndef FLASHKITLINK_HH
#define FLASHKITLINK_HH

#include <cstdint>
#include <span>
#include <string>

namespace flashkit {

/** Raw access to the console's address/data bus through the programmer.
  *
  * All addresses are byte offsets in the console's visible address space
  * (cartridge area 0x000000-0x3FFFFF plus the mapper registers at 0xA130xx).
  * Word accesses operate on 2-byte aligned addresses, words are big-endian
  * on the bus (high byte at the even address).
  *
  * Implementations throw LinkException when a transfer fails.
  */
class FlashkitLink
{
public:
	FlashkitLink(const FlashkitLink&) = delete;
	FlashkitLink& operator=(const FlashkitLink&) = delete;
	virtual ~FlashkitLink() = default;

	virtual void connect() = 0;
	virtual void disconnect() noexcept = 0;
	[[nodiscard]] virtual bool isConnected() const = 0;
	/** Name of the connected port, for display. */
	[[nodiscard]] virtual std::string getName() const = 0;

	/** Delay (in ms) the programmer inserts between bus cycles. */
	virtual void setDelay(unsigned ms) = 0;

	[[nodiscard]] virtual uint16_t readWord(uint32_t address) = 0;
	virtual void writeWord(uint32_t address, uint16_t value) = 0;
	virtual void writeByte(uint32_t address, uint8_t value) = 0;

	/** Sequential read/write starting at 'address'. The size must be even. */
	virtual void read(uint32_t address, std::span<uint8_t> buffer) = 0;
	virtual void write(uint32_t address, std::span<const uint8_t> data) = 0;

protected:
	FlashkitLink() = default;
};

} // namespace flashkit

#endif
