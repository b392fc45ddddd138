#ifndef DEVICESESSION_HH
#define DEVICESESSION_HH

#include <cstdint>
#include <span>
#include <string>

namespace flashkit {

class FlashkitLink;
class CliComm;

/** Exclusive, scoped access to the programmer.
  *
  * The constructor connects the link and applies the inter-command delay,
  * the destructor disconnects it again. When connecting fails the session
  * is still constructed (a warning is logged), but every bus access then
  * throws NotConnectedException. Opening a second session on a link that
  * is already in use throws LinkException.
  */
class DeviceSession
{
public:
	DeviceSession(FlashkitLink& link, CliComm& cliComm, unsigned delayMs = 1);
	~DeviceSession();

	DeviceSession(const DeviceSession&) = delete;
	DeviceSession& operator=(const DeviceSession&) = delete;

	[[nodiscard]] bool isConnected() const { return connected; }
	[[nodiscard]] std::string getPortName() const;
	[[nodiscard]] CliComm& getCliComm() const { return cliComm; }

	void setDelay(unsigned ms);

	[[nodiscard]] uint16_t readWord(uint32_t address);
	void writeWord(uint32_t address, uint16_t value);
	void writeByte(uint32_t address, uint8_t value);
	void read(uint32_t address, std::span<uint8_t> buffer);
	void write(uint32_t address, std::span<const uint8_t> data);

private:
	FlashkitLink& checkedLink();

private:
	FlashkitLink& link;
	CliComm& cliComm;
	bool connected = false;
};

} // namespace flashkit

#endif
