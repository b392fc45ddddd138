#ifndef SERIALFLASHKITLINK_HH
#define SERIALFLASHKITLINK_HH

#include "FlashkitLink.hh"

#include <cstdint>
#include <span>
#include <string>

namespace flashkit {

/** FlashkitLink for the flashkit-md USB programmer, which shows up as a
  * CDC-ACM serial device. The port name "auto" scans /dev/ttyACM* and
  * /dev/ttyUSB* and picks the first device that answers the ID query.
  */
class SerialFlashkitLink final : public FlashkitLink
{
public:
	explicit SerialFlashkitLink(std::string port);
	~SerialFlashkitLink() override;

	void connect() override;
	void disconnect() noexcept override;
	[[nodiscard]] bool isConnected() const override { return fd != -1; }
	[[nodiscard]] std::string getName() const override { return portName; }

	void setDelay(unsigned ms) override;

	[[nodiscard]] uint16_t readWord(uint32_t address) override;
	void writeWord(uint32_t address, uint16_t value) override;
	void writeByte(uint32_t address, uint8_t value) override;
	void read(uint32_t address, std::span<uint8_t> buffer) override;
	void write(uint32_t address, std::span<const uint8_t> data) override;

	/** Query the programmer's device ID. */
	[[nodiscard]] uint16_t getID();

private:
	[[nodiscard]] bool tryPort(const std::string& name);
	void openPort(const std::string& name);
	void closePort() noexcept;
	void setAddress(uint32_t address);
	void send(std::span<const uint8_t> data);
	void receive(std::span<uint8_t> data);

private:
	std::string requestedPort;
	std::string portName;
	int fd = -1;
};

} // namespace flashkit

#endif
